#pragma once
/**
 * @file IDeviceState.h
 * @brief Access to the shared device state slot.
 */

class DeviceStateSlot;

/**
 * @brief Exposes the slot written by the protocol task.
 *
 * Readers (indicator) use `load()`; the wake task may only call
 * `requestPulse()`.
 */
struct DeviceStateService {
    DeviceStateSlot* slot;
};

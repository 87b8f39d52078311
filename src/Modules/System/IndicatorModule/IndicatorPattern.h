#pragma once
/**
 * @file IndicatorPattern.h
 * @brief Blink pattern renderer for the status LED.
 */
#include <stdint.h>

#include "Core/DeviceStateMachine.h"

/**
 * @brief Turns the latest state slot snapshot into an LED level.
 *
 * A new pulse sequence overrides the base pattern for `count` flashes,
 * then the base pattern of the current state resumes from its first phase.
 */
class IndicatorPattern {
public:
    /** @brief LED level (true = lit) at `nowMs`. */
    bool update(const DeviceStateSnapshot& snap, uint32_t nowMs);

    bool pulseActive() const { return pulseActive_; }

    static bool baseLevel(DeviceState state, uint32_t elapsedMs);

private:
    uint16_t lastSeq_ = 0;
    bool pulseActive_ = false;
    uint8_t pulseCount_ = 0;
    uint32_t pulseStartMs_ = 0;

    bool hasBase_ = false;
    DeviceState baseState_ = DeviceState::Booting;
    uint32_t baseStartMs_ = 0;
};

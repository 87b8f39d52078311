#pragma once
/**
 * @file ITime.h
 * @brief UTC time source service interface.
 */
#include <stddef.h>
#include <stdint.h>

/** @brief Time synchronization state. */
enum class TimeSyncState : uint8_t { Disabled, WaitingNetwork, Syncing, Synced, ErrorWait };

static inline const char* timeSyncStateStr(TimeSyncState s)
{
    switch (s) {
    case TimeSyncState::Disabled: return "disabled";
    case TimeSyncState::WaitingNetwork: return "waiting_network";
    case TimeSyncState::Syncing: return "syncing";
    case TimeSyncState::Synced: return "synced";
    case TimeSyncState::ErrorWait: return "error_wait";
    }
    return "unknown";
}

/**
 * @brief Service interface for the network-synchronized UTC clock.
 *
 * `epoch` never blocks and returns 0 until the first successful sync.
 */
struct TimeService {
    TimeSyncState (*state)(void* ctx);
    bool (*isSynced)(void* ctx);
    uint64_t (*epoch)(void* ctx);
    /** @brief Ask the time task for a fresh sync at its next loop. */
    void (*requestResync)(void* ctx);
    /** @brief `YYYY-MM-DD hh:mm:ss` in UTC, false if not synced. */
    bool (*formatUtc)(void* ctx, char* out, size_t len);
    void* ctx;
};

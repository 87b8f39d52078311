#pragma once
/**
 * @file EventPayloads.h
 * @brief Payload types used by EventBus events.
 */
#include <stdint.h>

// Payloads are copied byte-wise into the queue: keep them small and POD.

/** @brief Payload for ConfigChanged events. */
struct ConfigChangedPayload {
    char nvsKey[16];
};

/** @brief Payload for NetworkReady events. */
struct NetworkReadyPayload {
    uint8_t ip[4];
    uint8_t gw[4];
    uint8_t mask[4];
};

/** @brief Payload for TimeSynced events. */
struct TimeSyncedPayload {
    uint64_t epoch;
};

/** @brief Payload for TimeSyncFailed events. */
struct TimeSyncFailedPayload {
    uint8_t attempts;
};

/** @brief Payload for TopicRotated events. */
struct TopicRotatedPayload {
    uint64_t window;
};

/** @brief Origin of a magic packet. */
enum class WakeSource : uint8_t { Command = 0, Schedule = 1 };

/** @brief Payload for WakeSent events. */
struct WakeSentPayload {
    WakeSource source;
    uint8_t slot;  // schedule slot, 0xFF for remote commands
    uint8_t ok;
};

#pragma once
/**
 * @file EventId.h
 * @brief Enumerates event identifiers used by EventBus.
 */
#include <stdint.h>

/** @brief Known event identifiers. */
enum class EventId : uint16_t {
    None = 0,

    // System lifecycle
    SystemStarted = 1,

    // Network
    NetworkReady = 20,
    NetworkLost = 21,

    // Time source
    TimeSynced = 40,
    TimeSyncFailed = 41,

    // Configuration
    ConfigChanged = 100,

    // Secure link
    TopicRotated = 200,

    // Wake collaborators
    WakeSent = 300,
};

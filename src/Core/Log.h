/**
 * @file Log.h
 * @brief Process-wide log front end used by the module layer.
 */
#pragma once

#include "Core/Services/ILogger.h"

namespace Log {
    /**
     * @brief Install the hub every producer writes to.
     *
     * Until a hub is set, log calls are silently discarded.
     */
    void setHub(const LogHubService* hub);

    /** @brief Hub currently installed, or nullptr. */
    const LogHubService* hub();

    /** @brief Number of entries refused by a full hub queue since boot. */
    uint32_t droppedCount();

    /** @brief Format and enqueue one entry at `lvl`. */
    void logf(LogLevel lvl, const char* tag, const char* fmt, ...);

    void debug(const char* tag, const char* fmt, ...);
    void info(const char* tag, const char* fmt, ...);
    void warn(const char* tag, const char* fmt, ...);
    void error(const char* tag, const char* fmt, ...);
}

// Macros are provided by Core/ModuleLog.h to keep Module.h neutral.

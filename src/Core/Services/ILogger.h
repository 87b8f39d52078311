#pragma once
/**
 * @file ILogger.h
 * @brief Log entry type and the hub/sink service interfaces.
 */
#include <stdint.h>
#include <stddef.h>

/** @brief Log severity levels. */
enum class LogLevel : uint8_t { Debug, Info, Warn, Error };

/** @brief Tag buffer length, module tags are at most 8 visible chars. */
constexpr int LOG_TAG_MAX = 10;
/** @brief Message buffer length, longer messages are cut. */
constexpr int LOG_MSG_MAX = 110;

/** @brief Fixed-size log entry copied through the hub queue. */
struct LogEntry {
    uint32_t ts_ms;
    LogLevel lvl;
    char tag[LOG_TAG_MAX];
    char msg[LOG_MSG_MAX];
};

/** @brief Log sink interface (consumer side). */
struct LogSinkService {
    void (*write)(void* ctx, const LogEntry& e);
    void* ctx;
};

/** @brief Log hub interface (producer side, never blocks). */
struct LogHubService {
    bool (*enqueue)(void* ctx, const LogEntry& e);
    void* ctx;
};

/** @brief Registry interface for log sinks. */
struct LogSinkRegistryService {
    bool (*add)(void* ctx, LogSinkService sink);
    int (*count)(void* ctx);
    LogSinkService (*get)(void* ctx, int index);
    void* ctx;
};

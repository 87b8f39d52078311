#pragma once
/**
 * @file LogSinkRegistry.h
 * @brief Fixed table of log sinks fed by the dispatcher.
 */
#include "Core/Services/ILogger.h"

class LogSinkRegistry {
public:
    static constexpr int MaxSinks = 4;

    /** @brief Append a sink. Sinks without a write callback are refused. */
    bool add(LogSinkService sink);
    int count() const;
    /** @brief Sink at `idx`, or an empty sink when out of range. */
    LogSinkService get(int idx) const;

private:
    LogSinkService sinks_[MaxSinks]{};
    int n_ = 0;
};

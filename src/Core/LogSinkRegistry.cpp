/**
 * @file LogSinkRegistry.cpp
 * @brief Implementation file.
 */
#include "Core/LogSinkRegistry.h"

bool LogSinkRegistry::add(LogSinkService sink) {
    if (!sink.write || n_ >= MaxSinks) return false;
    sinks_[n_++] = sink;
    return true;
}

int LogSinkRegistry::count() const {
    return n_;
}

LogSinkService LogSinkRegistry::get(int idx) const {
    if (idx < 0 || idx >= n_) return LogSinkService{};
    return sinks_[idx];
}

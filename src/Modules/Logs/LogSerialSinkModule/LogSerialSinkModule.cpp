/**
 * @file LogSerialSinkModule.cpp
 * @brief Implementation file.
 */
#include "LogSerialSinkModule.h"
#include <Arduino.h>

static const char* lvlStr(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "D";
        case LogLevel::Info:  return "I";
        case LogLevel::Warn:  return "W";
        case LogLevel::Error: return "E";
    }
    return "?";
}

static const char* lvlColor(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "\x1b[90m";
        case LogLevel::Info:  return "\x1b[32m";
        case LogLevel::Warn:  return "\x1b[33m";
        case LogLevel::Error: return "\x1b[31m";
    }
    return "";
}

static void formatUptime(char* out, size_t outSize, uint32_t ms)
{
    const uint32_t s = ms / 1000;
    snprintf(out, outSize, "+%02lu:%02lu:%02lu.%03lu",
             (unsigned long)((s / 3600) % 100),
             (unsigned long)((s / 60) % 60),
             (unsigned long)(s % 60),
             (unsigned long)(ms % 1000));
}

void LogSerialSinkModule::write_(void* ctx, const LogEntry& e) {
    const SinkCtx* c = static_cast<const SinkCtx*>(ctx);

    char ts[32];
    bool utc = false;
    if (c && c->timeSvc && c->timeSvc->formatUtc) {
        char utcTs[24] = {0};
        if (c->timeSvc->formatUtc(c->timeSvc->ctx, utcTs, sizeof(utcTs))) {
            snprintf(ts, sizeof(ts), "%sZ", utcTs);
            utc = true;
        }
    }
    if (!utc) formatUptime(ts, sizeof(ts), e.ts_ms);

    Serial.printf("[%s][%s][%s] %s%s\x1b[0m\n",
                  ts,
                  lvlStr(e.lvl),
                  e.tag,
                  lvlColor(e.lvl),
                  e.msg);
}

void LogSerialSinkModule::init(ConfigStore&, ServiceRegistry& services) {
    auto sinks = services.get<LogSinkRegistryService>("logsinks");
    if (!sinks) return;

    LogSinkService sink{};
    sink.write = write_;
    sink.ctx = &ctx_;
    sinks->add(sinks->ctx, sink);
}

void LogSerialSinkModule::onConfigLoaded(ConfigStore&, ServiceRegistry& services) {
    /// The time module registers after the sink, pick it up once everything exists.
    ctx_.timeSvc = services.get<TimeService>("time");
}

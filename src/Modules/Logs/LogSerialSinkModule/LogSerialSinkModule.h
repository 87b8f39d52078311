#pragma once
/**
 * @file LogSerialSinkModule.h
 * @brief Serial log sink module.
 */
#include "Core/ModulePassive.h"
#include "Core/Services/ILogger.h"
#include "Core/Services/ITime.h"
#include "Core/ServiceRegistry.h"

/**
 * @brief Passive module that writes log entries to Serial.
 *
 * Lines are `[timestamp][L][tag] msg`. The timestamp is UTC once the time
 * source is synced and uptime before that.
 */
class LogSerialSinkModule : public ModulePassive {
public:
    const char* moduleId() const override { return "log.sink.serial"; }

    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;

private:
    struct SinkCtx {
        const TimeService* timeSvc = nullptr;
    };
    SinkCtx ctx_{};

    static void write_(void* ctx, const LogEntry& e);
};

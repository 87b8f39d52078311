#pragma once
/**
 * @file TimeModule.h
 * @brief Network-synchronized UTC time source.
 */
#include "Core/Module.h"
#include "Core/NvsKeys.h"
#include "Core/Services/Services.h"
#include "Core/EventBus/EventBus.h"
#include "Domain/WakeDefaults.h"
#include <time.h>

/** @brief Time sync configuration values. */
struct TimeConfig {
    char server1[40] = "pool.ntp.org";
    char server2[40] = "time.google.com";
    bool enabled = true;
    uint8_t maxAttempts = WakeDefaults::MaxTimeSyncAttempts;
};

/**
 * @brief Active module that keeps the system clock on UTC.
 *
 * The clock runs without timezone or DST so topic windows and `issued_at`
 * agree with any publisher. Until the first successful sync `epoch()`
 * returns 0 and `isSynced()` is false. Once synced, a failed periodic resync
 * leaves the running clock in service.
 */
class TimeModule : public Module {
public:
    const char* moduleId() const override { return "time"; }
    const char* taskName() const override { return "time"; }

    uint8_t dependencyCount() const override { return 2; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "eventbus";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

    uint16_t taskStackSize() const override { return 4096; }

private:
    TimeConfig cfgData{};
    EventBus* eventBus = nullptr;
    TimeService svc{};

    TimeSyncState state = TimeSyncState::WaitingNetwork;
    uint32_t stateTs = 0;

    volatile bool netReady_ = false;
    volatile uint32_t netReadyTs_ = 0;
    volatile bool resyncRequested_ = false;
    volatile bool hasSynced_ = false;
    uint8_t failedAttempts_ = 0;
    bool failurePosted_ = false;
    uint32_t retryDelayMs_ = Limits::Mqtt::Backoff::MinMs;

    ConfigVariable<char> server1Var {
        NVS_KEY(NvsKeys::Time::Server1),"server1","time",ConfigType::CharArray,
        (char*)cfgData.server1,ConfigPersistence::Persistent,sizeof(cfgData.server1)
    };
    ConfigVariable<char> server2Var {
        NVS_KEY(NvsKeys::Time::Server2),"server2","time",ConfigType::CharArray,
        (char*)cfgData.server2,ConfigPersistence::Persistent,sizeof(cfgData.server2)
    };
    ConfigVariable<bool> enabledVar {
        NVS_KEY(NvsKeys::Time::Enabled),"enabled","time",ConfigType::Bool,
        &cfgData.enabled,ConfigPersistence::Persistent,0
    };
    ConfigVariable<uint8_t> maxAttemptsVar {
        NVS_KEY(NvsKeys::Time::MaxAttempts),"max_attempts","time",ConfigType::UInt8,
        &cfgData.maxAttempts,ConfigPersistence::Persistent,0
    };

    void setState(TimeSyncState s);
    bool syncOnce_();
    void onSyncFailed_();

    static void onEventStatic(const Event& e, void* user);
    void onEvent(const Event& e);

    static TimeSyncState svcState(void* ctx);
    static bool svcIsSynced(void* ctx);
    static uint64_t svcEpoch(void* ctx);
    static void svcRequestResync(void* ctx);
    static bool svcFormatUtc(void* ctx, char* out, size_t len);
};

/**
 * @file TimeModule.cpp
 * @brief Implementation file.
 */
#include "TimeModule.h"
#include "Core/Backoff.h"
#include "Core/EventBus/EventPayloads.h"
#include <Arduino.h>
#include <string.h>
#define LOG_TAG "TimeModu"
#include "Core/ModuleLog.h"

static uint64_t systemEpoch()
{
    time_t now;
    time(&now);
    return (now > 0) ? (uint64_t)now : 0ULL;
}

void TimeModule::setState(TimeSyncState s) {
    if (s == state) return;
    state = s;
    stateTs = millis();
}

TimeSyncState TimeModule::svcState(void* ctx) {
    return static_cast<TimeModule*>(ctx)->state;
}

bool TimeModule::svcIsSynced(void* ctx) {
    TimeModule* self = static_cast<TimeModule*>(ctx);
    return self->hasSynced_ && systemEpoch() >= Limits::Time::MinValidEpoch;
}

uint64_t TimeModule::svcEpoch(void* ctx) {
    if (!svcIsSynced(ctx)) return 0;
    return systemEpoch();
}

void TimeModule::svcRequestResync(void* ctx) {
    static_cast<TimeModule*>(ctx)->resyncRequested_ = true;
}

bool TimeModule::svcFormatUtc(void* ctx, char* out, size_t len) {
    if (!out || len == 0) return false;
    const uint64_t now = svcEpoch(ctx);
    if (now == 0) return false;

    const time_t t = (time_t)now;
    struct tm utc;
    if (!gmtime_r(&t, &utc)) return false;
    const int n = snprintf(out, len, "%04d-%02d-%02d %02d:%02d:%02d",
                           utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                           utc.tm_hour, utc.tm_min, utc.tm_sec);
    return n > 0 && (size_t)n < len;
}

void TimeModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    cfg.registerVar(server1Var);
    cfg.registerVar(server2Var);
    cfg.registerVar(enabledVar);
    cfg.registerVar(maxAttemptsVar);

    auto* ebSvc = services.get<EventBusService>("eventbus");
    eventBus = ebSvc ? ebSvc->bus : nullptr;
    if (eventBus) {
        eventBus->subscribe(EventId::NetworkReady, &TimeModule::onEventStatic, this);
        eventBus->subscribe(EventId::NetworkLost, &TimeModule::onEventStatic, this);
        eventBus->subscribe(EventId::ConfigChanged, &TimeModule::onEventStatic, this);
    }

    svc = TimeService{
        svcState,
        svcIsSynced,
        svcEpoch,
        svcRequestResync,
        svcFormatUtc,
        this
    };
    services.add("time", &svc);

    LOGI("TimeService registered");
}

void TimeModule::onConfigLoaded(ConfigStore&, ServiceRegistry&) {
    if (cfgData.maxAttempts == 0) cfgData.maxAttempts = 1;
    setState(cfgData.enabled ? TimeSyncState::WaitingNetwork : TimeSyncState::Disabled);
}

bool TimeModule::syncOnce_() {
    LOGI("Syncing via NTP (%s, %s)", cfgData.server1, cfgData.server2);

    // UTC only: zero offset, zero DST.
    configTime(0, 0, cfgData.server1, cfgData.server2);

    struct tm timeinfo;
    if (!getLocalTime(&timeinfo, Limits::Time::SyncWaitMs)) return false;

    const uint64_t now = systemEpoch();
    if (now < Limits::Time::MinValidEpoch) {
        LOGW("Clock still unset after sync (epoch=%llu)", (unsigned long long)now);
        return false;
    }

    hasSynced_ = true;
    failedAttempts_ = 0;
    failurePosted_ = false;
    retryDelayMs_ = Limits::Mqtt::Backoff::MinMs;

    char buf[24];
    if (svcFormatUtc(this, buf, sizeof(buf))) LOGI("Synced ok: %sZ", buf);

    TimeSyncedPayload p{now};
    if (eventBus) eventBus->post(EventId::TimeSynced, &p, sizeof(p));
    return true;
}

void TimeModule::onSyncFailed_() {
    if (hasSynced_) {
        LOGW("Resync failed, keeping running clock, retry in %lu ms", (unsigned long)retryDelayMs_);
        return;
    }

    if (failedAttempts_ < 0xFF) ++failedAttempts_;
    LOGW("Sync failed (%u/%u) -> retry in %lu ms",
         (unsigned)failedAttempts_, (unsigned)cfgData.maxAttempts, (unsigned long)retryDelayMs_);

    if (failedAttempts_ >= cfgData.maxAttempts && !failurePosted_) {
        LOGE("Time source unavailable after %u attempts", (unsigned)failedAttempts_);
        TimeSyncFailedPayload p{failedAttempts_};
        if (eventBus && eventBus->post(EventId::TimeSyncFailed, &p, sizeof(p))) {
            failurePosted_ = true;
        }
    }
}

void TimeModule::loop() {
    if (!cfgData.enabled) {
        setState(TimeSyncState::Disabled);
        vTaskDelay(pdMS_TO_TICKS(2000));
        return;
    }

    switch (state) {

    case TimeSyncState::Disabled:
        setState(TimeSyncState::WaitingNetwork);
        break;

    case TimeSyncState::WaitingNetwork:
        if (netReady_ && (millis() - netReadyTs_ >= Limits::Time::NetWarmupMs)) {
            LOGI("Network warmup done -> start syncing");
            setState(TimeSyncState::Syncing);
        }
        break;

    case TimeSyncState::Syncing:
        resyncRequested_ = false;
        if (syncOnce_()) {
            setState(TimeSyncState::Synced);
        } else {
            onSyncFailed_();
            setState(TimeSyncState::ErrorWait);
        }
        break;

    case TimeSyncState::ErrorWait:
        if (!netReady_) {
            setState(TimeSyncState::WaitingNetwork);
            break;
        }
        if (millis() - stateTs >= retryDelayMs_) {
            retryDelayMs_ = Backoff::nextDelayMs(retryDelayMs_);
            setState(TimeSyncState::Syncing);
        }
        break;

    case TimeSyncState::Synced:
        if (!netReady_) break;
        if (resyncRequested_) {
            LOGD("Resync requested");
            setState(TimeSyncState::Syncing);
        } else if (millis() - stateTs > Limits::Time::ResyncPeriodMs) {
            setState(TimeSyncState::Syncing);
        }
        break;
    }

    vTaskDelay(pdMS_TO_TICKS(Limits::Time::LoopDelayMs));
}

void TimeModule::onEventStatic(const Event& e, void* user)
{
    static_cast<TimeModule*>(user)->onEvent(e);
}

void TimeModule::onEvent(const Event& e)
{
    switch (e.id) {
    case EventId::NetworkReady:
        if (netReady_) return;
        netReady_ = true;
        netReadyTs_ = millis();
        LOGD("Network ready -> warmup");
        return;

    case EventId::NetworkLost:
        netReady_ = false;
        LOGD("Network lost -> wait");
        return;

    case EventId::ConfigChanged: {
        if (!e.payload || e.len < sizeof(ConfigChangedPayload)) return;
        const ConfigChangedPayload* p = (const ConfigChangedPayload*)e.payload;
        if (strcmp(p->nvsKey, server1Var.nvsKey) == 0 ||
            strcmp(p->nvsKey, server2Var.nvsKey) == 0) {
            resyncRequested_ = true;
        }
        return;
    }

    default:
        return;
    }
}

/**
 * @file WakeModule.cpp
 * @brief Implementation file.
 */
#include "WakeModule.h"
#include "Core/DeviceStateMachine.h"
#include "Core/SystemStats.h"
#include <Arduino.h>
#include <WiFi.h>
#include <WiFiUdp.h>
#include <lwip/ip_addr.h>
#include <ping/ping_sock.h>
#include <string.h>
#define LOG_TAG "WakeModu"
#include "Core/ModuleLog.h"

namespace {

struct ProbeCtx {
    SemaphoreHandle_t done;
    volatile bool replied;
};

void onPingSuccess(esp_ping_handle_t, void* args)
{
    static_cast<ProbeCtx*>(args)->replied = true;
}

void onPingEnd(esp_ping_handle_t, void* args)
{
    xSemaphoreGive(static_cast<ProbeCtx*>(args)->done);
}

}  // namespace

bool WakeModule::svcSendMagicPacket(void* ctx) {
    return static_cast<WakeModule*>(ctx)->sendMagicPacket_(WakeSource::Command, 0xFF);
}

bool WakeModule::svcProbeTarget(void* ctx, bool* online) {
    if (!online) return false;
    bool result = false;
    if (!static_cast<WakeModule*>(ctx)->probe_(result)) return false;
    *online = result;
    return true;
}

bool WakeModule::svcCollectUsage(void* ctx, WakeUsage* out) {
    WakeModule* self = static_cast<WakeModule*>(ctx);
    if (!out) return false;

    SystemStatsSnapshot snap{};
    SystemStats::collect(snap);

    out->uptimeS = snap.uptimeMs / 1000UL;
    out->heapFree = snap.heap.freeBytes;
    out->heapTotal = snap.heap.totalBytes;
    out->flashUsed = snap.flash.sketchBytes;
    out->flashTotal = snap.flash.sketchCapacity;
    out->cpuMhz = snap.cpuMhz;
    out->cores = snap.cores;
    out->rssi = (self->wifiSvc && self->wifiSvc->rssi) ? self->wifiSvc->rssi(self->wifiSvc->ctx) : 0;
    return true;
}

bool WakeModule::svcScheduleJson(void* ctx, char* out, size_t outLen) {
    WakeModule* self = static_cast<WakeModule*>(ctx);
    if (xSemaphoreTake(self->schedMutex_, pdMS_TO_TICKS(1000)) != pdTRUE) return false;
    const bool ok = self->schedule_.toJson(out, outLen);
    xSemaphoreGive(self->schedMutex_);
    return ok;
}

bool WakeModule::svcSetSchedule(void* ctx, const char* json, ErrorCode* err, uint8_t* badSlot, uint8_t* saved) {
    WakeModule* self = static_cast<WakeModule*>(ctx);
    ErrorCode e = ErrorCode::Failed;
    uint8_t bad = 0;
    uint8_t count = 0;

    if (xSemaphoreTake(self->schedMutex_, pdMS_TO_TICKS(1000)) != pdTRUE) {
        if (err) *err = ErrorCode::NotReady;
        return false;
    }

    bool ok = self->schedule_.applyJson(json, e, bad, count);
    if (ok) {
        char blob[Limits::Wake::ScheduleBlob];
        ok = self->schedule_.serializeBlob(blob, sizeof(blob)) &&
             self->cfgStore && self->cfgStore->set(self->scheduleVar, blob);
        if (!ok) e = ErrorCode::SetFailed;
    }
    xSemaphoreGive(self->schedMutex_);

    if (ok) {
        LOGI("Schedule replaced, %u slot(s)", (unsigned)count);
    } else {
        LOGW("Schedule rejected: %s (entry %u)", errorCodeStr(e), (unsigned)bad);
    }
    if (err) *err = e;
    if (badSlot) *badSlot = bad;
    if (saved) *saved = count;
    return ok;
}

void WakeModule::onEventStatic(const Event& e, void* user)
{
    WakeModule* self = static_cast<WakeModule*>(user);
    if (e.id != EventId::ConfigChanged || !e.payload || e.len < sizeof(ConfigChangedPayload)) return;

    const ConfigChangedPayload* p = static_cast<const ConfigChangedPayload*>(e.payload);
    if (strcmp(p->nvsKey, self->scheduleVar.nvsKey) == 0) {
        self->scheduleReload_ = true;
    }
}

bool WakeModule::sendMagicPacket_(WakeSource source, uint8_t slot) {
    uint8_t mac[MagicPacket::MacLen];
    uint8_t frame[MagicPacket::Length];
    bool ok = false;

    if (!MagicPacket::parseMac(cfgData.mac, mac)) {
        LOGE("Invalid target MAC '%s'", cfgData.mac);
    } else if (!MagicPacket::build(mac, frame, sizeof(frame))) {
        LOGE("Magic packet build failed");
    } else if (!wifiSvc || !wifiSvc->isConnected || !wifiSvc->isConnected(wifiSvc->ctx)) {
        LOGW("Magic packet not sent: WiFi down");
    } else {
        // An empty bcast_ip means the directed broadcast of the station subnet.
        char dstStr[sizeof(cfgData.broadcastIp)];
        strncpy(dstStr, cfgData.broadcastIp, sizeof(dstStr) - 1);
        dstStr[sizeof(dstStr) - 1] = '\0';
        if (dstStr[0] == '\0' &&
            (!wifiSvc->subnetBroadcast || !wifiSvc->subnetBroadcast(wifiSvc->ctx, dstStr, sizeof(dstStr)))) {
            LOGW("Subnet broadcast unavailable");
        }

        IPAddress dst;
        if (!dst.fromString(dstStr)) {
            LOGE("Invalid broadcast address '%s'", dstStr);
        } else {
            WiFiUDP udp;
            ok = udp.beginPacket(dst, (uint16_t)cfgData.port) == 1 &&
                 udp.write(frame, sizeof(frame)) == sizeof(frame) &&
                 udp.endPacket() == 1;
            if (ok) {
                LOGI("Magic packet sent to %s:%ld", dstStr, (long)cfgData.port);
            } else {
                LOGW("Magic packet UDP send failed");
            }
        }
    }

    WakeSentPayload p{source, slot, (uint8_t)(ok ? 1 : 0)};
    if (eventBus) eventBus->post(EventId::WakeSent, &p, sizeof(p));
    return ok;
}

bool WakeModule::probe_(bool& online) {
    online = false;
    if (cfgData.hostIp[0] == '\0') {
        LOGW("Probe skipped: host_ip not set");
        return false;
    }

    ip_addr_t target;
    memset(&target, 0, sizeof(target));
    if (!ipaddr_aton(cfgData.hostIp, &target)) {
        LOGW("Probe skipped: invalid host_ip '%s'", cfgData.hostIp);
        return false;
    }

    ProbeCtx ctx{xSemaphoreCreateBinary(), false};
    if (!ctx.done) return false;

    esp_ping_config_t pc = ESP_PING_DEFAULT_CONFIG();
    pc.target_addr = target;
    pc.count = 1;
    pc.timeout_ms = Limits::Wake::ProbeTimeoutMs;

    esp_ping_callbacks_t cbs{};
    cbs.cb_args = &ctx;
    cbs.on_ping_success = onPingSuccess;
    cbs.on_ping_end = onPingEnd;

    esp_ping_handle_t handle = nullptr;
    if (esp_ping_new_session(&pc, &cbs, &handle) != ESP_OK) {
        vSemaphoreDelete(ctx.done);
        LOGW("Probe session create failed");
        return false;
    }

    esp_ping_start(handle);
    const bool ended = xSemaphoreTake(ctx.done, pdMS_TO_TICKS(Limits::Wake::ProbeTimeoutMs + 1000U)) == pdTRUE;
    esp_ping_stop(handle);
    esp_ping_delete_session(handle);
    vSemaphoreDelete(ctx.done);

    online = ended && ctx.replied;
    LOGD("Probe %s -> %s", cfgData.hostIp, online ? "ONLINE" : "OFFLINE");
    return true;
}

void WakeModule::reloadSchedule_() {
    scheduleReload_ = false;
    if (xSemaphoreTake(schedMutex_, pdMS_TO_TICKS(1000)) != pdTRUE) {
        scheduleReload_ = true;
        return;
    }

    // Our own writes echo back through ConfigChanged: keep runtime state then.
    char current[Limits::Wake::ScheduleBlob];
    if (!schedule_.serializeBlob(current, sizeof(current)) ||
        strcmp(current, cfgData.scheduleBlob) != 0) {
        schedule_.parseBlob(cfgData.scheduleBlob);
        LOGI("Schedule loaded, %u slot(s)", (unsigned)schedule_.usedCount());
    }
    xSemaphoreGive(schedMutex_);
}

void WakeModule::checkSchedule_() {
    if (!timeSvc || !timeSvc->isSynced || !timeSvc->isSynced(timeSvc->ctx)) return;
    const uint64_t now = timeSvc->epoch(timeSvc->ctx);
    if (now == 0) return;

    if (xSemaphoreTake(schedMutex_, pdMS_TO_TICKS(100)) != pdTRUE) return;
    const uint8_t mask = schedule_.due(now);
    xSemaphoreGive(schedMutex_);

    for (uint8_t i = 0; i < WakeSchedule::MaxSlots; ++i) {
        if ((mask & (uint8_t)(1U << i)) == 0) continue;
        LOGI("Scheduled wake, slot %u", (unsigned)i);
        sendMagicPacket_(WakeSource::Schedule, i);
        if (slot_) slot_->requestPulse(DeviceStateMachine::flashCountFor(CommandKind::Wake));
    }
}

void WakeModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    cfgStore = &cfg;
    cfg.registerVar(macVar);
    cfg.registerVar(broadcastVar);
    cfg.registerVar(portVar);
    cfg.registerVar(hostVar);
    cfg.registerVar(scheduleVar);

    schedMutex_ = xSemaphoreCreateMutex();

    auto ebSvc = services.get<EventBusService>("eventbus");
    eventBus = ebSvc ? ebSvc->bus : nullptr;
    if (eventBus) {
        eventBus->subscribe(EventId::ConfigChanged, &WakeModule::onEventStatic, this);
    }

    timeSvc = services.get<TimeService>("time");
    wifiSvc = services.get<WifiService>("wifi");
    auto ds = services.get<DeviceStateService>("devstate");
    slot_ = ds ? ds->slot : nullptr;

    svc = WakeService{
        svcSendMagicPacket,
        svcProbeTarget,
        svcCollectUsage,
        svcScheduleJson,
        svcSetSchedule,
        this
    };
    services.add("wake", &svc);

    LOGI("WakeService registered");
}

void WakeModule::onConfigLoaded(ConfigStore&, ServiceRegistry&) {
    uint8_t mac[MagicPacket::MacLen];
    if (!MagicPacket::parseMac(cfgData.mac, mac)) {
        LOGW("wake.mac not configured, WAKE will fail");
    }
    if (cfgData.port <= 0 || cfgData.port > 65535) {
        LOGW("wake.port %ld out of range, using %u", (long)cfgData.port, (unsigned)WakeDefaults::WolPort);
        cfgData.port = WakeDefaults::WolPort;
    }
    scheduleReload_ = true;
}

void WakeModule::loop() {
    if (!schedMutex_) {
        vTaskDelay(pdMS_TO_TICKS(5000));
        return;
    }

    if (scheduleReload_) reloadSchedule_();

    const uint32_t now = millis();
    if ((uint32_t)(now - lastCheckMs_) >= Limits::Wake::SchedulerCheckMs) {
        lastCheckMs_ = now;
        checkSchedule_();
    }

    vTaskDelay(pdMS_TO_TICKS(Limits::Wake::LoopDelayMs));
}

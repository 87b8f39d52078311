/**
 * @file WifiModule.cpp
 * @brief Implementation file.
 */
#include "WifiModule.h"
#define LOG_TAG "WifiModu"
#include "Core/ModuleLog.h"
#include "Core/Backoff.h"
#include "Core/EventBus/EventPayloads.h"
#include <esp_system.h>
#include <string.h>

static bool formatIp_(const IPAddress& ip, char* out, size_t len)
{
    const int n = snprintf(out, len, "%u.%u.%u.%u", ip[0], ip[1], ip[2], ip[3]);
    return n > 0 && (size_t)n < len;
}

WifiState WifiModule::svcState(void* ctx) {
    return static_cast<WifiModule*>(ctx)->state;
}

bool WifiModule::svcIsConnected(void* ctx) {
    return static_cast<WifiModule*>(ctx)->state == WifiState::Connected && WiFi.isConnected();
}

bool WifiModule::svcGetIP(void*, char* out, size_t len) {
    if (!out || len == 0) return false;
    out[0] = '\0';
    if (!WiFi.isConnected()) return false;
    return formatIp_(WiFi.localIP(), out, len);
}

bool WifiModule::svcSubnetBroadcast(void*, char* out, size_t len) {
    if (!out || len == 0) return false;
    out[0] = '\0';
    if (!WiFi.isConnected()) return false;

    const IPAddress ip = WiFi.localIP();
    const IPAddress mask = WiFi.subnetMask();
    IPAddress bcast;
    for (uint8_t i = 0; i < 4; ++i) {
        bcast[i] = (uint8_t)(ip[i] | (uint8_t)~mask[i]);
    }
    return formatIp_(bcast, out, len);
}

int8_t WifiModule::svcRssi(void*) {
    if (!WiFi.isConnected()) return 0;
    return (int8_t)WiFi.RSSI();
}

uint32_t WifiModule::svcDropCount(void* ctx) {
    return static_cast<WifiModule*>(ctx)->dropCount_;
}

bool WifiModule::svcRequestReconnect(void* ctx)
{
    WifiModule* self = static_cast<WifiModule*>(ctx);
    if (!self) return false;
    self->reconnectRequested = true;
    return true;
}

void WifiModule::onEventStatic(const Event& e, void* user)
{
    WifiModule* self = static_cast<WifiModule*>(user);
    if (!self || e.id != EventId::ConfigChanged || !e.payload) return;

    const ConfigChangedPayload* p = static_cast<const ConfigChangedPayload*>(e.payload);
    if (strncmp(p->nvsKey, "wifi_", 5) == 0) {
        self->reconnectRequested = true;
    }
}

void WifiModule::setState(WifiState s) {
    if (s == state) return;
    const WifiState prev = state;
    state = s;
    stateTs = millis();

    if (prev == WifiState::Connected) {
        ++dropCount_;
        if (readySent) {
            readySent = false;
            if (eventBus) eventBus->post(EventId::NetworkLost);
        }
    }
}

void WifiModule::startConnect() {
    if (cfgData.ssid[0] == '\0') {
        const uint32_t now = millis();
        if ((now - lastEmptySsidLogMs) >= Limits::Wifi::EmptySsidLogMs) {
            lastEmptySsidLogMs = now;
            LOGW("SSID empty, relay stays offline");
        }
        return;
    }

    LOGI("Connecting to '%s'", cfgData.ssid);

    WiFi.disconnect(false, false);
    delay(50);

    WiFi.mode(WIFI_MODE_STA);
    // Modem sleep delays broadcast frames and adds MQTT latency.
    WiFi.setSleep(false);
    WiFi.setAutoReconnect(false);
    WiFi.begin(cfgData.ssid, cfgData.pass);

    setState(WifiState::Connecting);
}

void WifiModule::enterErrorWait_(const char* why)
{
    WiFi.disconnect(false, false);
    retryDelayMs_ = Backoff::jitterMs(Backoff::nextDelayMs(retryDelayMs_),
                                      Limits::Mqtt::Backoff::JitterPct, esp_random());
    LOGW("%s, retry in %lums", why, (unsigned long)retryDelayMs_);
    setState(WifiState::ErrorWait);
}

void WifiModule::postReady_()
{
    IPAddress ip = WiFi.localIP();
    if (ip[0] == 0 && ip[1] == 0 && ip[2] == 0 && ip[3] == 0) return;

    NetworkReadyPayload p{};
    IPAddress gw = WiFi.gatewayIP();
    IPAddress mask = WiFi.subnetMask();
    for (uint8_t i = 0; i < 4; ++i) {
        p.ip[i] = ip[i];
        p.gw[i] = gw[i];
        p.mask[i] = mask[i];
    }

    if (eventBus && !eventBus->post(EventId::NetworkReady, &p, sizeof(p))) {
        LOGW("NetworkReady post failed, retrying");
        return;
    }
    readySent = true;
}

void WifiModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    cfg.registerVar(enabledVar);
    cfg.registerVar(ssidVar);
    cfg.registerVar(passVar);

    auto ebSvc = services.get<EventBusService>("eventbus");
    eventBus = ebSvc ? ebSvc->bus : nullptr;
    if (eventBus) {
        eventBus->subscribe(EventId::ConfigChanged, &WifiModule::onEventStatic, this);
    }

    svc = WifiService{
        WifiModule::svcState,
        WifiModule::svcIsConnected,
        WifiModule::svcGetIP,
        WifiModule::svcSubnetBroadcast,
        WifiModule::svcRssi,
        WifiModule::svcDropCount,
        WifiModule::svcRequestReconnect,
        this
    };
    services.add("wifi", &svc);

    // Credentials live in ConfigStore only, not in the driver's own NVS copy.
    WiFi.persistent(false);
}

void WifiModule::onConfigLoaded(ConfigStore&, ServiceRegistry&) {
    setState(cfgData.enabled ? WifiState::Idle : WifiState::Disabled);
    if (!cfgData.enabled) LOGW("WiFi disabled by config");
}

void WifiModule::loop() {
    if (reconnectRequested) {
        reconnectRequested = false;
        LOGI("Reconnect requested");
        WiFi.disconnect(false, false);
        retryDelayMs_ = 0;
        setState(cfgData.enabled ? WifiState::Idle : WifiState::Disabled);
    }

    switch (state) {

    case WifiState::Disabled:
        vTaskDelay(pdMS_TO_TICKS(Limits::Wifi::DisabledPollMs));
        break;

    case WifiState::Idle:
        startConnect();
        vTaskDelay(pdMS_TO_TICKS(Limits::Wifi::LinkPollMs));
        break;

    case WifiState::Connecting:
        if (WiFi.isConnected()) {
            IPAddress ip = WiFi.localIP();
            LOGI("Connected IP=%u.%u.%u.%u RSSI=%d",
                 ip[0], ip[1], ip[2], ip[3], WiFi.RSSI());
            retryDelayMs_ = 0;
            setState(WifiState::Connected);
        } else if (millis() - stateTs > Limits::Wifi::ConnectTimeoutMs) {
            enterErrorWait_("Connect timeout");
        }
        vTaskDelay(pdMS_TO_TICKS(Limits::Wifi::ConnectPollMs));
        break;

    case WifiState::Connected:
        if (!WiFi.isConnected()) {
            enterErrorWait_("Link lost");
        } else if (!readySent) {
            postReady_();
        }
        vTaskDelay(pdMS_TO_TICKS(Limits::Wifi::LinkPollMs));
        break;

    case WifiState::ErrorWait:
        if (millis() - stateTs > retryDelayMs_) {
            setState(WifiState::Idle);
        }
        vTaskDelay(pdMS_TO_TICKS(Limits::Wifi::ConnectPollMs));
        break;
    }
}

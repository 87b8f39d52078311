#pragma once
/**
 * @file WifiModule.h
 * @brief WiFi station connectivity module.
 */
#include "Core/Module.h"
#include "Core/NvsKeys.h"
#include "Core/Services/Services.h"
#include "Core/EventBus/EventBus.h"
#include <WiFi.h>

/** @brief WiFi configuration values. */
struct WifiConfig {
    bool enabled = true;
    char ssid[32] = "";
    char pass[64] = "";
};

/**
 * @brief Active module that keeps the station connected.
 *
 * Posts NetworkReady once an address is assigned and NetworkLost when the
 * link drops. Other modules gate on those events, never on WiFi directly.
 * Failed attempts wait on the Backoff ladder, reset by a successful connect.
 */
class WifiModule : public Module {
public:
    const char* moduleId() const override { return "wifi"; }
    const char* taskName() const override { return "wifi"; }
    BaseType_t taskCore() const override { return 0; }

    uint8_t dependencyCount() const override { return 2; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "eventbus";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

private:
    WifiConfig cfgData;
    WifiState state = WifiState::Idle;
    uint32_t stateTs = 0;
    EventBus* eventBus = nullptr;
    bool readySent = false;
    volatile bool reconnectRequested = false;
    uint32_t lastEmptySsidLogMs = 0;
    uint32_t retryDelayMs_ = 0;
    uint32_t dropCount_ = 0;
    WifiService svc{};

    ConfigVariable<bool> enabledVar {
        NVS_KEY(NvsKeys::Wifi::Enabled),"enabled","wifi",
        ConfigType::Bool,
        &cfgData.enabled,
        ConfigPersistence::Persistent,
        0
    };

    ConfigVariable<char> ssidVar {
        NVS_KEY(NvsKeys::Wifi::Ssid),"ssid","wifi",
        ConfigType::CharArray,
        cfgData.ssid,
        ConfigPersistence::Persistent,
        sizeof(cfgData.ssid)
    };

    ConfigVariable<char> passVar {
        NVS_KEY(NvsKeys::Wifi::Pass),"pass","wifi",
        ConfigType::CharArray,
        cfgData.pass,
        ConfigPersistence::Persistent,
        sizeof(cfgData.pass)
    };

    static WifiState svcState(void* ctx);
    static bool svcIsConnected(void* ctx);
    static bool svcGetIP(void* ctx, char* out, size_t len);
    static bool svcSubnetBroadcast(void* ctx, char* out, size_t len);
    static int8_t svcRssi(void* ctx);
    static uint32_t svcDropCount(void* ctx);
    static bool svcRequestReconnect(void* ctx);

    static void onEventStatic(const Event& e, void* user);

    void setState(WifiState s);
    void startConnect();
    void enterErrorWait_(const char* why);
    void postReady_();
};

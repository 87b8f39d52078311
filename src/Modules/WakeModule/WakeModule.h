#pragma once
/**
 * @file WakeModule.h
 * @brief Wake-on-LAN collaborators: magic packet, reachability probe,
 * usage snapshot and the scheduled auto-wake task.
 */
#include "Core/Module.h"
#include "Core/NvsKeys.h"
#include "Core/Services/Services.h"
#include "Core/EventBus/EventBus.h"
#include "Core/EventBus/EventPayloads.h"
#include "Domain/WakeDefaults.h"
#include "MagicPacket.h"
#include "WakeSchedule.h"
#include <freertos/semphr.h>

/** @brief Wake target configuration values. */
struct WakeConfig {
    char mac[18] = "";
    char broadcastIp[16] = "255.255.255.255";
    int32_t port = WakeDefaults::WolPort;
    char hostIp[16] = "";
    char scheduleBlob[Limits::Wake::ScheduleBlob] = "";
};

class WakeModule : public Module {
public:
    const char* moduleId() const override { return "wake"; }
    const char* taskName() const override { return "wake"; }
    uint16_t taskStackSize() const override { return 4096; }

    uint8_t dependencyCount() const override { return 5; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "eventbus";
        if (i == 2) return "time";
        if (i == 3) return "wifi";
        if (i == 4) return "mqtt";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

private:
    WakeConfig cfgData{};
    ConfigStore* cfgStore = nullptr;
    EventBus* eventBus = nullptr;
    const TimeService* timeSvc = nullptr;
    const WifiService* wifiSvc = nullptr;
    DeviceStateSlot* slot_ = nullptr;
    WakeService svc{};

    // Guards schedule_ between the protocol task (get/set) and the wake task.
    SemaphoreHandle_t schedMutex_ = nullptr;
    WakeSchedule schedule_{};
    volatile bool scheduleReload_ = false;
    uint32_t lastCheckMs_ = 0;

    ConfigVariable<char> macVar {
        NVS_KEY(NvsKeys::Wake::Mac),"mac","wake",ConfigType::CharArray,
        cfgData.mac,ConfigPersistence::Persistent,sizeof(cfgData.mac)
    };
    ConfigVariable<char> broadcastVar {
        NVS_KEY(NvsKeys::Wake::BroadcastIp),"bcast_ip","wake",ConfigType::CharArray,
        cfgData.broadcastIp,ConfigPersistence::Persistent,sizeof(cfgData.broadcastIp)
    };
    ConfigVariable<int32_t> portVar {
        NVS_KEY(NvsKeys::Wake::Port),"port","wake",ConfigType::Int32,
        &cfgData.port,ConfigPersistence::Persistent,0,1,65535
    };
    ConfigVariable<char> hostVar {
        NVS_KEY(NvsKeys::Wake::HostIp),"host_ip","wake",ConfigType::CharArray,
        cfgData.hostIp,ConfigPersistence::Persistent,sizeof(cfgData.hostIp)
    };
    ConfigVariable<char> scheduleVar {
        NVS_KEY(NvsKeys::Wake::ScheduleBlob),"sched","wake",ConfigType::CharArray,
        cfgData.scheduleBlob,ConfigPersistence::Persistent,sizeof(cfgData.scheduleBlob)
    };

    static bool svcSendMagicPacket(void* ctx);
    static bool svcProbeTarget(void* ctx, bool* online);
    static bool svcCollectUsage(void* ctx, WakeUsage* out);
    static bool svcScheduleJson(void* ctx, char* out, size_t outLen);
    static bool svcSetSchedule(void* ctx, const char* json, ErrorCode* err, uint8_t* badSlot, uint8_t* saved);

    static void onEventStatic(const Event& e, void* user);

    bool sendMagicPacket_(WakeSource source, uint8_t slot);
    bool probe_(bool& online);
    void reloadSchedule_();
    void checkSchedule_();
};

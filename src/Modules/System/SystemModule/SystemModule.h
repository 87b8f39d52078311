#pragma once
/**
 * @file SystemModule.h
 * @brief Supervision: restart service, maintenance reboot, liveness watchdog
 * and the serial provisioning console.
 */
#include "Core/Module.h"
#include "Core/NvsKeys.h"
#include "Core/Services/Services.h"
#include "Core/SystemLimits.h"
#include "Domain/WakeDefaults.h"

/** @brief Supervision configuration values. */
struct SystemConfig {
    int32_t maintenanceSec = (int32_t)WakeDefaults::MaintenanceRebootSec;
    int32_t errorDwellMs = (int32_t)WakeDefaults::ErrorDwellMs;
};

/**
 * @brief Active module on core 0.
 *
 * Console lines (115200 baud, newline terminated):
 * - `cfg list`
 * - `cfg get <module>`
 * - `cfg set {"module":{"key":value}}`
 * - `reboot`
 * - `factory_reset`
 */
class SystemModule : public Module {
public:
    const char* moduleId() const override { return "system"; }
    const char* taskName() const override { return "system"; }
    BaseType_t taskCore() const override { return 0; }
    UBaseType_t taskPriority() const override { return 2; }
    uint16_t taskStackSize() const override { return Limits::System::TaskStackSize; }

    uint8_t dependencyCount() const override { return 2; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "config";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

private:
    SystemConfig cfgData{};
    const ConfigStoreService* cfgSvc = nullptr;
    // Link and time register after this module; resolved on first use.
    ServiceRegistry* services_ = nullptr;
    SystemService svc{};

    volatile uint32_t lastBeatMs_ = 0;
    volatile bool beatSeen_ = false;
    bool restarting_ = false;

    char line_[Limits::System::ConsoleLine] = {0};
    size_t lineLen_ = 0;
    bool lineOverflow_ = false;

    ConfigVariable<int32_t> maintenanceVar {
        NVS_KEY(NvsKeys::System::MaintenanceSec),"maint_s","system",ConfigType::Int32,
        &cfgData.maintenanceSec,ConfigPersistence::Persistent,0,0,30 * 86400
    };
    ConfigVariable<int32_t> errorDwellVar {
        NVS_KEY(NvsKeys::System::ErrorDwellMs),"err_dwell_ms","system",ConfigType::Int32,
        &cfgData.errorDwellMs,ConfigPersistence::Persistent,0,1000,600000
    };

    static void svcRestart(void* ctx, const char* reason);
    static void svcHeartbeat(void* ctx);
    static uint32_t svcUptimeSec(void* ctx);
    static uint32_t svcErrorDwellMs(void* ctx);

    void restart_(const char* reason);
    void superviseLiveness_(uint32_t nowMs);
    void pollConsole_();
    void handleLine_(char* line);
    void cmdLinkStatus_();
    void cmdCfgList_();
    void cmdCfgGet_(const char* module);
    void cmdCfgSet_(const char* json);
    void cmdFactoryReset_();
};

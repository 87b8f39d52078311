#pragma once
/**
 * @file IndicatorModule.h
 * @brief Status LED driver fed by the shared device state slot.
 */
#include "Core/Module.h"
#include "Core/NvsKeys.h"
#include "Core/Services/Services.h"
#include "Core/SystemLimits.h"
#include "Board/BoardPinMap.h"
#include "IndicatorPattern.h"

/** @brief Indicator configuration values. */
struct IndicatorConfig {
    bool enabled = true;
    uint8_t pin = Board::Led::Status;
    bool activeHigh = Board::Led::ActiveHigh;
};

/**
 * @brief Active module on core 0, read-only consumer of `DeviceStateSlot`.
 */
class IndicatorModule : public Module {
public:
    const char* moduleId() const override { return "indicator"; }
    const char* taskName() const override { return "indicator"; }
    BaseType_t taskCore() const override { return 0; }
    uint16_t taskStackSize() const override { return Limits::Indicator::TaskStackSize; }

    uint8_t dependencyCount() const override { return 2; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "mqtt";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

private:
    IndicatorConfig cfgData{};
    const DeviceStateSlot* slot_ = nullptr;
    IndicatorPattern pattern_{};
    bool level_ = false;
    bool pinReady_ = false;

    ConfigVariable<bool> enabledVar {
        NVS_KEY(NvsKeys::Indicator::Enabled),"enabled","indicator",ConfigType::Bool,
        &cfgData.enabled,ConfigPersistence::Persistent,0
    };
    ConfigVariable<uint8_t> pinVar {
        NVS_KEY(NvsKeys::Indicator::Pin),"pin","indicator",ConfigType::UInt8,
        &cfgData.pin,ConfigPersistence::Persistent,0
    };
    ConfigVariable<bool> activeHighVar {
        NVS_KEY(NvsKeys::Indicator::ActiveHigh),"active_high","indicator",ConfigType::Bool,
        &cfgData.activeHigh,ConfigPersistence::Persistent,0
    };

    void write_(bool lit);
};

/**
 * @file IndicatorModule.cpp
 * @brief Implementation file.
 */
#include "IndicatorModule.h"
#include "Core/DeviceStateMachine.h"
#include <Arduino.h>
#define LOG_TAG "Indicatr"
#include "Core/ModuleLog.h"

void IndicatorModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    cfg.registerVar(enabledVar);
    cfg.registerVar(pinVar);
    cfg.registerVar(activeHighVar);

    auto ds = services.get<DeviceStateService>("devstate");
    slot_ = ds ? ds->slot : nullptr;
    if (!slot_) LOGW("devstate service missing, LED stays off");
}

void IndicatorModule::onConfigLoaded(ConfigStore&, ServiceRegistry&) {
    if (!cfgData.enabled) {
        LOGI("Indicator disabled");
        return;
    }
    pinMode(cfgData.pin, OUTPUT);
    pinReady_ = true;
    level_ = true;
    write_(false);
    LOGI("Indicator on GPIO%u (active %s)", (unsigned)cfgData.pin, cfgData.activeHigh ? "high" : "low");
}

void IndicatorModule::write_(bool lit) {
    if (!pinReady_ || lit == level_) return;
    level_ = lit;
    digitalWrite(cfgData.pin, (lit == cfgData.activeHigh) ? HIGH : LOW);
}

void IndicatorModule::loop() {
    if (!pinReady_ || !slot_) {
        vTaskDelay(pdMS_TO_TICKS(1000));
        return;
    }

    write_(pattern_.update(slot_->load(), millis()));
    vTaskDelay(pdMS_TO_TICKS(Limits::Indicator::TickMs));
}

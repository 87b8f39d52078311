/**
 * @file SystemModule.cpp
 * @brief Implementation file.
 */
#include "SystemModule.h"
#include "Core/SystemStats.h"
#include <Arduino.h>
#include <WiFi.h>
#include <esp_system.h>
#include <esp_wifi.h>
#include <string.h>
#define LOG_TAG "SysModul"
#include "Core/ModuleLog.h"

static bool wipeWifiPersistent_(esp_err_t* outErr)
{
    // The driver must be up to restore its NVS defaults.
    WiFi.mode(WIFI_MODE_STA);
    delay(20);
    WiFi.disconnect(false, true);

    esp_err_t err = esp_wifi_restore();
    if (err == ESP_ERR_WIFI_NOT_INIT) {
        WiFi.mode(WIFI_MODE_STA);
        delay(20);
        err = esp_wifi_restore();
    }

    if (outErr) *outErr = err;
    return err == ESP_OK;
}

static char* trimInPlace_(char* s)
{
    while (*s == ' ' || *s == '\t') ++s;
    size_t n = strlen(s);
    while (n > 0 && (s[n - 1] == ' ' || s[n - 1] == '\t' || s[n - 1] == '\r')) s[--n] = '\0';
    return s;
}

void SystemModule::svcRestart(void* ctx, const char* reason) {
    static_cast<SystemModule*>(ctx)->restart_(reason);
}

void SystemModule::svcHeartbeat(void* ctx) {
    SystemModule* self = static_cast<SystemModule*>(ctx);
    self->lastBeatMs_ = millis();
    self->beatSeen_ = true;
}

uint32_t SystemModule::svcUptimeSec(void*) {
    return (uint32_t)(millis() / 1000UL);
}

uint32_t SystemModule::svcErrorDwellMs(void* ctx) {
    return (uint32_t)static_cast<SystemModule*>(ctx)->cfgData.errorDwellMs;
}

void SystemModule::restart_(const char* reason) {
    restarting_ = true;
    LOGE("Restarting: %s", reason ? reason : "unspecified");
    vTaskDelay(pdMS_TO_TICKS(Limits::System::RestartDrainMs));
    esp_restart();
}

void SystemModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    cfg.registerVar(maintenanceVar);
    cfg.registerVar(errorDwellVar);

    cfgSvc = services.get<ConfigStoreService>("config");
    services_ = &services;

    svc = SystemService{ svcRestart, svcHeartbeat, svcUptimeSec, svcErrorDwellMs, this };
    services.add("system", &svc);

    LOGI("Boot reset reason: %s", SystemStats::resetReasonStr());
}

void SystemModule::onConfigLoaded(ConfigStore&, ServiceRegistry&) {
    if (cfgData.maintenanceSec < 0) cfgData.maintenanceSec = 0;
    if (cfgData.errorDwellMs < 0) cfgData.errorDwellMs = (int32_t)WakeDefaults::ErrorDwellMs;
    lastBeatMs_ = millis();

    SystemStatsSnapshot snap{};
    SystemStats::collect(snap);
    LOGI("Heap free=%lu/%lu sketch=%lu/%lu cpu=%uMHz x%u",
         (unsigned long)snap.heap.freeBytes, (unsigned long)snap.heap.totalBytes,
         (unsigned long)snap.flash.sketchBytes, (unsigned long)snap.flash.sketchCapacity,
         (unsigned)snap.cpuMhz, (unsigned)snap.cores);
}

void SystemModule::superviseLiveness_(uint32_t nowMs) {
    if (beatSeen_ && (uint32_t)(nowMs - lastBeatMs_) > WakeDefaults::WatchdogTimeoutMs) {
        restart_("protocol task heartbeat lost");
    }

    if (cfgData.maintenanceSec > 0 && (nowMs / 1000UL) >= (uint32_t)cfgData.maintenanceSec) {
        restart_("scheduled maintenance");
    }
}

void SystemModule::loop() {
    if (restarting_) {
        vTaskDelay(pdMS_TO_TICKS(1000));
        return;
    }

    const uint32_t now = millis();
    superviseLiveness_(now);
    pollConsole_();

    vTaskDelay(pdMS_TO_TICKS(Limits::System::LoopDelayMs));
}

void SystemModule::pollConsole_() {
    while (Serial.available() > 0) {
        const int c = Serial.read();
        if (c < 0) break;

        if (c == '\n') {
            line_[lineLen_] = '\0';
            if (lineOverflow_) {
                Serial.println("ERR line too long");
            } else if (lineLen_ > 0) {
                handleLine_(line_);
            }
            lineLen_ = 0;
            lineOverflow_ = false;
            continue;
        }

        if (lineLen_ + 1 < sizeof(line_)) {
            line_[lineLen_++] = (char)c;
        } else {
            lineOverflow_ = true;
        }
    }
}

void SystemModule::handleLine_(char* raw) {
    char* line = trimInPlace_(raw);
    if (line[0] == '\0') return;

    if (strcmp(line, "cfg list") == 0) {
        cmdCfgList_();
    } else if (strncmp(line, "cfg get ", 8) == 0) {
        cmdCfgGet_(trimInPlace_(line + 8));
    } else if (strncmp(line, "cfg set ", 8) == 0) {
        cmdCfgSet_(trimInPlace_(line + 8));
    } else if (strcmp(line, "link") == 0) {
        cmdLinkStatus_();
    } else if (strcmp(line, "reboot") == 0) {
        Serial.println("OK");
        restart_("console reboot");
    } else if (strcmp(line, "factory_reset") == 0) {
        cmdFactoryReset_();
    } else {
        Serial.println("ERR unknown command");
    }
}

void SystemModule::cmdLinkStatus_() {
    const MqttService* mqtt = services_ ? services_->get<MqttService>("mqtt") : nullptr;
    const TimeService* time = services_ ? services_->get<TimeService>("time") : nullptr;

    char utc[24] = "unsynced";
    if (time && time->formatUtc && !time->formatUtc(time->ctx, utc, sizeof(utc))) {
        snprintf(utc, sizeof(utc), "unsynced");
    }
    Serial.printf("time %s (%s)\n", utc, time ? timeSyncStateStr(time->state(time->ctx)) : "n/a");

    const WifiService* wifi = services_ ? services_->get<WifiService>("wifi") : nullptr;
    if (wifi) {
        char ip[16];
        if (!wifi->getIP(wifi->ctx, ip, sizeof(ip))) snprintf(ip, sizeof(ip), "-");
        Serial.printf("wifi %s rssi %d drops %lu\n", ip, (int)wifi->rssi(wifi->ctx),
                      (unsigned long)wifi->dropCount(wifi->ctx));
    }

    if (!mqtt) {
        Serial.println("ERR link unavailable");
        return;
    }
    MqttLinkStats st{};
    mqtt->stats(mqtt->ctx, &st);
    char topic[Limits::Mqtt::Buffers::Topic];
    const bool hasTopic = mqtt->currentTopic(mqtt->ctx, topic, sizeof(topic));

    Serial.printf("broker %s topic %s\n",
                  mqtt->isConnected(mqtt->ctx) ? "connected" : "down",
                  hasTopic ? topic : "-");
    Serial.printf("accepted=%lu rejected=%lu rx_dropped=%lu published=%lu refused=%lu reconnects=%lu\n",
                  (unsigned long)st.accepted, (unsigned long)st.rejected,
                  (unsigned long)st.rxDropped, (unsigned long)st.published,
                  (unsigned long)st.publishRefused, (unsigned long)st.reconnects);
    Serial.println("OK");
}

void SystemModule::cmdCfgList_() {
    if (!cfgSvc || !cfgSvc->listModules) {
        Serial.println("ERR config unavailable");
        return;
    }
    const char* mods[12] = {nullptr};
    const uint8_t n = cfgSvc->listModules(cfgSvc->ctx, mods, 12);
    for (uint8_t i = 0; i < n; ++i) Serial.println(mods[i]);
    Serial.println("OK");
}

void SystemModule::cmdCfgGet_(const char* module) {
    if (!cfgSvc || !cfgSvc->toJsonModule) {
        Serial.println("ERR config unavailable");
        return;
    }
    char out[Limits::System::ConsoleJsonOut];
    if (!cfgSvc->toJsonModule(cfgSvc->ctx, module, out, sizeof(out))) {
        Serial.printf("ERR unknown module '%s'\n", module);
        return;
    }
    Serial.println(out);
    Serial.println("OK");
}

void SystemModule::cmdCfgSet_(const char* json) {
    if (!cfgSvc || !cfgSvc->applyJson) {
        Serial.println("ERR config unavailable");
        return;
    }
    uint8_t changed = 0;
    if (!cfgSvc->applyJson(cfgSvc->ctx, json, &changed)) {
        Serial.println("ERR bad json");
        return;
    }
    LOGI("Console config patch applied, changed=%u", (unsigned)changed);
    Serial.printf("OK changed=%u\n", (unsigned)changed);
}

void SystemModule::cmdFactoryReset_() {
    if (!cfgSvc || !cfgSvc->erase) {
        Serial.println("ERR config unavailable");
        return;
    }

    const bool cfgCleared = cfgSvc->erase(cfgSvc->ctx);
    esp_err_t wifiErr = ESP_OK;
    const bool wifiCleared = wipeWifiPersistent_(&wifiErr);

    if (!cfgCleared || !wifiCleared) {
        LOGE("Factory reset failed cfg=%d wifi=%d wifi_err=%d",
             (int)cfgCleared, (int)wifiCleared, (int)wifiErr);
        Serial.println("ERR factory reset failed");
        return;
    }

    Serial.println("OK");
    restart_("factory reset");
}

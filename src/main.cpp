/**
 * @file main.cpp
 * @brief Firmware entry point and module wiring.
 */
#include <Arduino.h>
#include <Preferences.h>
#include "Core/NvsKeys.h"    ///< Preference needs to be singleton-like global to work

/// Load Core Functions
#include "Core/ConfigMigrations.h"
#include "Core/ConfigStore.h"
#include "Core/ModuleManager.h"
#include "Core/ServiceRegistry.h"

/// Load Modules
// Network modules
#include "Modules/Network/WifiModule/WifiModule.h"
#include "Modules/Network/TimeModule/TimeModule.h"
#include "Modules/Network/MQTTModule/MQTTModule.h"
// Stores Modules
#include "Modules/Stores/ConfigStoreModule/ConfigStoreModule.h"
// System Modules
#include "Modules/System/SystemModule/SystemModule.h"
#include "Modules/System/IndicatorModule/IndicatorModule.h"
// Logs Modules
#include "Modules/Logs/LogHubModule/LogHubModule.h"
#include "Modules/Logs/LogSerialSinkModule/LogSerialSinkModule.h"
#include "Modules/Logs/LogDispatcherModule/LogDispatcherModule.h"

#include "Modules/EventBusModule/EventBusModule.h"
#include "Modules/WakeModule/WakeModule.h"

static Preferences preferences;
static ConfigStore registry;

static ModuleManager moduleManager;
static ServiceRegistry services;

static LogHubModule         logHubModule;
static LogDispatcherModule  logDispatcherModule;
static LogSerialSinkModule  logSerialSinkModule;
static EventBusModule       eventBusModule;
static ConfigStoreModule    configStoreModule;
static SystemModule         systemModule;
static WifiModule           wifiModule;
static TimeModule           timeModule;
static MQTTModule           mqttModule;
static WakeModule           wakeModule;
static IndicatorModule      indicatorModule;

static void requireSetup(bool ok, const char* step)
{
    if (ok) return;
    Serial.printf("Setup failure: %s\n", step ? step : "unknown");
    while (true) delay(1000);
}

void setup() {
    Serial.begin(115200);
    delay(50);

    requireSetup(preferences.begin(NvsKeys::StorageNamespace, false), "open preferences");
    registry.setPreferences(preferences);
    if (!registry.runMigrations(CURRENT_CFG_VERSION, kMigrationSteps, MIGRATION_COUNT, NvsKeys::ConfigVersion)) {
        Serial.println("Config migration failed, running on defaults");
    }

    requireSetup(moduleManager.add(&logHubModule), "add loghub");
    requireSetup(moduleManager.add(&logDispatcherModule), "add logdispatcher");
    requireSetup(moduleManager.add(&logSerialSinkModule), "add logserial");
    requireSetup(moduleManager.add(&eventBusModule), "add eventbus");
    requireSetup(moduleManager.add(&configStoreModule), "add config");
    requireSetup(moduleManager.add(&systemModule), "add system");
    requireSetup(moduleManager.add(&wifiModule), "add wifi");
    requireSetup(moduleManager.add(&timeModule), "add time");
    requireSetup(moduleManager.add(&mqttModule), "add mqtt");
    requireSetup(moduleManager.add(&wakeModule), "add wake");
    requireSetup(moduleManager.add(&indicatorModule), "add indicator");

    requireSetup(moduleManager.initAll(registry, services), "module init");

    Serial.print(
        "\x1b[34m"
        " __      __        _        ___     _\n"
        " \\ \\    / /_ _ ___| |_____ | _ \\___| |__ _ _  _\n"
        "  \\ \\/\\/ / _` / / / / -_)  |   / -_) / _` | || |\n"
        "   \\_/\\_/\\__,_\\_\\_\\_\\___|  |_|_\\___|_\\__,_|\\_, |\n"
        "                                           |__/\n"
        "\x1b[0m"
        );
}

void loop() {
    vTaskDelay(pdMS_TO_TICKS(1000));
}

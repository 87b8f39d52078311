#pragma once
/**
 * @file Module.h
 * @brief Base interface for all runtime modules.
 */
#include "ConfigStore.h"
#include "ServiceRegistry.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

/**
 * @brief Unit of the firmware: owns config variables, services and a task.
 *
 * ModuleManager calls, in dependency order:
 * init() for every module, ConfigStore::loadPersistent(), onConfigLoaded()
 * for every module, then startTask() for modules where hasTask() is true.
 * Services fetched in init() may only be called from onConfigLoaded() on.
 */
class Module {
public:
    virtual ~Module() = default;

    /** @brief Unique module identifier (used for dependency wiring). */
    virtual const char* moduleId() const = 0;
    /** @brief FreeRTOS task name (15 chars max). */
    virtual const char* taskName() const = 0;

    virtual uint8_t dependencyCount() const { return 0; }
    /** @brief Dependency id at index, or nullptr if none. */
    virtual const char* dependency(uint8_t) const { return nullptr; }

    virtual void init(ConfigStore& cfg, ServiceRegistry& services) = 0;
    virtual void onConfigLoaded(ConfigStore&, ServiceRegistry&) {}
    /** @brief One iteration of the module task. May block. */
    virtual void loop() = 0;

    virtual uint16_t taskStackSize() const { return 3072; }
    virtual UBaseType_t taskPriority() const { return 1; }
    /** @brief Core 0 hosts the WiFi stack, core 1 the application. */
    virtual BaseType_t taskCore() const { return 1; }
    /** @brief Delay inserted after every loop() so a busy module cannot starve IDLE. */
    virtual uint32_t loopYieldMs() const { return 10; }

    virtual bool hasTask() const { return true; }

    bool startTask() {
        if (taskHandle) return true;
        const BaseType_t ok = xTaskCreatePinnedToCore(
            taskEntry, taskName(), taskStackSize(),
            this, taskPriority(), &taskHandle, taskCore()
        );
        return ok == pdPASS;
    }

    TaskHandle_t getTaskHandle() const { return taskHandle; }

protected:
    TaskHandle_t taskHandle = nullptr;

private:
    static void taskEntry(void* arg) {
        Module* self = static_cast<Module*>(arg);
        const TickType_t yieldTicks = pdMS_TO_TICKS(self->loopYieldMs());
        for (;;) {
            self->loop();
            vTaskDelay(yieldTicks > 0 ? yieldTicks : 1);
        }
    }
};

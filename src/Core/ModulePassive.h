#pragma once
/**
 * @file ModulePassive.h
 * @brief Module without a FreeRTOS task.
 */
#include "Core/Module.h"

/**
 * @brief Module that only does work in init() and onConfigLoaded().
 *
 * Used for service providers (log hub, sinks, config store). ModuleManager
 * skips startTask() for these, so loop() is sealed here.
 */
class ModulePassive : public Module {
public:
    bool hasTask() const final { return false; }
    const char* taskName() const override { return moduleId(); }
    uint16_t taskStackSize() const final { return 0; }

private:
    void loop() final {}
};

#pragma once
/**
 * @file EventBusModule.h
 * @brief Owner of the EventBus and its dispatch task.
 */
#include "Core/Module.h"
#include "Core/Services/Services.h"
#include "Core/EventBus/EventBus.h"

/**
 * @brief Delivers queued events to subscribers from its own task.
 *
 * Runs one priority step above the network modules so a NetworkLost or
 * ConfigChanged is seen before their next loop iteration. Subscribers run on
 * this task and must only copy data or set flags.
 */
class EventBusModule : public Module {
public:
    const char* moduleId() const override { return "eventbus"; }
    const char* taskName() const override { return "evtbus"; }

    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override { return (i == 0) ? "loghub" : nullptr; }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

    uint16_t taskStackSize() const override { return 4096; }
    UBaseType_t taskPriority() const override { return 2; }
    uint32_t loopYieldMs() const override { return 5; }

private:
    EventBus bus_;
    EventBusService svc_{ &bus_ };
    uint32_t reportedDrops_ = 0;
};

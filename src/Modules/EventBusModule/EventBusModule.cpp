/**
 * @file EventBusModule.cpp
 * @brief Implementation file.
 */
#include "EventBusModule.h"
#define LOG_TAG "EvtBusMd"
#include "Core/ModuleLog.h"

void EventBusModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    if (!services.add("eventbus", &svc_)) {
        LOGE("eventbus service not registered");
        return;
    }
    // ConfigStore announces every changed key on this bus.
    cfg.setEventBus(&bus_);
}

void EventBusModule::onConfigLoaded(ConfigStore&, ServiceRegistry&) {
    // Posted after NVS load so the first subscribers see final config values.
    if (!bus_.post(EventId::SystemStarted, nullptr, 0)) {
        LOGW("SystemStarted not queued");
    }
}

void EventBusModule::loop() {
    bus_.dispatch(Limits::EventDispatchBurst);

    const uint32_t dropped = bus_.droppedCount();
    if (dropped != reportedDrops_) {
        LOGW("queue full, %lu events lost (total %lu)",
             (unsigned long)(dropped - reportedDrops_), (unsigned long)dropped);
        reportedDrops_ = dropped;
    }
}

/**
 * @file LogDispatcherModule.cpp
 * @brief Implementation file.
 */
#include "LogDispatcherModule.h"
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

void LogDispatcherModule::init(ConfigStore&, ServiceRegistry& services) {
    auto hubSvc = services.get<LogHubService>("loghub");
    _sinkReg = services.get<LogSinkRegistryService>("logsinks");

    /// The hub service ctx is the LogHub itself.
    if (hubSvc && hubSvc->ctx) {
        _hub = static_cast<LogHub*>(hubSvc->ctx);
    }
}

void LogDispatcherModule::loop() {
    if (!_hub || !_sinkReg) {
        vTaskDelay(pdMS_TO_TICKS(1000));
        return;
    }

    LogEntry e;
    if (!_hub->dequeue(e, pdMS_TO_TICKS(500))) return;

    /// Drain a burst before yielding back to the task delay.
    uint8_t burst = 0;
    do {
        const int n = _sinkReg->count(_sinkReg->ctx);
        for (int i = 0; i < n; ++i) {
            LogSinkService sink = _sinkReg->get(_sinkReg->ctx, i);
            if (sink.write) sink.write(sink.ctx, e);
        }
    } while (++burst < 16 && _hub->dequeue(e, 0));
}

#pragma once
/**
 * @file LogHub.h
 * @brief Bounded FreeRTOS queue between log producers and the dispatcher.
 */
#include "Core/Services/ILogger.h"
#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>

class LogHub {
public:
    /** @brief Create the queue. Returns false if allocation failed. */
    bool init(uint8_t queueLen);

    /** @brief Non-blocking push; false when the queue is full or missing. */
    bool enqueue(const LogEntry& e);
    /** @brief Pop one entry, waiting up to `waitTicks`. */
    bool dequeue(LogEntry& out, TickType_t waitTicks);

    /** @brief Entries currently waiting. */
    uint32_t pending() const;

private:
    QueueHandle_t q_ = nullptr;
};

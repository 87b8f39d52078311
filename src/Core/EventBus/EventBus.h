#pragma once
/**
 * @file EventBus.h
 * @brief Queued event bus with fixed-size payloads.
 */
#include <stdint.h>
#include <stddef.h>
#include <string.h>

#include "EventId.h"
#include "Core/SystemLimits.h"

#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"

#ifndef EVENTBUS_HANDLER_WARN_US
#define EVENTBUS_HANDLER_WARN_US 5000
#endif

#ifndef EVENTBUS_WARN_MIN_INTERVAL_MS
#define EVENTBUS_WARN_MIN_INTERVAL_MS 2000
#endif

/** @brief Event delivered to subscribers during dispatch(). */
struct Event {
    EventId id;
    const void* payload;
    size_t len;
};

/** @brief Callback signature for event subscribers. */
using EventCallback = void(*)(const Event& e, void* user);

/**
 * @brief Multi-producer event queue drained by a single dispatcher task.
 *
 * Subscriptions happen during module init only. Posting never blocks: a full
 * queue drops the event and bumps `droppedCount()`.
 */
class EventBus {
public:
    static constexpr uint8_t MAX_SUBSCRIBERS = 16;
    static constexpr uint8_t MAX_PAYLOAD_SIZE = 24;
    static constexpr uint8_t QUEUE_LENGTH = Limits::EventQueueLen;

    EventBus();
    ~EventBus() = default;

    bool subscribe(EventId id, EventCallback cb, void* user);

    /** @brief Copy `payload` into the queue. Safe from any task. */
    bool post(EventId id, const void* payload = nullptr, size_t len = 0);

    /** @brief Deliver up to `maxEvents` queued events to subscribers. */
    void dispatch(uint8_t maxEvents = 8);

    uint32_t droppedCount() const { return _dropped; }

private:
    struct Subscriber {
        EventId id;
        EventCallback cb;
        void* user;
    };

    struct QueuedEvent {
        EventId id;
        uint8_t len;
        uint8_t data[MAX_PAYLOAD_SIZE];
    };

    Subscriber _subs[MAX_SUBSCRIBERS]{};
    uint8_t _count = 0;
    volatile uint32_t _dropped = 0;

    QueueHandle_t _queue = nullptr;

    void dispatchOne(const QueuedEvent& qe);
};

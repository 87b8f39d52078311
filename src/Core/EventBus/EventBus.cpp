/**
 * @file EventBus.cpp
 * @brief Implementation file.
 */
#include "EventBus.h"
#include <Arduino.h>
#include "Core/Log.h"

#define LOG_TAG_CORE "EventBus"

static uint32_t g_lastWarnMs = 0;

static bool canWarnNow() {
    const uint32_t now = millis();
    if ((uint32_t)(now - g_lastWarnMs) < EVENTBUS_WARN_MIN_INTERVAL_MS) return false;
    g_lastWarnMs = now;
    return true;
}

EventBus::EventBus() {
    _queue = xQueueCreate(QUEUE_LENGTH, sizeof(QueuedEvent));
}

bool EventBus::subscribe(EventId id, EventCallback cb, void* user) {
    if (cb == nullptr) return false;
    if (_count >= MAX_SUBSCRIBERS) return false;

    _subs[_count].id = id;
    _subs[_count].cb = cb;
    _subs[_count].user = user;
    _count++;
    return true;
}

bool EventBus::post(EventId id, const void* payload, size_t len) {
    if (_queue == nullptr) return false;
    if (len > MAX_PAYLOAD_SIZE) return false;

    QueuedEvent qe{};
    qe.id = id;
    qe.len = static_cast<uint8_t>(len);
    if (len > 0 && payload != nullptr) {
        memcpy(qe.data, payload, len);
    }

    if (xQueueSend(_queue, &qe, 0) != pdTRUE) {
        _dropped = _dropped + 1;
        return false;
    }
    return true;
}

void EventBus::dispatch(uint8_t maxEvents) {
    if (_queue == nullptr) return;

    for (uint8_t i = 0; i < maxEvents; i++) {
        QueuedEvent qe;
        if (xQueueReceive(_queue, &qe, 0) != pdTRUE) break;
        dispatchOne(qe);
    }
}

void EventBus::dispatchOne(const QueuedEvent& qe) {
    Event e;
    e.id = qe.id;
    e.payload = (qe.len > 0) ? qe.data : nullptr;
    e.len = qe.len;

    for (uint8_t i = 0; i < _count; i++) {
        if (_subs[i].id != qe.id || _subs[i].cb == nullptr) continue;

        const uint32_t t0 = micros();
        _subs[i].cb(e, _subs[i].user);
        const uint32_t dt = (uint32_t)(micros() - t0);

        if (dt > EVENTBUS_HANDLER_WARN_US && canWarnNow()) {
            Log::warn(LOG_TAG_CORE, "slow handler: event=%u dt=%lu us",
                      (unsigned)qe.id, (unsigned long)dt);
        }
    }
}

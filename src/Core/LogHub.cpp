/**
 * @file LogHub.cpp
 * @brief Implementation file.
 */
#include "Core/LogHub.h"

bool LogHub::init(uint8_t queueLen) {
    if (q_) return true;
    q_ = xQueueCreate(queueLen, sizeof(LogEntry));
    return q_ != nullptr;
}

bool LogHub::enqueue(const LogEntry& e) {
    if (!q_) return false;
    return xQueueSend(q_, &e, 0) == pdTRUE;
}

bool LogHub::dequeue(LogEntry& out, TickType_t waitTicks) {
    if (!q_) return false;
    return xQueueReceive(q_, &out, waitTicks) == pdTRUE;
}

uint32_t LogHub::pending() const {
    if (!q_) return 0;
    return (uint32_t)uxQueueMessagesWaiting(q_);
}

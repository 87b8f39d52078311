#pragma once
/**
 * @file IEventBus.h
 * @brief Event bus service interface.
 */

class EventBus;

/**
 * @brief Registered as "eventbus" by EventBusModule.
 *
 * Modules fetch it in init() and keep the raw pointer; the bus outlives
 * every subscriber.
 */
struct EventBusService {
    EventBus* bus;
};

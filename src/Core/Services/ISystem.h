#pragma once
/**
 * @file ISystem.h
 * @brief System supervision service interface.
 */
#include <stdint.h>

struct SystemService {
    /** @brief Log `reason`, let the log drain, then reboot. Does not return. */
    void (*restart)(void* ctx, const char* reason);
    /** @brief Liveness beat from the protocol task. */
    void (*heartbeat)(void* ctx);
    uint32_t (*uptimeSec)(void* ctx);
    /** @brief How long the Error state is held before a restart. */
    uint32_t (*errorDwellMs)(void* ctx);
    void* ctx;
};

#pragma once
/**
 * @file IMqtt.h
 * @brief Secure command link service interface.
 */
#include <stddef.h>
#include <stdint.h>

/** @brief Link counters exposed for diagnostics. */
struct MqttLinkStats {
    uint32_t accepted;
    uint32_t rejected;
    uint32_t rxDropped;
    uint32_t published;
    uint32_t publishRefused;
    uint32_t reconnects;
};

struct MqttService {
    bool (*isConnected)(void* ctx);
    /** @brief Copy the active rotated command topic, false before first subscription. */
    bool (*currentTopic)(void* ctx, char* out, size_t outLen);
    void (*stats)(void* ctx, MqttLinkStats* out);
    void* ctx;
};

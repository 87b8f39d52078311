#pragma once
/**
 * @file IWifi.h
 * @brief WiFi station service interface.
 */
#include <stdint.h>
#include <stddef.h>

/** @brief WiFi connection state. */
enum class WifiState : uint8_t {
    Disabled,
    Idle,
    Connecting,
    Connected,
    ErrorWait
};

/** @brief Registered as "wifi" by WifiModule. */
struct WifiService {
    WifiState (*state)(void* ctx);
    bool (*isConnected)(void* ctx);
    /** @brief Station address as dotted quad. False while disconnected. */
    bool (*getIP)(void* ctx, char* out, size_t len);
    /** @brief Directed broadcast of the station subnet (ip | ~mask). */
    bool (*subnetBroadcast)(void* ctx, char* out, size_t len);
    /** @brief Station RSSI in dBm, 0 when not connected. */
    int8_t (*rssi)(void* ctx);
    /** @brief Link drops since boot. */
    uint32_t (*dropCount)(void* ctx);
    bool (*requestReconnect)(void* ctx);
    void* ctx;
};

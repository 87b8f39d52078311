#pragma once
/**
 * @file IWake.h
 * @brief Wake-on-LAN collaborator service interface.
 */
#include <stddef.h>
#include <stdint.h>

#include "Core/ErrorCodes.h"

/** @brief Host resource snapshot returned by `WakeService::collectUsage`. */
struct WakeUsage {
    uint32_t uptimeS = 0;
    uint32_t heapFree = 0;
    uint32_t heapTotal = 0;
    uint32_t flashUsed = 0;
    uint32_t flashTotal = 0;
    uint16_t cpuMhz = 0;
    uint8_t cores = 0;
    int8_t rssi = 0;
};

/** @brief Service interface exposed by WakeModule to the command dispatcher. */
struct WakeService {
    /** @brief Broadcast the magic packet; no delivery confirmation exists. */
    bool (*sendMagicPacket)(void* ctx);
    /** @brief Reachability probe of the target host; false when the probe could not run. */
    bool (*probeTarget)(void* ctx, bool* online);
    bool (*collectUsage)(void* ctx, WakeUsage* out);
    /** @brief Current schedule as `{"slots":[...]}`. */
    bool (*scheduleJson)(void* ctx, char* out, size_t outLen);
    /** @brief Replace and persist the schedule from `{"slots":[...]}`. */
    bool (*setSchedule)(void* ctx, const char* json, ErrorCode* err, uint8_t* badSlot, uint8_t* saved);
    void* ctx;
};

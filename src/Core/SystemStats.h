#pragma once
/**
 * @file SystemStats.h
 * @brief Lightweight system and heap stats helpers.
 */
#include <stdint.h>

/** @brief Heap snapshot (no dynamic allocation). */
struct HeapStats {
    uint32_t freeBytes;           // heap_caps_get_free_size(MALLOC_CAP_8BIT)
    uint32_t totalBytes;          // ESP.getHeapSize()
    uint32_t minFreeBytes;        // ESP.getMinFreeHeap()
    uint32_t largestFreeBlock;    // heap_caps_get_largest_free_block(MALLOC_CAP_8BIT)
};

/** @brief Application flash usage. */
struct FlashStats {
    uint32_t sketchBytes;         // ESP.getSketchSize()
    uint32_t sketchCapacity;      // sketch + ESP.getFreeSketchSpace()
};

struct SystemStatsSnapshot {
    uint32_t uptimeMs;
    HeapStats heap;
    FlashStats flash;
    uint16_t cpuMhz;
    uint8_t cores;
};

/** @brief Stateless collectors over the Arduino/ESP-IDF system APIs. */
class SystemStats {
public:
    static void collect(SystemStatsSnapshot& out);

    /** @brief Reset reason as const string (ESP_RST_*). */
    static const char* resetReasonStr();
};

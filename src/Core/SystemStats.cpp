/**
 * @file SystemStats.cpp
 * @brief Implementation file.
 */
#include "SystemStats.h"

#include <Arduino.h>
#include <esp_system.h>
#include <esp_heap_caps.h>

void SystemStats::collect(SystemStatsSnapshot& out) {
    out.uptimeMs = millis();

    out.heap.freeBytes = heap_caps_get_free_size(MALLOC_CAP_8BIT);
    out.heap.totalBytes = ESP.getHeapSize();
    out.heap.minFreeBytes = ESP.getMinFreeHeap();
    out.heap.largestFreeBlock = heap_caps_get_largest_free_block(MALLOC_CAP_8BIT);

    // getSketchSize() hashes the image on first call, then caches it.
    out.flash.sketchBytes = ESP.getSketchSize();
    out.flash.sketchCapacity = out.flash.sketchBytes + ESP.getFreeSketchSpace();

    esp_chip_info_t chip;
    esp_chip_info(&chip);
    out.cpuMhz = (uint16_t)ESP.getCpuFreqMHz();
    out.cores = chip.cores;
}

const char* SystemStats::resetReasonStr() {
    switch (esp_reset_reason()) {
    case ESP_RST_POWERON:   return "POWERON";
    case ESP_RST_EXT:       return "EXT";
    case ESP_RST_SW:        return "SW";
    case ESP_RST_PANIC:     return "PANIC";
    case ESP_RST_INT_WDT:   return "INT_WDT";
    case ESP_RST_TASK_WDT:  return "TASK_WDT";
    case ESP_RST_WDT:       return "WDT";
    case ESP_RST_DEEPSLEEP: return "DEEPSLEEP";
    case ESP_RST_BROWNOUT:  return "BROWNOUT";
    case ESP_RST_SDIO:      return "SDIO";
    default:                return "UNKNOWN";
    }
}

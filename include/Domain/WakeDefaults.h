#pragma once

#include <stdint.h>

namespace WakeDefaults {

constexpr uint32_t RotationIntervalSec = 3600;
constexpr uint32_t SkewToleranceSec = 120;
constexpr uint8_t MaxConnectAttempts = 8;
/** @brief Station outage charged as one failed connect attempt. */
constexpr uint32_t NetworkAttemptMs = 30000;
constexpr uint8_t MaxTimeSyncAttempts = 5;

constexpr uint32_t ErrorDwellMs = 10000;
constexpr uint32_t MaintenanceRebootSec = 43200;
constexpr uint32_t WatchdogTimeoutMs = 15000;

constexpr uint16_t WolPort = 9;

constexpr uint16_t BootToggleMs = 100;
constexpr uint16_t ConnectingToggleMs = 300;
constexpr uint16_t ErrorToggleMs = 50;
constexpr uint16_t IdleOnMs = 50;
constexpr uint16_t IdleOffMs = 4000;
constexpr uint16_t FlashOnMs = 50;
constexpr uint16_t FlashOffMs = 50;

constexpr uint8_t FlashesReceived = 1;
constexpr uint8_t FlashesWake = 3;
constexpr uint8_t FlashesStatus = 2;
constexpr uint8_t FlashesOther = 1;

}  // namespace WakeDefaults

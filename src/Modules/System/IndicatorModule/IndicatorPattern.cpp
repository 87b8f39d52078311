/**
 * @file IndicatorPattern.cpp
 * @brief Implementation file.
 */
#include "Modules/System/IndicatorModule/IndicatorPattern.h"

#include "Domain/WakeDefaults.h"

static bool toggleLevel(uint32_t elapsedMs, uint32_t halfPeriodMs)
{
    return ((elapsedMs / halfPeriodMs) % 2U) == 0U;
}

bool IndicatorPattern::baseLevel(DeviceState state, uint32_t elapsedMs)
{
    switch (state) {
    case DeviceState::Booting:
        return toggleLevel(elapsedMs, WakeDefaults::BootToggleMs);
    case DeviceState::Connecting:
        return toggleLevel(elapsedMs, WakeDefaults::ConnectingToggleMs);
    case DeviceState::Idle:
    case DeviceState::Signaling:
        return (elapsedMs % (uint32_t)(WakeDefaults::IdleOnMs + WakeDefaults::IdleOffMs)) <
               WakeDefaults::IdleOnMs;
    case DeviceState::Error:
        return toggleLevel(elapsedMs, WakeDefaults::ErrorToggleMs);
    }
    return false;
}

bool IndicatorPattern::update(const DeviceStateSnapshot& snap, uint32_t nowMs)
{
    if (snap.pulseSeq != lastSeq_) {
        lastSeq_ = snap.pulseSeq;
        pulseActive_ = (snap.pulseCount > 0);
        pulseCount_ = snap.pulseCount;
        pulseStartMs_ = nowMs;
    }

    if (!hasBase_ || snap.state != baseState_) {
        hasBase_ = true;
        baseState_ = snap.state;
        baseStartMs_ = nowMs;
    }

    if (pulseActive_) {
        const uint32_t flashMs = (uint32_t)WakeDefaults::FlashOnMs + WakeDefaults::FlashOffMs;
        const uint32_t elapsed = nowMs - pulseStartMs_;
        if (elapsed < (uint32_t)pulseCount_ * flashMs) {
            return (elapsed % flashMs) < WakeDefaults::FlashOnMs;
        }
        pulseActive_ = false;
        baseStartMs_ = nowMs;
    }

    return baseLevel(baseState_, nowMs - baseStartMs_);
}

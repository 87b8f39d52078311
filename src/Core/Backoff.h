#pragma once
/**
 * @file Backoff.h
 * @brief Retry ladder shared by the station, time sync and broker connect loops.
 */
#include <stdint.h>

#include "Core/SystemLimits.h"

namespace Backoff {

static inline uint32_t clampU32(uint32_t v, uint32_t minV, uint32_t maxV)
{
    if (v < minV) return minV;
    if (v > maxV) return maxV;
    return v;
}

/** @brief Next step of the 2s -> 5s -> 10s -> 30s -> 60s -> 300s ladder. */
static inline uint32_t nextDelayMs(uint32_t currentMs)
{
    uint32_t next = currentMs;
    if      (next < Limits::Mqtt::Backoff::Step1Ms) next = Limits::Mqtt::Backoff::Step1Ms;
    else if (next < Limits::Mqtt::Backoff::Step2Ms) next = Limits::Mqtt::Backoff::Step2Ms;
    else if (next < Limits::Mqtt::Backoff::Step3Ms) next = Limits::Mqtt::Backoff::Step3Ms;
    else if (next < Limits::Mqtt::Backoff::Step4Ms) next = Limits::Mqtt::Backoff::Step4Ms;
    else                                            next = Limits::Mqtt::Backoff::MaxMs;
    return clampU32(next, Limits::Mqtt::Backoff::MinMs, Limits::Mqtt::Backoff::MaxMs);
}

/**
 * @brief Spread `baseMs` by +/- `pct` percent using the caller's random word.
 *
 * Modules pass `esp_random()`; tests pass fixed values.
 */
static inline uint32_t jitterMs(uint32_t baseMs, uint8_t pct, uint32_t rnd)
{
    if (baseMs == 0 || pct == 0) return baseMs;
    const uint32_t span = (baseMs * pct) / 100U;
    const uint32_t delta = rnd % (2U * span + 1U);
    const int32_t out = (int32_t)baseMs + ((int32_t)delta - (int32_t)span);
    return (out < 0) ? 0U : (uint32_t)out;
}

}  // namespace Backoff

#pragma once
/**
 * @file MagicPacket.h
 * @brief Wake-on-LAN frame builder.
 */
#include <stddef.h>
#include <stdint.h>

#include "Core/SystemLimits.h"

namespace MagicPacket {

constexpr size_t MacLen = 6;
constexpr size_t Length = Limits::Wake::MagicPacketLen;

/** @brief Parse `AA:BB:CC:DD:EE:FF`, `AA-BB-...` or `AABBCCDDEEFF`. */
bool parseMac(const char* text, uint8_t out[MacLen]);

/** @brief 6 x 0xFF followed by the MAC repeated 16 times. */
bool build(const uint8_t mac[MacLen], uint8_t* out, size_t outLen);

}  // namespace MagicPacket

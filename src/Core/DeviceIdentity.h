#pragma once
/**
 * @file DeviceIdentity.h
 * @brief Immutable device credential injected into the secure link components.
 */
#include <stddef.h>
#include <stdint.h>
#include <string.h>

#include "Core/SystemLimits.h"

/** @brief 256-bit symmetric key shared by encryption and authentication. */
struct CryptoKey {
    uint8_t bytes[Limits::Link::KeyLen] = {0};
};

/**
 * @brief Serial and key of this device.
 *
 * Built once from config by the protocol context and handed by const reference
 * to CryptoManager users. Never copied into the indicator context.
 */
struct DeviceIdentity {
    char serial[Limits::Link::Serial] = {0};
    CryptoKey key{};

    /** @brief Copy a serial into the identity, truncating to the buffer. */
    void setSerial(const char* s) {
        if (!s) s = "";
        strncpy(serial, s, sizeof(serial) - 1);
        serial[sizeof(serial) - 1] = '\0';
    }

    /** @brief Overwrite key material. */
    void wipe() {
        volatile uint8_t* p = key.bytes;
        for (size_t i = 0; i < sizeof(key.bytes); ++i) p[i] = 0;
    }
};

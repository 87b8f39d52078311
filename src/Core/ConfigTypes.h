#pragma once
/**
 * @file ConfigTypes.h
 * @brief Shared configuration types and metadata.
 */
#include <stdint.h>
#include <stddef.h>
#include "Core/SystemLimits.h"

// Wrap literal NVS keys with NVS_KEY("...") to enforce the Preferences key
// length at compile time.
template <size_t N>
constexpr const char* NVS_KEY(const char (&s)[N]) {
    static_assert(N > 1, "NVS key cannot be empty");
    static_assert((N - 1) <= Limits::MaxNvsKeyLen, "NVS key too long");
    return s;
}

/** @brief Config persistence mode. */
enum class ConfigPersistence : uint8_t { Runtime, Persistent };

/** @brief Supported config value types. */
enum class ConfigType : uint8_t {
    Int32,
    UInt8,
    Bool,
    CharArray
};

/**
 * @brief Declares one module-owned config value.
 *
 * `jsonName` is the key inside the module object of a JSON patch,
 * e.g. `{"mqtt":{"host":"..."}}`. Int32 values outside
 * [`minValue`, `maxValue`] are refused by patches and ignored when loaded
 * from NVS.
 */
template<typename T>
struct ConfigVariable {
    const char* nvsKey;
    const char* jsonName;
    const char* moduleName;
    ConfigType type;
    T* value;
    ConfigPersistence persistence;
    uint16_t size; // for char[]
    int32_t minValue = INT32_MIN;
    int32_t maxValue = INT32_MAX;
};

/** @brief Type-erased view of a registered variable. */
struct ConfigMeta {
    const char* module;
    const char* name;
    const char* nvsKey;
    ConfigType type;
    ConfigPersistence persistence;
    void* valuePtr;
    uint16_t size;
    int32_t minValue;
    int32_t maxValue;

    bool accepts(int32_t v) const { return v >= minValue && v <= maxValue; }
};

#pragma once
/**
 * @file ConfigStore.h
 * @brief Persistent configuration store with JSON patch and export.
 */

// Variables are owned by their modules and registered here during init().
// A change through set() or applyJson() is written to NVS (Persistent vars)
// and announced with EventId::ConfigChanged carrying the NVS key.
// No heap allocation on the runtime path.

#include <Preferences.h>
#include <atomic>
#include <cstdint>
#include <cstring>
#include <type_traits>

#include "ConfigTypes.h"
#include "Core/Log.h"
#include "Core/EventBus/EventBus.h"
#include "Core/EventBus/EventPayloads.h"

/** @brief Defines a configuration migration step between versions. */
struct MigrationStep {
    uint32_t fromVersion;
    uint32_t toVersion;
    bool (*apply)(Preferences& prefs);
};

class ConfigStore {
public:
    static constexpr size_t MAX_CONFIG_VARS = Limits::MaxConfigVars;

    ConfigStore() = default;

    void setEventBus(EventBus* bus) { _eventBus = bus; }
    void setPreferences(Preferences& prefs) { _prefs = &prefs; }

    /** @brief Register a variable. Keys longer than the NVS limit are refused. */
    template<typename T>
    bool registerVar(ConfigVariable<T>& var);

    /** @brief Set a typed value, persist it and notify on change. Out-of-range Int32 is refused. */
    template<typename T>
    bool set(ConfigVariable<T>& var, const T& value);

    /** @brief Set a char array value (truncated to the buffer). */
    bool set(ConfigVariable<char>& var, const char* str);

    /** @brief Load NVS values over the registered defaults. */
    void loadPersistent();
    /** @brief Clear the whole Preferences namespace. RAM values are kept until reboot. */
    bool erasePersistent();

    /**
     * @brief Serialize one module as a flat JSON object.
     *
     * Values named `pass` or `secret` are written as `"***"`.
     */
    bool toJsonModule(const char* module, char* out, size_t outLen) const;
    /** @brief Unique module names, in registration order. */
    uint8_t listModules(const char** out, uint8_t max) const;

    /**
     * @brief Apply `{"module":{"name":value,...},...}`.
     *
     * Unknown modules and names are ignored. Values of the wrong JSON type are
     * skipped, as are Int32 values outside their range. Returns false only
     * when the document cannot be parsed.
     * `changedCount` receives the number of variables that changed.
     */
    bool applyJson(const char* json, uint8_t* changedCount = nullptr);

    /** @brief Run config migrations using a version key in NVS. */
    bool runMigrations(uint32_t currentVersion, const MigrationStep* steps, size_t count,
                       const char* versionKey);
    /** @brief Log NVS write counters once per `periodMs`. */
    void logNvsWriteSummaryIfDue(uint32_t nowMs, uint32_t periodMs = 60000U);

private:
    Preferences* _prefs = nullptr;
    EventBus* _eventBus = nullptr;
    ConfigMeta _meta[MAX_CONFIG_VARS]{};
    uint16_t _metaCount = 0;

    void notifyChanged(const char* nvsKey);
    void writePersistent(const ConfigMeta& m);
    void recordNvsWrite_(size_t bytesWritten);

    ConfigMeta* find(const char* module, const char* name);

    std::atomic<uint32_t> _nvsWriteTotal{0};
    std::atomic<uint32_t> _nvsWriteWindow{0};
    std::atomic<uint32_t> _nvsLastSummaryMs{0};
};

// -------------------------
// Template implementation
// -------------------------
template<typename T>
bool ConfigStore::registerVar(ConfigVariable<T>& var)
{
    if (_metaCount >= MAX_CONFIG_VARS) {
        Log::error("CfgStore", "too many config vars, dropped %s", var.jsonName ? var.jsonName : "?");
        return false;
    }
    if (var.nvsKey && strlen(var.nvsKey) > Limits::MaxNvsKeyLen) {
        Log::warn("CfgStore", "NVS key too long (%s)", var.nvsKey);
        return false;
    }

    ConfigMeta& m = _meta[_metaCount++];
    m.module      = var.moduleName;
    m.name        = var.jsonName;
    m.nvsKey      = var.nvsKey;
    m.type        = var.type;
    m.persistence = var.persistence;
    m.valuePtr    = (void*)var.value;
    m.size        = var.size;
    m.minValue    = var.minValue;
    m.maxValue    = var.maxValue;
    return true;
}

template<typename T>
bool ConfigStore::set(ConfigVariable<T>& var, const T& value)
{
    static_assert(!std::is_same<T, char>::value, "use the const char* overload");
    if (!var.value) return false;
    if (std::is_same<T, int32_t>::value &&
        ((int32_t)value < var.minValue || (int32_t)value > var.maxValue)) {
        Log::warn("CfgStore", "set: %s.%s out of range", var.moduleName, var.jsonName);
        return false;
    }
    if (*(var.value) == value) return true;

    *(var.value) = value;

    ConfigMeta m{var.moduleName, var.jsonName, var.nvsKey, var.type, var.persistence,
                 (void*)var.value, var.size, var.minValue, var.maxValue};
    writePersistent(m);
    notifyChanged(var.nvsKey);
    return true;
}

inline bool ConfigStore::set(ConfigVariable<char>& var, const char* str)
{
    if (!var.value || !str || var.size == 0) return false;

    size_t len = strlen(str);
    if (len >= var.size) len = var.size - 1;
    if (strncmp(var.value, str, len) == 0 && var.value[len] == '\0') return true;

    memcpy(var.value, str, len);
    var.value[len] = '\0';

    ConfigMeta m{var.moduleName, var.jsonName, var.nvsKey, var.type, var.persistence,
                 (void*)var.value, var.size, var.minValue, var.maxValue};
    writePersistent(m);
    notifyChanged(var.nvsKey);
    return true;
}

/**
 * @file ConfigStore.cpp
 * @brief Implementation file.
 */
#include "Core/ConfigStore.h"
#include "Core/Log.h"
#include <ArduinoJson.h>
#include <stdio.h>

#define LOG_TAG_CORE "CfgStore"

static bool isMaskedKey(const char* key) {
    if (!key) return false;
    return strcmp(key, "pass") == 0 || strcmp(key, "secret") == 0;
}

void ConfigStore::notifyChanged(const char* nvsKey)
{
    if (!_eventBus || !nvsKey) return;

    ConfigChangedPayload p{};
    strncpy(p.nvsKey, nvsKey, sizeof(p.nvsKey) - 1);
    _eventBus->post(EventId::ConfigChanged, &p, sizeof(p));
}

void ConfigStore::recordNvsWrite_(size_t bytesWritten)
{
    if (bytesWritten == 0) return;
    _nvsWriteTotal.fetch_add(1U, std::memory_order_relaxed);
    _nvsWriteWindow.fetch_add(1U, std::memory_order_relaxed);
}

void ConfigStore::logNvsWriteSummaryIfDue(uint32_t nowMs, uint32_t periodMs)
{
    if (periodMs == 0U) return;

    const uint32_t last = _nvsLastSummaryMs.load(std::memory_order_relaxed);
    if (last == 0U) {
        _nvsLastSummaryMs.store(nowMs, std::memory_order_relaxed);
        return;
    }
    if ((uint32_t)(nowMs - last) < periodMs) return;

    _nvsLastSummaryMs.store(nowMs, std::memory_order_relaxed);
    const uint32_t windowWrites = _nvsWriteWindow.exchange(0U, std::memory_order_relaxed);
    if (windowWrites == 0U) return;

    Log::info(LOG_TAG_CORE, "NVS writes: last_%lus=%lu total=%lu",
              (unsigned long)(periodMs / 1000U),
              (unsigned long)windowWrites,
              (unsigned long)_nvsWriteTotal.load(std::memory_order_relaxed));
}

void ConfigStore::writePersistent(const ConfigMeta& m)
{
    if (!_prefs || !m.nvsKey || !m.valuePtr) return;
    if (m.persistence != ConfigPersistence::Persistent) return;

    size_t wrote = 0;
    switch (m.type) {
        case ConfigType::Int32:     wrote = _prefs->putInt(m.nvsKey, *(int32_t*)m.valuePtr); break;
        case ConfigType::UInt8:     wrote = _prefs->putUChar(m.nvsKey, *(uint8_t*)m.valuePtr); break;
        case ConfigType::Bool:      wrote = _prefs->putBool(m.nvsKey, *(bool*)m.valuePtr); break;
        case ConfigType::CharArray: wrote = _prefs->putString(m.nvsKey, (const char*)m.valuePtr); break;
    }
    if (wrote == 0) {
        Log::warn(LOG_TAG_CORE, "NVS write failed (%s)", m.nvsKey);
        return;
    }
    recordNvsWrite_(wrote);
}

void ConfigStore::loadPersistent()
{
    if (!_prefs) return;

    Log::debug(LOG_TAG_CORE, "loadPersistent: vars=%u", (unsigned)_metaCount);
    for (uint16_t i = 0; i < _metaCount; ++i) {
        ConfigMeta& m = _meta[i];
        if (m.persistence != ConfigPersistence::Persistent || !m.nvsKey) continue;
        if (!_prefs->isKey(m.nvsKey)) continue;

        switch (m.type) {
            case ConfigType::Int32: {
                const int32_t v = _prefs->getInt(m.nvsKey, *(int32_t*)m.valuePtr);
                if (!m.accepts(v)) {
                    Log::warn(LOG_TAG_CORE, "NVS %s=%ld out of range, default kept", m.nvsKey, (long)v);
                    break;
                }
                *(int32_t*)m.valuePtr = v;
                break;
            }
            case ConfigType::UInt8:
                *(uint8_t*)m.valuePtr = _prefs->getUChar(m.nvsKey, *(uint8_t*)m.valuePtr);
                break;
            case ConfigType::Bool:
                *(bool*)m.valuePtr = _prefs->getBool(m.nvsKey, *(bool*)m.valuePtr);
                break;
            case ConfigType::CharArray:
                _prefs->getString(m.nvsKey, (char*)m.valuePtr, m.size);
                break;
        }
    }
}

bool ConfigStore::erasePersistent()
{
    if (!_prefs) return false;
    const bool ok = _prefs->clear();
    Log::warn(LOG_TAG_CORE, "persistent config erased ok=%d", (int)ok);
    return ok;
}

ConfigMeta* ConfigStore::find(const char* module, const char* name)
{
    if (!module || !name) return nullptr;
    for (uint16_t i = 0; i < _metaCount; ++i) {
        ConfigMeta& m = _meta[i];
        if (m.module && m.name && strcmp(m.module, module) == 0 && strcmp(m.name, name) == 0) {
            return &m;
        }
    }
    return nullptr;
}

bool ConfigStore::toJsonModule(const char* module, char* out, size_t outLen) const
{
    if (!out || outLen == 0) return false;
    out[0] = '\0';
    if (!module || module[0] == '\0') return false;

    StaticJsonDocument<Limits::JsonConfigApplyBuf> doc;
    JsonObject root = doc.to<JsonObject>();

    bool any = false;
    for (uint16_t i = 0; i < _metaCount; ++i) {
        const ConfigMeta& m = _meta[i];
        if (!m.module || !m.name || strcmp(m.module, module) != 0) continue;

        switch (m.type) {
            case ConfigType::Int32:  root[m.name] = *(const int32_t*)m.valuePtr; break;
            case ConfigType::UInt8:  root[m.name] = *(const uint8_t*)m.valuePtr; break;
            case ConfigType::Bool:   root[m.name] = *(const bool*)m.valuePtr; break;
            case ConfigType::CharArray:
                root[m.name] = isMaskedKey(m.name) ? "***" : (const char*)m.valuePtr;
                break;
        }
        any = true;
    }

    if (doc.overflowed() || measureJson(doc) >= outLen) {
        Log::warn(LOG_TAG_CORE, "toJsonModule: %s does not fit (%u)", module, (unsigned)outLen);
        return false;
    }
    serializeJson(doc, out, outLen);
    return any;
}

uint8_t ConfigStore::listModules(const char** out, uint8_t max) const
{
    if (!out || max == 0) return 0;
    uint8_t count = 0;

    for (uint16_t i = 0; i < _metaCount && count < max; ++i) {
        const ConfigMeta& m = _meta[i];
        if (!m.module || m.module[0] == '\0') continue;

        bool exists = false;
        for (uint8_t j = 0; j < count; ++j) {
            if (strcmp(out[j], m.module) == 0) { exists = true; break; }
        }
        if (!exists) out[count++] = m.module;
    }
    return count;
}

bool ConfigStore::applyJson(const char* json, uint8_t* changedCount)
{
    if (changedCount) *changedCount = 0;
    if (!json) return false;

    StaticJsonDocument<Limits::JsonConfigApplyBuf> doc;
    const DeserializationError err = deserializeJson(doc, json);
    if (err) {
        Log::warn(LOG_TAG_CORE, "applyJson: parse error (%s)", err.c_str());
        return false;
    }

    JsonObjectConst root = doc.as<JsonObjectConst>();
    if (root.isNull()) return false;

    uint8_t changed = 0;
    for (JsonPairConst mod : root) {
        JsonObjectConst vars = mod.value().as<JsonObjectConst>();
        if (vars.isNull()) continue;

        for (JsonPairConst kv : vars) {
            ConfigMeta* cm = find(mod.key().c_str(), kv.key().c_str());
            if (!cm) {
                Log::debug(LOG_TAG_CORE, "applyJson: unknown %s.%s", mod.key().c_str(), kv.key().c_str());
                continue;
            }
            ConfigMeta& m = *cm;
            JsonVariantConst v = kv.value();
            bool did = false;

            switch (m.type) {
            case ConfigType::Int32: {
                if (!v.is<int32_t>()) break;
                const int32_t nv = v.as<int32_t>();
                if (!m.accepts(nv)) {
                    Log::warn(LOG_TAG_CORE, "applyJson: %s.%s=%ld out of [%ld,%ld]", m.module, m.name,
                              (long)nv, (long)m.minValue, (long)m.maxValue);
                    break;
                }
                if (*(int32_t*)m.valuePtr != nv) { *(int32_t*)m.valuePtr = nv; did = true; }
                break;
            }
            case ConfigType::UInt8: {
                if (!v.is<uint8_t>()) break;
                const uint8_t nv = v.as<uint8_t>();
                if (*(uint8_t*)m.valuePtr != nv) { *(uint8_t*)m.valuePtr = nv; did = true; }
                break;
            }
            case ConfigType::Bool: {
                if (!v.is<bool>()) break;
                const bool nv = v.as<bool>();
                if (*(bool*)m.valuePtr != nv) { *(bool*)m.valuePtr = nv; did = true; }
                break;
            }
            case ConfigType::CharArray: {
                if (!v.is<const char*>()) break;
                const char* s = v.as<const char*>();
                size_t len = strlen(s);
                if (len >= m.size) len = m.size - 1;
                char* dst = (char*)m.valuePtr;
                if (strncmp(dst, s, len) != 0 || dst[len] != '\0') {
                    memcpy(dst, s, len);
                    dst[len] = '\0';
                    did = true;
                }
                break;
            }
            }

            if (!did) continue;
            ++changed;
            Log::debug(LOG_TAG_CORE, "applyJson: changed %s.%s", m.module, m.name);
            writePersistent(m);
            notifyChanged(m.nvsKey);
        }
    }

    if (changedCount) *changedCount = changed;
    return true;
}

bool ConfigStore::runMigrations(uint32_t currentVersion,
                                const MigrationStep* steps,
                                size_t count,
                                const char* versionKey)
{
    if (!_prefs || !versionKey) return false;

    uint32_t storedVersion = _prefs->getUInt(versionKey, 0);
    Log::debug(LOG_TAG_CORE, "migrations: stored=%lu current=%lu",
               (unsigned long)storedVersion, (unsigned long)currentVersion);

    if (storedVersion == currentVersion) return true;

    if (storedVersion > currentVersion) {
        Log::warn(LOG_TAG_CORE, "config schema %lu is newer than firmware %lu",
                  (unsigned long)storedVersion, (unsigned long)currentVersion);
        return false;
    }

    while (storedVersion < currentVersion) {
        const MigrationStep* step = nullptr;
        for (size_t i = 0; i < count; ++i) {
            if (steps && steps[i].fromVersion == storedVersion) { step = &steps[i]; break; }
        }

        if (!step || !step->apply || !step->apply(*_prefs)) {
            Log::warn(LOG_TAG_CORE, "migration from %lu failed, clearing config",
                      (unsigned long)storedVersion);
            _prefs->clear();
            recordNvsWrite_(_prefs->putUInt(versionKey, currentVersion));
            return false;
        }

        storedVersion = step->toVersion;
        recordNvsWrite_(_prefs->putUInt(versionKey, storedVersion));
        Log::debug(LOG_TAG_CORE, "migration applied: now=%lu", (unsigned long)storedVersion);
    }
    return true;
}

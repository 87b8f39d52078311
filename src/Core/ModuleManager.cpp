/**
 * @file ModuleManager.cpp
 * @brief Implementation file.
 */
#include "ModuleManager.h"
#include "Core/Log.h"
#include <Arduino.h>
#include <cstring>

#define LOG_TAG_CORE "ModManag"

bool ModuleManager::add(Module* m) {
    if (!m || count >= MAX_MODULES) return false;
    modules[count++] = m;
    return true;
}

Module* ModuleManager::findById(const char* id) {
    for (uint8_t i = 0; i < count; ++i)
        if (strcmp(modules[i]->moduleId(), id) == 0) return modules[i];
    return nullptr;
}

bool ModuleManager::buildInitOrder() {
    /// Kahn topo-sort
    bool placed[MAX_MODULES] = {false};
    orderedCount = 0;

    while (orderedCount < count) {
        bool progress = false;

        for (uint8_t i = 0; i < count; ++i) {
            Module* m = modules[i];
            if (placed[i]) continue;

            bool depsOk = true;
            for (uint8_t d = 0; d < m->dependencyCount() && depsOk; ++d) {
                const char* depId = m->dependency(d);
                if (!depId) continue;

                Module* dep = findById(depId);
                if (!dep) {
                    // Logs are not dispatched yet at this point of the boot.
                    Serial.printf("[MOD][ERR] Missing dependency: module='%s' requires='%s'\n",
                                  m->moduleId(), depId);
                    Log::error(LOG_TAG_CORE, "missing dependency: module=%s requires=%s",
                               m->moduleId(), depId);
                    return false;
                }

                bool depPlaced = false;
                for (uint8_t j = 0; j < orderedCount; ++j) {
                    if (ordered[j] == dep) { depPlaced = true; break; }
                }
                depsOk = depPlaced;
            }

            if (depsOk) {
                ordered[orderedCount++] = m;
                placed[i] = true;
                progress = true;
            }
        }

        if (!progress) {
            Serial.println("[MOD][ERR] Cyclic deps detected, not placed:");
            for (uint8_t i = 0; i < count; ++i) {
                if (!placed[i]) Serial.printf("   * %s\n", modules[i]->moduleId());
            }
            Log::error(LOG_TAG_CORE, "cyclic or unresolved deps detected");
            return false;
        }
    }

    Log::debug(LOG_TAG_CORE, "buildInitOrder: ordered=%u", (unsigned)orderedCount);
    return true;
}

bool ModuleManager::initAll(ConfigStore& cfg, ServiceRegistry& services) {
    Log::debug(LOG_TAG_CORE, "initAll: moduleCount=%u", (unsigned)count);

    if (!buildInitOrder()) return false;

    for (uint8_t i = 0; i < orderedCount; ++i) {
        Log::debug(LOG_TAG_CORE, "init: %s", ordered[i]->moduleId());
        ordered[i]->init(cfg, services);
    }

    /// Load persistent config after all modules registered their variables.
    cfg.loadPersistent();

    for (uint8_t i = 0; i < orderedCount; ++i) {
        ordered[i]->onConfigLoaded(cfg, services);
    }

    bool ok = true;
    for (uint8_t i = 0; i < orderedCount; ++i) {
        if (!ordered[i]->hasTask()) continue;
        Log::debug(LOG_TAG_CORE, "startTask: %s", ordered[i]->moduleId());
        if (!ordered[i]->startTask()) {
            Log::error(LOG_TAG_CORE, "task start failed: %s", ordered[i]->moduleId());
            ok = false;
        }
    }

    Log::debug(LOG_TAG_CORE, "initAll: done");
    return ok;
}

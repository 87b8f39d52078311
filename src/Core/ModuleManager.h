#pragma once
/**
 * @file ModuleManager.h
 * @brief Dependency ordering and initialization for modules.
 */
#include "Module.h"

/** @brief Maximum number of modules supported at runtime. */
constexpr uint8_t MAX_MODULES = 12;

/**
 * @brief Registers modules, resolves dependencies, and starts tasks.
 *
 * Boot order: init() in dependency order, ConfigStore::loadPersistent(),
 * onConfigLoaded() in the same order, then task start.
 */
class ModuleManager {
public:
    bool add(Module* m);
    /** @brief Run the whole boot sequence. False on a dependency or task error. */
    bool initAll(ConfigStore& cfg, ServiceRegistry& services);

    uint8_t getCount() const { return count; }
    Module* getModule(uint8_t idx) const {
        if (idx >= count) return nullptr;
        return modules[idx];
    }

private:
    Module* modules[MAX_MODULES]{};
    uint8_t count = 0;

    Module* ordered[MAX_MODULES]{};
    uint8_t orderedCount = 0;

    Module* findById(const char* id);
    bool buildInitOrder();
};

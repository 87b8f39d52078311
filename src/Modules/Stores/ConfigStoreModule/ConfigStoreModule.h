#pragma once
/**
 * @file ConfigStoreModule.h
 * @brief Module that exposes ConfigStore service.
 */
#include "Core/ModulePassive.h"
#include "Core/Services/Services.h"

/**
 * @brief Passive module wiring ConfigStore JSON services.
 */
class ConfigStoreModule : public ModulePassive {
public:
    const char* moduleId() const override { return "config"; }

    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override { return (i == 0) ? "loghub" : nullptr; }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;

private:
    ConfigStoreService svc_{};

    static bool svcApplyJson(void* ctx, const char* json, uint8_t* changedCount);
    static bool svcToJsonModule(void* ctx, const char* module, char* out, size_t outLen);
    static uint8_t svcListModules(void* ctx, const char** out, uint8_t max);
    static bool svcErase(void* ctx);
};

/**
 * @file ConfigStoreModule.cpp
 * @brief Implementation file.
 */
#include "ConfigStoreModule.h"
#define LOG_TAG "CfgModul"
#include "Core/ModuleLog.h"

bool ConfigStoreModule::svcApplyJson(void* ctx, const char* json, uint8_t* changedCount) {
    return static_cast<ConfigStore*>(ctx)->applyJson(json, changedCount);
}

bool ConfigStoreModule::svcToJsonModule(void* ctx, const char* module, char* out, size_t outLen) {
    return static_cast<ConfigStore*>(ctx)->toJsonModule(module, out, outLen);
}

uint8_t ConfigStoreModule::svcListModules(void* ctx, const char** out, uint8_t max) {
    return static_cast<ConfigStore*>(ctx)->listModules(out, max);
}

bool ConfigStoreModule::svcErase(void* ctx) {
    return static_cast<ConfigStore*>(ctx)->erasePersistent();
}

void ConfigStoreModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    svc_ = ConfigStoreService{ svcApplyJson, svcToJsonModule, svcListModules, svcErase, &cfg };
    services.add("config", &svc_);
    LOGI("ConfigStoreService registered");
}

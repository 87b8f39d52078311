#pragma once
/**
 * @file ConfigMigrations.h
 * @brief Config schema migrations run at boot before modules load NVS.
 */
#include <Preferences.h>
#include "Core/ConfigStore.h"

/** @brief Current configuration schema version. */
constexpr uint32_t CURRENT_CFG_VERSION = 1;

/** @brief Fresh or pre-schema storage: nothing to convert. */
static bool mig_0_to_1(Preferences&)
{
    return true;
}

static const MigrationStep kMigrationSteps[] = {
    {0, 1, mig_0_to_1}
};

static constexpr size_t MIGRATION_COUNT = sizeof(kMigrationSteps) / sizeof(kMigrationSteps[0]);

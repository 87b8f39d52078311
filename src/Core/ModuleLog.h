/**
 * @file ModuleLog.h
 * @brief Tagged logging macros for module sources.
 *
 * Include after `#define LOG_TAG "Xxxxxxxx"`. Never include from headers or
 * from the pure protocol core.
 */
#pragma once

#include "Core/Log.h"
#include "Core/SnprintfCheck.h"

#ifndef LOG_TAG
#define LOG_TAG "Module"
#endif

#undef LOGD
#undef LOGI
#undef LOGW
#undef LOGE

#define LOGD(...) ::Log::debug(LOG_TAG, __VA_ARGS__)
#define LOGI(...) ::Log::info(LOG_TAG, __VA_ARGS__)
#define LOGW(...) ::Log::warn(LOG_TAG, __VA_ARGS__)
#define LOGE(...) ::Log::error(LOG_TAG, __VA_ARGS__)

#ifndef WAKE_SNPRINTF_WRAP_ACTIVE
#define WAKE_SNPRINTF_WRAP_ACTIVE 1
#undef snprintf
#define snprintf(OUT, LEN, FMT, ...) \
    WAKE_SNPRINTF_CHECKED(LOG_TAG, OUT, LEN, FMT, ##__VA_ARGS__)
#endif

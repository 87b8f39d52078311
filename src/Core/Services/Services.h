#pragma once
/**
 * @file Services.h
 * @brief Convenience include for all service interfaces.
 */
#include "IConfig.h"
#include "IDeviceState.h"
#include "IEventBus.h"
#include "ILogger.h"
#include "IMqtt.h"
#include "ISystem.h"
#include "ITime.h"
#include "IWake.h"
#include "IWifi.h"

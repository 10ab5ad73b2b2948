/// @file EnvSense.h
/// @brief Umbrella header for the EnvSense sensor drivers
#pragma once

#include "EnvSense/Status.h"
#include "EnvSense/Config.h"
#include "EnvSense/CommandTable.h"
#include "EnvSense/Crc.h"
#include "EnvSense/Conversion.h"
#include "EnvSense/I2cDevice.h"
#include "EnvSense/Sensor.h"
#include "EnvSense/SHT2x.h"
#include "EnvSense/SHT4x.h"
#include "EnvSense/SHT85.h"
#include "EnvSense/SCD30.h"
#include "EnvSense/SCD4x.h"
#include "EnvSense/BusSession.h"
#include "EnvSense/Version.h"

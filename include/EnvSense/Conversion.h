/// @file Conversion.h
/// @brief Raw signal to physical unit conversion and dew point calculation
#pragma once

#include <cstdint>
#include "EnvSense/Status.h"

namespace EnvSense {

/// Linear transfer function of one sensor family
/// value = min + span * (raw & rawMask) / (2^16 - 1)
struct ConversionSpec {
  float tMin;        ///< Temperature at raw 0 (degC)
  float tSpan;       ///< Temperature span over the 16-bit range (degC)
  float rhMin;       ///< Humidity at raw 0 (%RH)
  float rhSpan;      ///< Humidity span over the 16-bit range (%RH)
  float rhFloor;     ///< Value returned instead of RH < 0.01 %
  uint16_t rawMask;  ///< Bits of the raw word that carry data
};

static constexpr ConversionSpec SHT2X_CONVERSION = {-46.85f, 175.72f, -6.0f, 125.0f, 5e-3f, 0xFFFC};
static constexpr ConversionSpec SHT4X_CONVERSION = {-45.0f, 175.0f, -6.0f, 125.0f, 1e-3f, 0xFFFF};
static constexpr ConversionSpec SHT85_CONVERSION = {-45.0f, 175.0f, 0.0f, 100.0f, 1e-3f, 0xFFFF};
static constexpr ConversionSpec SCD4X_CONVERSION = {-45.0f, 175.0f, 0.0f, 100.0f, 1e-3f, 0xFFFF};

/// RH floor used for sensors reporting humidity as float (SCD30)
static constexpr float DEFAULT_RH_FLOOR = 1e-3f;

/// Magnus coefficients (Sensirion humidity application note)
struct MagnusCoefficients {
  float alpha;   ///< hPa
  float beta;
  float lambda;  ///< degC
};

static constexpr MagnusCoefficients MAGNUS_WATER = {6.112f, 17.62f, 243.12f};
static constexpr MagnusCoefficients MAGNUS_ICE = {6.112f, 22.46f, 272.62f};

/// Round to two decimals (sensor resolution is 0.01)
float roundTo2(double value);

/// Convert raw temperature to degC, rounded to 0.01
float temperatureC(const ConversionSpec& spec, uint16_t raw);

/// Convert raw humidity to %RH above liquid water
/// Result is rounded to 0.01, never below spec.rhFloor and never above 100.
float humidityWaterPct(const ConversionSpec& spec, uint16_t raw);

/// Convert %RH above water to %RH above ice for temperatures below 0 degC
float humidityIcePct(float rhWaterPct, float temperatureC, float rhFloor);

/// Floor/clamp a humidity value and apply the ice correction when t < 0
float correctHumidity(float rhWaterPct, float temperatureC, float rhFloor);

/// Convert raw humidity to %RH, selecting the water or ice reference by temperature
float humidityPct(const ConversionSpec& spec, uint16_t raw, float temperatureC);

/// Dew point (frost point below 0 degC) from the Magnus formula
/// @param temperatureC Temperature in degC
/// @param humidityPct Relative humidity in %, must be > 0
/// @param out Dew point in degC, rounded to 0.01 (untouched on error)
/// @return INVALID_PARAM if humidity <= 0 or an input is NaN
Status dewPointC(float temperatureC, float humidityPct, float& out);

} // namespace EnvSense

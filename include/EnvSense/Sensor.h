/// @file Sensor.h
/// @brief Measurement types and the capability interface shared by all drivers
#pragma once

#include <cstdint>
#include <limits>
#include "EnvSense/Status.h"
#include "EnvSense/I2cDevice.h"

namespace EnvSense {

/// Measurement mode state
enum class MeasurementMode : uint8_t {
  IDLE,                 ///< No conversion running
  SINGLE_SHOT_PENDING,  ///< Single-shot command issued, result not read yet
  PERIODIC,             ///< Periodic (or ART) measurement running
  CONTINUOUS,           ///< Continuous measurement running (SCD30)
  LOW_POWER_PERIODIC    ///< Low power periodic measurement running (SCD4x)
};

/// Measurement result
/// Physical fields stay NaN until the first successful read.
struct Measurement {
  float temperatureC = std::numeric_limits<float>::quiet_NaN();
  float humidityPct = std::numeric_limits<float>::quiet_NaN();
  float dewPointC = std::numeric_limits<float>::quiet_NaN();
  float co2Ppm = std::numeric_limits<float>::quiet_NaN();  ///< CO2 sensors only
  bool valid = false;
};

/// Fill a measurement from converted values and derive the dew point
/// @param co2Ppm CO2 concentration, NaN for humidity-only sensors
/// @return INVALID_PARAM if the dew point cannot be computed (out untouched)
Status completeMeasurement(float temperatureC, float humidityPct, float co2Ppm,
                           Measurement& out);

/// Capability interface implemented by every sensor driver
class Sensor {
public:
  virtual ~Sensor() = default;

  /// Model name (static string)
  virtual const char* name() const = 0;

  /// Read the electronic serial number
  virtual Status readSerialNumber(uint64_t& serial) = 0;

  /// Blocking single measurement
  /// @return UNSUPPORTED if the model has no single-shot mode
  virtual Status singleShot(Measurement& out) = 0;

  /// Read the next sample of a running periodic/continuous measurement
  /// @return TIMEOUT if no sample becomes ready within the bounded poll,
  ///         UNSUPPORTED if the model has no periodic mode
  virtual Status fetch(Measurement& out) = 0;

  /// Return to idle. Safe to call when no measurement is running.
  virtual Status stop() = 0;

  virtual MeasurementMode mode() const = 0;

  /// Last successful measurement
  virtual const Measurement& measurement() const = 0;

  virtual I2cDevice& device() = 0;
  virtual const I2cDevice& device() const = 0;
};

} // namespace EnvSense

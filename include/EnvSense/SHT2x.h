/// @file SHT2x.h
/// @brief SHT2x (SHT20/SHT21/SHT25) temperature and humidity driver
#pragma once

#include <cstdint>
#include "EnvSense/Status.h"
#include "EnvSense/Config.h"
#include "EnvSense/Sensor.h"

namespace EnvSense {

/// SHT2x driver: two sequential single-shot conversions (T then RH)
class SHT2x : public Sensor {
public:
  // =========================================================================
  // Lifecycle
  // =========================================================================

  /// Validate configuration and bind the device (no I/O)
  Status begin(const SHT2xConfig& config);

  void end();

  // =========================================================================
  // Sensor interface
  // =========================================================================

  const char* name() const override { return "SHT2x"; }

  /// Read the 64-bit electronic identification code
  Status readSerialNumber(uint64_t& serial) override;

  /// Temperature conversion followed by a humidity conversion
  Status singleShot(Measurement& out) override;

  /// SHT2x has no periodic mode
  Status fetch(Measurement& out) override;

  /// No conversion runs between commands, so this only resets the mode
  Status stop() override;

  MeasurementMode mode() const override { return _mode; }
  const Measurement& measurement() const override { return _measurement; }
  I2cDevice& device() override { return _device; }
  const I2cDevice& device() const override { return _device; }

  HoldMode holdMode() const { return _config.holdMode; }

  // =========================================================================
  // Measurement
  // =========================================================================

  /// Single temperature conversion (85 ms)
  Status singleShotTemperature(float& temperatureC);

  /// Single humidity conversion (29 ms) over liquid water
  Status singleShotHumidity(float& humidityPct);

  /// Single humidity conversion (29 ms) with the ice correction applied
  /// below 0 degC
  /// @param temperatureC Temperature measured alongside (NaN = water only)
  Status singleShotHumidity(float temperatureC, float& humidityPct);

  // =========================================================================
  // User register
  // =========================================================================

  Status readUserRegister(uint8_t& value);

  /// Write the user register. Reserved bits are taken from the current
  /// register content.
  Status writeUserRegister(uint8_t value);

  Status setResolution(Sht2xResolution resolution);
  Status getResolution(Sht2xResolution& out);

  Status setHeater(bool enable);
  Status readHeater(bool& enabled);

  /// OTP reload before each measurement (enabled after reset)
  Status setOtpReload(bool enable);
  Status readOtpReload(bool& enabled);

  /// True if VDD dropped below 2.25 V
  Status readEndOfBattery(bool& low);

  /// Soft reset (15 ms)
  Status softReset();

private:
  Status _measureRaw(uint8_t command, uint32_t waitMs, uint16_t& raw);
  Status _updateUserRegister(uint8_t mask, uint8_t bits);

  SHT2xConfig _config;
  I2cDevice _device;
  Measurement _measurement;
  MeasurementMode _mode = MeasurementMode::IDLE;
};

} // namespace EnvSense

/// @file SHT4x.h
/// @brief SHT4x temperature and humidity driver
#pragma once

#include <cstdint>
#include "EnvSense/Status.h"
#include "EnvSense/Config.h"
#include "EnvSense/Sensor.h"

namespace EnvSense {

/// SHT4x driver: single-shot only, with optional heater pulse
class SHT4x : public Sensor {
public:
  /// Validate configuration and bind the device (no I/O)
  Status begin(const SHT4xConfig& config);

  void end();

  const char* name() const override { return "SHT4x"; }

  Status readSerialNumber(uint64_t& serial) override;

  /// Measure with the configured repeatability
  Status singleShot(Measurement& out) override;

  /// SHT4x has no periodic mode
  Status fetch(Measurement& out) override;

  Status stop() override;

  MeasurementMode mode() const override { return _mode; }
  const Measurement& measurement() const override { return _measurement; }
  I2cDevice& device() override { return _device; }
  const I2cDevice& device() const override { return _device; }

  Repeatability repeatability() const { return _config.repeatability; }

  /// Activate the heater, then measure at high repeatability
  /// @note Heater duty cycle must stay below 10 % (application responsibility)
  Status singleShotWithHeater(HeaterPower power, HeaterDuration duration, Measurement& out);

  /// Soft reset (1 ms)
  Status softReset();

private:
  Status _measure(uint8_t command, uint32_t waitMs, Measurement& out);

  static uint8_t _commandForRepeatability(Repeatability rep, uint32_t& waitMs);
  static uint8_t _commandForHeater(HeaterPower power, HeaterDuration duration, uint32_t& waitMs);

  SHT4xConfig _config;
  I2cDevice _device;
  Measurement _measurement;
  MeasurementMode _mode = MeasurementMode::IDLE;
};

} // namespace EnvSense

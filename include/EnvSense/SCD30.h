/// @file SCD30.h
/// @brief SCD30 CO2, temperature and humidity driver
#pragma once

#include <cstdint>
#include "EnvSense/Status.h"
#include "EnvSense/CommandTable.h"
#include "EnvSense/Config.h"
#include "EnvSense/Sensor.h"

namespace EnvSense {

/// SCD30 driver (continuous measurement only)
class SCD30 : public Sensor {
public:
  // =========================================================================
  // Lifecycle
  // =========================================================================

  /// Validate configuration and bind the device (no I/O)
  Status begin(const SCD30Config& config);

  void end();

  // =========================================================================
  // Sensor interface
  // =========================================================================

  const char* name() const override { return "SCD30"; }

  /// Serial number from the first six characters of the ID string
  Status readSerialNumber(uint64_t& serial) override;

  /// SCD30 has no single-shot mode
  Status singleShot(Measurement& out) override;

  /// Poll the data-ready register, then read CO2, T and RH
  /// The wait covers one measurement interval plus the configured margin.
  /// @return TIMEOUT if data-ready stays 0 for that long
  Status fetch(Measurement& out) override;

  /// Stop continuous measurement
  Status stop() override;

  MeasurementMode mode() const override { return _mode; }
  const Measurement& measurement() const override { return _measurement; }
  I2cDevice& device() override { return _device; }
  const I2cDevice& device() const override { return _device; }

  // =========================================================================
  // Continuous measurement
  // =========================================================================

  /// Start with the configured ambient pressure compensation
  Status startContinuous();

  /// Start with ambient pressure compensation
  /// @param pressureMbar 0 (no compensation) or 700..1200 mbar
  Status startContinuous(uint16_t pressureMbar);

  /// Poll data-ready once
  Status readDataReady(bool& ready);

  // =========================================================================
  // Calibration / configuration
  // =========================================================================

  /// Write the configured start-up settings
  Status applySettings();

  /// Measurement interval in seconds (2..1800)
  Status setMeasurementInterval(uint16_t seconds);
  Status getMeasurementInterval(uint16_t& seconds);

  /// Automatic self-calibration
  Status setAutoSelfCalibration(bool enable);
  Status getAutoSelfCalibration(bool& enabled);

  /// Forced recalibration reference (400..2000 ppm)
  Status setForcedRecalibration(uint16_t co2Ppm);
  Status getForcedRecalibration(uint16_t& co2Ppm);

  /// Temperature offset in degC (0..20, 0.01 resolution)
  Status setTemperatureOffset(float offsetC);
  Status getTemperatureOffset(float& offsetC);

  /// Altitude compensation in metres above sea level (0..3000)
  Status setAltitude(uint16_t meters);
  Status getAltitude(uint16_t& meters);

  Status readFirmwareVersion(uint8_t& major, uint8_t& minor);

  /// Soft reset (sensor restarts, 2 s)
  Status softReset();

private:
  Status _writeWord(uint16_t command, uint16_t value);
  Status _readWord(uint16_t command, uint16_t& value);

  static float _wordsToFloat(uint16_t msw, uint16_t lsw);

  SCD30Config _config;
  I2cDevice _device;
  Measurement _measurement;
  MeasurementMode _mode = MeasurementMode::IDLE;
  uint16_t _intervalS = cmd::scd30::INTERVAL_DEFAULT_S; ///< Last interval written or read
};

} // namespace EnvSense

/// @file SCD4x.h
/// @brief SCD40/SCD41 CO2, temperature and humidity driver
#pragma once

#include <cstdint>
#include "EnvSense/Status.h"
#include "EnvSense/Config.h"
#include "EnvSense/Sensor.h"

namespace EnvSense {

/// SCD4x driver
/// Configuration commands are only accepted in idle mode; if a periodic
/// measurement runs they stop it first (500 ms).
class SCD4x : public Sensor {
public:
  // =========================================================================
  // Lifecycle
  // =========================================================================

  /// Validate configuration and bind the device (no I/O)
  Status begin(const SCD4xConfig& config);

  void end();

  // =========================================================================
  // Sensor interface
  // =========================================================================

  const char* name() const override {
    return _config.variant == Scd4xVariant::SCD41 ? "SCD41" : "SCD40";
  }

  /// 48-bit serial number (stops periodic mode first)
  Status readSerialNumber(uint64_t& serial) override;

  /// On-demand CO2, T and RH measurement (SCD41 only, 5 s)
  Status singleShot(Measurement& out) override;

  /// Poll data-ready, then read CO2, T and RH
  /// The wait covers the active mode's sample period plus the configured margin.
  /// @return TIMEOUT if no sample becomes ready in that time
  Status fetch(Measurement& out) override;

  /// Stop periodic measurement (500 ms). Always sent, even when idle.
  Status stop() override;

  MeasurementMode mode() const override { return _mode; }
  const Measurement& measurement() const override { return _measurement; }
  I2cDevice& device() override { return _device; }
  const I2cDevice& device() const override { return _device; }

  Scd4xVariant variant() const { return _config.variant; }

  /// Write the configured start-up settings (stops periodic mode when any
  /// setting needs the sensor idle)
  Status applySettings();

  // =========================================================================
  // Measurement
  // =========================================================================

  /// Periodic measurement, 5 s signal update interval
  Status startPeriodic();

  /// Low power periodic measurement, ~30 s signal update interval
  Status startLowPowerPeriodic();

  /// Poll data-ready once
  Status readDataReady(bool& ready);

  /// On-demand T and RH only (SCD41 only, 50 ms). CO2 reads as 0 ppm.
  Status singleShotRht(Measurement& out);

  // =========================================================================
  // Calibration / configuration
  // =========================================================================

  Status setAutoSelfCalibration(bool enable);
  Status getAutoSelfCalibration(bool& enabled);

  /// Forced recalibration against a reference concentration (400..2000 ppm)
  /// @param correctionPpm FRC correction applied by the sensor
  /// @return COMMAND_FAILED if the sensor rejected the recalibration
  Status performForcedRecalibration(uint16_t referencePpm, int16_t& correctionPpm);

  /// Temperature offset in degC (0..20)
  Status setTemperatureOffset(float offsetC);
  Status getTemperatureOffset(float& offsetC);

  /// Sensor altitude in metres above sea level (0..3000)
  Status setAltitude(uint16_t meters);
  Status getAltitude(uint16_t& meters);

  /// Ambient pressure in Pa (70000..120000). Allowed during periodic mode.
  Status setAmbientPressure(uint32_t pascal);
  Status getAmbientPressure(uint32_t& pascal);

  /// Store configuration in EEPROM (800 ms)
  Status persistSettings();

  /// End-of-line self test (10 s)
  /// @param malfunction Non-zero if the sensor detected a malfunction
  /// @return OK even when a malfunction is reported
  Status selfTest(uint16_t& malfunction);

  /// Reset EEPROM configuration and calibration history (1.2 s)
  Status factoryReset();

  /// Reload user settings from EEPROM (30 ms)
  Status reinit();

  // =========================================================================
  // SCD41 only
  // =========================================================================

  Status powerDown();
  Status wakeUp();

  /// Initial ASC period in hours (multiple of 4)
  Status setAscInitialPeriod(uint16_t hours);
  Status getAscInitialPeriod(uint16_t& hours);

  /// Standard ASC period in hours (multiple of 4)
  Status setAscStandardPeriod(uint16_t hours);
  Status getAscStandardPeriod(uint16_t& hours);

private:
  Status _ensureIdle();
  Status _requireScd41() const;
  Status _readMeasurement(Measurement& out);
  Status _writeWord(uint16_t command, uint16_t value, uint32_t waitMs);
  Status _readWord(uint16_t command, uint16_t& value, uint32_t waitMs);
  Status _idleWrite(uint16_t command, uint16_t value);
  Status _idleRead(uint16_t command, uint16_t& value);
  Status _idleCommand(uint16_t command, uint32_t waitMs);
  uint32_t _samplePeriodMs() const;

  SCD4xConfig _config;
  I2cDevice _device;
  Measurement _measurement;
  MeasurementMode _mode = MeasurementMode::IDLE;
};

} // namespace EnvSense

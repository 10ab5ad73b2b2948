/// @file SHT85.h
/// @brief SHT85 temperature and humidity driver (SHT3x command set)
#pragma once

#include <cstdint>
#include "EnvSense/Status.h"
#include "EnvSense/Config.h"
#include "EnvSense/Sensor.h"

namespace EnvSense {

/// Parsed status register
struct StatusRegister {
  uint16_t raw = 0;
  bool alertPending = false;
  bool heaterOn = false;
  bool rhAlert = false;
  bool tAlert = false;
  bool resetDetected = false;
  bool commandError = false;
  bool writeCrcError = false;
};

/// SHT85 driver
class SHT85 : public Sensor {
public:
  // =========================================================================
  // Lifecycle
  // =========================================================================

  /// Validate configuration and bind the device (no I/O)
  Status begin(const SHT85Config& config);

  void end();

  // =========================================================================
  // Sensor interface
  // =========================================================================

  const char* name() const override { return "SHT85"; }

  Status readSerialNumber(uint64_t& serial) override;

  /// Single-shot measurement with the configured repeatability
  /// @return BUSY while periodic mode runs
  Status singleShot(Measurement& out) override;

  /// Fetch the latest periodic sample
  /// A read NACK (reported as MEASUREMENT_NOT_READY by a transport with
  /// READ_HEADER_NACK) is retried for one sample period plus the margin.
  /// @return TIMEOUT if no sample arrives, INVALID_PARAM if periodic mode is off
  Status fetch(Measurement& out) override;

  /// Break command (stops periodic and ART mode)
  Status stop() override;

  MeasurementMode mode() const override { return _mode; }
  const Measurement& measurement() const override { return _measurement; }
  I2cDevice& device() override { return _device; }
  const I2cDevice& device() const override { return _device; }

  // =========================================================================
  // Periodic mode
  // =========================================================================

  /// Start periodic measurements with the configured rate and repeatability
  Status startPeriodic();

  Status startPeriodic(PeriodicRate rate, Repeatability rep);

  /// Start ART (accelerated response time, 4 Hz)
  Status startArt();

  bool artActive() const { return _artActive; }
  PeriodicRate periodicRate() const { return _config.periodicRate; }
  Repeatability repeatability() const { return _config.repeatability; }

  // =========================================================================
  // Status / Heater / Reset
  // =========================================================================

  Status readStatus(uint16_t& raw);
  Status readStatus(StatusRegister& out);

  /// Clear alert, reset and command flags
  Status clearStatus();

  /// Read the status register and report the flags not at their default
  /// @param flags Status bits that are set (all documented defaults are 0)
  Status checkStatus(uint16_t& flags);

  Status setHeater(bool enable);
  Status readHeaterStatus(bool& enabled);

  /// Break, then soft reset
  Status softReset();

private:
  Status _readMeasurement(const Command& command, Measurement& out);
  Status _enterPeriodic(PeriodicRate rate, Repeatability rep, bool art);

  static uint16_t _commandForSingleShot(Repeatability rep, uint32_t& waitMs);
  static uint16_t _commandForPeriodic(Repeatability rep, PeriodicRate rate);

  SHT85Config _config;
  I2cDevice _device;
  Measurement _measurement;
  MeasurementMode _mode = MeasurementMode::IDLE;
  bool _artActive = false;
};

} // namespace EnvSense

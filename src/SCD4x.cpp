/**
 * @file SCD4x.cpp
 * @brief SCD4x driver implementation.
 */

#include "EnvSense/SCD4x.h"

#include <cmath>

#include "EnvSense/CommandTable.h"
#include "EnvSense/Conversion.h"

namespace EnvSense {
namespace {

static constexpr double OFFSET_SCALE = 65535.0 / 175.0;
static constexpr uint32_t PRESSURE_STEP_PA = 100;

static bool isValidVariant(Scd4xVariant variant) {
  return variant == Scd4xVariant::SCD40 || variant == Scd4xVariant::SCD41;
}

static bool isValidToggle(Toggle t) {
  return t == Toggle::KEEP || t == Toggle::ENABLE || t == Toggle::DISABLE;
}

static Status validateSettings(const SCD4xSettings& s) {
  if (!isValidToggle(s.autoSelfCalibration)) {
    return Status::Error(Err::INVALID_CONFIG, "Invalid ASC setting");
  }
  if (!std::isnan(s.temperatureOffsetC) &&
      (s.temperatureOffsetC < 0.0f || s.temperatureOffsetC > cmd::TEMPERATURE_OFFSET_MAX_C)) {
    return Status::Error(Err::INVALID_CONFIG, "Temperature offset must be 0..20 degC");
  }
  if (s.altitudeM < -1 || s.altitudeM > cmd::ALTITUDE_MAX_M) {
    return Status::Error(Err::INVALID_CONFIG, "Altitude must be 0..3000 m", s.altitudeM);
  }
  if (s.ambientPressurePa != 0 &&
      (s.ambientPressurePa < cmd::scd4x::PRESSURE_MIN_PA ||
       s.ambientPressurePa > cmd::scd4x::PRESSURE_MAX_PA)) {
    return Status::Error(Err::INVALID_CONFIG, "Ambient pressure must be 70000..120000 Pa",
                         static_cast<int32_t>(s.ambientPressurePa));
  }
  return Status::Ok();
}

}  // namespace

// ============================================================================
// Lifecycle
// ============================================================================

Status SCD4x::begin(const SCD4xConfig& config) {
  _mode = MeasurementMode::IDLE;
  _measurement = Measurement{};

  if (!isValidVariant(config.variant)) {
    return Status::Error(Err::INVALID_CONFIG, "Invalid SCD4x variant");
  }
  Status st = validateSettings(config.settings);
  if (!st.ok()) {
    return st;
  }

  st = _device.begin(config.bus, cmd::scd4x::I2C_ADDR);
  if (!st.ok()) {
    return st;
  }

  _config = config;
  return Status::Ok();
}

void SCD4x::end() {
  _device.end();
  _mode = MeasurementMode::IDLE;
}

// ============================================================================
// Sensor interface
// ============================================================================

Status SCD4x::readSerialNumber(uint64_t& serial) {
  Status st = _ensureIdle();
  if (!st.ok()) {
    return st;
  }

  Response resp;
  st = _device.execute(Command::op16(cmd::scd4x::CMD_SERIAL, cmd::scd4x::WAIT_MS,
                                     cmd::scd4x::SERIAL_DATA_LEN),
                       &resp);
  if (!st.ok()) {
    return st;
  }

  serial = (static_cast<uint64_t>(resp.word(0)) << 32) |
           (static_cast<uint64_t>(resp.word(1)) << 16) | resp.word(2);
  return Status::Ok();
}

Status SCD4x::singleShot(Measurement& out) {
  Status st = _requireScd41();
  if (!st.ok()) {
    return st;
  }
  st = _idleCommand(cmd::scd4x::CMD_SINGLE_SHOT, cmd::scd4x::WAIT_SINGLE_SHOT_MS);
  if (!st.ok()) {
    return st;
  }

  _mode = MeasurementMode::SINGLE_SHOT_PENDING;
  st = fetch(out);
  _mode = MeasurementMode::IDLE;
  return st;
}

Status SCD4x::fetch(Measurement& out) {
  const BusConfig& bus = _device.config();
  const uint32_t periodMs = _samplePeriodMs();
  const uint32_t attempts = _device.readyPollBudget(periodMs);

  bool ready = false;
  for (uint32_t attempt = 0; attempt < attempts; ++attempt) {
    Status st = readDataReady(ready);
    if (!st.ok()) {
      return st;
    }
    if (ready) {
      break;
    }
    st = _device.waitMs(bus.readyPollIntervalMs);
    if (!st.ok()) {
      return st;
    }
  }
  if (!ready) {
    return Status::Error(Err::TIMEOUT, "Data ready not set",
                         static_cast<int32_t>(_device.readyTimeoutMs(periodMs)));
  }

  return _readMeasurement(out);
}

Status SCD4x::stop() {
  Status st = _device.execute(Command::op16(cmd::scd4x::CMD_STOP_PERIODIC,
                                            cmd::scd4x::WAIT_STOP_MS));
  if (!st.ok()) {
    return st;
  }
  _mode = MeasurementMode::IDLE;
  return Status::Ok();
}

// ============================================================================
// Measurement
// ============================================================================

Status SCD4x::startPeriodic() {
  Status st = _idleCommand(cmd::scd4x::CMD_START_PERIODIC, cmd::scd4x::WAIT_MS);
  if (!st.ok()) {
    return st;
  }
  _mode = MeasurementMode::PERIODIC;
  return Status::Ok();
}

Status SCD4x::startLowPowerPeriodic() {
  Status st = _idleCommand(cmd::scd4x::CMD_START_LOW_POWER_PERIODIC, cmd::scd4x::WAIT_MS);
  if (!st.ok()) {
    return st;
  }
  _mode = MeasurementMode::LOW_POWER_PERIODIC;
  return Status::Ok();
}

Status SCD4x::readDataReady(bool& ready) {
  uint16_t value = 0;
  Status st = _readWord(cmd::scd4x::CMD_DATA_READY, value, cmd::scd4x::WAIT_MS);
  if (!st.ok()) {
    return st;
  }
  ready = (value & cmd::scd4x::DATA_READY_MASK) != 0;
  return Status::Ok();
}

Status SCD4x::singleShotRht(Measurement& out) {
  Status st = _requireScd41();
  if (!st.ok()) {
    return st;
  }
  st = _idleCommand(cmd::scd4x::CMD_SINGLE_SHOT_RHT, cmd::scd4x::WAIT_SINGLE_SHOT_RHT_MS);
  if (!st.ok()) {
    return st;
  }

  _mode = MeasurementMode::SINGLE_SHOT_PENDING;
  st = fetch(out);
  _mode = MeasurementMode::IDLE;
  return st;
}

// ============================================================================
// Calibration / configuration
// ============================================================================

Status SCD4x::setAutoSelfCalibration(bool enable) {
  return _idleWrite(cmd::scd4x::CMD_SET_ASC, enable ? 1 : 0);
}

Status SCD4x::getAutoSelfCalibration(bool& enabled) {
  uint16_t value = 0;
  Status st = _idleRead(cmd::scd4x::CMD_GET_ASC, value);
  if (!st.ok()) {
    return st;
  }
  enabled = (value != 0);
  return Status::Ok();
}

Status SCD4x::performForcedRecalibration(uint16_t referencePpm, int16_t& correctionPpm) {
  if (referencePpm < cmd::CO2_REFERENCE_MIN_PPM || referencePpm > cmd::CO2_REFERENCE_MAX_PPM) {
    return Status::Error(Err::OUT_OF_RANGE, "CO2 reference must be 400..2000 ppm", referencePpm);
  }

  Status st = _ensureIdle();
  if (!st.ok()) {
    return st;
  }

  Response resp;
  st = _device.execute(Command::op16(cmd::scd4x::CMD_FORCED_RECALIBRATION,
                                     cmd::scd4x::WAIT_FRC_MS, cmd::WORD_DATA_LEN)
                           .withWord(referencePpm),
                       &resp);
  if (!st.ok()) {
    return st;
  }

  const uint16_t raw = resp.word(0);
  if (raw == cmd::scd4x::FRC_FAILED) {
    return Status::Error(Err::COMMAND_FAILED, "Forced recalibration failed", raw);
  }
  correctionPpm = static_cast<int16_t>(static_cast<int32_t>(raw) - cmd::scd4x::FRC_OFFSET);
  return Status::Ok();
}

Status SCD4x::setTemperatureOffset(float offsetC) {
  if (std::isnan(offsetC) || offsetC < 0.0f || offsetC > cmd::TEMPERATURE_OFFSET_MAX_C) {
    return Status::Error(Err::OUT_OF_RANGE, "Temperature offset must be 0..20 degC");
  }
  const uint16_t raw = static_cast<uint16_t>(
      std::lround(static_cast<double>(offsetC) * OFFSET_SCALE));
  return _idleWrite(cmd::scd4x::CMD_SET_TEMPERATURE_OFFSET, raw);
}

Status SCD4x::getTemperatureOffset(float& offsetC) {
  uint16_t raw = 0;
  Status st = _idleRead(cmd::scd4x::CMD_GET_TEMPERATURE_OFFSET, raw);
  if (!st.ok()) {
    return st;
  }
  offsetC = roundTo2(static_cast<double>(raw) / OFFSET_SCALE);
  return Status::Ok();
}

Status SCD4x::setAltitude(uint16_t meters) {
  if (meters > cmd::ALTITUDE_MAX_M) {
    return Status::Error(Err::OUT_OF_RANGE, "Altitude must be 0..3000 m", meters);
  }
  return _idleWrite(cmd::scd4x::CMD_SET_ALTITUDE, meters);
}

Status SCD4x::getAltitude(uint16_t& meters) {
  return _idleRead(cmd::scd4x::CMD_GET_ALTITUDE, meters);
}

Status SCD4x::setAmbientPressure(uint32_t pascal) {
  if (pascal < cmd::scd4x::PRESSURE_MIN_PA || pascal > cmd::scd4x::PRESSURE_MAX_PA) {
    return Status::Error(Err::OUT_OF_RANGE, "Ambient pressure must be 70000..120000 Pa",
                         static_cast<int32_t>(pascal));
  }
  return _writeWord(cmd::scd4x::CMD_AMBIENT_PRESSURE,
                    static_cast<uint16_t>(pascal / PRESSURE_STEP_PA), cmd::scd4x::WAIT_MS);
}

Status SCD4x::getAmbientPressure(uint32_t& pascal) {
  uint16_t raw = 0;
  Status st = _readWord(cmd::scd4x::CMD_AMBIENT_PRESSURE, raw, cmd::scd4x::WAIT_MS);
  if (!st.ok()) {
    return st;
  }
  pascal = static_cast<uint32_t>(raw) * PRESSURE_STEP_PA;
  return Status::Ok();
}

Status SCD4x::applySettings() {
  const SCD4xSettings& s = _config.settings;

  if (s.autoSelfCalibration != Toggle::KEEP) {
    Status st = setAutoSelfCalibration(s.autoSelfCalibration == Toggle::ENABLE);
    if (!st.ok()) {
      return st;
    }
  }
  if (!std::isnan(s.temperatureOffsetC)) {
    Status st = setTemperatureOffset(s.temperatureOffsetC);
    if (!st.ok()) {
      return st;
    }
  }
  if (s.altitudeM >= 0) {
    Status st = setAltitude(static_cast<uint16_t>(s.altitudeM));
    if (!st.ok()) {
      return st;
    }
  }
  if (s.ambientPressurePa != 0) {
    Status st = setAmbientPressure(s.ambientPressurePa);
    if (!st.ok()) {
      return st;
    }
  }
  return Status::Ok();
}

Status SCD4x::persistSettings() {
  return _idleCommand(cmd::scd4x::CMD_PERSIST_SETTINGS, cmd::scd4x::WAIT_PERSIST_MS);
}

Status SCD4x::selfTest(uint16_t& malfunction) {
  Status st = _ensureIdle();
  if (!st.ok()) {
    return st;
  }
  return _readWord(cmd::scd4x::CMD_SELF_TEST, malfunction, cmd::scd4x::WAIT_SELF_TEST_MS);
}

Status SCD4x::factoryReset() {
  return _idleCommand(cmd::scd4x::CMD_FACTORY_RESET, cmd::scd4x::WAIT_FACTORY_RESET_MS);
}

Status SCD4x::reinit() {
  return _idleCommand(cmd::scd4x::CMD_REINIT, cmd::scd4x::WAIT_REINIT_MS);
}

// ============================================================================
// SCD41 only
// ============================================================================

Status SCD4x::powerDown() {
  Status st = _requireScd41();
  if (!st.ok()) {
    return st;
  }
  return _idleCommand(cmd::scd4x::CMD_POWER_DOWN, cmd::scd4x::WAIT_MS);
}

Status SCD4x::wakeUp() {
  Status st = _requireScd41();
  if (!st.ok()) {
    return st;
  }
  // Sleeping sensor is idle, no stop needed
  return _device.execute(Command::op16(cmd::scd4x::CMD_WAKE_UP, cmd::scd4x::WAIT_WAKE_UP_MS));
}

Status SCD4x::setAscInitialPeriod(uint16_t hours) {
  Status st = _requireScd41();
  if (!st.ok()) {
    return st;
  }
  if (hours % cmd::scd4x::ASC_PERIOD_STEP_H != 0) {
    return Status::Error(Err::OUT_OF_RANGE, "ASC period must be a multiple of 4 h", hours);
  }
  return _idleWrite(cmd::scd4x::CMD_SET_ASC_INITIAL_PERIOD, hours);
}

Status SCD4x::getAscInitialPeriod(uint16_t& hours) {
  Status st = _requireScd41();
  if (!st.ok()) {
    return st;
  }
  return _idleRead(cmd::scd4x::CMD_GET_ASC_INITIAL_PERIOD, hours);
}

Status SCD4x::setAscStandardPeriod(uint16_t hours) {
  Status st = _requireScd41();
  if (!st.ok()) {
    return st;
  }
  if (hours % cmd::scd4x::ASC_PERIOD_STEP_H != 0) {
    return Status::Error(Err::OUT_OF_RANGE, "ASC period must be a multiple of 4 h", hours);
  }
  return _idleWrite(cmd::scd4x::CMD_SET_ASC_STANDARD_PERIOD, hours);
}

Status SCD4x::getAscStandardPeriod(uint16_t& hours) {
  Status st = _requireScd41();
  if (!st.ok()) {
    return st;
  }
  return _idleRead(cmd::scd4x::CMD_GET_ASC_STANDARD_PERIOD, hours);
}

// ============================================================================
// Internal Helpers
// ============================================================================

Status SCD4x::_ensureIdle() {
  if (_mode == MeasurementMode::PERIODIC || _mode == MeasurementMode::LOW_POWER_PERIODIC) {
    return stop();
  }
  return Status::Ok();
}

Status SCD4x::_requireScd41() const {
  if (_config.variant != Scd4xVariant::SCD41) {
    return Status::Error(Err::UNSUPPORTED, "Command requires SCD41");
  }
  return Status::Ok();
}

Status SCD4x::_readMeasurement(Measurement& out) {
  Response resp;
  Status st = _device.execute(Command::op16(cmd::scd4x::CMD_READ_MEASUREMENT, cmd::scd4x::WAIT_MS,
                                            cmd::scd4x::MEASUREMENT_DATA_LEN),
                              &resp);
  if (!st.ok()) {
    return st;
  }

  const float co2 = static_cast<float>(resp.word(0));
  const float t = temperatureC(SCD4X_CONVERSION, resp.word(1));
  const float rh = humidityPct(SCD4X_CONVERSION, resp.word(2), t);
  st = completeMeasurement(t, rh, co2, _measurement);
  if (!st.ok()) {
    return st;
  }

  out = _measurement;
  return Status::Ok();
}

Status SCD4x::_writeWord(uint16_t command, uint16_t value, uint32_t waitMs) {
  return _device.execute(Command::op16(command, waitMs).withWord(value));
}

Status SCD4x::_readWord(uint16_t command, uint16_t& value, uint32_t waitMs) {
  Response resp;
  Status st = _device.execute(Command::op16(command, waitMs, cmd::WORD_DATA_LEN), &resp);
  if (!st.ok()) {
    return st;
  }
  value = resp.word(0);
  return Status::Ok();
}

Status SCD4x::_idleWrite(uint16_t command, uint16_t value) {
  Status st = _ensureIdle();
  if (!st.ok()) {
    return st;
  }
  return _writeWord(command, value, cmd::scd4x::WAIT_MS);
}

Status SCD4x::_idleRead(uint16_t command, uint16_t& value) {
  Status st = _ensureIdle();
  if (!st.ok()) {
    return st;
  }
  return _readWord(command, value, cmd::scd4x::WAIT_MS);
}

uint32_t SCD4x::_samplePeriodMs() const {
  switch (_mode) {
    case MeasurementMode::PERIODIC:
      return cmd::scd4x::PERIOD_MS;
    case MeasurementMode::LOW_POWER_PERIODIC:
      return cmd::scd4x::LOW_POWER_PERIOD_MS;
    default:
      // Single shot commands already waited for their conversion
      return 0;
  }
}

Status SCD4x::_idleCommand(uint16_t command, uint32_t waitMs) {
  Status st = _ensureIdle();
  if (!st.ok()) {
    return st;
  }
  return _device.execute(Command::op16(command, waitMs));
}

} // namespace EnvSense

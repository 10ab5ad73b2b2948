/**
 * @file SCD30.cpp
 * @brief SCD30 driver implementation.
 */

#include "EnvSense/SCD30.h"

#include <cmath>
#include <cstring>

#include "EnvSense/CommandTable.h"
#include "EnvSense/Conversion.h"

namespace EnvSense {
namespace {

static bool isValidPressure(uint16_t mbar) {
  return mbar == 0 ||
         (mbar >= cmd::scd30::PRESSURE_MIN_MBAR && mbar <= cmd::scd30::PRESSURE_MAX_MBAR);
}

static bool isValidToggle(Toggle t) {
  return t == Toggle::KEEP || t == Toggle::ENABLE || t == Toggle::DISABLE;
}

static Status validateSettings(const SCD30Settings& s) {
  if (s.measurementIntervalS != 0 && (s.measurementIntervalS < cmd::scd30::INTERVAL_MIN_S ||
                                      s.measurementIntervalS > cmd::scd30::INTERVAL_MAX_S)) {
    return Status::Error(Err::INVALID_CONFIG, "Interval must be 2..1800 s",
                         s.measurementIntervalS);
  }
  if (!isValidToggle(s.autoSelfCalibration)) {
    return Status::Error(Err::INVALID_CONFIG, "Invalid ASC setting");
  }
  if (s.forcedRecalibrationPpm != 0 &&
      (s.forcedRecalibrationPpm < cmd::CO2_REFERENCE_MIN_PPM ||
       s.forcedRecalibrationPpm > cmd::CO2_REFERENCE_MAX_PPM)) {
    return Status::Error(Err::INVALID_CONFIG, "CO2 reference must be 400..2000 ppm",
                         s.forcedRecalibrationPpm);
  }
  if (!std::isnan(s.temperatureOffsetC) &&
      (s.temperatureOffsetC < 0.0f || s.temperatureOffsetC > cmd::TEMPERATURE_OFFSET_MAX_C)) {
    return Status::Error(Err::INVALID_CONFIG, "Temperature offset must be 0..20 degC");
  }
  if (s.altitudeM < -1 || s.altitudeM > cmd::ALTITUDE_MAX_M) {
    return Status::Error(Err::INVALID_CONFIG, "Altitude must be 0..3000 m", s.altitudeM);
  }
  return Status::Ok();
}

}  // namespace

// ============================================================================
// Lifecycle
// ============================================================================

Status SCD30::begin(const SCD30Config& config) {
  _mode = MeasurementMode::IDLE;
  _measurement = Measurement{};
  _intervalS = cmd::scd30::INTERVAL_DEFAULT_S;

  if (!isValidPressure(config.ambientPressureMbar)) {
    return Status::Error(Err::INVALID_CONFIG, "Ambient pressure must be 0 or 700..1200 mbar",
                         config.ambientPressureMbar);
  }
  Status st = validateSettings(config.settings);
  if (!st.ok()) {
    return st;
  }

  st = _device.begin(config.bus, cmd::scd30::I2C_ADDR);
  if (!st.ok()) {
    return st;
  }

  _config = config;
  return Status::Ok();
}

void SCD30::end() {
  _device.end();
  _mode = MeasurementMode::IDLE;
}

// ============================================================================
// Sensor interface
// ============================================================================

Status SCD30::readSerialNumber(uint64_t& serial) {
  Response resp;
  Status st = _device.execute(Command::op16(cmd::scd30::CMD_SERIAL, cmd::scd30::WAIT_MS,
                                            cmd::scd30::SERIAL_DATA_LEN),
                              &resp);
  if (!st.ok()) {
    return st;
  }

  serial = (static_cast<uint64_t>(resp.word(0)) << 32) |
           (static_cast<uint64_t>(resp.word(1)) << 16) | resp.word(2);
  return Status::Ok();
}

Status SCD30::singleShot(Measurement& out) {
  (void)out;
  return Status::Error(Err::UNSUPPORTED, "SCD30 has no single-shot mode");
}

Status SCD30::fetch(Measurement& out) {
  const BusConfig& bus = _device.config();
  const uint32_t periodMs = static_cast<uint32_t>(_intervalS) * 1000u;
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

  Response resp;
  Status st = _device.execute(Command::op16(cmd::scd30::CMD_READ_MEASUREMENT, cmd::scd30::WAIT_MS,
                                            cmd::scd30::MEASUREMENT_DATA_LEN),
                              &resp);
  if (!st.ok()) {
    return st;
  }

  const float co2 = _wordsToFloat(resp.word(0), resp.word(1));
  const float tRaw = _wordsToFloat(resp.word(2), resp.word(3));
  const float rhRaw = _wordsToFloat(resp.word(4), resp.word(5));
  if (std::isnan(co2) || std::isnan(tRaw) || std::isnan(rhRaw)) {
    return Status::Error(Err::INVALID_PARAM, "Sensor returned NaN");
  }

  const float t = roundTo2(tRaw);
  const float rh = correctHumidity(rhRaw, t, DEFAULT_RH_FLOOR);
  st = completeMeasurement(t, rh, roundTo2(co2), _measurement);
  if (!st.ok()) {
    return st;
  }

  out = _measurement;
  return Status::Ok();
}

Status SCD30::stop() {
  Status st = _device.execute(Command::op16(cmd::scd30::CMD_STOP_CONTINUOUS, cmd::scd30::WAIT_MS));
  if (!st.ok()) {
    return st;
  }
  _mode = MeasurementMode::IDLE;
  return Status::Ok();
}

// ============================================================================
// Continuous measurement
// ============================================================================

Status SCD30::startContinuous() {
  return startContinuous(_config.ambientPressureMbar);
}

Status SCD30::startContinuous(uint16_t pressureMbar) {
  if (!isValidPressure(pressureMbar)) {
    return Status::Error(Err::OUT_OF_RANGE, "Ambient pressure must be 0 or 700..1200 mbar",
                         pressureMbar);
  }

  Status st = _writeWord(cmd::scd30::CMD_START_CONTINUOUS, pressureMbar);
  if (!st.ok()) {
    return st;
  }
  _mode = MeasurementMode::CONTINUOUS;
  return Status::Ok();
}

Status SCD30::readDataReady(bool& ready) {
  uint16_t value = 0;
  Status st = _readWord(cmd::scd30::CMD_DATA_READY, value);
  if (!st.ok()) {
    return st;
  }
  ready = (value == cmd::scd30::DATA_READY);
  return Status::Ok();
}

// ============================================================================
// Calibration / configuration
// ============================================================================

Status SCD30::applySettings() {
  const SCD30Settings& s = _config.settings;

  if (s.measurementIntervalS != 0) {
    Status st = setMeasurementInterval(s.measurementIntervalS);
    if (!st.ok()) {
      return st;
    }
  }
  if (s.autoSelfCalibration != Toggle::KEEP) {
    Status st = setAutoSelfCalibration(s.autoSelfCalibration == Toggle::ENABLE);
    if (!st.ok()) {
      return st;
    }
  }
  if (s.forcedRecalibrationPpm != 0) {
    Status st = setForcedRecalibration(s.forcedRecalibrationPpm);
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
  return Status::Ok();
}

Status SCD30::setMeasurementInterval(uint16_t seconds) {
  if (seconds < cmd::scd30::INTERVAL_MIN_S || seconds > cmd::scd30::INTERVAL_MAX_S) {
    return Status::Error(Err::OUT_OF_RANGE, "Interval must be 2..1800 s", seconds);
  }
  Status st = _writeWord(cmd::scd30::CMD_MEASUREMENT_INTERVAL, seconds);
  if (!st.ok()) {
    return st;
  }
  _intervalS = seconds;
  return Status::Ok();
}

Status SCD30::getMeasurementInterval(uint16_t& seconds) {
  Status st = _readWord(cmd::scd30::CMD_MEASUREMENT_INTERVAL, seconds);
  if (!st.ok()) {
    return st;
  }
  if (seconds >= cmd::scd30::INTERVAL_MIN_S && seconds <= cmd::scd30::INTERVAL_MAX_S) {
    _intervalS = seconds;
  }
  return Status::Ok();
}

Status SCD30::setAutoSelfCalibration(bool enable) {
  return _writeWord(cmd::scd30::CMD_ASC, enable ? 1 : 0);
}

Status SCD30::getAutoSelfCalibration(bool& enabled) {
  uint16_t value = 0;
  Status st = _readWord(cmd::scd30::CMD_ASC, value);
  if (!st.ok()) {
    return st;
  }
  enabled = (value != 0);
  return Status::Ok();
}

Status SCD30::setForcedRecalibration(uint16_t co2Ppm) {
  if (co2Ppm < cmd::CO2_REFERENCE_MIN_PPM || co2Ppm > cmd::CO2_REFERENCE_MAX_PPM) {
    return Status::Error(Err::OUT_OF_RANGE, "CO2 reference must be 400..2000 ppm", co2Ppm);
  }
  return _writeWord(cmd::scd30::CMD_FRC, co2Ppm);
}

Status SCD30::getForcedRecalibration(uint16_t& co2Ppm) {
  return _readWord(cmd::scd30::CMD_FRC, co2Ppm);
}

Status SCD30::setTemperatureOffset(float offsetC) {
  if (std::isnan(offsetC) || offsetC < 0.0f || offsetC > cmd::TEMPERATURE_OFFSET_MAX_C) {
    return Status::Error(Err::OUT_OF_RANGE, "Temperature offset must be 0..20 degC");
  }
  const uint16_t raw = static_cast<uint16_t>(std::lround(static_cast<double>(offsetC) * 100.0));
  return _writeWord(cmd::scd30::CMD_TEMPERATURE_OFFSET, raw);
}

Status SCD30::getTemperatureOffset(float& offsetC) {
  uint16_t raw = 0;
  Status st = _readWord(cmd::scd30::CMD_TEMPERATURE_OFFSET, raw);
  if (!st.ok()) {
    return st;
  }
  offsetC = roundTo2(static_cast<double>(raw) / 100.0);
  return Status::Ok();
}

Status SCD30::setAltitude(uint16_t meters) {
  if (meters > cmd::ALTITUDE_MAX_M) {
    return Status::Error(Err::OUT_OF_RANGE, "Altitude must be 0..3000 m", meters);
  }
  return _writeWord(cmd::scd30::CMD_ALTITUDE, meters);
}

Status SCD30::getAltitude(uint16_t& meters) {
  return _readWord(cmd::scd30::CMD_ALTITUDE, meters);
}

Status SCD30::readFirmwareVersion(uint8_t& major, uint8_t& minor) {
  uint16_t value = 0;
  Status st = _readWord(cmd::scd30::CMD_FIRMWARE_VERSION, value);
  if (!st.ok()) {
    return st;
  }
  major = static_cast<uint8_t>(value >> 8);
  minor = static_cast<uint8_t>(value & 0xFF);
  return Status::Ok();
}

Status SCD30::softReset() {
  Status st = _device.execute(Command::op16(cmd::scd30::CMD_SOFT_RESET, cmd::scd30::WAIT_RESET_MS));
  if (!st.ok()) {
    return st;
  }
  _mode = MeasurementMode::IDLE;
  return Status::Ok();
}

// ============================================================================
// Internal Helpers
// ============================================================================

Status SCD30::_writeWord(uint16_t command, uint16_t value) {
  return _device.execute(Command::op16(command, cmd::scd30::WAIT_MS).withWord(value));
}

Status SCD30::_readWord(uint16_t command, uint16_t& value) {
  Response resp;
  Status st = _device.execute(Command::op16(command, cmd::scd30::WAIT_MS, cmd::WORD_DATA_LEN),
                              &resp);
  if (!st.ok()) {
    return st;
  }
  value = resp.word(0);
  return Status::Ok();
}

float SCD30::_wordsToFloat(uint16_t msw, uint16_t lsw) {
  const uint32_t bits = (static_cast<uint32_t>(msw) << 16) | lsw;
  float value = 0.0f;
  std::memcpy(&value, &bits, sizeof(value));
  return value;
}

} // namespace EnvSense

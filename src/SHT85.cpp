/**
 * @file SHT85.cpp
 * @brief SHT85 driver implementation.
 */

#include "EnvSense/SHT85.h"

#include "EnvSense/CommandTable.h"
#include "EnvSense/Conversion.h"

namespace EnvSense {
namespace {

static constexpr uint16_t STATUS_DEFINED_BITS =
    cmd::sht85::STATUS_ALERT_PENDING | cmd::sht85::STATUS_HEATER_ON |
    cmd::sht85::STATUS_RH_ALERT | cmd::sht85::STATUS_T_ALERT |
    cmd::sht85::STATUS_RESET_DETECTED | cmd::sht85::STATUS_COMMAND_ERROR |
    cmd::sht85::STATUS_WRITE_CRC_ERROR;

static bool isValidRepeatability(Repeatability rep) {
  return rep == Repeatability::LOW_REPEATABILITY || rep == Repeatability::MEDIUM_REPEATABILITY ||
         rep == Repeatability::HIGH_REPEATABILITY;
}

static bool isValidPeriodicRate(PeriodicRate rate) {
  return rate == PeriodicRate::MPS_0_5 || rate == PeriodicRate::MPS_1 ||
         rate == PeriodicRate::MPS_2 || rate == PeriodicRate::MPS_4 ||
         rate == PeriodicRate::MPS_10;
}

static uint32_t periodForRate(PeriodicRate rate) {
  switch (rate) {
    case PeriodicRate::MPS_0_5: return 2000;
    case PeriodicRate::MPS_1: return 1000;
    case PeriodicRate::MPS_2: return 500;
    case PeriodicRate::MPS_4: return 250;
    case PeriodicRate::MPS_10: return 100;
    default: return 2000;
  }
}

}  // namespace

// ============================================================================
// Lifecycle
// ============================================================================

Status SHT85::begin(const SHT85Config& config) {
  _mode = MeasurementMode::IDLE;
  _artActive = false;
  _measurement = Measurement{};

  if (!isValidRepeatability(config.repeatability)) {
    return Status::Error(Err::INVALID_CONFIG, "Invalid repeatability");
  }
  if (!isValidPeriodicRate(config.periodicRate)) {
    return Status::Error(Err::INVALID_CONFIG, "Invalid periodic rate");
  }

  Status st = _device.begin(config.bus, cmd::sht85::I2C_ADDR);
  if (!st.ok()) {
    return st;
  }

  _config = config;
  return Status::Ok();
}

void SHT85::end() {
  _device.end();
  _mode = MeasurementMode::IDLE;
  _artActive = false;
}

// ============================================================================
// Sensor interface
// ============================================================================

Status SHT85::readSerialNumber(uint64_t& serial) {
  if (_mode == MeasurementMode::PERIODIC) {
    return Status::Error(Err::BUSY, "Stop periodic mode before reading serial");
  }

  Response resp;
  Status st = _device.execute(Command::op16(cmd::sht85::CMD_SERIAL, cmd::sht85::WAIT_SHORT_MS,
                                            cmd::sht85::SERIAL_DATA_LEN),
                              &resp);
  if (!st.ok()) {
    return st;
  }

  serial = (static_cast<uint64_t>(resp.word(0)) << 16) | resp.word(1);
  return Status::Ok();
}

Status SHT85::singleShot(Measurement& out) {
  if (_mode == MeasurementMode::PERIODIC) {
    return Status::Error(Err::BUSY, "Periodic mode active");
  }

  uint32_t waitMs = 0;
  const uint16_t command = _commandForSingleShot(_config.repeatability, waitMs);
  if (command == 0) {
    return Status::Error(Err::INVALID_PARAM, "Invalid single-shot configuration");
  }

  _mode = MeasurementMode::SINGLE_SHOT_PENDING;
  Status st = _readMeasurement(Command::op16(command, waitMs, cmd::sht85::MEASUREMENT_DATA_LEN),
                               out);
  _mode = MeasurementMode::IDLE;
  return st;
}

Status SHT85::fetch(Measurement& out) {
  if (_mode != MeasurementMode::PERIODIC) {
    return Status::Error(Err::INVALID_PARAM, "Periodic mode not active");
  }

  const BusConfig& bus = _device.config();
  const uint32_t periodMs = _artActive ? cmd::sht85::ART_PERIOD_MS
                                       : periodForRate(_config.periodicRate);
  const uint32_t attempts = _device.readyPollBudget(periodMs);
  const Command fetchCmd = Command::op16(cmd::sht85::CMD_FETCH_DATA, cmd::sht85::WAIT_SHORT_MS,
                                         cmd::sht85::MEASUREMENT_DATA_LEN).expectNoData();

  for (uint32_t attempt = 0; attempt < attempts; ++attempt) {
    Status st = _readMeasurement(fetchCmd, out);
    if (st.code != Err::MEASUREMENT_NOT_READY) {
      return st;
    }

    st = _device.waitMs(bus.readyPollIntervalMs);
    if (!st.ok()) {
      return st;
    }
  }

  return Status::Error(Err::TIMEOUT, "No periodic sample",
                       static_cast<int32_t>(_device.readyTimeoutMs(periodMs)));
}

Status SHT85::stop() {
  Status st = _device.execute(Command::op16(cmd::sht85::CMD_BREAK, cmd::sht85::WAIT_BREAK_MS));
  if (!st.ok()) {
    return st;
  }

  _mode = MeasurementMode::IDLE;
  _artActive = false;
  return Status::Ok();
}

// ============================================================================
// Periodic mode
// ============================================================================

Status SHT85::startPeriodic() {
  return _enterPeriodic(_config.periodicRate, _config.repeatability, false);
}

Status SHT85::startPeriodic(PeriodicRate rate, Repeatability rep) {
  if (!isValidPeriodicRate(rate) || !isValidRepeatability(rep)) {
    return Status::Error(Err::INVALID_PARAM, "Invalid periodic settings");
  }
  return _enterPeriodic(rate, rep, false);
}

Status SHT85::startArt() {
  return _enterPeriodic(_config.periodicRate, _config.repeatability, true);
}

// ============================================================================
// Status / Heater / Reset
// ============================================================================

Status SHT85::readStatus(uint16_t& raw) {
  if (_mode == MeasurementMode::PERIODIC) {
    return Status::Error(Err::BUSY, "Stop periodic mode before reading status");
  }

  Response resp;
  Status st = _device.execute(Command::op16(cmd::sht85::CMD_READ_STATUS,
                                            cmd::sht85::WAIT_SHORT_MS,
                                            cmd::sht85::STATUS_DATA_LEN),
                              &resp);
  if (!st.ok()) {
    return st;
  }

  raw = resp.word(0);
  return Status::Ok();
}

Status SHT85::readStatus(StatusRegister& out) {
  uint16_t raw = 0;
  Status st = readStatus(raw);
  if (!st.ok()) {
    return st;
  }

  out.raw = raw;
  out.alertPending = (raw & cmd::sht85::STATUS_ALERT_PENDING) != 0;
  out.heaterOn = (raw & cmd::sht85::STATUS_HEATER_ON) != 0;
  out.rhAlert = (raw & cmd::sht85::STATUS_RH_ALERT) != 0;
  out.tAlert = (raw & cmd::sht85::STATUS_T_ALERT) != 0;
  out.resetDetected = (raw & cmd::sht85::STATUS_RESET_DETECTED) != 0;
  out.commandError = (raw & cmd::sht85::STATUS_COMMAND_ERROR) != 0;
  out.writeCrcError = (raw & cmd::sht85::STATUS_WRITE_CRC_ERROR) != 0;
  return Status::Ok();
}

Status SHT85::clearStatus() {
  if (_mode == MeasurementMode::PERIODIC) {
    return Status::Error(Err::BUSY, "Stop periodic mode before clearing status");
  }

  return _device.execute(Command::op16(cmd::sht85::CMD_CLEAR_STATUS, cmd::sht85::WAIT_SHORT_MS));
}

Status SHT85::checkStatus(uint16_t& flags) {
  uint16_t raw = 0;
  Status st = readStatus(raw);
  if (!st.ok()) {
    return st;
  }

  flags = raw & STATUS_DEFINED_BITS;
  return Status::Ok();
}

Status SHT85::setHeater(bool enable) {
  if (_mode == MeasurementMode::PERIODIC) {
    return Status::Error(Err::BUSY, "Stop periodic mode before changing heater");
  }

  return _device.execute(Command::op16(enable ? cmd::sht85::CMD_HEATER_ENABLE
                                              : cmd::sht85::CMD_HEATER_DISABLE,
                                       cmd::sht85::WAIT_SHORT_MS));
}

Status SHT85::readHeaterStatus(bool& enabled) {
  StatusRegister reg;
  Status st = readStatus(reg);
  if (!st.ok()) {
    return st;
  }
  enabled = reg.heaterOn;
  return Status::Ok();
}

Status SHT85::softReset() {
  Status st = stop();
  if (!st.ok()) {
    return st;
  }

  return _device.execute(Command::op16(cmd::sht85::CMD_SOFT_RESET, cmd::sht85::WAIT_RESET_MS));
}

// ============================================================================
// Internal Helpers
// ============================================================================

Status SHT85::_readMeasurement(const Command& command, Measurement& out) {
  Response resp;
  Status st = _device.execute(command, &resp);
  if (!st.ok()) {
    return st;
  }

  const float t = temperatureC(SHT85_CONVERSION, resp.word(0));
  const float rh = humidityPct(SHT85_CONVERSION, resp.word(1), t);
  st = completeMeasurement(t, rh, std::numeric_limits<float>::quiet_NaN(), _measurement);
  if (!st.ok()) {
    return st;
  }

  out = _measurement;
  return Status::Ok();
}

Status SHT85::_enterPeriodic(PeriodicRate rate, Repeatability rep, bool art) {
  if (_mode == MeasurementMode::PERIODIC) {
    Status st = stop();
    if (!st.ok()) {
      return st;
    }
  }

  const uint16_t command = art ? cmd::sht85::CMD_ART : _commandForPeriodic(rep, rate);
  if (command == 0) {
    return Status::Error(Err::INVALID_PARAM, "Invalid periodic command");
  }

  Status st = _device.execute(Command::op16(command, cmd::sht85::WAIT_SHORT_MS));
  if (!st.ok()) {
    return st;
  }

  _mode = MeasurementMode::PERIODIC;
  _artActive = art;
  if (!art) {
    _config.periodicRate = rate;
    _config.repeatability = rep;
  }
  return Status::Ok();
}

uint16_t SHT85::_commandForSingleShot(Repeatability rep, uint32_t& waitMs) {
  switch (rep) {
    case Repeatability::HIGH_REPEATABILITY:
      waitMs = cmd::sht85::WAIT_HIGH_MS;
      return cmd::sht85::CMD_SINGLE_SHOT_HIGH;
    case Repeatability::MEDIUM_REPEATABILITY:
      waitMs = cmd::sht85::WAIT_MED_MS;
      return cmd::sht85::CMD_SINGLE_SHOT_MED;
    case Repeatability::LOW_REPEATABILITY:
      waitMs = cmd::sht85::WAIT_LOW_MS;
      return cmd::sht85::CMD_SINGLE_SHOT_LOW;
    default:
      return 0;
  }
}

uint16_t SHT85::_commandForPeriodic(Repeatability rep, PeriodicRate rate) {
  static constexpr uint16_t TABLE[5][3] = {
      // LOW, MEDIUM, HIGH
      {cmd::sht85::CMD_PERIODIC_0_5_LOW, cmd::sht85::CMD_PERIODIC_0_5_MED,
       cmd::sht85::CMD_PERIODIC_0_5_HIGH},
      {cmd::sht85::CMD_PERIODIC_1_LOW, cmd::sht85::CMD_PERIODIC_1_MED,
       cmd::sht85::CMD_PERIODIC_1_HIGH},
      {cmd::sht85::CMD_PERIODIC_2_LOW, cmd::sht85::CMD_PERIODIC_2_MED,
       cmd::sht85::CMD_PERIODIC_2_HIGH},
      {cmd::sht85::CMD_PERIODIC_4_LOW, cmd::sht85::CMD_PERIODIC_4_MED,
       cmd::sht85::CMD_PERIODIC_4_HIGH},
      {cmd::sht85::CMD_PERIODIC_10_LOW, cmd::sht85::CMD_PERIODIC_10_MED,
       cmd::sht85::CMD_PERIODIC_10_HIGH},
  };

  const uint8_t r = static_cast<uint8_t>(rate);
  const uint8_t p = static_cast<uint8_t>(rep);
  if (r >= 5 || p >= 3) {
    return 0;
  }
  return TABLE[r][p];
}

} // namespace EnvSense

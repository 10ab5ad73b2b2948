/**
 * @file SHT4x.cpp
 * @brief SHT4x driver implementation.
 */

#include "EnvSense/SHT4x.h"

#include "EnvSense/CommandTable.h"
#include "EnvSense/Conversion.h"

namespace EnvSense {
namespace {

static bool isValidAddress(uint8_t addr) {
  return addr == cmd::sht4x::I2C_ADDR_A || addr == cmd::sht4x::I2C_ADDR_B ||
         addr == cmd::sht4x::I2C_ADDR_C;
}

static bool isValidRepeatability(Repeatability rep) {
  return rep == Repeatability::LOW_REPEATABILITY || rep == Repeatability::MEDIUM_REPEATABILITY ||
         rep == Repeatability::HIGH_REPEATABILITY;
}

}  // namespace

Status SHT4x::begin(const SHT4xConfig& config) {
  _mode = MeasurementMode::IDLE;
  _measurement = Measurement{};

  if (!isValidAddress(config.i2cAddress)) {
    return Status::Error(Err::INVALID_CONFIG, "Invalid SHT4x address", config.i2cAddress);
  }
  if (!isValidRepeatability(config.repeatability)) {
    return Status::Error(Err::INVALID_CONFIG, "Invalid repeatability");
  }

  Status st = _device.begin(config.bus, config.i2cAddress);
  if (!st.ok()) {
    return st;
  }

  _config = config;
  return Status::Ok();
}

void SHT4x::end() {
  _device.end();
  _mode = MeasurementMode::IDLE;
}

Status SHT4x::readSerialNumber(uint64_t& serial) {
  Response resp;
  Status st = _device.execute(Command::op8(cmd::sht4x::CMD_SERIAL, cmd::sht4x::WAIT_SERIAL_MS,
                                           cmd::sht4x::SERIAL_DATA_LEN),
                              &resp);
  if (!st.ok()) {
    return st;
  }

  serial = (static_cast<uint64_t>(resp.word(0)) << 16) | resp.word(1);
  return Status::Ok();
}

Status SHT4x::singleShot(Measurement& out) {
  uint32_t waitMs = 0;
  const uint8_t command = _commandForRepeatability(_config.repeatability, waitMs);
  if (command == 0) {
    return Status::Error(Err::INVALID_PARAM, "Invalid single-shot configuration");
  }
  return _measure(command, waitMs, out);
}

Status SHT4x::fetch(Measurement& out) {
  (void)out;
  return Status::Error(Err::UNSUPPORTED, "SHT4x has no periodic mode");
}

Status SHT4x::stop() {
  _mode = MeasurementMode::IDLE;
  return Status::Ok();
}

Status SHT4x::singleShotWithHeater(HeaterPower power, HeaterDuration duration,
                                   Measurement& out) {
  uint32_t waitMs = 0;
  const uint8_t command = _commandForHeater(power, duration, waitMs);
  if (command == 0) {
    return Status::Error(Err::INVALID_PARAM, "Invalid heater setting");
  }
  return _measure(command, waitMs, out);
}

Status SHT4x::softReset() {
  Status st = _device.execute(Command::op8(cmd::sht4x::CMD_SOFT_RESET, cmd::sht4x::WAIT_RESET_MS));
  if (!st.ok()) {
    return st;
  }
  _mode = MeasurementMode::IDLE;
  return Status::Ok();
}

Status SHT4x::_measure(uint8_t command, uint32_t waitMs, Measurement& out) {
  _mode = MeasurementMode::SINGLE_SHOT_PENDING;

  Response resp;
  Status st = _device.execute(Command::op8(command, waitMs, cmd::sht4x::MEASUREMENT_DATA_LEN),
                              &resp);
  _mode = MeasurementMode::IDLE;
  if (!st.ok()) {
    return st;
  }

  const float t = temperatureC(SHT4X_CONVERSION, resp.word(0));
  const float rh = humidityPct(SHT4X_CONVERSION, resp.word(1), t);
  st = completeMeasurement(t, rh, std::numeric_limits<float>::quiet_NaN(), _measurement);
  if (!st.ok()) {
    return st;
  }

  out = _measurement;
  return Status::Ok();
}

uint8_t SHT4x::_commandForRepeatability(Repeatability rep, uint32_t& waitMs) {
  switch (rep) {
    case Repeatability::HIGH_REPEATABILITY:
      waitMs = cmd::sht4x::WAIT_HIGH_MS;
      return cmd::sht4x::CMD_MEASURE_HIGH;
    case Repeatability::MEDIUM_REPEATABILITY:
      waitMs = cmd::sht4x::WAIT_MED_MS;
      return cmd::sht4x::CMD_MEASURE_MED;
    case Repeatability::LOW_REPEATABILITY:
      waitMs = cmd::sht4x::WAIT_LOW_MS;
      return cmd::sht4x::CMD_MEASURE_LOW;
    default:
      return 0;
  }
}

uint8_t SHT4x::_commandForHeater(HeaterPower power, HeaterDuration duration, uint32_t& waitMs) {
  const bool longPulse = (duration == HeaterDuration::MS_1000);
  if (!longPulse && duration != HeaterDuration::MS_100) {
    return 0;
  }
  waitMs = longPulse ? cmd::sht4x::WAIT_HEATER_1S_MS : cmd::sht4x::WAIT_HEATER_100MS_MS;

  switch (power) {
    case HeaterPower::MW_200:
      return longPulse ? cmd::sht4x::CMD_HEATER_200MW_1S : cmd::sht4x::CMD_HEATER_200MW_100MS;
    case HeaterPower::MW_110:
      return longPulse ? cmd::sht4x::CMD_HEATER_110MW_1S : cmd::sht4x::CMD_HEATER_110MW_100MS;
    case HeaterPower::MW_20:
      return longPulse ? cmd::sht4x::CMD_HEATER_20MW_1S : cmd::sht4x::CMD_HEATER_20MW_100MS;
    default:
      return 0;
  }
}

} // namespace EnvSense

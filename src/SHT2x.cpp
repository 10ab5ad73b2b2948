/**
 * @file SHT2x.cpp
 * @brief SHT2x driver implementation.
 */

#include "EnvSense/SHT2x.h"

#include <cmath>
#include <limits>

#include "EnvSense/CommandTable.h"
#include "EnvSense/Conversion.h"
#include "EnvSense/Crc.h"

namespace EnvSense {
namespace {

// Bits 3..5 are reserved and must keep their value
static constexpr uint8_t USER_WRITABLE_MASK =
    cmd::sht2x::USER_RES_MASK | cmd::sht2x::USER_HEATER | cmd::sht2x::USER_OTP_RELOAD_DISABLE;

static bool isValidHoldMode(HoldMode mode) {
  return mode == HoldMode::HOLD || mode == HoldMode::NO_HOLD;
}

static bool isValidResolution(Sht2xResolution res) {
  return res == Sht2xResolution::RH12_T14 || res == Sht2xResolution::RH8_T12 ||
         res == Sht2xResolution::RH10_T13 || res == Sht2xResolution::RH11_T11;
}

}  // namespace

Status SHT2x::begin(const SHT2xConfig& config) {
  _mode = MeasurementMode::IDLE;
  _measurement = Measurement{};

  if (!isValidHoldMode(config.holdMode)) {
    return Status::Error(Err::INVALID_CONFIG, "Invalid hold mode");
  }

  Status st = _device.begin(config.bus, cmd::sht2x::I2C_ADDR);
  if (!st.ok()) {
    return st;
  }

  _config = config;
  return Status::Ok();
}

void SHT2x::end() {
  _device.end();
  _mode = MeasurementMode::IDLE;
}

Status SHT2x::readSerialNumber(uint64_t& serial) {
  // First part: SNB_3..SNB_0, each byte followed by its own CRC
  Response first;
  Status st = _device.execute(Command::op16(cmd::sht2x::CMD_SERIAL_B,
                                            cmd::sht2x::WAIT_SERIAL_MS,
                                            cmd::sht2x::SERIAL_B_LEN).withoutCrc(),
                              &first);
  if (!st.ok()) {
    return st;
  }

  uint32_t snb = 0;
  for (size_t i = 0; i < cmd::sht2x::SERIAL_B_LEN; i += 2) {
    const uint8_t value = first.byte(i);
    if (_device.checkCrc() && crc8(&value, 1) != first.byte(i + 1)) {
      return Status::Error(Err::CRC_MISMATCH, "Serial CRC mismatch", static_cast<int32_t>(i / 2));
    }
    snb = (snb << 8) | value;
  }

  // Second part: SNC_1 SNC_0 CRC SNA_1 SNA_0 CRC
  Response second;
  st = _device.execute(Command::op16(cmd::sht2x::CMD_SERIAL_AC,
                                     cmd::sht2x::WAIT_SERIAL_MS,
                                     cmd::sht2x::SERIAL_AC_LEN),
                       &second);
  if (!st.ok()) {
    return st;
  }

  const uint64_t snc = second.word(0);
  const uint64_t sna = second.word(1);
  serial = (sna << 48) | (static_cast<uint64_t>(snb) << 16) | snc;
  return Status::Ok();
}

Status SHT2x::singleShot(Measurement& out) {
  float t = 0.0f;
  Status st = singleShotTemperature(t);
  if (!st.ok()) {
    return st;
  }

  float rh = 0.0f;
  st = singleShotHumidity(t, rh);
  if (!st.ok()) {
    return st;
  }

  st = completeMeasurement(t, rh, std::numeric_limits<float>::quiet_NaN(), _measurement);
  if (!st.ok()) {
    return st;
  }

  out = _measurement;
  return Status::Ok();
}

Status SHT2x::fetch(Measurement& out) {
  (void)out;
  return Status::Error(Err::UNSUPPORTED, "SHT2x has no periodic mode");
}

Status SHT2x::stop() {
  _mode = MeasurementMode::IDLE;
  return Status::Ok();
}

Status SHT2x::singleShotTemperature(float& temperatureC) {
  const uint8_t command = (_config.holdMode == HoldMode::HOLD) ? cmd::sht2x::CMD_T_HOLD
                                                               : cmd::sht2x::CMD_T_NO_HOLD;
  uint16_t raw = 0;
  Status st = _measureRaw(command, cmd::sht2x::WAIT_T_MS, raw);
  if (!st.ok()) {
    return st;
  }

  temperatureC = EnvSense::temperatureC(SHT2X_CONVERSION, raw);
  return Status::Ok();
}

Status SHT2x::singleShotHumidity(float& humidityPct) {
  return singleShotHumidity(std::numeric_limits<float>::quiet_NaN(), humidityPct);
}

Status SHT2x::singleShotHumidity(float temperatureC, float& humidityPct) {
  const uint8_t command = (_config.holdMode == HoldMode::HOLD) ? cmd::sht2x::CMD_RH_HOLD
                                                               : cmd::sht2x::CMD_RH_NO_HOLD;
  uint16_t raw = 0;
  Status st = _measureRaw(command, cmd::sht2x::WAIT_RH_MS, raw);
  if (!st.ok()) {
    return st;
  }

  if (std::isnan(temperatureC)) {
    humidityPct = humidityWaterPct(SHT2X_CONVERSION, raw);
  } else {
    humidityPct = EnvSense::humidityPct(SHT2X_CONVERSION, raw, temperatureC);
  }
  return Status::Ok();
}

Status SHT2x::readUserRegister(uint8_t& value) {
  Response resp;
  Status st = _device.execute(Command::op8(cmd::sht2x::CMD_READ_USER_REG,
                                           cmd::sht2x::WAIT_USER_REG_MS,
                                           cmd::sht2x::USER_REG_LEN).withoutCrc(),
                              &resp);
  if (!st.ok()) {
    return st;
  }

  value = resp.byte(0);
  return Status::Ok();
}

Status SHT2x::writeUserRegister(uint8_t value) {
  return _updateUserRegister(USER_WRITABLE_MASK, value);
}

Status SHT2x::setResolution(Sht2xResolution resolution) {
  if (!isValidResolution(resolution)) {
    return Status::Error(Err::INVALID_PARAM, "Invalid resolution");
  }
  return _updateUserRegister(cmd::sht2x::USER_RES_MASK, static_cast<uint8_t>(resolution));
}

Status SHT2x::getResolution(Sht2xResolution& out) {
  uint8_t reg = 0;
  Status st = readUserRegister(reg);
  if (!st.ok()) {
    return st;
  }
  out = static_cast<Sht2xResolution>(reg & cmd::sht2x::USER_RES_MASK);
  return Status::Ok();
}

Status SHT2x::setHeater(bool enable) {
  return _updateUserRegister(cmd::sht2x::USER_HEATER, enable ? cmd::sht2x::USER_HEATER : 0);
}

Status SHT2x::readHeater(bool& enabled) {
  uint8_t reg = 0;
  Status st = readUserRegister(reg);
  if (!st.ok()) {
    return st;
  }
  enabled = (reg & cmd::sht2x::USER_HEATER) != 0;
  return Status::Ok();
}

Status SHT2x::setOtpReload(bool enable) {
  // Register bit set = reload disabled
  return _updateUserRegister(cmd::sht2x::USER_OTP_RELOAD_DISABLE,
                             enable ? 0 : cmd::sht2x::USER_OTP_RELOAD_DISABLE);
}

Status SHT2x::readOtpReload(bool& enabled) {
  uint8_t reg = 0;
  Status st = readUserRegister(reg);
  if (!st.ok()) {
    return st;
  }
  enabled = (reg & cmd::sht2x::USER_OTP_RELOAD_DISABLE) == 0;
  return Status::Ok();
}

Status SHT2x::readEndOfBattery(bool& low) {
  uint8_t reg = 0;
  Status st = readUserRegister(reg);
  if (!st.ok()) {
    return st;
  }
  low = (reg & cmd::sht2x::USER_END_OF_BATTERY) != 0;
  return Status::Ok();
}

Status SHT2x::softReset() {
  Status st = _device.execute(Command::op8(cmd::sht2x::CMD_SOFT_RESET, cmd::sht2x::WAIT_RESET_MS));
  if (!st.ok()) {
    return st;
  }
  _mode = MeasurementMode::IDLE;
  return Status::Ok();
}

Status SHT2x::_measureRaw(uint8_t command, uint32_t waitMs, uint16_t& raw) {
  _mode = MeasurementMode::SINGLE_SHOT_PENDING;

  Response resp;
  Status st = _device.execute(Command::op8(command, waitMs, cmd::sht2x::MEASUREMENT_DATA_LEN),
                              &resp);
  _mode = MeasurementMode::IDLE;
  if (!st.ok()) {
    return st;
  }

  raw = static_cast<uint16_t>(resp.word(0) & cmd::sht2x::DATA_MASK);
  return Status::Ok();
}

Status SHT2x::_updateUserRegister(uint8_t mask, uint8_t bits) {
  uint8_t reg = 0;
  Status st = readUserRegister(reg);
  if (!st.ok()) {
    return st;
  }

  const uint8_t value = static_cast<uint8_t>((reg & ~mask) | (bits & mask));
  return _device.execute(Command::op8(cmd::sht2x::CMD_WRITE_USER_REG,
                                      cmd::sht2x::WAIT_USER_REG_MS).withByte(value));
}

} // namespace EnvSense

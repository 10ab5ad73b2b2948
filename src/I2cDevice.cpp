/**
 * @file I2cDevice.cpp
 * @brief Transaction primitive and health tracking shared by all drivers.
 */

#include "EnvSense/I2cDevice.h"

#include <limits>

#include "EnvSense/Crc.h"

namespace EnvSense {
namespace {

static constexpr size_t MAX_WRITE_LEN = 5;   // 2 opcode + 2 data + CRC

}  // namespace

// ============================================================================
// Command
// ============================================================================

Command Command::op8(uint8_t code, uint32_t waitMs, uint8_t responseLen) {
  Command c;
  c.code = code;
  c.codeLen = 1;
  c.waitMs = waitMs;
  c.responseLen = responseLen;
  return c;
}

Command Command::op16(uint16_t code, uint32_t waitMs, uint8_t responseLen) {
  Command c;
  c.code = code;
  c.codeLen = 2;
  c.waitMs = waitMs;
  c.responseLen = responseLen;
  return c;
}

Command& Command::withWord(uint16_t value) {
  payload[0] = static_cast<uint8_t>(value >> 8);
  payload[1] = static_cast<uint8_t>(value & 0xFF);
  payload[2] = crc8(&payload[0], 2);
  payloadLen = 3;
  return *this;
}

Command& Command::withByte(uint8_t value) {
  payload[0] = value;
  payloadLen = 1;
  return *this;
}

Command& Command::withoutCrc() {
  crcWords = false;
  return *this;
}

Command& Command::expectNoData() {
  allowNoData = true;
  return *this;
}

// ============================================================================
// Response
// ============================================================================

uint16_t Response::word(size_t index) const {
  const size_t offset = index * cmd::DATA_WORD_WITH_CRC;
  if (offset + cmd::DATA_WORD_BYTES > _len) {
    return 0;
  }
  return static_cast<uint16_t>((_buf[offset] << 8) | _buf[offset + 1]);
}

// ============================================================================
// I2cDevice
// ============================================================================

Status I2cDevice::begin(const BusConfig& config, uint8_t address) {
  _initialized = false;
  _driverState = DriverState::UNINIT;
  _busOpen = false;
  _commandIssued = false;

  _lastError = Status::Ok();
  _consecutiveFailures = 0;
  _totalFailures = 0;
  _totalSuccess = 0;
  _crcErrors = 0;

  if (config.i2cWrite == nullptr || config.i2cWriteRead == nullptr) {
    return Status::Error(Err::INVALID_CONFIG, "I2C callbacks not set");
  }
  if (config.delayMs == nullptr) {
    return Status::Error(Err::INVALID_CONFIG, "Delay callback not set");
  }
  if ((config.busOpen == nullptr) != (config.busClose == nullptr)) {
    return Status::Error(Err::INVALID_CONFIG, "Bus open/close callbacks must be set together");
  }
  if (config.i2cTimeoutMs == 0) {
    return Status::Error(Err::INVALID_CONFIG, "I2C timeout must be > 0");
  }
  if (config.readyPollIntervalMs == 0) {
    return Status::Error(Err::INVALID_CONFIG, "Ready poll interval must be > 0");
  }
  if (address == 0 || address > 0x7F) {
    return Status::Error(Err::INVALID_CONFIG, "Invalid I2C address", address);
  }

  _config = config;
  _address = address;
  if (_config.offlineThreshold == 0) {
    _config.offlineThreshold = 1;
  }

  _initialized = true;
  _driverState = DriverState::READY;
  return Status::Ok();
}

void I2cDevice::end() {
  _initialized = false;
  _busOpen = false;
  _driverState = DriverState::UNINIT;
}

Status I2cDevice::openBus() {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }
  if (_config.busOpen == nullptr) {
    return Status::Ok();
  }
  if (_busOpen) {
    return Status::Ok();
  }

  Status st = _config.busOpen(_config.busIndex, _config.i2cUser);
  if (!st.ok()) {
    _lastError = Status::Error(Err::BUS_UNAVAILABLE, "Bus interface not available",
                               static_cast<int32_t>(st.code));
    return _lastError;
  }

  _busOpen = true;
  _commandIssued = false;
  return Status::Ok();
}

Status I2cDevice::closeBus() {
  if (!_busOpen || _config.busClose == nullptr) {
    _busOpen = false;
    return Status::Ok();
  }

  _busOpen = false;
  return _config.busClose(_config.i2cUser);
}

bool I2cDevice::busReady() const {
  return _config.busOpen == nullptr || _busOpen;
}

Status I2cDevice::execute(const Command& command, Response* response) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }
  if (!busReady()) {
    return Status::Error(Err::BUS_UNAVAILABLE, "Bus not open");
  }
  if (command.codeLen < 1 || command.codeLen > 2) {
    return Status::Error(Err::INVALID_PARAM, "Invalid opcode length");
  }
  if (command.responseLen > cmd::MAX_RESPONSE_LEN) {
    return Status::Error(Err::INVALID_PARAM, "Response too long");
  }
  if (command.responseLen > 0 && response == nullptr) {
    return Status::Error(Err::INVALID_PARAM, "Response buffer missing");
  }

  Status st = _ensureCommandDelay();
  if (!st.ok()) {
    return st;
  }

  uint8_t tx[MAX_WRITE_LEN] = {};
  size_t txLen = 0;
  if (command.codeLen == 2) {
    tx[txLen++] = static_cast<uint8_t>(command.code >> 8);
  }
  tx[txLen++] = static_cast<uint8_t>(command.code & 0xFF);
  for (uint8_t i = 0; i < command.payloadLen; ++i) {
    tx[txLen++] = command.payload[i];
  }

  st = _i2cWriteTracked(tx, txLen);
  if (!st.ok()) {
    return st;
  }
  _commandIssued = true;

  st = waitMs(command.waitMs);
  if (!st.ok()) {
    return st;
  }

  if (command.responseLen == 0) {
    if (response != nullptr) {
      response->_len = 0;
    }
    return Status::Ok();
  }

  response->_len = 0;
  st = _i2cReadTracked(response->_buf, command.responseLen, command.allowNoData);
  if (!st.ok()) {
    return st;
  }
  response->_len = command.responseLen;

  if (_config.checkCrc && command.crcWords) {
    return _verifyCrc(*response);
  }
  return Status::Ok();
}

Status I2cDevice::waitMs(uint32_t delayMs) {
  if (delayMs == 0) {
    return Status::Ok();
  }
  if (_config.delayMs == nullptr) {
    return Status::Error(Err::INVALID_CONFIG, "Delay callback not set");
  }
  _config.delayMs(delayMs, _config.i2cUser);
  return Status::Ok();
}

uint32_t I2cDevice::readyTimeoutMs(uint32_t periodMs) const {
  if (_config.readyTimeoutMs != 0) {
    return _config.readyTimeoutMs;
  }
  return periodMs + _config.readyTimeoutMarginMs;
}

uint32_t I2cDevice::readyPollBudget(uint32_t periodMs) const {
  const uint32_t interval = _config.readyPollIntervalMs > 0 ? _config.readyPollIntervalMs : 1;
  return readyTimeoutMs(periodMs) / interval + 1;
}

Status I2cDevice::interfaceReset() {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }
  if (_config.busReset == nullptr) {
    return Status::Error(Err::UNSUPPORTED, "Bus reset callback not set");
  }

  Status st = _config.busReset(_config.i2cUser);
  if (!st.ok()) {
    _lastError = st;
    return st;
  }
  _commandIssued = false;
  return Status::Ok();
}

Status I2cDevice::generalCallReset() {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }
  if (!_config.allowGeneralCallReset) {
    return Status::Error(Err::INVALID_CONFIG, "General call reset disabled");
  }
  if (!busReady()) {
    return Status::Error(Err::BUS_UNAVAILABLE, "Bus not open");
  }

  Status st = _ensureCommandDelay();
  if (!st.ok()) {
    return st;
  }

  const uint8_t byte = cmd::GENERAL_CALL_RESET_BYTE;
  st = _i2cWriteRawAddrTracked(cmd::GENERAL_CALL_ADDR, &byte, 1);
  if (!st.ok()) {
    return st;
  }
  _commandIssued = true;

  return waitMs(cmd::GENERAL_CALL_RESET_WAIT_MS);
}

Status I2cDevice::_i2cWriteTracked(const uint8_t* buf, size_t len) {
  return _i2cWriteRawAddrTracked(_address, buf, len);
}

Status I2cDevice::_i2cWriteRawAddrTracked(uint8_t addr, const uint8_t* buf, size_t len) {
  if (buf == nullptr || len == 0) {
    return Status::Error(Err::INVALID_PARAM, "Invalid I2C buffer");
  }

  Status st = _config.i2cWrite(addr, buf, len, _config.i2cTimeoutMs, _config.i2cUser);
  if (st.code == Err::INVALID_CONFIG || st.code == Err::INVALID_PARAM) {
    return st;
  }
  return _updateHealth(st);
}

Status I2cDevice::_i2cReadTracked(uint8_t* buf, size_t len, bool allowNoData) {
  if (buf == nullptr || len == 0) {
    return Status::Error(Err::INVALID_PARAM, "Invalid read buffer");
  }

  const bool canReportNack = hasCapability(_config.transportCapabilities,
                                           TransportCapability::READ_HEADER_NACK);

  Status st = _config.i2cWriteRead(_address, nullptr, 0, buf, len, _config.i2cTimeoutMs,
                                   _config.i2cUser);
  if (st.code == Err::INVALID_CONFIG || st.code == Err::INVALID_PARAM) {
    return st;
  }
  if (allowNoData && canReportNack && st.code == Err::I2C_NACK_READ) {
    return Status::Error(Err::MEASUREMENT_NOT_READY, "No new data", st.detail);
  }
  return _updateHealth(st);
}

Status I2cDevice::_updateHealth(const Status& st) {
  const uint32_t maxU32 = std::numeric_limits<uint32_t>::max();
  const uint8_t maxU8 = std::numeric_limits<uint8_t>::max();

  if (st.ok()) {
    if (_totalSuccess < maxU32) {
      _totalSuccess++;
    }
    _consecutiveFailures = 0;
    _driverState = DriverState::READY;
    return st;
  }

  _lastError = st;
  if (_totalFailures < maxU32) {
    _totalFailures++;
  }
  if (_consecutiveFailures < maxU8) {
    _consecutiveFailures++;
  }

  if (_consecutiveFailures >= _config.offlineThreshold) {
    _driverState = DriverState::OFFLINE;
  } else {
    _driverState = DriverState::DEGRADED;
  }

  return st;
}

Status I2cDevice::_ensureCommandDelay() {
  if (!_commandIssued) {
    return Status::Ok();
  }
  return waitMs(_config.commandDelayMs);
}

Status I2cDevice::_verifyCrc(const Response& response) {
  if (response._len % cmd::DATA_WORD_WITH_CRC != 0) {
    return Status::Error(Err::INVALID_PARAM, "Response is not word aligned",
                         static_cast<int32_t>(response._len));
  }

  for (size_t n = 0; n < response._len; n += cmd::DATA_WORD_WITH_CRC) {
    if (!verifyWord(&response._buf[n], response._buf[n + cmd::DATA_WORD_BYTES])) {
      if (_crcErrors < std::numeric_limits<uint32_t>::max()) {
        _crcErrors++;
      }
      _lastError = Status::Error(Err::CRC_MISMATCH, "CRC mismatch",
                                 static_cast<int32_t>(n / cmd::DATA_WORD_WITH_CRC));
      return _lastError;
    }
  }
  return Status::Ok();
}

} // namespace EnvSense

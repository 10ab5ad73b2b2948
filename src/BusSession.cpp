/**
 * @file BusSession.cpp
 * @brief Scoped bus session implementation.
 */

#include "EnvSense/BusSession.h"

#include "EnvSense/CommandTable.h"

namespace EnvSense {

BusSession::~BusSession() {
  // Errors stay available through lastError() until destruction
  (void)close();
}

Status BusSession::open() {
  if (_open) {
    return Status::Ok();
  }

  I2cDevice& dev = _sensor.device();
  if (!dev.initialized()) {
    _lastError = Status::Error(Err::NOT_INITIALIZED, "begin() not called");
    return _lastError;
  }

  const uint8_t index = dev.busIndex();
  if (index == cmd::RESERVED_BUS_A || index == cmd::RESERVED_BUS_B) {
    _lastError = Status::Error(Err::INVALID_CONFIG, "Bus interface is reserved", index);
    return _lastError;
  }
  if (dev.config().busOpen == nullptr || dev.config().busClose == nullptr) {
    _lastError = Status::Error(Err::INVALID_CONFIG, "Bus open/close callbacks not set");
    return _lastError;
  }

  Status st = dev.openBus();
  if (!st.ok()) {
    _lastError = st;
    return st;
  }

  _open = true;
  _lastError = Status::Ok();
  return Status::Ok();
}

Status BusSession::close() {
  if (!_open) {
    return Status::Ok();
  }
  _open = false;

  Status result = _sensor.stop();
  Status st = _sensor.device().closeBus();
  if (result.ok()) {
    result = st;
  }

  _lastError = result;
  return result;
}

} // namespace EnvSense

/// @file BusSession.h
/// @brief Scoped bus session: open on entry, stop sensor and close on exit
#pragma once

#include "EnvSense/Status.h"
#include "EnvSense/Sensor.h"

namespace EnvSense {

/// Scoped acquisition session for one sensor
///
/// open() opens the sensor's bus interface. close() (or the destructor)
/// sends the sensor's stop command and then always closes the bus, even if
/// the stop fails. A bus that never opened is never closed.
class BusSession {
public:
  explicit BusSession(Sensor& sensor) : _sensor(sensor) {}
  ~BusSession();

  BusSession(const BusSession&) = delete;
  BusSession& operator=(const BusSession&) = delete;

  /// Open the bus interface
  /// @return INVALID_CONFIG for reserved bus indices (0, 2) or missing
  ///         open/close callbacks, BUS_UNAVAILABLE if the transport fails
  Status open();

  /// Stop the sensor and close the bus. Idempotent.
  /// @return First teardown error, OK if none
  Status close();

  bool isOpen() const { return _open; }

  /// Last open or teardown error
  Status lastError() const { return _lastError; }

  Sensor& sensor() { return _sensor; }

private:
  Sensor& _sensor;
  bool _open = false;
  Status _lastError = Status::Ok();
};

} // namespace EnvSense

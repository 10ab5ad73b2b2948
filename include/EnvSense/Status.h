/// @file Status.h
/// @brief Error codes and status handling for EnvSense drivers
#pragma once

#include <cstdint>

namespace EnvSense {

/// Error codes for all EnvSense operations
enum class Err : uint8_t {
  OK = 0,                 ///< Operation successful
  NOT_INITIALIZED,        ///< begin() not called
  INVALID_CONFIG,         ///< Invalid configuration parameter
  I2C_ERROR,              ///< Unspecified I2C communication failure
  I2C_NACK_ADDR,          ///< Address not acknowledged
  I2C_NACK_DATA,          ///< Data byte not acknowledged
  I2C_NACK_READ,          ///< Read header not acknowledged (no data)
  I2C_TIMEOUT,            ///< Transport timeout
  I2C_BUS,                ///< Bus or arbitration error
  BUS_UNAVAILABLE,        ///< Bus interface missing or not configured for I2C
  TIMEOUT,                ///< Operation timed out
  INVALID_PARAM,          ///< Invalid parameter value
  OUT_OF_RANGE,           ///< Argument outside documented device limits
  CRC_MISMATCH,           ///< CRC check failed
  MEASUREMENT_NOT_READY,  ///< Sample not yet available
  BUSY,                   ///< Device or driver busy
  COMMAND_FAILED,         ///< Sensor reported last command failed
  UNSUPPORTED             ///< Operation not supported by this model
};

/// Status structure returned by all fallible operations
struct Status {
  Err code = Err::OK;
  int32_t detail = 0;        ///< Implementation-specific detail (e.g., I2C error code)
  const char* msg = "";      ///< Static string describing the error

  constexpr Status() = default;
  constexpr Status(Err c, int32_t d, const char* m) : code(c), detail(d), msg(m) {}

  /// @return true if operation succeeded
  constexpr bool ok() const { return code == Err::OK; }

  /// Create a success status
  static constexpr Status Ok() { return Status{Err::OK, 0, "OK"}; }

  /// Create an error status
  static constexpr Status Error(Err err, const char* message, int32_t detailCode = 0) {
    return Status{err, detailCode, message};
  }
};

/// Static name of an error code (for logs)
const char* errToStr(Err err);

} // namespace EnvSense

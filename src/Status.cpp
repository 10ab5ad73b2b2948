/**
 * @file Status.cpp
 * @brief Error code names.
 */

#include "EnvSense/Status.h"

namespace EnvSense {

const char* errToStr(Err err) {
  switch (err) {
    case Err::OK: return "OK";
    case Err::NOT_INITIALIZED: return "NOT_INITIALIZED";
    case Err::INVALID_CONFIG: return "INVALID_CONFIG";
    case Err::I2C_ERROR: return "I2C_ERROR";
    case Err::I2C_NACK_ADDR: return "I2C_NACK_ADDR";
    case Err::I2C_NACK_DATA: return "I2C_NACK_DATA";
    case Err::I2C_NACK_READ: return "I2C_NACK_READ";
    case Err::I2C_TIMEOUT: return "I2C_TIMEOUT";
    case Err::I2C_BUS: return "I2C_BUS";
    case Err::BUS_UNAVAILABLE: return "BUS_UNAVAILABLE";
    case Err::TIMEOUT: return "TIMEOUT";
    case Err::INVALID_PARAM: return "INVALID_PARAM";
    case Err::OUT_OF_RANGE: return "OUT_OF_RANGE";
    case Err::CRC_MISMATCH: return "CRC_MISMATCH";
    case Err::MEASUREMENT_NOT_READY: return "MEASUREMENT_NOT_READY";
    case Err::BUSY: return "BUSY";
    case Err::COMMAND_FAILED: return "COMMAND_FAILED";
    case Err::UNSUPPORTED: return "UNSUPPORTED";
    default: return "UNKNOWN";
  }
}

} // namespace EnvSense

/// @file Config.h
/// @brief Bus configuration and transport callbacks shared by all drivers
#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include "EnvSense/Status.h"

namespace EnvSense {

/// Transport capability flags
enum class TransportCapability : uint8_t {
  NONE = 0,
  READ_HEADER_NACK = 1 << 0,   ///< Transport can reliably report read-header NACK
  TIMEOUT = 1 << 1,            ///< Transport can reliably report timeouts
  BUS_ERROR = 1 << 2           ///< Transport can reliably report bus errors
};

inline constexpr TransportCapability operator|(TransportCapability a, TransportCapability b) {
  return static_cast<TransportCapability>(
      static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

inline constexpr bool hasCapability(TransportCapability caps, TransportCapability cap) {
  return (static_cast<uint8_t>(caps) & static_cast<uint8_t>(cap)) != 0;
}

/// I2C write callback signature
/// @param addr     I2C device address (7-bit)
/// @param data     Pointer to data to write (opcode first)
/// @param len      Number of bytes to write. len == 1 is a plain byte write,
///                 longer transfers are block writes whose first byte acts as
///                 the register.
/// @param timeoutMs Maximum time to wait for completion
/// @param user     User context pointer passed through from BusConfig
/// @return Status indicating success or failure. Transport SHOULD distinguish:
///         - Err::I2C_NACK_ADDR (address NACK)
///         - Err::I2C_NACK_DATA (data NACK)
///         - Err::I2C_TIMEOUT (timeout)
///         - Err::I2C_BUS (bus/arbitration error)
///         - Err::I2C_ERROR (unspecified I2C error)
using I2cWriteFn = Status (*)(uint8_t addr, const uint8_t* data, size_t len,
                              uint32_t timeoutMs, void* user);

/// I2C read callback signature
/// @param addr     I2C device address (7-bit)
/// @param txData   Unused by the drivers (txLen is always 0)
/// @param txLen    Number of bytes to write before the read (always 0)
/// @param rxData   Pointer to buffer for read data
/// @param rxLen    Number of bytes to read
/// @param timeoutMs Maximum time to wait for completion
/// @param user     User context pointer passed through from BusConfig
/// @return Status indicating success or failure. Err::I2C_NACK_READ marks a
///         read header NACK (sensor has no data yet).
/// @note Sensirion sensors need a STOP and a settle time between the command
///       write and the read, so the drivers never use a combined transfer.
using I2cWriteReadFn = Status (*)(uint8_t addr, const uint8_t* txData, size_t txLen,
                                  uint8_t* rxData, size_t rxLen, uint32_t timeoutMs,
                                  void* user);

/// Open a bus interface (e.g. /dev/i2c-<busIndex>)
/// @return Status::Ok() or an error; any error is reported as BUS_UNAVAILABLE
using BusOpenFn = Status (*)(uint8_t busIndex, void* user);

/// Close the bus interface opened by BusOpenFn
using BusCloseFn = Status (*)(void* user);

/// Optional interface reset callback (SCL pulse recovery)
/// @param user User context pointer (BusConfig::i2cUser)
/// @return Status indicating success or failure
using BusResetFn = Status (*)(void* user);

/// Blocking sleep in milliseconds
using DelayMsFn = void (*)(uint32_t ms, void* user);

/// Bus and transport settings shared by every driver configuration
struct BusConfig {
  // === Transport (required) ===
  I2cWriteFn i2cWrite = nullptr;         ///< I2C write function pointer
  I2cWriteReadFn i2cWriteRead = nullptr; ///< I2C read function pointer
  DelayMsFn delayMs = nullptr;           ///< Blocking sleep
  BusOpenFn busOpen = nullptr;           ///< Required by BusSession
  BusCloseFn busClose = nullptr;         ///< Required by BusSession
  BusResetFn busReset = nullptr;         ///< Optional interface reset callback
  void* i2cUser = nullptr;               ///< User context for callbacks

  // === Bus Settings ===
  uint8_t busIndex = 1;                  ///< Bus interface index (0 and 2 are reserved)
  uint32_t i2cTimeoutMs = 50;            ///< I2C transaction timeout in ms
  TransportCapability transportCapabilities = TransportCapability::NONE; ///< Transport capabilities
  bool checkCrc = true;                  ///< Verify CRC of every response word
  bool allowGeneralCallReset = false;    ///< Allow general call reset (resets every device on the bus)

  // === Timing ===
  uint16_t commandDelayMs = 1;           ///< Minimum command spacing

  /// Data-ready wait used by fetch(). The limit is the active mode's
  /// measurement period plus readyTimeoutMarginMs; a non-zero
  /// readyTimeoutMs replaces it.
  uint32_t readyTimeoutMs = 0;
  uint32_t readyTimeoutMarginMs = 1000;
  uint16_t readyPollIntervalMs = 3;      ///< Sleep between data-ready polls

  // === Health Tracking ===
  uint8_t offlineThreshold = 5;          ///< Consecutive failures before OFFLINE
};

/// Measurement repeatability (SHT4x, SHT85)
enum class Repeatability : uint8_t {
  LOW_REPEATABILITY = 0,
  MEDIUM_REPEATABILITY = 1,
  HIGH_REPEATABILITY = 2
};

/// Periodic measurement rate (measurements per second, SHT85)
enum class PeriodicRate : uint8_t {
  MPS_0_5 = 0,
  MPS_1 = 1,
  MPS_2 = 2,
  MPS_4 = 3,
  MPS_10 = 4
};

/// SHT2x master mode
enum class HoldMode : uint8_t {
  HOLD = 0,      ///< Sensor holds SCL during conversion
  NO_HOLD = 1    ///< Master polls after the conversion time
};

/// SHT2x measurement resolution (user register bits 7 and 0)
enum class Sht2xResolution : uint8_t {
  RH12_T14 = 0x00,   ///< Default
  RH8_T12 = 0x01,
  RH10_T13 = 0x80,
  RH11_T11 = 0x81
};

/// SHT4x heater power
enum class HeaterPower : uint8_t {
  MW_200 = 0,
  MW_110 = 1,
  MW_20 = 2
};

/// SHT4x heater pulse length
enum class HeaterDuration : uint8_t {
  MS_1000 = 0,
  MS_100 = 1
};

/// SCD4x product variant
enum class Scd4xVariant : uint8_t {
  SCD40 = 0,
  SCD41 = 1      ///< Adds single shot, power down and ASC period registers
};

/// SHT2x driver configuration
struct SHT2xConfig {
  BusConfig bus;
  HoldMode holdMode = HoldMode::HOLD;
};

/// SHT4x driver configuration
struct SHT4xConfig {
  BusConfig bus;
  uint8_t i2cAddress = 0x44;             ///< 0x44 (A), 0x45 (B) or 0x46 (C)
  Repeatability repeatability = Repeatability::HIGH_REPEATABILITY;
};

/// SHT85 driver configuration
struct SHT85Config {
  BusConfig bus;
  Repeatability repeatability = Repeatability::HIGH_REPEATABILITY;
  PeriodicRate periodicRate = PeriodicRate::MPS_1;
};

/// Optional boolean setting
enum class Toggle : uint8_t {
  KEEP = 0,      ///< Leave the sensor setting untouched
  ENABLE = 1,
  DISABLE = 2
};

/// SCD30 start-up settings written by applySettings()
/// Fields left at their KEEP value cause no bus traffic.
struct SCD30Settings {
  uint16_t measurementIntervalS = 0;     ///< 0 = keep, else 2..1800
  Toggle autoSelfCalibration = Toggle::KEEP;
  uint16_t forcedRecalibrationPpm = 0;   ///< 0 = keep, else 400..2000
  float temperatureOffsetC = std::numeric_limits<float>::quiet_NaN(); ///< NaN = keep, else 0..20
  int32_t altitudeM = -1;                ///< -1 = keep, else 0..3000
};

/// SCD30 driver configuration
struct SCD30Config {
  BusConfig bus;
  uint16_t ambientPressureMbar = 0;      ///< 0 (disabled) or 700..1200, used by startContinuous()
  SCD30Settings settings;
};

/// SCD4x start-up settings written by applySettings()
struct SCD4xSettings {
  Toggle autoSelfCalibration = Toggle::KEEP;
  float temperatureOffsetC = std::numeric_limits<float>::quiet_NaN(); ///< NaN = keep, else 0..20
  int32_t altitudeM = -1;                ///< -1 = keep, else 0..3000
  uint32_t ambientPressurePa = 0;        ///< 0 = keep, else 70000..120000
};

/// SCD4x driver configuration
struct SCD4xConfig {
  BusConfig bus;
  Scd4xVariant variant = Scd4xVariant::SCD41;
  SCD4xSettings settings;
};

} // namespace EnvSense

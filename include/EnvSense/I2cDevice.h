/// @file I2cDevice.h
/// @brief Device handle and command/response transaction primitive
#pragma once

#include <cstddef>
#include <cstdint>
#include "EnvSense/Status.h"
#include "EnvSense/Config.h"
#include "EnvSense/CommandTable.h"

namespace EnvSense {

/// Driver state for health monitoring
enum class DriverState : uint8_t {
  UNINIT,    ///< begin() not called or end() called
  READY,     ///< Operational, consecutiveFailures == 0
  DEGRADED,  ///< 1 <= consecutiveFailures < offlineThreshold
  OFFLINE    ///< consecutiveFailures >= offlineThreshold
};

/// One bus command: opcode, optional payload, settle time and response size
struct Command {
  uint16_t code = 0;           ///< Opcode (1 or 2 bytes)
  uint8_t codeLen = 2;         ///< Opcode length in bytes
  uint8_t payload[3] = {};     ///< Argument bytes following the opcode
  uint8_t payloadLen = 0;
  uint32_t waitMs = 0;         ///< Settle time between write and read
  uint8_t responseLen = 0;     ///< Bytes to read back (0 = write only)
  bool crcWords = true;        ///< Response is made of CRC-protected words
  bool allowNoData = false;    ///< Read NACK means "not ready" (not a failure)

  /// 8-bit opcode command
  static Command op8(uint8_t code, uint32_t waitMs, uint8_t responseLen = 0);

  /// 16-bit opcode command
  static Command op16(uint16_t code, uint32_t waitMs, uint8_t responseLen = 0);

  /// Append a 16-bit argument followed by its CRC
  Command& withWord(uint16_t value);

  /// Append a raw argument byte (no CRC)
  Command& withByte(uint8_t value);

  /// Response bytes carry no CRC
  Command& withoutCrc();

  /// Read NACK is reported as MEASUREMENT_NOT_READY
  Command& expectNoData();
};

/// Read-only response buffer organised in 3-byte words (MSB, LSB, CRC)
class Response {
public:
  const uint8_t* data() const { return _buf; }
  size_t size() const { return _len; }
  size_t wordCount() const { return _len / cmd::DATA_WORD_WITH_CRC; }

  /// Raw byte access (0 if out of range)
  uint8_t byte(size_t index) const { return index < _len ? _buf[index] : 0; }

  /// Data word of the given 3-byte group (0 if out of range)
  uint16_t word(size_t index) const;

private:
  friend class I2cDevice;

  uint8_t _buf[cmd::MAX_RESPONSE_LEN] = {};
  size_t _len = 0;
};

/// Device handle: bus index, fixed address and CRC policy, plus the
/// transaction primitive every driver is built on
class I2cDevice {
public:
  // =========================================================================
  // Lifecycle
  // =========================================================================

  /// Validate bus configuration and bind the device address (no I/O)
  Status begin(const BusConfig& config, uint8_t address);

  /// Release the handle (does not touch the bus)
  void end();

  bool initialized() const { return _initialized; }

  // =========================================================================
  // Identity (fixed by begin())
  // =========================================================================

  uint8_t address() const { return _address; }
  uint8_t busIndex() const { return _config.busIndex; }
  bool checkCrc() const { return _config.checkCrc; }
  const BusConfig& config() const { return _config; }

  // =========================================================================
  // Bus
  // =========================================================================

  /// Open the bus interface through the transport
  /// @return BUS_UNAVAILABLE if the transport cannot open it
  Status openBus();

  /// Close the bus interface (no-op if never opened)
  Status closeBus();

  /// True if the bus is open or managed outside the driver (no busOpen callback)
  bool busReady() const;

  // =========================================================================
  // Transactions
  // =========================================================================

  /// Write command, wait its settle time, read and verify the response
  /// @param command Command to issue
  /// @param response Receives the response (may be null for write-only commands)
  /// @return CRC_MISMATCH (detail = word index) if a response word fails the CRC
  Status execute(const Command& command, Response* response = nullptr);

  /// Blocking wait through the transport delay callback
  Status waitMs(uint32_t delayMs);

  /// Data-ready polls allowed for a sample due within periodMs
  /// Covers readyTimeoutMs when set, else periodMs + readyTimeoutMarginMs,
  /// at readyPollIntervalMs spacing.
  uint32_t readyPollBudget(uint32_t periodMs) const;

  /// Time limit behind readyPollBudget() in ms
  uint32_t readyTimeoutMs(uint32_t periodMs) const;

  // =========================================================================
  // Bus recovery
  // =========================================================================

  /// Interface reset through the busReset callback
  /// @return UNSUPPORTED if no callback is configured
  Status interfaceReset();

  /// General call reset (0x06 to address 0x00), resets every device on the bus
  /// @return INVALID_CONFIG unless allowGeneralCallReset is set
  Status generalCallReset();

  // =========================================================================
  // Health Tracking
  // =========================================================================

  DriverState state() const { return _driverState; }

  bool isOnline() const {
    return _driverState == DriverState::READY ||
           _driverState == DriverState::DEGRADED;
  }

  Status lastError() const { return _lastError; }
  uint8_t consecutiveFailures() const { return _consecutiveFailures; }
  uint32_t totalFailures() const { return _totalFailures; }
  uint32_t totalSuccess() const { return _totalSuccess; }

  /// Response words rejected by the CRC check (lifetime)
  uint32_t crcErrors() const { return _crcErrors; }

private:
  // =========================================================================
  // Transport Wrappers
  // =========================================================================

  Status _i2cWriteTracked(const uint8_t* buf, size_t len);
  Status _i2cWriteRawAddrTracked(uint8_t addr, const uint8_t* buf, size_t len);
  Status _i2cReadTracked(uint8_t* buf, size_t len, bool allowNoData);
  Status _updateHealth(const Status& st);

  Status _ensureCommandDelay();
  Status _verifyCrc(const Response& response);

  // =========================================================================
  // State
  // =========================================================================

  BusConfig _config;
  uint8_t _address = 0;
  bool _initialized = false;
  bool _busOpen = false;
  bool _commandIssued = false;
  DriverState _driverState = DriverState::UNINIT;

  Status _lastError = Status::Ok();
  uint8_t _consecutiveFailures = 0;
  uint32_t _totalFailures = 0;
  uint32_t _totalSuccess = 0;
  uint32_t _crcErrors = 0;
};

} // namespace EnvSense

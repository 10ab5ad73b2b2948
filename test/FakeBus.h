/// @file FakeBus.h
/// @brief Scripted fake transport shared by the unit tests

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>

#include "EnvSense/Config.h"
#include "EnvSense/Crc.h"
#include "EnvSense/Status.h"

namespace testbus {

using EnvSense::Err;
using EnvSense::Status;

static constexpr size_t MAX_EVENTS = 64;
static constexpr size_t MAX_FRAME = 18;

/// Recorded transfers plus a queue of scripted read results.
/// Reads past the end of the queue return zero words with a valid CRC.
struct FakeBus {
  // Writes
  uint8_t writes[MAX_EVENTS][MAX_FRAME] = {};
  size_t writeLens[MAX_EVENTS] = {};
  uint8_t writeAddrs[MAX_EVENTS] = {};
  size_t writeCount = 0;
  uint16_t lastCommand = 0;
  Status writeStatus = Status::Ok();

  // Reads
  uint8_t reads[MAX_EVENTS][MAX_FRAME] = {};
  size_t readLens[MAX_EVENTS] = {};
  Status readStatus[MAX_EVENTS] = {};
  size_t readQueued = 0;
  size_t readIdx = 0;
  size_t readCount = 0;

  // Delays, also the simulated clock
  uint32_t delayCalls = 0;
  uint32_t delayTotalMs = 0;
  uint32_t nowMs = 0;

  // Data-ready emulation: a read following a write of readyCommand reports
  // "not ready" until nowMs reaches readyAtMs. Not ready is a zero word, or
  // a read NACK when notReadyAsNack is set (the ready read then comes from
  // the queue).
  bool clockedReady = false;
  uint16_t readyCommand = 0;
  uint32_t readyAtMs = 0;
  uint16_t readyWord = 0x0001;
  bool notReadyAsNack = false;

  // Bus open/close
  Status openStatus = Status::Ok();
  Status closeStatus = Status::Ok();
  uint32_t openCalls = 0;
  uint32_t closeCalls = 0;
  uint8_t openedIndex = 0xFF;

  // Interface reset
  Status resetStatus = Status::Ok();
  uint32_t resetCalls = 0;

  // Transfer order: 'O' open, 'W' write, 'R' read, 'C' close
  char events[MAX_EVENTS + 1] = {};
  size_t eventCount = 0;

  void record(char ev) {
    if (eventCount < MAX_EVENTS) {
      events[eventCount++] = ev;
    }
  }

  /// Command opcode of write n (first two bytes)
  uint16_t command16(size_t n) const {
    return static_cast<uint16_t>((writes[n][0] << 8) | writes[n][1]);
  }

  /// Queue a response of data words, each followed by its CRC
  void queueWords(const uint16_t* words, size_t count) {
    if (readQueued >= MAX_EVENTS) {
      return;
    }
    uint8_t* buf = reads[readQueued];
    for (size_t i = 0; i < count && (i * 3 + 2) < MAX_FRAME; ++i) {
      buf[i * 3] = static_cast<uint8_t>(words[i] >> 8);
      buf[i * 3 + 1] = static_cast<uint8_t>(words[i] & 0xFF);
      buf[i * 3 + 2] = EnvSense::crc8(&buf[i * 3], 2);
    }
    readLens[readQueued] = count * 3;
    readStatus[readQueued] = Status::Ok();
    readQueued++;
  }

  void queueWord(uint16_t word) { queueWords(&word, 1); }

  /// Queue raw response bytes (no CRC added)
  void queueRaw(const uint8_t* data, size_t len) {
    if (readQueued >= MAX_EVENTS || len > MAX_FRAME) {
      return;
    }
    std::memcpy(reads[readQueued], data, len);
    readLens[readQueued] = len;
    readStatus[readQueued] = Status::Ok();
    readQueued++;
  }

  /// Emulate a data-ready flag that sets at readyAt on the simulated clock
  void readyAt(uint16_t command, uint32_t atMs, bool asNack = false) {
    clockedReady = true;
    readyCommand = command;
    readyAtMs = atMs;
    notReadyAsNack = asNack;
  }

  /// Queue a failed read
  void queueError(Status st) {
    if (readQueued >= MAX_EVENTS) {
      return;
    }
    readLens[readQueued] = 0;
    readStatus[readQueued] = st;
    readQueued++;
  }
};

static void fillWord(uint8_t* rxData, size_t rxLen, uint16_t word) {
  std::memset(rxData, 0, rxLen);
  if (rxLen >= 3) {
    rxData[0] = static_cast<uint8_t>(word >> 8);
    rxData[1] = static_cast<uint8_t>(word & 0xFF);
  }
  for (size_t i = 0; i + 2 < rxLen; i += 3) {
    rxData[i + 2] = EnvSense::crc8(&rxData[i], 2);
  }
}

static Status fakeWrite(uint8_t addr, const uint8_t* data, size_t len,
                        uint32_t timeoutMs, void* user) {
  (void)timeoutMs;
  auto* bus = static_cast<FakeBus*>(user);
  bus->record('W');
  if (bus->writeCount < MAX_EVENTS) {
    const size_t n = len < MAX_FRAME ? len : MAX_FRAME;
    std::memcpy(bus->writes[bus->writeCount], data, n);
    bus->writeLens[bus->writeCount] = len;
    bus->writeAddrs[bus->writeCount] = addr;
  }
  bus->writeCount++;
  bus->lastCommand = (len >= 2) ? static_cast<uint16_t>((data[0] << 8) | data[1]) : data[0];
  return bus->writeStatus;
}

static Status fakeWriteRead(uint8_t addr, const uint8_t* txData, size_t txLen,
                            uint8_t* rxData, size_t rxLen, uint32_t timeoutMs,
                            void* user) {
  (void)addr;
  (void)txData;
  (void)txLen;
  (void)timeoutMs;
  auto* bus = static_cast<FakeBus*>(user);
  bus->record('R');
  bus->readCount++;

  if (bus->clockedReady && bus->lastCommand == bus->readyCommand) {
    const bool ready = bus->nowMs >= bus->readyAtMs;
    if (!bus->notReadyAsNack) {
      fillWord(rxData, rxLen, ready ? bus->readyWord : 0x0000);
      return Status::Ok();
    }
    if (!ready) {
      return Status::Error(Err::I2C_NACK_READ, "NACK read");
    }
  }

  if (bus->readIdx < bus->readQueued) {
    const size_t idx = bus->readIdx++;
    if (!bus->readStatus[idx].ok()) {
      return bus->readStatus[idx];
    }
    std::memset(rxData, 0, rxLen);
    const size_t n = bus->readLens[idx] < rxLen ? bus->readLens[idx] : rxLen;
    std::memcpy(rxData, bus->reads[idx], n);
    return Status::Ok();
  }

  fillWord(rxData, rxLen, 0x0000);
  return Status::Ok();
}

static void fakeDelay(uint32_t ms, void* user) {
  auto* bus = static_cast<FakeBus*>(user);
  bus->delayCalls++;
  bus->delayTotalMs += ms;
  bus->nowMs += ms;
}

static Status fakeOpen(uint8_t busIndex, void* user) {
  auto* bus = static_cast<FakeBus*>(user);
  bus->record('O');
  bus->openCalls++;
  bus->openedIndex = busIndex;
  return bus->openStatus;
}

static Status fakeClose(void* user) {
  auto* bus = static_cast<FakeBus*>(user);
  bus->record('C');
  bus->closeCalls++;
  return bus->closeStatus;
}

static Status fakeBusReset(void* user) {
  auto* bus = static_cast<FakeBus*>(user);
  bus->resetCalls++;
  return bus->resetStatus;
}

/// Bus configuration wired to a fake bus
/// @param withOpenClose Install open/close callbacks (bus must then be opened)
static EnvSense::BusConfig makeBusConfig(FakeBus& bus, bool withOpenClose = false) {
  EnvSense::BusConfig cfg;
  cfg.i2cWrite = fakeWrite;
  cfg.i2cWriteRead = fakeWriteRead;
  cfg.delayMs = fakeDelay;
  if (withOpenClose) {
    cfg.busOpen = fakeOpen;
    cfg.busClose = fakeClose;
  }
  cfg.i2cUser = &bus;
  // Five data-ready polls before TIMEOUT
  cfg.readyTimeoutMs = 12;
  cfg.readyPollIntervalMs = 3;
  return cfg;
}

} // namespace testbus

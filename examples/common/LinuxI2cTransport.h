/// @file LinuxI2cTransport.h
/// @brief Linux i2c-dev transport adapter for examples
/// @note NOT part of the library - examples only
#pragma once

#include <cerrno>
#include <cstdio>
#include <ctime>

#include <fcntl.h>
#include <linux/i2c-dev.h>
// i2c-dev.h defines an I2C_TIMEOUT ioctl macro that clashes with Err::I2C_TIMEOUT
#undef I2C_TIMEOUT
#include <sys/ioctl.h>
#include <unistd.h>

#include "EnvSense/Status.h"

namespace transport {

using EnvSense::Err;
using EnvSense::Status;

/// Bus state shared by all callbacks (pass as BusConfig::i2cUser)
struct LinuxI2cBus {
  int fd = -1;
  int slaveAddr = -1;
};

/// Map errno from read()/write() to a driver error code
inline Status errnoToStatus(int err, const char* msg) {
  switch (err) {
    case ENXIO:
    case EREMOTEIO:
      return Status::Error(Err::I2C_NACK_ADDR, msg, err);
    case ETIMEDOUT:
      return Status::Error(Err::I2C_TIMEOUT, msg, err);
    case EAGAIN:
    case EIO:
      return Status::Error(Err::I2C_BUS, msg, err);
    default:
      return Status::Error(Err::I2C_ERROR, msg, err);
  }
}

/// Select the slave address (cached per bus)
inline Status selectAddress(LinuxI2cBus& bus, uint8_t addr) {
  if (bus.fd < 0) {
    return Status::Error(Err::BUS_UNAVAILABLE, "I2C bus not open");
  }
  if (bus.slaveAddr == addr) {
    return Status::Ok();
  }
  if (ioctl(bus.fd, I2C_SLAVE, static_cast<unsigned long>(addr)) < 0) {
    return errnoToStatus(errno, "I2C_SLAVE ioctl failed");
  }
  bus.slaveAddr = addr;
  return Status::Ok();
}

/// Open /dev/i2c-<busIndex>
inline Status linuxOpen(uint8_t busIndex, void* user) {
  auto* bus = static_cast<LinuxI2cBus*>(user);
  char path[32];
  std::snprintf(path, sizeof(path), "/dev/i2c-%u", static_cast<unsigned>(busIndex));

  const int fd = ::open(path, O_RDWR);
  if (fd < 0) {
    return Status::Error(Err::I2C_ERROR, "Cannot open I2C device node", errno);
  }
  bus->fd = fd;
  bus->slaveAddr = -1;
  return Status::Ok();
}

inline Status linuxClose(void* user) {
  auto* bus = static_cast<LinuxI2cBus*>(user);
  if (bus->fd < 0) {
    return Status::Ok();
  }
  const int rc = ::close(bus->fd);
  bus->fd = -1;
  bus->slaveAddr = -1;
  if (rc < 0) {
    return Status::Error(Err::I2C_ERROR, "close() failed", errno);
  }
  return Status::Ok();
}

/// I2C write callback (one write transfer terminated by STOP)
inline Status linuxWrite(uint8_t addr, const uint8_t* data, size_t len,
                         uint32_t timeoutMs, void* user) {
  (void)timeoutMs;  // kernel adapter timeout applies
  auto* bus = static_cast<LinuxI2cBus*>(user);
  Status st = selectAddress(*bus, addr);
  if (!st.ok()) {
    return st;
  }

  const ssize_t written = ::write(bus->fd, data, len);
  if (written < 0) {
    return errnoToStatus(errno, "I2C write failed");
  }
  if (static_cast<size_t>(written) != len) {
    return Status::Error(Err::I2C_ERROR, "I2C write incomplete", static_cast<int32_t>(written));
  }
  return Status::Ok();
}

/// I2C read callback (read-only, txLen must be 0)
/// A NACK on the read header is reported as I2C_NACK_READ.
inline Status linuxWriteRead(uint8_t addr, const uint8_t* txData, size_t txLen,
                             uint8_t* rxData, size_t rxLen, uint32_t timeoutMs,
                             void* user) {
  (void)txData;
  (void)timeoutMs;
  if (txLen > 0) {
    return Status::Error(Err::INVALID_PARAM, "Combined write+read not supported");
  }
  if (rxLen == 0) {
    return Status::Ok();
  }

  auto* bus = static_cast<LinuxI2cBus*>(user);
  Status st = selectAddress(*bus, addr);
  if (!st.ok()) {
    return st;
  }

  const ssize_t received = ::read(bus->fd, rxData, rxLen);
  if (received < 0) {
    if (errno == ENXIO || errno == EREMOTEIO) {
      return Status::Error(Err::I2C_NACK_READ, "I2C read NACK", errno);
    }
    return errnoToStatus(errno, "I2C read failed");
  }
  if (static_cast<size_t>(received) != rxLen) {
    return Status::Error(Err::I2C_ERROR, "I2C read incomplete", static_cast<int32_t>(received));
  }
  return Status::Ok();
}

/// Blocking sleep
inline void linuxDelay(uint32_t ms, void* user) {
  (void)user;
  timespec req;
  req.tv_sec = static_cast<time_t>(ms / 1000);
  req.tv_nsec = static_cast<long>(ms % 1000) * 1000000L;
  while (nanosleep(&req, &req) != 0 && errno == EINTR) {
  }
}

} // namespace transport

/**
 * @file Crc.cpp
 * @brief Sensirion CRC-8 implementation.
 */

#include "EnvSense/Crc.h"

#include "EnvSense/CommandTable.h"

namespace EnvSense {

uint8_t crc8(const uint8_t* data, size_t len) {
  uint8_t crc = cmd::CRC_INIT;
  for (size_t i = 0; i < len; ++i) {
    crc ^= data[i];
    for (uint8_t bit = 0; bit < 8; ++bit) {
      if (crc & 0x80) {
        crc = static_cast<uint8_t>((crc << 1) ^ cmd::CRC_POLY);
      } else {
        crc <<= 1;
      }
    }
  }
  return crc;
}

bool verifyWord(const uint8_t* word, uint8_t checksum) {
  if (word == nullptr) {
    return false;
  }
  return crc8(word, cmd::DATA_WORD_BYTES) == checksum;
}

} // namespace EnvSense

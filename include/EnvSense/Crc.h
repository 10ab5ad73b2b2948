/// @file Crc.h
/// @brief Sensirion CRC-8 (poly 0x31, init 0xFF, no final XOR)
#pragma once

#include <cstddef>
#include <cstdint>

namespace EnvSense {

/// Compute CRC-8 over a byte sequence
uint8_t crc8(const uint8_t* data, size_t len);

/// Check a 2-byte data word against its trailing checksum byte
/// @param word Pointer to the two data bytes (MSB first)
/// @param checksum Checksum byte received after the word
bool verifyWord(const uint8_t* word, uint8_t checksum);

} // namespace EnvSense

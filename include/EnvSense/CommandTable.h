/// @file CommandTable.h
/// @brief Command opcodes, wait times and bit masks per sensor model
#pragma once

#include <cstdint>
#include <cstddef>

namespace EnvSense {
namespace cmd {

// ============================================================================
// Shared framing
// ============================================================================

// CRC-8 parameters
static constexpr uint8_t CRC_INIT = 0xFF;
static constexpr uint8_t CRC_POLY = 0x31;

static constexpr size_t DATA_WORD_BYTES = 2;
static constexpr size_t DATA_WORD_WITH_CRC = 3;

static constexpr size_t WORD_DATA_LEN = 3;           // One word (2+1)
static constexpr size_t MAX_RESPONSE_LEN = 18;       // SCD30 measurement (6 words)

// General call reset (address 0x00, second byte 0x06)
static constexpr uint8_t GENERAL_CALL_ADDR = 0x00;
static constexpr uint8_t GENERAL_CALL_RESET_BYTE = 0x06;
static constexpr uint32_t GENERAL_CALL_RESET_WAIT_MS = 2;

// Bus interfaces the session guard refuses to open
static constexpr uint8_t RESERVED_BUS_A = 0;
static constexpr uint8_t RESERVED_BUS_B = 2;

// ============================================================================
// SHT2x (1-byte commands)
// ============================================================================

namespace sht2x {

static constexpr uint8_t I2C_ADDR = 0x40;

static constexpr uint8_t CMD_T_HOLD = 0xE3;
static constexpr uint8_t CMD_RH_HOLD = 0xE5;
static constexpr uint8_t CMD_T_NO_HOLD = 0xF3;
static constexpr uint8_t CMD_RH_NO_HOLD = 0xF5;
static constexpr uint8_t CMD_WRITE_USER_REG = 0xE6;
static constexpr uint8_t CMD_READ_USER_REG = 0xE7;
static constexpr uint8_t CMD_SOFT_RESET = 0xFE;
static constexpr uint16_t CMD_SERIAL_B = 0xFA0F;      // Electronic ID, first part
static constexpr uint16_t CMD_SERIAL_AC = 0xFCC9;     // Electronic ID, second part

static constexpr uint32_t WAIT_T_MS = 85;
static constexpr uint32_t WAIT_RH_MS = 29;
static constexpr uint32_t WAIT_USER_REG_MS = 15;
static constexpr uint32_t WAIT_RESET_MS = 15;
static constexpr uint32_t WAIT_SERIAL_MS = 3;

// Two least significant bits of a measurement word are status bits
static constexpr uint16_t DATA_MASK = 0xFFFC;

// User register bits
static constexpr uint8_t USER_RES_MSB = 0x80;
static constexpr uint8_t USER_END_OF_BATTERY = 0x40;
static constexpr uint8_t USER_HEATER = 0x04;
static constexpr uint8_t USER_OTP_RELOAD_DISABLE = 0x02;
static constexpr uint8_t USER_RES_LSB = 0x01;

static constexpr uint8_t USER_RES_MASK = USER_RES_MSB | USER_RES_LSB;

static constexpr size_t MEASUREMENT_DATA_LEN = 3;   // One value (2+1)
static constexpr size_t SERIAL_B_LEN = 8;           // 4 x (byte + CRC)
static constexpr size_t SERIAL_AC_LEN = 6;          // 2 x (word + CRC)
static constexpr size_t USER_REG_LEN = 1;           // No CRC

} // namespace sht2x

// ============================================================================
// SHT4x (1-byte commands)
// ============================================================================

namespace sht4x {

static constexpr uint8_t I2C_ADDR_A = 0x44;
static constexpr uint8_t I2C_ADDR_B = 0x45;
static constexpr uint8_t I2C_ADDR_C = 0x46;

static constexpr uint8_t CMD_MEASURE_HIGH = 0xFD;
static constexpr uint8_t CMD_MEASURE_MED = 0xF6;
static constexpr uint8_t CMD_MEASURE_LOW = 0xE0;
static constexpr uint8_t CMD_SERIAL = 0x89;
static constexpr uint8_t CMD_SOFT_RESET = 0x94;

static constexpr uint8_t CMD_HEATER_200MW_1S = 0x39;
static constexpr uint8_t CMD_HEATER_200MW_100MS = 0x32;
static constexpr uint8_t CMD_HEATER_110MW_1S = 0x2F;
static constexpr uint8_t CMD_HEATER_110MW_100MS = 0x24;
static constexpr uint8_t CMD_HEATER_20MW_1S = 0x1E;
static constexpr uint8_t CMD_HEATER_20MW_100MS = 0x15;

static constexpr uint32_t WAIT_HIGH_MS = 10;
static constexpr uint32_t WAIT_MED_MS = 5;
static constexpr uint32_t WAIT_LOW_MS = 2;
static constexpr uint32_t WAIT_SERIAL_MS = 1;
static constexpr uint32_t WAIT_RESET_MS = 1;
static constexpr uint32_t WAIT_HEATER_1S_MS = 1100;
static constexpr uint32_t WAIT_HEATER_100MS_MS = 110;

static constexpr size_t MEASUREMENT_DATA_LEN = 6;   // T (2+1) + RH (2+1)
static constexpr size_t SERIAL_DATA_LEN = 6;

} // namespace sht4x

// ============================================================================
// SHT85 (16-bit commands, SHT3x command set)
// ============================================================================

namespace sht85 {

static constexpr uint8_t I2C_ADDR = 0x44;

// Single-shot measurement (clock stretching disabled)
static constexpr uint16_t CMD_SINGLE_SHOT_HIGH = 0x2400;
static constexpr uint16_t CMD_SINGLE_SHOT_MED = 0x240B;
static constexpr uint16_t CMD_SINGLE_SHOT_LOW = 0x2416;

// Periodic measurement commands (repeatability + mps)
static constexpr uint16_t CMD_PERIODIC_0_5_HIGH = 0x2032;
static constexpr uint16_t CMD_PERIODIC_0_5_MED = 0x2024;
static constexpr uint16_t CMD_PERIODIC_0_5_LOW = 0x202F;

static constexpr uint16_t CMD_PERIODIC_1_HIGH = 0x2130;
static constexpr uint16_t CMD_PERIODIC_1_MED = 0x2126;
static constexpr uint16_t CMD_PERIODIC_1_LOW = 0x212D;

static constexpr uint16_t CMD_PERIODIC_2_HIGH = 0x2236;
static constexpr uint16_t CMD_PERIODIC_2_MED = 0x2220;
static constexpr uint16_t CMD_PERIODIC_2_LOW = 0x222B;

static constexpr uint16_t CMD_PERIODIC_4_HIGH = 0x2334;
static constexpr uint16_t CMD_PERIODIC_4_MED = 0x2322;
static constexpr uint16_t CMD_PERIODIC_4_LOW = 0x2329;

static constexpr uint16_t CMD_PERIODIC_10_HIGH = 0x2737;
static constexpr uint16_t CMD_PERIODIC_10_MED = 0x2721;
static constexpr uint16_t CMD_PERIODIC_10_LOW = 0x272A;

static constexpr uint16_t CMD_FETCH_DATA = 0xE000;
static constexpr uint16_t CMD_ART = 0x2B32;
static constexpr uint16_t CMD_BREAK = 0x3093;

static constexpr uint16_t CMD_READ_STATUS = 0xF32D;
static constexpr uint16_t CMD_CLEAR_STATUS = 0x3041;
static constexpr uint16_t CMD_SOFT_RESET = 0x30A2;
static constexpr uint16_t CMD_HEATER_ENABLE = 0x306D;
static constexpr uint16_t CMD_HEATER_DISABLE = 0x3066;
static constexpr uint16_t CMD_SERIAL = 0x3682;

static constexpr uint32_t WAIT_HIGH_MS = 16;
static constexpr uint32_t WAIT_MED_MS = 7;
static constexpr uint32_t WAIT_LOW_MS = 5;
static constexpr uint32_t WAIT_SHORT_MS = 3;
static constexpr uint32_t WAIT_BREAK_MS = 1;
static constexpr uint32_t WAIT_RESET_MS = 2;

// ART samples at 4 Hz
static constexpr uint32_t ART_PERIOD_MS = 250;

// Status register bit masks (16-bit)
static constexpr uint16_t STATUS_ALERT_PENDING = 0x8000;
static constexpr uint16_t STATUS_HEATER_ON = 0x2000;
static constexpr uint16_t STATUS_RH_ALERT = 0x0800;
static constexpr uint16_t STATUS_T_ALERT = 0x0400;
static constexpr uint16_t STATUS_RESET_DETECTED = 0x0010;
static constexpr uint16_t STATUS_COMMAND_ERROR = 0x0002;
static constexpr uint16_t STATUS_WRITE_CRC_ERROR = 0x0001;

static constexpr size_t MEASUREMENT_DATA_LEN = 6; // T (2+1) + RH (2+1)
static constexpr size_t STATUS_DATA_LEN = 3;      // Status (2+1)
static constexpr size_t SERIAL_DATA_LEN = 6;      // SN (2+1 + 2+1)

} // namespace sht85

// ============================================================================
// SCD30 (16-bit commands, 3 ms between write and read)
// ============================================================================

namespace scd30 {

static constexpr uint8_t I2C_ADDR = 0x61;

static constexpr uint16_t CMD_START_CONTINUOUS = 0x0010;
static constexpr uint16_t CMD_STOP_CONTINUOUS = 0x0104;
static constexpr uint16_t CMD_MEASUREMENT_INTERVAL = 0x4600;
static constexpr uint16_t CMD_DATA_READY = 0x0202;
static constexpr uint16_t CMD_READ_MEASUREMENT = 0x0300;
static constexpr uint16_t CMD_ASC = 0x5306;
static constexpr uint16_t CMD_FRC = 0x5204;
static constexpr uint16_t CMD_TEMPERATURE_OFFSET = 0x5403;
static constexpr uint16_t CMD_ALTITUDE = 0x5102;
static constexpr uint16_t CMD_FIRMWARE_VERSION = 0xD100;
static constexpr uint16_t CMD_SOFT_RESET = 0xD304;
static constexpr uint16_t CMD_SERIAL = 0xD033;

static constexpr uint32_t WAIT_MS = 3;
static constexpr uint32_t WAIT_RESET_MS = 2000;

static constexpr uint16_t DATA_READY = 0x0001;

static constexpr uint16_t PRESSURE_MIN_MBAR = 700;
static constexpr uint16_t PRESSURE_MAX_MBAR = 1200;
static constexpr uint16_t INTERVAL_MIN_S = 2;
static constexpr uint16_t INTERVAL_MAX_S = 1800;
static constexpr uint16_t INTERVAL_DEFAULT_S = 2;

static constexpr size_t MEASUREMENT_DATA_LEN = 18; // CO2, T, RH as float (2 words each)
static constexpr size_t SERIAL_DATA_LEN = 9;

} // namespace scd30

// ============================================================================
// SCD4x (16-bit commands)
// ============================================================================

namespace scd4x {

static constexpr uint8_t I2C_ADDR = 0x62;

static constexpr uint16_t CMD_START_PERIODIC = 0x21B1;
static constexpr uint16_t CMD_START_LOW_POWER_PERIODIC = 0x21AC;
static constexpr uint16_t CMD_READ_MEASUREMENT = 0xEC05;
static constexpr uint16_t CMD_STOP_PERIODIC = 0x3F86;
static constexpr uint16_t CMD_DATA_READY = 0xE4B8;
static constexpr uint16_t CMD_SERIAL = 0x3682;

static constexpr uint16_t CMD_GET_ASC = 0x2313;
static constexpr uint16_t CMD_SET_ASC = 0x2416;
static constexpr uint16_t CMD_FORCED_RECALIBRATION = 0x362F;
static constexpr uint16_t CMD_GET_TEMPERATURE_OFFSET = 0x2318;
static constexpr uint16_t CMD_SET_TEMPERATURE_OFFSET = 0x241D;
static constexpr uint16_t CMD_GET_ALTITUDE = 0x2322;
static constexpr uint16_t CMD_SET_ALTITUDE = 0x2427;
static constexpr uint16_t CMD_AMBIENT_PRESSURE = 0xE000;
static constexpr uint16_t CMD_PERSIST_SETTINGS = 0x3615;
static constexpr uint16_t CMD_SELF_TEST = 0x3639;
static constexpr uint16_t CMD_FACTORY_RESET = 0x3632;
static constexpr uint16_t CMD_REINIT = 0x3646;

// SCD41 only
static constexpr uint16_t CMD_SINGLE_SHOT = 0x219D;
static constexpr uint16_t CMD_SINGLE_SHOT_RHT = 0x2196;
static constexpr uint16_t CMD_POWER_DOWN = 0x36E0;
static constexpr uint16_t CMD_WAKE_UP = 0x36F6;
static constexpr uint16_t CMD_GET_ASC_INITIAL_PERIOD = 0x2340;
static constexpr uint16_t CMD_SET_ASC_INITIAL_PERIOD = 0x2445;
static constexpr uint16_t CMD_GET_ASC_STANDARD_PERIOD = 0x234B;
static constexpr uint16_t CMD_SET_ASC_STANDARD_PERIOD = 0x244E;

static constexpr uint32_t WAIT_MS = 1;
static constexpr uint32_t WAIT_STOP_MS = 500;
static constexpr uint32_t WAIT_FRC_MS = 400;
static constexpr uint32_t WAIT_PERSIST_MS = 800;
static constexpr uint32_t WAIT_SELF_TEST_MS = 10000;
static constexpr uint32_t WAIT_FACTORY_RESET_MS = 1200;
static constexpr uint32_t WAIT_REINIT_MS = 30;
static constexpr uint32_t WAIT_SINGLE_SHOT_MS = 5000;
static constexpr uint32_t WAIT_SINGLE_SHOT_RHT_MS = 50;
static constexpr uint32_t WAIT_WAKE_UP_MS = 30;

// Sample period per measurement mode
static constexpr uint32_t PERIOD_MS = 5000;
static constexpr uint32_t LOW_POWER_PERIOD_MS = 30000;

// Data ready when any of the 11 least significant bits is set
static constexpr uint16_t DATA_READY_MASK = 0x07FF;
static constexpr uint16_t FRC_FAILED = 0xFFFF;
static constexpr uint16_t FRC_OFFSET = 0x8000;

static constexpr uint32_t PRESSURE_MIN_PA = 70000;
static constexpr uint32_t PRESSURE_MAX_PA = 120000;
static constexpr uint16_t ASC_PERIOD_STEP_H = 4;

static constexpr size_t MEASUREMENT_DATA_LEN = 9; // CO2, T, RH (3 words)
static constexpr size_t SERIAL_DATA_LEN = 9;

} // namespace scd4x

// Calibration limits shared by the CO2 sensors
static constexpr uint16_t CO2_REFERENCE_MIN_PPM = 400;
static constexpr uint16_t CO2_REFERENCE_MAX_PPM = 2000;
static constexpr uint16_t ALTITUDE_MAX_M = 3000;
static constexpr float TEMPERATURE_OFFSET_MAX_C = 20.0f;

} // namespace cmd
} // namespace EnvSense

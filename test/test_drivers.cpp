/// @file test_drivers.cpp
/// @brief Command sequence and decoding tests for each sensor driver

#include <unity.h>

#include <cmath>

#include "FakeBus.h"

#include "EnvSense/Conversion.h"
#include "EnvSense/Crc.h"
#include "EnvSense/SCD30.h"
#include "EnvSense/SCD4x.h"
#include "EnvSense/SHT2x.h"
#include "EnvSense/SHT4x.h"
#include "EnvSense/SHT85.h"

using namespace EnvSense;
using testbus::FakeBus;
using testbus::makeBusConfig;

void setUp() {}
void tearDown() {}

// ============================================================================
// SHT2x
// ============================================================================

static void beginSht2x(SHT2x& sensor, FakeBus& bus) {
  SHT2xConfig cfg;
  cfg.bus = makeBusConfig(bus);
  TEST_ASSERT_TRUE(sensor.begin(cfg).ok());
}

void test_sht2x_single_shot_sequence() {
  FakeBus bus;
  SHT2x sensor;
  beginSht2x(sensor, bus);

  bus.queueWord(0x6680);
  bus.queueWord(0x7D00);

  Measurement m;
  Status st = sensor.singleShot(m);
  TEST_ASSERT_TRUE(st.ok());
  TEST_ASSERT_EQUAL_size_t(2, bus.writeCount);
  TEST_ASSERT_EQUAL_size_t(1, bus.writeLens[0]);
  TEST_ASSERT_EQUAL_HEX8(0xE3, bus.writes[0][0]);
  TEST_ASSERT_EQUAL_HEX8(0xE5, bus.writes[1][0]);
  TEST_ASSERT_TRUE(bus.delayTotalMs >= 85u + 29u);

  TEST_ASSERT_TRUE(m.valid);
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 23.51f, m.temperatureC);
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 55.04f, m.humidityPct);
  TEST_ASSERT_FLOAT_WITHIN(0.011f, 13.96f, m.dewPointC);
  TEST_ASSERT_TRUE(std::isnan(m.co2Ppm));
  TEST_ASSERT_EQUAL(MeasurementMode::IDLE, sensor.mode());
}

void test_sht2x_no_hold_commands() {
  FakeBus bus;
  SHT2x sensor;
  SHT2xConfig cfg;
  cfg.bus = makeBusConfig(bus);
  cfg.holdMode = HoldMode::NO_HOLD;
  TEST_ASSERT_TRUE(sensor.begin(cfg).ok());

  Measurement m;
  TEST_ASSERT_TRUE(sensor.singleShot(m).ok());
  TEST_ASSERT_EQUAL_HEX8(0xF3, bus.writes[0][0]);
  TEST_ASSERT_EQUAL_HEX8(0xF5, bus.writes[1][0]);
}

void test_sht2x_heater_keeps_other_bits() {
  FakeBus bus;
  SHT2x sensor;
  beginSht2x(sensor, bus);

  const uint8_t reg = 0x3A;
  bus.queueRaw(&reg, 1);

  TEST_ASSERT_TRUE(sensor.setHeater(true).ok());
  TEST_ASSERT_EQUAL_size_t(2, bus.writeCount);
  TEST_ASSERT_EQUAL_HEX8(0xE7, bus.writes[0][0]);
  TEST_ASSERT_EQUAL_size_t(2, bus.writeLens[1]);
  TEST_ASSERT_EQUAL_HEX8(0xE6, bus.writes[1][0]);
  TEST_ASSERT_EQUAL_HEX8(0x3E, bus.writes[1][1]);
}

void test_sht2x_resolution_replaces_bits() {
  FakeBus bus;
  SHT2x sensor;
  beginSht2x(sensor, bus);

  const uint8_t before = 0xBB;  // RH11_T11 set
  bus.queueRaw(&before, 1);
  TEST_ASSERT_TRUE(sensor.setResolution(Sht2xResolution::RH12_T14).ok());
  TEST_ASSERT_EQUAL_HEX8(0x3A, bus.writes[1][1]);

  const uint8_t after = 0x3B;
  bus.queueRaw(&after, 1);
  Sht2xResolution res = Sht2xResolution::RH12_T14;
  TEST_ASSERT_TRUE(sensor.getResolution(res).ok());
  TEST_ASSERT_EQUAL(Sht2xResolution::RH8_T12, res);
}

void test_sht2x_serial_number() {
  FakeBus bus;
  SHT2x sensor;
  beginSht2x(sensor, bus);

  const uint8_t snb[4] = {0x11, 0x22, 0x33, 0x44};
  uint8_t first[8] = {};
  for (size_t i = 0; i < 4; ++i) {
    first[i * 2] = snb[i];
    first[i * 2 + 1] = crc8(&snb[i], 1);
  }
  bus.queueRaw(first, sizeof(first));
  const uint16_t second[2] = {0x5566, 0x7788};  // SNC, SNA
  bus.queueWords(second, 2);

  uint64_t serial = 0;
  TEST_ASSERT_TRUE(sensor.readSerialNumber(serial).ok());
  TEST_ASSERT_EQUAL_HEX16(0xFA0F, bus.command16(0));
  TEST_ASSERT_EQUAL_HEX16(0xFCC9, bus.command16(1));
  TEST_ASSERT_TRUE(serial == 0x7788112233445566ULL);
}

void test_sht2x_serial_byte_crc_error() {
  FakeBus bus;
  SHT2x sensor;
  beginSht2x(sensor, bus);

  const uint8_t first[8] = {0x11, 0x00, 0x22, 0x00, 0x33, 0x00, 0x44, 0x00};
  bus.queueRaw(first, sizeof(first));

  uint64_t serial = 0;
  Status st = sensor.readSerialNumber(serial);
  TEST_ASSERT_EQUAL(Err::CRC_MISMATCH, st.code);
  TEST_ASSERT_EQUAL_size_t(1, bus.writeCount);
}

void test_sht2x_fetch_unsupported() {
  FakeBus bus;
  SHT2x sensor;
  beginSht2x(sensor, bus);

  Measurement m;
  TEST_ASSERT_EQUAL(Err::UNSUPPORTED, sensor.fetch(m).code);
  TEST_ASSERT_TRUE(sensor.stop().ok());
  TEST_ASSERT_EQUAL_size_t(0, bus.writeCount);
}

void test_sht2x_humidity_uses_given_temperature() {
  FakeBus bus;
  SHT2x sensor;
  beginSht2x(sensor, bus);

  bus.queueWord(0x35B0);  // about -10 degC
  bus.queueWord(0x7D00);
  bus.queueWord(0x7D00);

  float t = 0.0f;
  TEST_ASSERT_TRUE(sensor.singleShotTemperature(t).ok());
  TEST_ASSERT_TRUE(t < 0.0f);

  // An earlier temperature read does not leak into the water-only call
  float rh = 0.0f;
  TEST_ASSERT_TRUE(sensor.singleShotHumidity(rh).ok());
  TEST_ASSERT_EQUAL_FLOAT(humidityWaterPct(SHT2X_CONVERSION, 0x7D00), rh);

  TEST_ASSERT_TRUE(sensor.singleShotHumidity(t, rh).ok());
  TEST_ASSERT_EQUAL_FLOAT(humidityPct(SHT2X_CONVERSION, 0x7D00, t), rh);
  TEST_ASSERT_EQUAL_HEX8(0xE5, bus.writes[2][0]);
}

// ============================================================================
// SHT4x
// ============================================================================

void test_sht4x_rejects_invalid_address() {
  FakeBus bus;
  SHT4x sensor;
  SHT4xConfig cfg;
  cfg.bus = makeBusConfig(bus);
  cfg.i2cAddress = 0x40;

  TEST_ASSERT_EQUAL(Err::INVALID_CONFIG, sensor.begin(cfg).code);
  TEST_ASSERT_FALSE(sensor.device().initialized());

  Measurement m;
  TEST_ASSERT_EQUAL(Err::NOT_INITIALIZED, sensor.singleShot(m).code);
  TEST_ASSERT_EQUAL_size_t(0, bus.writeCount);
}

void test_sht4x_single_shot_repeatability() {
  FakeBus bus;
  SHT4x sensor;
  SHT4xConfig cfg;
  cfg.bus = makeBusConfig(bus);
  cfg.i2cAddress = 0x45;
  cfg.repeatability = Repeatability::MEDIUM_REPEATABILITY;
  TEST_ASSERT_TRUE(sensor.begin(cfg).ok());
  TEST_ASSERT_EQUAL_HEX8(0x45, sensor.device().address());

  const uint16_t words[2] = {0x6683, 0x8000};
  bus.queueWords(words, 2);

  Measurement m;
  TEST_ASSERT_TRUE(sensor.singleShot(m).ok());
  TEST_ASSERT_EQUAL_HEX8(0xF6, bus.writes[0][0]);
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 25.08f, m.temperatureC);
  TEST_ASSERT_FLOAT_WITHIN(0.011f, 56.5f, m.humidityPct);
}

void test_sht4x_heater_pulse() {
  FakeBus bus;
  SHT4x sensor;
  SHT4xConfig cfg;
  cfg.bus = makeBusConfig(bus);
  TEST_ASSERT_TRUE(sensor.begin(cfg).ok());

  const uint16_t words[2] = {0x6683, 0x8000};
  bus.queueWords(words, 2);

  Measurement m;
  TEST_ASSERT_TRUE(sensor.singleShotWithHeater(HeaterPower::MW_200, HeaterDuration::MS_1000, m).ok());
  TEST_ASSERT_EQUAL_size_t(1, bus.writeCount);
  TEST_ASSERT_EQUAL_HEX8(0x39, bus.writes[0][0]);
  TEST_ASSERT_TRUE(bus.delayTotalMs >= 1100u);
  TEST_ASSERT_TRUE(m.valid);
}

void test_sht4x_serial_number() {
  FakeBus bus;
  SHT4x sensor;
  SHT4xConfig cfg;
  cfg.bus = makeBusConfig(bus);
  TEST_ASSERT_TRUE(sensor.begin(cfg).ok());

  const uint16_t words[2] = {0x1234, 0xABCD};
  bus.queueWords(words, 2);

  uint64_t serial = 0;
  TEST_ASSERT_TRUE(sensor.readSerialNumber(serial).ok());
  TEST_ASSERT_EQUAL_HEX8(0x89, bus.writes[0][0]);
  TEST_ASSERT_TRUE(serial == 0x1234ABCDULL);
}

// ============================================================================
// SHT85
// ============================================================================

static void beginSht85(SHT85& sensor, FakeBus& bus) {
  SHT85Config cfg;
  cfg.bus = makeBusConfig(bus);
  cfg.bus.transportCapabilities = TransportCapability::READ_HEADER_NACK;
  TEST_ASSERT_TRUE(sensor.begin(cfg).ok());
}

void test_sht85_single_shot() {
  FakeBus bus;
  SHT85 sensor;
  beginSht85(sensor, bus);

  const uint16_t words[2] = {0x6683, 0x8000};
  bus.queueWords(words, 2);

  Measurement m;
  TEST_ASSERT_TRUE(sensor.singleShot(m).ok());
  TEST_ASSERT_EQUAL_HEX16(0x2400, bus.command16(0));
  TEST_ASSERT_EQUAL_UINT32(16u, bus.delayTotalMs);
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 25.08f, m.temperatureC);
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 50.0f, m.humidityPct);
  TEST_ASSERT_FLOAT_WITHIN(0.011f, 13.93f, m.dewPointC);
  TEST_ASSERT_TRUE(sensor.measurement().valid);
}

void test_sht85_fetch_requires_periodic() {
  FakeBus bus;
  SHT85 sensor;
  beginSht85(sensor, bus);

  Measurement m;
  TEST_ASSERT_EQUAL(Err::INVALID_PARAM, sensor.fetch(m).code);
  TEST_ASSERT_EQUAL_size_t(0, bus.writeCount);
}

void test_sht85_fetch_retries_on_nack() {
  FakeBus bus;
  SHT85 sensor;
  beginSht85(sensor, bus);

  TEST_ASSERT_TRUE(sensor.startPeriodic().ok());
  TEST_ASSERT_EQUAL_HEX16(0x2130, bus.command16(0));
  TEST_ASSERT_EQUAL(MeasurementMode::PERIODIC, sensor.mode());

  bus.queueError(Status::Error(Err::I2C_NACK_READ, "NACK read"));
  const uint16_t words[2] = {0x6683, 0x8000};
  bus.queueWords(words, 2);

  Measurement m;
  TEST_ASSERT_TRUE(sensor.fetch(m).ok());
  TEST_ASSERT_EQUAL_size_t(2, bus.readCount);
  TEST_ASSERT_EQUAL_HEX16(0xE000, bus.command16(1));
  TEST_ASSERT_EQUAL_HEX16(0xE000, bus.command16(2));
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 25.08f, m.temperatureC);
  TEST_ASSERT_EQUAL(DriverState::READY, sensor.device().state());
}

void test_sht85_fetch_times_out() {
  FakeBus bus;
  SHT85 sensor;
  beginSht85(sensor, bus);
  TEST_ASSERT_TRUE(sensor.startPeriodic().ok());

  for (int i = 0; i < 5; ++i) {
    bus.queueError(Status::Error(Err::I2C_NACK_READ, "NACK read"));
  }

  Measurement m;
  Status st = sensor.fetch(m);
  TEST_ASSERT_EQUAL(Err::TIMEOUT, st.code);
  TEST_ASSERT_EQUAL_size_t(5, bus.readCount);
  TEST_ASSERT_FALSE(m.valid);
}

void test_sht85_nack_without_capability_is_an_error() {
  FakeBus bus;
  SHT85 sensor;
  SHT85Config cfg;
  cfg.bus = makeBusConfig(bus);
  TEST_ASSERT_TRUE(sensor.begin(cfg).ok());
  TEST_ASSERT_TRUE(sensor.startPeriodic().ok());

  bus.queueError(Status::Error(Err::I2C_NACK_READ, "NACK read"));

  Measurement m;
  TEST_ASSERT_EQUAL(Err::I2C_NACK_READ, sensor.fetch(m).code);
  TEST_ASSERT_EQUAL_size_t(1, bus.readCount);
  TEST_ASSERT_EQUAL(DriverState::DEGRADED, sensor.device().state());
}

void test_sht85_fetch_waits_one_sample_period() {
  FakeBus bus;
  SHT85 sensor;
  SHT85Config cfg;
  cfg.bus = makeBusConfig(bus);
  cfg.bus.transportCapabilities = TransportCapability::READ_HEADER_NACK;
  cfg.bus.readyTimeoutMs = 0;
  cfg.periodicRate = PeriodicRate::MPS_0_5;
  TEST_ASSERT_TRUE(sensor.begin(cfg).ok());
  TEST_ASSERT_TRUE(sensor.startPeriodic().ok());

  bus.readyAt(0xE000, bus.nowMs + 2000, true);
  const uint16_t words[2] = {0x6683, 0x8000};
  bus.queueWords(words, 2);

  Measurement m;
  TEST_ASSERT_TRUE(sensor.fetch(m).ok());
  TEST_ASSERT_TRUE(bus.nowMs >= bus.readyAtMs);
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 25.08f, m.temperatureC);

  // Waiting for a sample is not a bus failure
  TEST_ASSERT_EQUAL(DriverState::READY, sensor.device().state());
  TEST_ASSERT_EQUAL_UINT32(0u, sensor.device().totalFailures());
  TEST_ASSERT_TRUE(sensor.device().lastError().ok());
}

void test_sht85_busy_while_periodic() {
  FakeBus bus;
  SHT85 sensor;
  beginSht85(sensor, bus);
  TEST_ASSERT_TRUE(sensor.startPeriodic(PeriodicRate::MPS_10, Repeatability::LOW_REPEATABILITY).ok());
  TEST_ASSERT_EQUAL_HEX16(0x272A, bus.command16(0));

  Measurement m;
  uint16_t raw = 0;
  TEST_ASSERT_EQUAL(Err::BUSY, sensor.singleShot(m).code);
  TEST_ASSERT_EQUAL(Err::BUSY, sensor.readStatus(raw).code);
  TEST_ASSERT_EQUAL(Err::BUSY, sensor.setHeater(true).code);
  TEST_ASSERT_EQUAL_size_t(1, bus.writeCount);
}

void test_sht85_stop_is_repeatable() {
  FakeBus bus;
  SHT85 sensor;
  beginSht85(sensor, bus);
  TEST_ASSERT_TRUE(sensor.startPeriodic().ok());

  TEST_ASSERT_TRUE(sensor.stop().ok());
  TEST_ASSERT_TRUE(sensor.stop().ok());
  TEST_ASSERT_EQUAL(MeasurementMode::IDLE, sensor.mode());
  TEST_ASSERT_EQUAL_HEX16(0x3093, bus.command16(1));
  TEST_ASSERT_EQUAL_HEX16(0x3093, bus.command16(2));
}

void test_sht85_stop_failure_keeps_mode() {
  FakeBus bus;
  SHT85 sensor;
  beginSht85(sensor, bus);
  TEST_ASSERT_TRUE(sensor.startPeriodic().ok());

  bus.writeStatus = Status::Error(Err::I2C_NACK_ADDR, "NACK addr");
  TEST_ASSERT_EQUAL(Err::I2C_NACK_ADDR, sensor.stop().code);
  TEST_ASSERT_EQUAL(MeasurementMode::PERIODIC, sensor.mode());
}

void test_sht85_art_mode() {
  FakeBus bus;
  SHT85 sensor;
  beginSht85(sensor, bus);

  TEST_ASSERT_TRUE(sensor.startArt().ok());
  TEST_ASSERT_EQUAL_HEX16(0x2B32, bus.command16(0));
  TEST_ASSERT_TRUE(sensor.artActive());
  TEST_ASSERT_EQUAL(MeasurementMode::PERIODIC, sensor.mode());

  TEST_ASSERT_TRUE(sensor.stop().ok());
  TEST_ASSERT_FALSE(sensor.artActive());
}

void test_sht85_check_status_flags() {
  FakeBus bus;
  SHT85 sensor;
  beginSht85(sensor, bus);

  bus.queueWord(0x2052);  // heater, reset, command error + undefined bit 6
  uint16_t flags = 0;
  TEST_ASSERT_TRUE(sensor.checkStatus(flags).ok());
  TEST_ASSERT_EQUAL_HEX16(0x2012, flags);

  bus.queueWord(0x2000);
  StatusRegister reg;
  TEST_ASSERT_TRUE(sensor.readStatus(reg).ok());
  TEST_ASSERT_TRUE(reg.heaterOn);
  TEST_ASSERT_FALSE(reg.alertPending);
}

// ============================================================================
// SCD30
// ============================================================================

static void beginScd30(SCD30& sensor, FakeBus& bus) {
  SCD30Config cfg;
  cfg.bus = makeBusConfig(bus);
  TEST_ASSERT_TRUE(sensor.begin(cfg).ok());
}

void test_scd30_fetch_polls_then_decodes_floats() {
  FakeBus bus;
  SCD30 sensor;
  beginScd30(sensor, bus);

  bus.queueWord(0x0000);
  bus.queueWord(0x0001);
  const uint16_t words[6] = {0x43C8, 0x0000, 0x41BC, 0x0000, 0x4235, 0x0000};
  bus.queueWords(words, 6);

  Measurement m;
  TEST_ASSERT_TRUE(sensor.fetch(m).ok());
  TEST_ASSERT_EQUAL_HEX16(0x0202, bus.command16(0));
  TEST_ASSERT_EQUAL_HEX16(0x0202, bus.command16(1));
  TEST_ASSERT_EQUAL_HEX16(0x0300, bus.command16(2));
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 400.0f, m.co2Ppm);
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 23.5f, m.temperatureC);
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 45.25f, m.humidityPct);
  TEST_ASSERT_FLOAT_WITHIN(0.011f, 10.96f, m.dewPointC);
}

void test_scd30_fetch_times_out() {
  FakeBus bus;
  SCD30 sensor;
  beginScd30(sensor, bus);

  Measurement m;
  TEST_ASSERT_EQUAL(Err::TIMEOUT, sensor.fetch(m).code);
  TEST_ASSERT_EQUAL_size_t(5, bus.readCount);
}

void test_scd30_fetch_waits_for_measurement_interval() {
  FakeBus bus;
  SCD30 sensor;
  SCD30Config cfg;
  cfg.bus = makeBusConfig(bus);
  cfg.bus.readyTimeoutMs = 0;
  TEST_ASSERT_TRUE(sensor.begin(cfg).ok());
  TEST_ASSERT_TRUE(sensor.startContinuous().ok());

  // First sample at the default 2 s interval
  bus.readyAt(0x0202, bus.nowMs + 2000);
  const uint16_t words[6] = {0x43C8, 0x0000, 0x41BC, 0x0000, 0x4235, 0x0000};
  bus.queueWords(words, 6);

  Measurement m;
  TEST_ASSERT_TRUE(sensor.fetch(m).ok());
  TEST_ASSERT_TRUE(bus.nowMs >= bus.readyAtMs);
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 400.0f, m.co2Ppm);

  // A longer interval extends the wait
  TEST_ASSERT_TRUE(sensor.setMeasurementInterval(10).ok());
  bus.readyAt(0x0202, bus.nowMs + 10000);
  bus.queueWords(words, 6);
  TEST_ASSERT_TRUE(sensor.fetch(m).ok());
  TEST_ASSERT_TRUE(bus.nowMs >= bus.readyAtMs);
}

void test_scd30_fetch_never_ready_times_out() {
  FakeBus bus;
  SCD30 sensor;
  SCD30Config cfg;
  cfg.bus = makeBusConfig(bus);
  cfg.bus.readyTimeoutMs = 0;
  TEST_ASSERT_TRUE(sensor.begin(cfg).ok());
  TEST_ASSERT_TRUE(sensor.startContinuous().ok());

  const uint32_t start = bus.nowMs;
  bus.readyAt(0x0202, 0xFFFFFFFFu);

  Measurement m;
  Status st = sensor.fetch(m);
  TEST_ASSERT_EQUAL(Err::TIMEOUT, st.code);
  TEST_ASSERT_EQUAL(3000, st.detail);
  TEST_ASSERT_TRUE(bus.nowMs - start >= 3000u);
  TEST_ASSERT_FALSE(m.valid);
}

void test_scd30_apply_settings() {
  FakeBus bus;
  SCD30 sensor;
  SCD30Config cfg;
  cfg.bus = makeBusConfig(bus);
  cfg.bus.readyTimeoutMs = 0;
  cfg.settings.measurementIntervalS = 5;
  cfg.settings.autoSelfCalibration = Toggle::DISABLE;
  cfg.settings.temperatureOffsetC = 1.5f;
  cfg.settings.altitudeM = 540;
  TEST_ASSERT_TRUE(sensor.begin(cfg).ok());

  TEST_ASSERT_TRUE(sensor.applySettings().ok());
  TEST_ASSERT_EQUAL_size_t(4, bus.writeCount);
  TEST_ASSERT_EQUAL_HEX16(0x4600, bus.command16(0));
  TEST_ASSERT_EQUAL_HEX8(0x05, bus.writes[0][3]);
  TEST_ASSERT_EQUAL_HEX16(0x5306, bus.command16(1));
  TEST_ASSERT_EQUAL_HEX8(0x00, bus.writes[1][3]);
  TEST_ASSERT_EQUAL_HEX16(0x5403, bus.command16(2));
  TEST_ASSERT_EQUAL_HEX8(0x96, bus.writes[2][3]);
  TEST_ASSERT_EQUAL_HEX16(0x5102, bus.command16(3));
  TEST_ASSERT_EQUAL_HEX8(0x02, bus.writes[3][2]);
  TEST_ASSERT_EQUAL_HEX8(0x1C, bus.writes[3][3]);

  // The configured interval sets the data-ready wait
  TEST_ASSERT_TRUE(sensor.startContinuous().ok());
  bus.readyAt(0x0202, bus.nowMs + 5000);
  const uint16_t words[6] = {0x43C8, 0x0000, 0x41BC, 0x0000, 0x4235, 0x0000};
  bus.queueWords(words, 6);
  Measurement m;
  TEST_ASSERT_TRUE(sensor.fetch(m).ok());
}

void test_scd30_settings_validated_at_begin() {
  FakeBus bus;
  SCD30 sensor;
  SCD30Config cfg;
  cfg.bus = makeBusConfig(bus);
  cfg.settings.measurementIntervalS = 1;
  TEST_ASSERT_EQUAL(Err::INVALID_CONFIG, sensor.begin(cfg).code);

  cfg.settings.measurementIntervalS = 0;
  cfg.settings.forcedRecalibrationPpm = 300;
  TEST_ASSERT_EQUAL(Err::INVALID_CONFIG, sensor.begin(cfg).code);

  cfg.settings.forcedRecalibrationPpm = 0;
  TEST_ASSERT_TRUE(sensor.begin(cfg).ok());
  TEST_ASSERT_TRUE(sensor.applySettings().ok());
  TEST_ASSERT_EQUAL_size_t(0, bus.writeCount);
}

void test_scd30_frc_out_of_range() {
  FakeBus bus;
  SCD30 sensor;
  beginScd30(sensor, bus);

  TEST_ASSERT_EQUAL(Err::OUT_OF_RANGE, sensor.setForcedRecalibration(300).code);
  TEST_ASSERT_EQUAL(Err::OUT_OF_RANGE, sensor.setForcedRecalibration(2001).code);
  TEST_ASSERT_EQUAL(Err::OUT_OF_RANGE, sensor.setMeasurementInterval(1).code);
  TEST_ASSERT_EQUAL(Err::OUT_OF_RANGE, sensor.setAltitude(3001).code);
  TEST_ASSERT_EQUAL(Err::OUT_OF_RANGE, sensor.setTemperatureOffset(25.0f).code);
  TEST_ASSERT_EQUAL_size_t(0, bus.writeCount);
  TEST_ASSERT_EQUAL_size_t(0, bus.readCount);
}

void test_scd30_start_continuous_pressure() {
  FakeBus bus;
  SCD30 sensor;
  beginScd30(sensor, bus);

  TEST_ASSERT_EQUAL(Err::OUT_OF_RANGE, sensor.startContinuous(650).code);
  TEST_ASSERT_EQUAL_size_t(0, bus.writeCount);

  TEST_ASSERT_TRUE(sensor.startContinuous(1013).ok());
  const uint8_t arg[2] = {0x03, 0xF5};
  TEST_ASSERT_EQUAL_size_t(5, bus.writeLens[0]);
  TEST_ASSERT_EQUAL_HEX8(0x00, bus.writes[0][0]);
  TEST_ASSERT_EQUAL_HEX8(0x10, bus.writes[0][1]);
  TEST_ASSERT_EQUAL_HEX8(0x03, bus.writes[0][2]);
  TEST_ASSERT_EQUAL_HEX8(0xF5, bus.writes[0][3]);
  TEST_ASSERT_EQUAL_HEX8(crc8(arg, 2), bus.writes[0][4]);
  TEST_ASSERT_EQUAL(MeasurementMode::CONTINUOUS, sensor.mode());
}

void test_scd30_temperature_offset_scale() {
  FakeBus bus;
  SCD30 sensor;
  beginScd30(sensor, bus);

  TEST_ASSERT_TRUE(sensor.setTemperatureOffset(1.5f).ok());
  TEST_ASSERT_EQUAL_HEX8(0x00, bus.writes[0][2]);
  TEST_ASSERT_EQUAL_HEX8(0x96, bus.writes[0][3]);

  bus.queueWord(250);
  float offset = 0.0f;
  TEST_ASSERT_TRUE(sensor.getTemperatureOffset(offset).ok());
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 2.5f, offset);
}

void test_scd30_single_shot_unsupported() {
  FakeBus bus;
  SCD30 sensor;
  beginScd30(sensor, bus);

  Measurement m;
  TEST_ASSERT_EQUAL(Err::UNSUPPORTED, sensor.singleShot(m).code);
  TEST_ASSERT_EQUAL_size_t(0, bus.writeCount);
}

// ============================================================================
// SCD4x
// ============================================================================

static void beginScd4x(SCD4x& sensor, FakeBus& bus,
                       Scd4xVariant variant = Scd4xVariant::SCD41) {
  SCD4xConfig cfg;
  cfg.bus = makeBusConfig(bus);
  cfg.variant = variant;
  TEST_ASSERT_TRUE(sensor.begin(cfg).ok());
}

void test_scd4x_fetch() {
  FakeBus bus;
  SCD4x sensor;
  beginScd4x(sensor, bus);

  bus.queueWord(0x8006);
  const uint16_t words[3] = {0x01F4, 0x6683, 0x8000};
  bus.queueWords(words, 3);

  Measurement m;
  TEST_ASSERT_TRUE(sensor.fetch(m).ok());
  TEST_ASSERT_EQUAL_HEX16(0xE4B8, bus.command16(0));
  TEST_ASSERT_EQUAL_HEX16(0xEC05, bus.command16(1));
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 500.0f, m.co2Ppm);
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 25.08f, m.temperatureC);
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 50.0f, m.humidityPct);
}

void test_scd4x_fetch_times_out() {
  FakeBus bus;
  SCD4x sensor;
  beginScd4x(sensor, bus);

  bus.queueWord(0x8000);  // upper bits only, not ready

  Measurement m;
  TEST_ASSERT_EQUAL(Err::TIMEOUT, sensor.fetch(m).code);
  TEST_ASSERT_EQUAL_size_t(5, bus.readCount);
  TEST_ASSERT_EQUAL_size_t(5, bus.writeCount);
}

void test_scd4x_fetch_waits_for_first_sample() {
  FakeBus bus;
  SCD4x sensor;
  SCD4xConfig cfg;
  cfg.bus = makeBusConfig(bus);
  cfg.bus.readyTimeoutMs = 0;
  TEST_ASSERT_TRUE(sensor.begin(cfg).ok());
  TEST_ASSERT_TRUE(sensor.startPeriodic().ok());

  bus.readyAt(0xE4B8, bus.nowMs + 5000);
  bus.readyWord = 0x8006;
  const uint16_t words[3] = {0x01F4, 0x6683, 0x8000};
  bus.queueWords(words, 3);

  Measurement m;
  TEST_ASSERT_TRUE(sensor.fetch(m).ok());
  TEST_ASSERT_TRUE(bus.nowMs >= bus.readyAtMs);
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 500.0f, m.co2Ppm);

  // Low power mode samples every 30 s
  TEST_ASSERT_TRUE(sensor.startLowPowerPeriodic().ok());
  TEST_ASSERT_EQUAL(MeasurementMode::LOW_POWER_PERIODIC, sensor.mode());
  bus.readyAt(0xE4B8, bus.nowMs + 30000);
  bus.queueWords(words, 3);
  TEST_ASSERT_TRUE(sensor.fetch(m).ok());
  TEST_ASSERT_TRUE(bus.nowMs >= bus.readyAtMs);
}

void test_scd4x_fetch_never_ready_times_out() {
  FakeBus bus;
  SCD4x sensor;
  SCD4xConfig cfg;
  cfg.bus = makeBusConfig(bus);
  cfg.bus.readyTimeoutMs = 0;
  TEST_ASSERT_TRUE(sensor.begin(cfg).ok());
  TEST_ASSERT_TRUE(sensor.startPeriodic().ok());

  const uint32_t start = bus.nowMs;
  bus.readyAt(0xE4B8, 0xFFFFFFFFu);

  Measurement m;
  Status st = sensor.fetch(m);
  TEST_ASSERT_EQUAL(Err::TIMEOUT, st.code);
  TEST_ASSERT_EQUAL(6000, st.detail);
  TEST_ASSERT_TRUE(bus.nowMs - start >= 6000u);
}

void test_scd4x_apply_settings() {
  FakeBus bus;
  SCD4x sensor;
  SCD4xConfig cfg;
  cfg.bus = makeBusConfig(bus);
  cfg.settings.autoSelfCalibration = Toggle::ENABLE;
  cfg.settings.temperatureOffsetC = 4.0f;
  cfg.settings.altitudeM = 100;
  cfg.settings.ambientPressurePa = 101300;
  TEST_ASSERT_TRUE(sensor.begin(cfg).ok());
  TEST_ASSERT_TRUE(sensor.startPeriodic().ok());

  TEST_ASSERT_TRUE(sensor.applySettings().ok());
  TEST_ASSERT_EQUAL_size_t(6, bus.writeCount);
  TEST_ASSERT_EQUAL_HEX16(0x3F86, bus.command16(1));
  TEST_ASSERT_EQUAL_HEX16(0x2416, bus.command16(2));
  TEST_ASSERT_EQUAL_HEX8(0x01, bus.writes[2][3]);
  TEST_ASSERT_EQUAL_HEX16(0x241D, bus.command16(3));
  TEST_ASSERT_EQUAL_HEX8(0x05, bus.writes[3][2]);
  TEST_ASSERT_EQUAL_HEX8(0xDA, bus.writes[3][3]);
  TEST_ASSERT_EQUAL_HEX16(0x2427, bus.command16(4));
  TEST_ASSERT_EQUAL_HEX8(0x64, bus.writes[4][3]);
  TEST_ASSERT_EQUAL_HEX16(0xE000, bus.command16(5));
  TEST_ASSERT_EQUAL_HEX8(0xF5, bus.writes[5][3]);
  TEST_ASSERT_EQUAL(MeasurementMode::IDLE, sensor.mode());

  cfg.settings.altitudeM = 3001;
  TEST_ASSERT_EQUAL(Err::INVALID_CONFIG, sensor.begin(cfg).code);
}

void test_scd4x_frc_out_of_range() {
  FakeBus bus;
  SCD4x sensor;
  beginScd4x(sensor, bus);

  int16_t correction = 0;
  TEST_ASSERT_EQUAL(Err::OUT_OF_RANGE, sensor.performForcedRecalibration(300, correction).code);
  TEST_ASSERT_EQUAL_size_t(0, bus.writeCount);
  TEST_ASSERT_EQUAL_size_t(0, bus.readCount);
}

void test_scd4x_frc_stops_periodic_first() {
  FakeBus bus;
  SCD4x sensor;
  beginScd4x(sensor, bus);
  TEST_ASSERT_TRUE(sensor.startPeriodic().ok());

  bus.queueWord(0x8019);
  int16_t correction = 0;
  TEST_ASSERT_TRUE(sensor.performForcedRecalibration(400, correction).ok());
  TEST_ASSERT_EQUAL_size_t(3, bus.writeCount);
  TEST_ASSERT_EQUAL_HEX16(0x21B1, bus.command16(0));
  TEST_ASSERT_EQUAL_HEX16(0x3F86, bus.command16(1));
  TEST_ASSERT_EQUAL_HEX16(0x362F, bus.command16(2));
  TEST_ASSERT_EQUAL_HEX8(0x01, bus.writes[2][2]);
  TEST_ASSERT_EQUAL_HEX8(0x90, bus.writes[2][3]);
  TEST_ASSERT_EQUAL_INT16(25, correction);
  TEST_ASSERT_EQUAL(MeasurementMode::IDLE, sensor.mode());
}

void test_scd4x_frc_failure_reported() {
  FakeBus bus;
  SCD4x sensor;
  beginScd4x(sensor, bus);

  bus.queueWord(0xFFFF);
  int16_t correction = 7;
  Status st = sensor.performForcedRecalibration(400, correction);
  TEST_ASSERT_EQUAL(Err::COMMAND_FAILED, st.code);
  TEST_ASSERT_EQUAL_INT16(7, correction);
}

void test_scd4x_temperature_offset_encoding() {
  FakeBus bus;
  SCD4x sensor;
  beginScd4x(sensor, bus);

  TEST_ASSERT_TRUE(sensor.setTemperatureOffset(4.0f).ok());
  const uint8_t arg[2] = {0x05, 0xDA};
  TEST_ASSERT_EQUAL_size_t(1, bus.writeCount);
  TEST_ASSERT_EQUAL_HEX16(0x241D, bus.command16(0));
  TEST_ASSERT_EQUAL_HEX8(0x05, bus.writes[0][2]);
  TEST_ASSERT_EQUAL_HEX8(0xDA, bus.writes[0][3]);
  TEST_ASSERT_EQUAL_HEX8(crc8(arg, 2), bus.writes[0][4]);

  TEST_ASSERT_EQUAL(Err::OUT_OF_RANGE, sensor.setTemperatureOffset(-1.0f).code);
  TEST_ASSERT_EQUAL(Err::OUT_OF_RANGE, sensor.setAltitude(3500).code);
  TEST_ASSERT_EQUAL_size_t(1, bus.writeCount);
}

void test_scd4x_ambient_pressure_keeps_periodic() {
  FakeBus bus;
  SCD4x sensor;
  beginScd4x(sensor, bus);
  TEST_ASSERT_TRUE(sensor.startPeriodic().ok());

  TEST_ASSERT_TRUE(sensor.setAmbientPressure(101300).ok());
  TEST_ASSERT_EQUAL_size_t(2, bus.writeCount);
  TEST_ASSERT_EQUAL_HEX16(0xE000, bus.command16(1));
  TEST_ASSERT_EQUAL_HEX8(0x03, bus.writes[1][2]);
  TEST_ASSERT_EQUAL_HEX8(0xF5, bus.writes[1][3]);
  TEST_ASSERT_EQUAL(MeasurementMode::PERIODIC, sensor.mode());
}

void test_scd40_rejects_scd41_commands() {
  FakeBus bus;
  SCD4x sensor;
  beginScd4x(sensor, bus, Scd4xVariant::SCD40);
  TEST_ASSERT_EQUAL_STRING("SCD40", sensor.name());

  Measurement m;
  TEST_ASSERT_EQUAL(Err::UNSUPPORTED, sensor.singleShot(m).code);
  TEST_ASSERT_EQUAL(Err::UNSUPPORTED, sensor.singleShotRht(m).code);
  TEST_ASSERT_EQUAL(Err::UNSUPPORTED, sensor.powerDown().code);
  TEST_ASSERT_EQUAL(Err::UNSUPPORTED, sensor.wakeUp().code);
  TEST_ASSERT_EQUAL_size_t(0, bus.writeCount);
  TEST_ASSERT_EQUAL_size_t(0, bus.readCount);
}

void test_scd41_single_shot() {
  FakeBus bus;
  SCD4x sensor;
  beginScd4x(sensor, bus);

  bus.queueWord(0x0001);
  const uint16_t words[3] = {0x01F4, 0x6683, 0x8000};
  bus.queueWords(words, 3);

  Measurement m;
  TEST_ASSERT_TRUE(sensor.singleShot(m).ok());
  TEST_ASSERT_EQUAL_HEX16(0x219D, bus.command16(0));
  TEST_ASSERT_TRUE(bus.delayTotalMs >= 5000u);
  TEST_ASSERT_EQUAL(MeasurementMode::IDLE, sensor.mode());
  TEST_ASSERT_TRUE(m.valid);
}

void test_scd4x_self_test_reports_malfunction() {
  FakeBus bus;
  SCD4x sensor;
  beginScd4x(sensor, bus);

  bus.queueWord(0x0001);
  uint16_t malfunction = 0;
  TEST_ASSERT_TRUE(sensor.selfTest(malfunction).ok());
  TEST_ASSERT_EQUAL_UINT16(1, malfunction);
  TEST_ASSERT_EQUAL_HEX16(0x3639, bus.command16(0));
  TEST_ASSERT_TRUE(bus.delayTotalMs >= 10000u);
}

void test_scd4x_asc_period_multiple_of_four() {
  FakeBus bus;
  SCD4x sensor;
  beginScd4x(sensor, bus);

  TEST_ASSERT_EQUAL(Err::OUT_OF_RANGE, sensor.setAscInitialPeriod(10).code);
  TEST_ASSERT_EQUAL(Err::OUT_OF_RANGE, sensor.setAscStandardPeriod(6).code);
  TEST_ASSERT_EQUAL_size_t(0, bus.writeCount);

  TEST_ASSERT_TRUE(sensor.setAscStandardPeriod(156).ok());
  TEST_ASSERT_EQUAL_HEX16(0x244E, bus.command16(0));
}

void test_scd4x_serial_number() {
  FakeBus bus;
  SCD4x sensor;
  beginScd4x(sensor, bus);

  const uint16_t words[3] = {0xF896, 0x9F07, 0x3BB3};
  bus.queueWords(words, 3);

  uint64_t serial = 0;
  TEST_ASSERT_TRUE(sensor.readSerialNumber(serial).ok());
  TEST_ASSERT_TRUE(serial == 0xF8969F073BB3ULL);
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char** argv) {
  (void)argc;
  (void)argv;
  UNITY_BEGIN();
  RUN_TEST(test_sht2x_single_shot_sequence);
  RUN_TEST(test_sht2x_no_hold_commands);
  RUN_TEST(test_sht2x_heater_keeps_other_bits);
  RUN_TEST(test_sht2x_resolution_replaces_bits);
  RUN_TEST(test_sht2x_serial_number);
  RUN_TEST(test_sht2x_serial_byte_crc_error);
  RUN_TEST(test_sht2x_fetch_unsupported);
  RUN_TEST(test_sht2x_humidity_uses_given_temperature);
  RUN_TEST(test_sht4x_rejects_invalid_address);
  RUN_TEST(test_sht4x_single_shot_repeatability);
  RUN_TEST(test_sht4x_heater_pulse);
  RUN_TEST(test_sht4x_serial_number);
  RUN_TEST(test_sht85_single_shot);
  RUN_TEST(test_sht85_fetch_requires_periodic);
  RUN_TEST(test_sht85_fetch_retries_on_nack);
  RUN_TEST(test_sht85_fetch_times_out);
  RUN_TEST(test_sht85_nack_without_capability_is_an_error);
  RUN_TEST(test_sht85_fetch_waits_one_sample_period);
  RUN_TEST(test_sht85_busy_while_periodic);
  RUN_TEST(test_sht85_stop_is_repeatable);
  RUN_TEST(test_sht85_stop_failure_keeps_mode);
  RUN_TEST(test_sht85_art_mode);
  RUN_TEST(test_sht85_check_status_flags);
  RUN_TEST(test_scd30_fetch_polls_then_decodes_floats);
  RUN_TEST(test_scd30_fetch_times_out);
  RUN_TEST(test_scd30_fetch_waits_for_measurement_interval);
  RUN_TEST(test_scd30_fetch_never_ready_times_out);
  RUN_TEST(test_scd30_apply_settings);
  RUN_TEST(test_scd30_settings_validated_at_begin);
  RUN_TEST(test_scd30_frc_out_of_range);
  RUN_TEST(test_scd30_start_continuous_pressure);
  RUN_TEST(test_scd30_temperature_offset_scale);
  RUN_TEST(test_scd30_single_shot_unsupported);
  RUN_TEST(test_scd4x_fetch);
  RUN_TEST(test_scd4x_fetch_times_out);
  RUN_TEST(test_scd4x_fetch_waits_for_first_sample);
  RUN_TEST(test_scd4x_fetch_never_ready_times_out);
  RUN_TEST(test_scd4x_apply_settings);
  RUN_TEST(test_scd4x_frc_out_of_range);
  RUN_TEST(test_scd4x_frc_stops_periodic_first);
  RUN_TEST(test_scd4x_frc_failure_reported);
  RUN_TEST(test_scd4x_temperature_offset_encoding);
  RUN_TEST(test_scd4x_ambient_pressure_keeps_periodic);
  RUN_TEST(test_scd40_rejects_scd41_commands);
  RUN_TEST(test_scd41_single_shot);
  RUN_TEST(test_scd4x_self_test_reports_malfunction);
  RUN_TEST(test_scd4x_asc_period_multiple_of_four);
  RUN_TEST(test_scd4x_serial_number);
  return UNITY_END();
}

/// @file main.cpp
/// @brief Acquisition loop example for the EnvSense drivers on Linux
/// @note This is an EXAMPLE, not part of the library
///
/// Usage: envsense_acquire <sht2x|sht4x|sht85|scd30|scd40|scd41> [bus] [samples] [--self-test]
///   bus      i2c-dev index (default 1)
///   samples  number of samples, 0 = until Ctrl-C (default 0)

#include <cmath>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>

#include "common/LinuxI2cTransport.h"
#include "common/Log.h"

#include "EnvSense/EnvSense.h"

// ============================================================================
// Globals
// ============================================================================

struct RunStats {
  int attempts = 0;
  int success = 0;
  uint32_t errors = 0;
  float minTemp = std::numeric_limits<float>::max();
  float maxTemp = std::numeric_limits<float>::lowest();
  double sumTemp = 0.0;
  double sumHumidity = 0.0;
  EnvSense::Status lastError = EnvSense::Status::Ok();
};

enum class Model { SHT2X, SHT4X, SHT85, SCD30, SCD40, SCD41 };

volatile std::sig_atomic_t gStop = 0;
transport::LinuxI2cBus gBus;
RunStats gStats;

EnvSense::SHT2x gSht2x;
EnvSense::SHT4x gSht4x;
EnvSense::SHT85 gSht85;
EnvSense::SCD30 gScd30;
EnvSense::SCD4x gScd4x;

// ============================================================================
// Helper Functions
// ============================================================================

void onSignal(int) { gStop = 1; }

const char* stateToStr(EnvSense::DriverState st) {
  using namespace EnvSense;
  switch (st) {
    case DriverState::UNINIT: return "UNINIT";
    case DriverState::READY: return "READY";
    case DriverState::DEGRADED: return "DEGRADED";
    case DriverState::OFFLINE: return "OFFLINE";
    default: return "UNKNOWN";
  }
}

bool parseModel(const char* token, Model& out) {
  if (std::strcmp(token, "sht2x") == 0) { out = Model::SHT2X; return true; }
  if (std::strcmp(token, "sht4x") == 0) { out = Model::SHT4X; return true; }
  if (std::strcmp(token, "sht85") == 0) { out = Model::SHT85; return true; }
  if (std::strcmp(token, "scd30") == 0) { out = Model::SCD30; return true; }
  if (std::strcmp(token, "scd40") == 0) { out = Model::SCD40; return true; }
  if (std::strcmp(token, "scd41") == 0) { out = Model::SCD41; return true; }
  return false;
}

void logStatus(const char* what, const EnvSense::Status& st) {
  LOGE("%s: %s (detail=%ld) %s", what, EnvSense::errToStr(st.code),
       static_cast<long>(st.detail), st.msg ? st.msg : "");
}

EnvSense::BusConfig makeBusConfig(uint8_t busIndex) {
  EnvSense::BusConfig bus;
  bus.i2cWrite = transport::linuxWrite;
  bus.i2cWriteRead = transport::linuxWriteRead;
  bus.delayMs = transport::linuxDelay;
  bus.busOpen = transport::linuxOpen;
  bus.busClose = transport::linuxClose;
  bus.i2cUser = &gBus;
  bus.busIndex = busIndex;
  bus.transportCapabilities = EnvSense::TransportCapability::READ_HEADER_NACK;
  return bus;
}

/// Bind the selected driver (no I/O)
EnvSense::Sensor* beginSensor(Model model, uint8_t busIndex, EnvSense::Status& st) {
  const EnvSense::BusConfig bus = makeBusConfig(busIndex);
  switch (model) {
    case Model::SHT2X: {
      EnvSense::SHT2xConfig cfg;
      cfg.bus = bus;
      st = gSht2x.begin(cfg);
      return &gSht2x;
    }
    case Model::SHT4X: {
      EnvSense::SHT4xConfig cfg;
      cfg.bus = bus;
      st = gSht4x.begin(cfg);
      return &gSht4x;
    }
    case Model::SHT85: {
      EnvSense::SHT85Config cfg;
      cfg.bus = bus;
      st = gSht85.begin(cfg);
      return &gSht85;
    }
    case Model::SCD30: {
      EnvSense::SCD30Config cfg;
      cfg.bus = bus;
      st = gScd30.begin(cfg);
      return &gScd30;
    }
    case Model::SCD40:
    case Model::SCD41: {
      EnvSense::SCD4xConfig cfg;
      cfg.bus = bus;
      cfg.variant = (model == Model::SCD40) ? EnvSense::Scd4xVariant::SCD40
                                            : EnvSense::Scd4xVariant::SCD41;
      st = gScd4x.begin(cfg);
      return &gScd4x;
    }
  }
  st = EnvSense::Status::Error(EnvSense::Err::INVALID_PARAM, "Unknown model");
  return nullptr;
}

/// Put the sensor in its free-running mode (single-shot models need nothing)
EnvSense::Status startAcquisition(Model model, bool selfTest) {
  switch (model) {
    case Model::SHT85: {
      uint16_t flags = 0;
      EnvSense::Status st = gSht85.checkStatus(flags);
      if (st.ok() && flags != 0) {
        LOGW("SHT85 status flags set: 0x%04X", static_cast<unsigned>(flags));
        (void)gSht85.clearStatus();
      }
      return gSht85.startPeriodic();
    }
    case Model::SCD30: {
      EnvSense::Status st = gScd30.applySettings();
      if (!st.ok()) {
        return st;
      }
      return gScd30.startContinuous();
    }
    case Model::SCD40:
    case Model::SCD41: {
      if (selfTest) {
        uint16_t malfunction = 0;
        EnvSense::Status st = gScd4x.selfTest(malfunction);
        if (!st.ok()) {
          return st;
        }
        if (malfunction != 0) {
          LOGW("SCD4x self test reported malfunction 0x%04X", static_cast<unsigned>(malfunction));
        } else {
          LOGI("SCD4x self test passed");
        }
      }
      EnvSense::Status st = gScd4x.applySettings();
      if (!st.ok()) {
        return st;
      }
      return gScd4x.startPeriodic();
    }
    default:
      return EnvSense::Status::Ok();
  }
}

bool usesFetch(Model model) {
  return model == Model::SHT85 || model == Model::SCD30 || model == Model::SCD40 ||
         model == Model::SCD41;
}

void printMeasurement(const EnvSense::Measurement& m) {
  if (std::isnan(m.co2Ppm)) {
    std::printf("T=%.2f C  RH=%.2f %%  Td=%.2f C\n", m.temperatureC, m.humidityPct,
                m.dewPointC);
  } else {
    std::printf("CO2=%.0f ppm  T=%.2f C  RH=%.2f %%  Td=%.2f C\n", m.co2Ppm, m.temperatureC,
                m.humidityPct, m.dewPointC);
  }
  std::fflush(stdout);
}

void updateStats(const EnvSense::Measurement& m) {
  if (m.temperatureC < gStats.minTemp) {
    gStats.minTemp = m.temperatureC;
  }
  if (m.temperatureC > gStats.maxTemp) {
    gStats.maxTemp = m.temperatureC;
  }
  gStats.sumTemp += m.temperatureC;
  gStats.sumHumidity += m.humidityPct;
  gStats.success++;
}

void printSummary(const EnvSense::Sensor& sensor) {
  const EnvSense::I2cDevice& dev = sensor.device();
  LOGI("=== Summary (%s) ===", sensor.name());
  LOGI("  Attempts: %d, success: %d, errors: %lu", gStats.attempts, gStats.success,
       static_cast<unsigned long>(gStats.errors));
  if (gStats.success > 0) {
    LOGI("  Temp C: min=%.2f avg=%.2f max=%.2f", gStats.minTemp,
         gStats.sumTemp / gStats.success, gStats.maxTemp);
    LOGI("  Humidity %%: avg=%.2f", gStats.sumHumidity / gStats.success);
  }
  LOGI("  Driver state: %s, CRC errors: %lu", stateToStr(dev.state()),
       static_cast<unsigned long>(dev.crcErrors()));
  if (!gStats.lastError.ok()) {
    logStatus("  Last error", gStats.lastError);
  }
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char** argv) {
  if (argc < 2) {
    std::fprintf(stderr,
                 "usage: %s <sht2x|sht4x|sht85|scd30|scd40|scd41> [bus] [samples] [--self-test]\n",
                 argv[0]);
    return EXIT_FAILURE;
  }

  Model model;
  if (!parseModel(argv[1], model)) {
    LOGE("Unknown model '%s'", argv[1]);
    return EXIT_FAILURE;
  }
  const uint8_t busIndex = (argc > 2) ? static_cast<uint8_t>(std::atoi(argv[2])) : 1;
  const int samples = (argc > 3) ? std::atoi(argv[3]) : 0;
  const bool selfTest = (argc > 4) && std::strcmp(argv[4], "--self-test") == 0;

  std::signal(SIGINT, onSignal);
  std::signal(SIGTERM, onSignal);

  LOGI("EnvSense %s", EnvSense::VERSION);

  EnvSense::Status st;
  EnvSense::Sensor* sensor = beginSensor(model, busIndex, st);
  if (sensor == nullptr || !st.ok()) {
    logStatus("begin", st);
    return EXIT_FAILURE;
  }

  int rc = EXIT_SUCCESS;
  {
    EnvSense::BusSession session(*sensor);
    st = session.open();
    if (!st.ok()) {
      logStatus("Bus open", st);
      return EXIT_FAILURE;
    }

    uint64_t serial = 0;
    st = sensor->readSerialNumber(serial);
    if (st.ok()) {
      LOGI("%s serial 0x%012llX", sensor->name(), static_cast<unsigned long long>(serial));
    } else {
      logStatus("Serial", st);
    }

    st = startAcquisition(model, selfTest);
    if (!st.ok()) {
      logStatus("Start", st);
      rc = EXIT_FAILURE;
    }

    while (rc == EXIT_SUCCESS && !gStop && (samples == 0 || gStats.attempts < samples)) {
      EnvSense::Measurement m;
      st = usesFetch(model) ? sensor->fetch(m) : sensor->singleShot(m);
      gStats.attempts++;

      if (st.ok()) {
        updateStats(m);
        printMeasurement(m);
      } else if (st.code == EnvSense::Err::CRC_MISMATCH) {
        gStats.errors++;
        gStats.lastError = st;
        LOGW("CRC mismatch in word %ld, sample dropped", static_cast<long>(st.detail));
      } else if (st.code == EnvSense::Err::TIMEOUT) {
        gStats.errors++;
        gStats.lastError = st;
        LOGW("No sample within poll window");
      } else {
        gStats.errors++;
        gStats.lastError = st;
        logStatus("Measure", st);
        if (!sensor->device().isOnline()) {
          LOGE("Sensor offline after %u consecutive failures",
               static_cast<unsigned>(sensor->device().consecutiveFailures()));
          rc = EXIT_FAILURE;
        }
      }

      if (!usesFetch(model) && !gStop) {
        transport::linuxDelay(1000, nullptr);
      }
    }

    st = session.close();
    if (!st.ok()) {
      logStatus("Teardown", st);
    }
  }

  printSummary(*sensor);
  return rc;
}

/**
 * @file Conversion.cpp
 * @brief Unit conversion and Magnus dew point.
 */

#include "EnvSense/Conversion.h"

#include <cmath>

namespace EnvSense {
namespace {

static constexpr double RAW_FULL_SCALE = 65535.0;
static constexpr float RH_RESOLUTION = 0.01f;
static constexpr float RH_MAX = 100.0f;

static float applyFloor(float rh, float rhFloor) {
  if (rh < RH_RESOLUTION) {
    return rhFloor;
  }
  if (rh > RH_MAX) {
    return RH_MAX;
  }
  return rh;
}

static double scale(float minValue, float span, uint16_t raw, uint16_t mask) {
  const double code = static_cast<double>(raw & mask);
  return static_cast<double>(minValue) + static_cast<double>(span) * code / RAW_FULL_SCALE;
}

}  // namespace

float roundTo2(double value) {
  return static_cast<float>(std::round(value * 100.0) / 100.0);
}

float temperatureC(const ConversionSpec& spec, uint16_t raw) {
  return roundTo2(scale(spec.tMin, spec.tSpan, raw, spec.rawMask));
}

float humidityWaterPct(const ConversionSpec& spec, uint16_t raw) {
  const float rh = roundTo2(scale(spec.rhMin, spec.rhSpan, raw, spec.rawMask));
  return applyFloor(rh, spec.rhFloor);
}

float humidityIcePct(float rhWaterPct, float temperatureC, float rhFloor) {
  const double t = static_cast<double>(temperatureC);
  const double water = std::exp(static_cast<double>(MAGNUS_WATER.beta) * t /
                                static_cast<double>(MAGNUS_WATER.lambda));
  const double ice = std::exp(static_cast<double>(MAGNUS_ICE.beta) * t /
                              static_cast<double>(MAGNUS_ICE.lambda));
  const float rh = roundTo2(static_cast<double>(rhWaterPct) * water / ice);
  return applyFloor(rh, rhFloor);
}

float correctHumidity(float rhWaterPct, float temperatureC, float rhFloor) {
  if (temperatureC < 0.0f) {
    return humidityIcePct(rhWaterPct, temperatureC, rhFloor);
  }
  return applyFloor(roundTo2(rhWaterPct), rhFloor);
}

float humidityPct(const ConversionSpec& spec, uint16_t raw, float temperatureC) {
  const float rhw = humidityWaterPct(spec, raw);
  if (temperatureC < 0.0f) {
    return humidityIcePct(rhw, temperatureC, spec.rhFloor);
  }
  return rhw;
}

Status dewPointC(float temperatureC, float humidityPct, float& out) {
  if (std::isnan(temperatureC) || std::isnan(humidityPct)) {
    return Status::Error(Err::INVALID_PARAM, "Dew point input is NaN");
  }
  if (humidityPct <= 0.0f) {
    return Status::Error(Err::INVALID_PARAM, "Dew point needs RH > 0");
  }

  const MagnusCoefficients& mc = (temperatureC >= 0.0f) ? MAGNUS_WATER : MAGNUS_ICE;
  const double t = static_cast<double>(temperatureC);
  const double beta = static_cast<double>(mc.beta);
  const double lambda = static_cast<double>(mc.lambda);

  const double c1 = beta * t / (lambda + t);
  const double c2 = std::log(static_cast<double>(humidityPct) / 100.0);
  out = roundTo2(lambda * (c2 + c1) / (beta - c2 - c1));
  return Status::Ok();
}

} // namespace EnvSense

/**
 * @file Sensor.cpp
 * @brief Shared measurement completion.
 */

#include "EnvSense/Sensor.h"

#include "EnvSense/Conversion.h"

namespace EnvSense {

Status completeMeasurement(float temperatureC, float humidityPct, float co2Ppm,
                           Measurement& out) {
  float dewPoint = 0.0f;
  Status st = dewPointC(temperatureC, humidityPct, dewPoint);
  if (!st.ok()) {
    return st;
  }

  out.temperatureC = temperatureC;
  out.humidityPct = humidityPct;
  out.dewPointC = dewPoint;
  out.co2Ppm = co2Ppm;
  out.valid = true;
  return Status::Ok();
}

} // namespace EnvSense

/* @file Measurement.cpp
 * @brief validating constructor for Measurement
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cmath>
#include <utility>

// Tempo headers
#include "core/Errors.hpp"
#include "core/Measurement.hpp"

using namespace tempo::core;

Measurement tempo::core::makeMeasurement(double value, std::string unit, std::string description,
                                         std::int64_t weight) {
  if (!std::isfinite(value))
    throw MeasurementFailure("[Measurement] non-finite value for " + description);
  if (value < 0.0)
    throw MeasurementFailure("[Measurement] negative value " + std::to_string(value) + " for " +
                             description);
  if (weight < 1)
    throw MeasurementFailure("[Measurement] weight " + std::to_string(weight) + " for " +
                             description + " is below 1");

  Measurement m;
  m.value = value;
  m.unit = std::move(unit);
  m.description = std::move(description);
  m.weight = weight;
  return m;
}

#pragma once
/** @file  Measurement.hpp
 *  @brief Named, weighted numeric observation produced by an Instrument.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <string>

namespace tempo::core {

  /**
 * @struct Measurement
 * @brief `value` covers `weight` underlying reps; the per-rep figure is value / weight.
 *
 *  * Build through `makeMeasurement()` so the invariants below always hold:
 *    weight >= 1, value finite and >= 0.
 */
  struct Measurement {
    double value{ 0.0 };
    std::string unit{};
    std::string description{};
    std::int64_t weight{ 1 };

    double perRep() const { return value / static_cast<double>(weight); }

    bool operator==(const Measurement&) const = default;
  };

  /// Validating factory; throws `MeasurementFailure` on a broken invariant.
  Measurement makeMeasurement(double value, std::string unit, std::string description,
                              std::int64_t weight);

} // namespace tempo::core

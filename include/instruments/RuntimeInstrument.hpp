#pragma once
/** @file  RuntimeInstrument.hpp
 *  @brief Measures elapsed wall time per rep of a timed-loop method.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// Tempo headers
#include "instruments/Instrument.hpp"

namespace tempo::instruments {

  /**
 * @class RuntimeInstrument
 * @brief Time-based instrument; the only built-in one that needs calibration.
 *
 *  Options:
 *  * `measurements`  recorded executions per trial (default 9).
 *  * `timeBoxNanos`  when > 0, recorded executions loop until this much time
 *                    has elapsed instead of running exactly the calibrated reps.
 */
  class RuntimeInstrument : public Instrument {
  public:
    static constexpr const char* kClassName = "RuntimeInstrument";

    explicit RuntimeInstrument(std::shared_ptr<const core::InstrumentConfig> config);

    bool isBenchmarkMethod(const core::BenchmarkMethod& method) const override;
    protocols::WorkerLoopSpec newWorkerLoop(std::int64_t repsPerLoop) const override;
    protocols::WorkerLoopSpec calibrationLoop(std::int64_t repsPerLoop) const override;
    core::Measurement toMeasurement(const std::vector<protocols::LogMessage>& messages) const override;
    bool requiresCalibration() const override { return true; }
    int defaultMeasurementReps() const override { return measurements_; }

  protected:
    void checkSignature(const core::BenchmarkMethod& method) const override;

  private:
    int measurements_{ 9 };
    std::int64_t timeBoxNanos_{ 0 };
  };

} // namespace tempo::instruments

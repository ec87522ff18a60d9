#pragma once
/** @file  ArbitraryMeasurementInstrument.hpp
 *  @brief Records whatever scalar the benchmark method itself reports.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// Tempo headers
#include "instruments/Instrument.hpp"

namespace tempo::instruments {

  /**
 * @class ArbitraryMeasurementInstrument
 * @brief Single invocation per execution, no calibration, weight 1.
 *
 *  Options:
 *  * `measurements`  recorded executions per trial (default 1).
 *  * `unit`          overrides the unit reported by the worker.
 */
  class ArbitraryMeasurementInstrument : public Instrument {
  public:
    static constexpr const char* kClassName = "ArbitraryMeasurementInstrument";

    explicit ArbitraryMeasurementInstrument(std::shared_ptr<const core::InstrumentConfig> config);

    bool isBenchmarkMethod(const core::BenchmarkMethod& method) const override;
    protocols::WorkerLoopSpec newWorkerLoop(std::int64_t repsPerLoop) const override;
    core::Measurement toMeasurement(const std::vector<protocols::LogMessage>& messages) const override;
    bool requiresCalibration() const override { return false; }
    int defaultMeasurementReps() const override { return measurements_; }

  protected:
    void checkSignature(const core::BenchmarkMethod& method) const override;

  private:
    int measurements_{ 1 };
  };

} // namespace tempo::instruments

#pragma once
/** @file  Instrument.hpp
 *  @brief Abstract base class for every measuring strategy.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// Tempo headers
#include "core/Benchmark.hpp"
#include "core/Measurement.hpp"
#include "core/RunConfig.hpp"
#include "protocols/LogMessage.hpp"

namespace tempo::instruments {

  class Instrument;

  /// A benchmark method bound to the instrument (and its config) that measures it.
  struct InstrumentedMethod {
    core::BenchmarkMethod method{};
    std::shared_ptr<const Instrument> instrument{};
  };

  /**
 * @class Instrument
 * @brief Common polymorphic interface that every concrete instrument
 *        (runtime, arbitrary value, ...) must implement.
 *
 *  * Immutable after construction; instances are shared across trial threads
 *    without locking.
 *  * Adding an instrument means implementing this interface and registering a
 *    creator with InstrumentFactory; the scheduler does not change.
 */
  class Instrument : public std::enable_shared_from_this<Instrument> {
  public:
    explicit Instrument(std::shared_ptr<const core::InstrumentConfig> config);
    virtual ~Instrument() = default;

    const std::string& name() const { return config_->name; }
    const std::string& className() const { return config_->className; }
    const core::InstrumentConfig& config() const { return *config_; }

    /// Pure filter: can this instrument measure \p method at all?
    virtual bool isBenchmarkMethod(const core::BenchmarkMethod& method) const = 0;

    /**
     * @brief Bind \p method to this instrument.
     * @throws core::InvalidBenchmarkException if the signature turns out incompatible.
     */
    InstrumentedMethod createInstrumentedMethod(const core::BenchmarkMethod& method) const;

    /// Loop the worker runs for one recorded execution.
    virtual protocols::WorkerLoopSpec newWorkerLoop(std::int64_t repsPerLoop) const = 0;

    /// Loop used while calibrating / warming up; defaults to the measurement loop.
    virtual protocols::WorkerLoopSpec calibrationLoop(std::int64_t repsPerLoop) const {
      return newWorkerLoop(repsPerLoop);
    }

    /**
     * @brief Reduce the messages of one execution to one Measurement.
     * @throws core::MeasurementFailure for missing, non-finite or negative values.
     */
    virtual core::Measurement toMeasurement(const std::vector<protocols::LogMessage>& messages) const = 0;

    virtual bool requiresCalibration() const = 0;
    virtual int defaultMeasurementReps() const = 0;

  protected:
    /// Throws InvalidBenchmarkException with a readable reason when false.
    virtual void checkSignature(const core::BenchmarkMethod& method) const = 0;

  private:
    std::shared_ptr<const core::InstrumentConfig> config_;
  };

} // namespace tempo::instruments

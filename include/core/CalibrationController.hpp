#pragma once
/** @file  CalibrationController.hpp
 *  @brief Per-worker granularity probe + warmup state machine for timed instruments.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <deque>
#include <functional>

// Tempo headers
#include "core/Measurement.hpp"
#include "core/RunConfig.hpp"

namespace tempo::core {

  enum class CalibrationState : std::uint8_t { GranularityProbe, Warmup, Ready, Aborted };

  const char* toString(CalibrationState state);

  struct CalibrationResult {
    CalibrationState state{ CalibrationState::GranularityProbe };
    std::int64_t repsPerLoop{ 1 };
    bool partialWarmup{ false };
    int probeAttempts{ 0 };
    int warmupLoops{ 0 };
    std::int64_t warmupNanos{ 0 };
  };

  /// Runs one timed loop of `reps` iterations on the worker and returns its Measurement.
  using TimedLoopRunner = std::function<Measurement(std::int64_t reps)>;

  /**
 * @class CalibrationController
 * @brief GRANULARITY_PROBE -> WARMUP -> READY, or ABORTED.
 *
 *  * Probe: grow reps until one loop takes more than margin x timer resolution.
 *  * Warmup: discard loops until the configured criterion holds or a cap is hit;
 *    a cap means READY with `partialWarmup`.
 *  * Errors thrown by the loop runner (crash, timeout, ...) abort and propagate.
 */
  class CalibrationController {
  public:
    CalibrationController(const CalibrationConfig& config, std::int64_t workerGranularityNanos);

    //---public API------------------------------------------------------
    /// @throws CalibrationFailure if the probe does not converge.
    CalibrationResult run(const TimedLoopRunner& runLoop);

    /// GRANULARITY_PROBE only; returns the chosen reps per loop.
    std::int64_t probe(const TimedLoopRunner& runLoop);

    /// Coefficient of variation of \p window <= \p threshold (all-zero counts as stable).
    static bool isStable(const std::deque<double>& window, double threshold);

    std::int64_t timerResolutionNanos() const { return resolution_; }
    CalibrationState state() const { return result_.state; }

  private:
    void warmup(const TimedLoopRunner& runLoop);

    CalibrationConfig config_;
    std::int64_t resolution_;
    CalibrationResult result_{};
  };

} // namespace tempo::core

#pragma once
/** @file  TrialDriver.hpp
 *  @brief Drives one trial on one leased worker: calibrate, measure, collect.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <memory>
#include <vector>

// Tempo headers
#include "core/RunConfig.hpp"
#include "core/Trial.hpp"
#include "io/WorkerProcess.hpp"
#include "protocols/LogMessage.hpp"

namespace tempo::core {

  class Logger;

  /**
 * @class TrialDriver
 * @brief Strictly sequential request/response with one worker.
 *
 *  * One RunRequest is outstanding at a time; its messages end with
 *    StopMeasurementLogMessage carrying the same trial id.
 *  * The deadline is checked at every receive.
 *  * Per-trial problems surface as exceptions: TrialTimedOut, WorkerCrashed,
 *    TrialFailure, CalibrationFailure, MeasurementFailure, ProtocolError.
 */
  class TrialDriver {
  public:
    using Clock = std::chrono::steady_clock;

    TrialDriver(io::WorkerProcess& worker, const Trial& trial, const RunConfig& config,
                Clock::time_point deadline, std::shared_ptr<Logger> logger = nullptr);

    //---public API------------------------------------------------------
    /// Fills measurements / partialWarmup / gcEvents of \p result; leaves state to the caller.
    void run(TrialResult& result);

    /// One RunRequest round-trip; returns every non-terminal message it produced.
    std::vector<protocols::LogMessage> execute(const protocols::WorkerLoopSpec& loop, bool dryRun);

    int gcEvents() const { return gcEvents_; }

  private:
    int measurementReps() const;

    io::WorkerProcess& worker_;
    const Trial& trial_;
    const RunConfig& config_;
    Clock::time_point deadline_;
    std::shared_ptr<Logger> logger_;
    int gcEvents_{ 0 };
  };

} // namespace tempo::core

#pragma once
/** @file  TrialScheduler.hpp
 *  @brief Runs enumerated trials on pooled workers, up to a parallelism limit.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <memory>
#include <vector>

// Tempo headers
#include "core/ErrorMonitor.hpp"
#include "core/RunConfig.hpp"
#include "core/Trial.hpp"
#include "core/WorkerPool.hpp"

namespace tempo::core {

  class Logger;

  /**
 * @class TrialScheduler
 * @brief Top-level control loop; every trial ends SUCCESS, FAILED or TIMED_OUT.
 *
 *  * Per-trial errors never escape `run()`: they become the trial's terminal
 *    state and a failure event on the ErrorMonitor.
 *  * A spawn failure is retried once after `spawnRetryBackoff`.
 *  * Only successful trials hand their worker back to the pool.
 */
  class TrialScheduler {
  public:
    TrialScheduler(const RunConfig& config, WorkerPool& pool, ErrorMonitor& monitor,
                   std::shared_ptr<Logger> logger = nullptr);

    //---public API------------------------------------------------------
    /// Results in trial order; updates each trial's state.
    std::vector<TrialResult> run(std::vector<Trial>& trials);

    TrialResult runTrial(Trial& trial);

  private:
    WorkerLease acquireWithRetry(const VmConfig& vm, std::int64_t trialId);
    void finish(Trial& trial, TrialResult& result, TrialState state, const std::string& reason);

    const RunConfig& config_;
    WorkerPool& pool_;
    ErrorMonitor& monitor_;
    std::shared_ptr<Logger> logger_;
  };

} // namespace tempo::core

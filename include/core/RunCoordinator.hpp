#pragma once

/** @file  RunCoordinator.hpp
 *  @brief Explicit assembly of one benchmark run: validate, schedule, aggregate.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>
#include <string>
#include <vector>

// Tempo headers
#include "core/Benchmark.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/ResultAggregator.hpp"
#include "core/RunConfig.hpp"
#include "core/Trial.hpp"
#include "instruments/InstrumentFactory.hpp"
#include "io/WorkerProcess.hpp"

namespace tempo {
  namespace core {

    class Logger;

    /**
 * @class RunCoordinator
 * @brief BOOT -> CONFIGURED -> RUNNING -> FINISHED, or ERROR.
 *
 *  * `initialize()` does every configuration check and throws ConfigurationError
 *    before any worker process exists.
 *  * `run()` owns the worker pool for its duration; no global state.
 */
    class RunCoordinator {

    public:
      enum class State { BOOT, CONFIGURED, RUNNING, FINISHED, ERROR };

      RunCoordinator(RunConfig config, BenchmarkTarget target, instruments::InstrumentFactory factory,
                     io::WorkerLauncher launcher = io::defaultLaunchSpec,
                     std::shared_ptr<Logger> logger = nullptr);
      ~RunCoordinator();

      //---public API------------------------------------------------------
      void initialize(); ///< select instruments, bind methods, enumerate trials
      Report run();      ///< execute every trial; only valid when CONFIGURED
      void handleError(const std::string& reason);

      State state() const { return currentState_; }
      const std::vector<Trial>& trials() const { return trials_; }
      const std::vector<std::shared_ptr<const instruments::Instrument>>& instruments() const {
        return instruments_;
      }
      ErrorMonitor& monitor() { return monitor_; }

      RunCoordinator(const RunCoordinator&) = delete;
      RunCoordinator& operator=(const RunCoordinator&) = delete;

    private:
      void transitionTo(State next);

      RunConfig config_;
      BenchmarkTarget target_;
      instruments::InstrumentFactory factory_;
      io::WorkerLauncher launcher_;
      std::shared_ptr<Logger> logger_;
      ErrorMonitor monitor_;
      std::vector<std::shared_ptr<const instruments::Instrument>> instruments_{};
      std::vector<Trial> trials_{};
      State currentState_{ State::BOOT };
    };

    const char* toString(RunCoordinator::State state);

  } // namespace core
} // namespace tempo

/* @file RunCoordinator.cpp
 * @brief run lifecycle FSM
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <utility>

// Tempo headers
#include "core/Logger.hpp"
#include "core/RunCoordinator.hpp"
#include "core/TrialEnumerator.hpp"
#include "core/TrialScheduler.hpp"
#include "core/WorkerPool.hpp"

namespace tempo {
  namespace core {

    const char* toString(RunCoordinator::State state) {
      switch (state) {
      case RunCoordinator::State::BOOT:
        return "BOOT";
      case RunCoordinator::State::CONFIGURED:
        return "CONFIGURED";
      case RunCoordinator::State::RUNNING:
        return "RUNNING";
      case RunCoordinator::State::FINISHED:
        return "FINISHED";
      case RunCoordinator::State::ERROR:
        return "ERROR";
      }
      return "UNKNOWN";
    }

    RunCoordinator::RunCoordinator(RunConfig config, BenchmarkTarget target,
                                   instruments::InstrumentFactory factory, io::WorkerLauncher launcher,
                                   std::shared_ptr<Logger> logger)
        : config_(std::move(config)), target_(std::move(target)), factory_(std::move(factory)),
          launcher_(std::move(launcher)), logger_(std::move(logger)) {
      if (logger_) {
        monitor_.registerListener([log = logger_](const RunEvent& e) {
          if (e.severity == RunEvent::Severity::Warning)
            log->warn(e.source, e.message);
          else
            log->error(e.source, e.message);
        });
      }
    }

    RunCoordinator::~RunCoordinator() {
      if (logger_)
        logger_->finishRun();
    }

    void RunCoordinator::initialize() {
      if (currentState_ != State::BOOT)
        throw std::logic_error(std::string("[RunCoordinator] initialize() in state ") + toString(currentState_));
      if (logger_)
        logger_->startNewRun(config_.logPath);

      try {
        instruments_ = selectInstruments(config_, factory_, monitor_);
        auto methods = instrumentMethods(instruments_, target_, config_.options);
        trials_ = enumerateTrials(methods, config_.vms, target_.parameters);
      } catch (const std::exception& e) {
        handleError(e.what());
        throw;
      }

      if (logger_)
        logger_->info("RunCoordinator", target_.name + ": " + std::to_string(trials_.size()) + " trial(s) with " +
                                            std::to_string(instruments_.size()) + " instrument(s)");
      transitionTo(State::CONFIGURED);
    }

    Report RunCoordinator::run() {
      if (currentState_ != State::CONFIGURED)
        throw std::logic_error(std::string("[RunCoordinator] run() in state ") + toString(currentState_));
      transitionTo(State::RUNNING);

      try {
        WorkerPool pool(WorkerPool::processSpawner(launcher_, config_.scheduler), logger_);
        TrialScheduler scheduler(config_, pool, monitor_, logger_);
        std::vector<TrialResult> results = scheduler.run(trials_);
        pool.shutdown();

        ResultAggregator aggregator(config_.aggregator);
        for (const auto& r : results)
          aggregator.add(r);
        Report report = aggregator.build(monitor_.events(), config_.scheduler.dryRun);

        transitionTo(State::FINISHED);
        if (logger_) {
          logger_->info("RunCoordinator", std::to_string(report.count(TrialState::Success)) + " succeeded, " +
                                              std::to_string(report.count(TrialState::Failed)) + " failed, " +
                                              std::to_string(report.count(TrialState::TimedOut)) +
                                              " timed out");
          logger_->finishRun();
        }
        return report;
      } catch (const std::exception& e) {
        handleError(e.what());
        throw;
      }
    }

    void RunCoordinator::handleError(const std::string& reason) {
      if (logger_)
        logger_->error("RunCoordinator", reason);
      transitionTo(State::ERROR);
    }

    void RunCoordinator::transitionTo(State next) {
      if (logger_)
        logger_->debug("RunCoordinator", std::string(toString(currentState_)) + " -> " + toString(next));
      currentState_ = next;
    }

  } // namespace core
} // namespace tempo

/* @file TrialScheduler.cpp
 * @brief parallel trial execution with per-trial error isolation
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <atomic>
#include <thread>

// Tempo headers
#include "core/Benchmark.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "core/TrialDriver.hpp"
#include "core/TrialScheduler.hpp"

using namespace tempo::core;

TrialScheduler::TrialScheduler(const RunConfig& config, WorkerPool& pool, ErrorMonitor& monitor,
                               std::shared_ptr<Logger> logger)
    : config_(config), pool_(pool), monitor_(monitor), logger_(std::move(logger)) {}

std::vector<TrialResult> TrialScheduler::run(std::vector<Trial>& trials) {
  std::vector<TrialResult> results(trials.size());
  std::atomic<std::size_t> next{ 0 };

  auto workerLoop = [&] {
    for (std::size_t i = next++; i < trials.size(); i = next++)
      results[i] = runTrial(trials[i]);
  };

  const std::size_t threads =
      std::max<std::size_t>(1, std::min(config_.scheduler.parallelism, trials.size()));
  if (threads == 1) {
    workerLoop();
    return results;
  }

  std::vector<std::thread> pool;
  pool.reserve(threads);
  for (std::size_t t = 0; t < threads; ++t)
    pool.emplace_back(workerLoop);
  for (auto& th : pool)
    th.join();
  return results;
}

TrialResult TrialScheduler::runTrial(Trial& trial) {
  TrialResult result;
  result.trialId = trial.id;
  result.key = trial.key();
  result.vmName = trial.vm->name;
  result.dryRun = config_.scheduler.dryRun;
  trial.state = TrialState::Running;
  if (logger_)
    logger_->info("TrialScheduler", "trial " + std::to_string(trial.id) + " " + trial.target.method.name +
                                        " [" + trial.target.instrument->name() + "] on " + trial.vm->name +
                                        " {" + toString(trial.parameters) + "}");

  WorkerLease lease;
  try {
    lease = acquireWithRetry(*trial.vm, trial.id);
  } catch (const std::exception& e) {
    finish(trial, result, TrialState::Failed, e.what());
    return result;
  }
  result.workerPid = lease->pid();

  // the deadline covers the trial, not the spawn (which has its own startup timeout)
  const auto deadline = TrialDriver::Clock::now() + config_.scheduler.trialTimeout;
  TrialDriver driver(lease.worker(), trial, config_, deadline, logger_);
  try {
    driver.run(result);
  } catch (const TrialTimedOut& e) {
    lease->kill();
    lease.discard();
    result.gcEvents = driver.gcEvents();
    finish(trial, result, TrialState::TimedOut, e.what());
    return result;
  } catch (const std::exception& e) {
    lease.discard();
    result.gcEvents = driver.gcEvents();
    result.measurements.clear();
    finish(trial, result, TrialState::Failed, e.what());
    return result;
  }

  if (config_.scheduler.freshWorkerPerTrial)
    lease.discard();
  else
    lease.release();
  finish(trial, result, TrialState::Success, {});
  return result;
}

WorkerLease TrialScheduler::acquireWithRetry(const VmConfig& vm, std::int64_t trialId) {
  try {
    return pool_.acquire(vm);
  } catch (const WorkerStartupFailure& e) {
    if (logger_)
      logger_->warn("TrialScheduler", "trial " + std::to_string(trialId) + ": " + e.what() + "; retrying once");
  }
  std::this_thread::sleep_for(config_.scheduler.spawnRetryBackoff);
  return pool_.acquire(vm);
}

void TrialScheduler::finish(Trial& trial, TrialResult& result, TrialState state, const std::string& reason) {
  trial.state = state;
  result.state = state;
  result.reason = reason;
  if (state != TrialState::Success)
    monitor_.notifyFailure("trial " + std::to_string(trial.id), std::string(toString(state)) + ": " + reason);
  if (logger_) {
    const std::string text = "trial " + std::to_string(trial.id) + " " + toString(state) +
                             (reason.empty() ? "" : " (" + reason + ")");
    if (state == TrialState::Success)
      logger_->info("TrialScheduler", text);
    else
      logger_->error("TrialScheduler", text);
  }
}

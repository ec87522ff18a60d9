/* @file TrialDriver.cpp
 * @brief run request / measurement collection for a single trial
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <string>
#include <utility>
#include <variant>

// Tempo headers
#include "core/CalibrationController.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "core/TrialDriver.hpp"

using namespace tempo::core;
using namespace tempo::protocols;

TrialDriver::TrialDriver(io::WorkerProcess& worker, const Trial& trial, const RunConfig& config,
                         Clock::time_point deadline, std::shared_ptr<Logger> logger)
    : worker_(worker), trial_(trial), config_(config), deadline_(deadline), logger_(std::move(logger)) {}

int TrialDriver::measurementReps() const {
  if (config_.scheduler.measurementReps > 0)
    return config_.scheduler.measurementReps;
  return trial_.target.instrument->defaultMeasurementReps();
}

void TrialDriver::run(TrialResult& result) {
  const auto& instrument = *trial_.target.instrument;
  const std::string tag = "trial " + std::to_string(trial_.id);

  if (config_.scheduler.dryRun) {
    // one execution, no calibration: only the success ack counts
    auto messages = execute(instrument.newWorkerLoop(1), true);
    bool confirmed = std::any_of(messages.begin(), messages.end(), [&](const LogMessage& m) {
      const auto* ok = std::get_if<DryRunSuccessLogMessage>(&m);
      return ok && std::find(ok->ids.begin(), ok->ids.end(), trial_.id) != ok->ids.end();
    });
    if (!confirmed)
      throw TrialFailure("[TrialDriver] dry run of " + trial_.target.method.name + " not confirmed by worker");
    result.dryRun = true;
    result.gcEvents = gcEvents_;
    return;
  }

  std::int64_t repsPerLoop = 1;
  if (instrument.requiresCalibration()) {
    CalibrationController calibration(config_.calibration, worker_.timerGranularityNanos());
    CalibrationResult cal = calibration.run([&](std::int64_t reps) {
      return instrument.toMeasurement(execute(instrument.calibrationLoop(reps), false));
    });
    repsPerLoop = cal.repsPerLoop;
    result.partialWarmup = cal.partialWarmup;
    if (logger_) {
      logger_->debug(tag, "calibrated to " + std::to_string(repsPerLoop) + " reps/loop after " +
                              std::to_string(cal.probeAttempts) + " probes, " +
                              std::to_string(cal.warmupLoops) + " warmup loops");
      if (cal.partialWarmup)
        logger_->warn(tag, "warmup cap reached before steady state");
    }
  }

  const int reps = measurementReps();
  result.measurements.reserve(static_cast<std::size_t>(reps));
  for (int i = 0; i < reps; ++i)
    result.measurements.push_back(instrument.toMeasurement(execute(instrument.newWorkerLoop(repsPerLoop), false)));
  result.gcEvents = gcEvents_;
}

std::vector<LogMessage> TrialDriver::execute(const WorkerLoopSpec& loop, bool dryRun) {
  RunRequest request{ trial_.id, trial_.target.method.name, trial_.parameters, loop, dryRun };
  if (!worker_.send(request))
    throw WorkerCrashed("[TrialDriver] worker pid " + std::to_string(worker_.pid()) +
                        " closed its channel before the run request");

  std::vector<LogMessage> messages;
  while (true) {
    auto left = std::chrono::ceil<std::chrono::milliseconds>(deadline_ - Clock::now());
    if (left.count() <= 0)
      throw TrialTimedOut("[TrialDriver] trial " + std::to_string(trial_.id) + " exceeded " +
                          std::to_string(config_.scheduler.trialTimeout.count()) + " ms");

    io::ReceiveResult received = worker_.receive(left);
    if (std::holds_alternative<io::ReceiveTimeout>(received))
      continue; // loop re-checks the deadline
    if (std::holds_alternative<io::ChannelClosed>(received))
      throw WorkerCrashed("[TrialDriver] worker pid " + std::to_string(worker_.pid()) +
                          " exited while running " + trial_.target.method.name);

    LogMessage msg = std::get<LogMessage>(std::move(received));
    if (const auto* stop = std::get_if<StopMeasurementLogMessage>(&msg)) {
      if (stop->trialId != trial_.id)
        throw ProtocolError("[TrialDriver] stop for trial " + std::to_string(stop->trialId) +
                            " while running trial " + std::to_string(trial_.id));
      return messages;
    }
    if (const auto* failure = std::get_if<FailureLogMessage>(&msg))
      throw TrialFailure(failure->exceptionType + ": " + failure->message);

    if (std::holds_alternative<GcLogMessage>(msg))
      ++gcEvents_;
    else if (!std::holds_alternative<RuntimeMeasurement>(msg) &&
             !std::holds_alternative<ArbitraryMeasurement>(msg) &&
             !std::holds_alternative<DryRunSuccessLogMessage>(msg))
      throw ProtocolError(std::string("[TrialDriver] unexpected ") + typeName(msg) + " during a run");
    messages.push_back(std::move(msg));
  }
}

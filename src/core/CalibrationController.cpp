/* @file CalibrationController.cpp
 * @brief granularity probe + warmup
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cmath>
#include <string>

// Tempo headers
#include "core/CalibrationController.hpp"
#include "core/Errors.hpp"

using namespace tempo::core;

const char* tempo::core::toString(CalibrationState state) {
  switch (state) {
  case CalibrationState::GranularityProbe:
    return "GRANULARITY_PROBE";
  case CalibrationState::Warmup:
    return "WARMUP";
  case CalibrationState::Ready:
    return "READY";
  case CalibrationState::Aborted:
    return "ABORTED";
  }
  return "UNKNOWN";
}

CalibrationController::CalibrationController(const CalibrationConfig& config,
                                             std::int64_t workerGranularityNanos)
    : config_(config),
      resolution_(std::max<std::int64_t>(1, config.timerResolutionNanos.value_or(workerGranularityNanos))) {}

CalibrationResult CalibrationController::run(const TimedLoopRunner& runLoop) {
  try {
    probe(runLoop);
    warmup(runLoop);
  } catch (const std::exception&) {
    result_.state = CalibrationState::Aborted;
    throw;
  }
  return result_;
}

std::int64_t CalibrationController::probe(const TimedLoopRunner& runLoop) {
  result_.state = CalibrationState::GranularityProbe;
  const double target = config_.resolutionMargin * static_cast<double>(resolution_);
  const std::int64_t maxReps = std::max<std::int64_t>(1, config_.maxRepsPerLoop);

  std::int64_t reps = 1;
  for (int attempt = 1; attempt <= config_.maxProbeAttempts; ++attempt) {
    Measurement m = runLoop(reps);
    result_.probeAttempts = attempt;
    const double elapsed = m.value;

    if (elapsed > target) {
      result_.repsPerLoop = reps;
      result_.state = CalibrationState::Warmup;
      return reps;
    }
    if (reps >= maxReps)
      break;

    // aim straight for the target, but always at least double
    const double factor = std::max(2.0, std::ceil(target / std::max(elapsed, 1.0)));
    const double next = static_cast<double>(reps) * factor;
    reps = next >= static_cast<double>(maxReps) ? maxReps : static_cast<std::int64_t>(next);
  }

  result_.state = CalibrationState::Aborted;
  throw CalibrationFailure("[Calibration] loop time never exceeded " + std::to_string(target) +
                           " ns after " + std::to_string(result_.probeAttempts) + " attempts (reps " +
                           std::to_string(reps) + ")");
}

void CalibrationController::warmup(const TimedLoopRunner& runLoop) {
  result_.state = CalibrationState::Warmup;
  std::deque<double> window;
  const std::size_t windowSize = std::max<std::size_t>(1, config_.cvWindow);

  while (true) {
    Measurement m = runLoop(result_.repsPerLoop);
    ++result_.warmupLoops;
    result_.warmupNanos += static_cast<std::int64_t>(m.value);

    if (config_.warmupPolicy == WarmupPolicy::CoefficientOfVariation) {
      window.push_back(m.perRep());
      if (window.size() > windowSize)
        window.pop_front();
      if (window.size() == windowSize && isStable(window, config_.cvThreshold))
        break;
    } else if (result_.warmupNanos >= config_.minWarmupNanos) {
      break;
    }

    if (result_.warmupLoops >= config_.maxWarmupLoops || result_.warmupNanos >= config_.maxWarmupNanos) {
      result_.partialWarmup = true;
      break;
    }
  }
  result_.state = CalibrationState::Ready;
}

bool CalibrationController::isStable(const std::deque<double>& window, double threshold) {
  if (window.empty())
    return false;
  double sum = 0.0;
  for (double v : window)
    sum += v;
  const double mean = sum / static_cast<double>(window.size());
  if (mean == 0.0)
    return std::all_of(window.begin(), window.end(), [](double v) { return v == 0.0; });

  double sq = 0.0;
  for (double v : window)
    sq += (v - mean) * (v - mean);
  const double variance = window.size() > 1 ? sq / static_cast<double>(window.size() - 1) : 0.0;
  return std::sqrt(variance) / mean <= threshold;
}

/* @file RuntimeInstrument.cpp
 * @brief elapsed-time instrument
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include <variant>

// Tempo headers
#include "core/Errors.hpp"
#include "instruments/RuntimeInstrument.hpp"

using namespace tempo::instruments;
using namespace tempo::protocols;
using tempo::core::ConfigurationError;
using tempo::core::InvalidBenchmarkException;
using tempo::core::MeasurementFailure;

namespace {

  std::int64_t parseOption(const tempo::core::InstrumentConfig& cfg, const std::string& key,
                           std::int64_t fallback, std::int64_t min, std::int64_t max) {
    auto raw = cfg.option(key);
    if (!raw)
      return fallback;
    std::size_t used = 0;
    std::int64_t v = 0;
    try {
      v = std::stoll(*raw, &used);
    } catch (const std::exception&) {
      used = 0;
    }
    if (used != raw->size() || v < min || v > max)
      throw ConfigurationError("[RuntimeInstrument] option " + key + " of " + cfg.name +
                               " must be an integer between " + std::to_string(min) + " and " +
                               std::to_string(max) + ", got '" + *raw + "'");
    return v;
  }

} // namespace

RuntimeInstrument::RuntimeInstrument(std::shared_ptr<const core::InstrumentConfig> config)
    : Instrument(std::move(config)) {
  measurements_ = static_cast<int>(
      parseOption(this->config(), "measurements", 9, 1, std::numeric_limits<int>::max()));
  timeBoxNanos_ =
      parseOption(this->config(), "timeBoxNanos", 0, 0, std::numeric_limits<std::int64_t>::max());
}

bool RuntimeInstrument::isBenchmarkMethod(const core::BenchmarkMethod& method) const {
  return method.invocation == core::InvocationKind::TimedLoop;
}

void RuntimeInstrument::checkSignature(const core::BenchmarkMethod& method) const {
  // the only parameter is the rep count handed in by the worker loop
  const auto& p = method.parameterTypes;
  if (p.size() != 1 || (p[0] != "int64" && p[0] != "int"))
    throw InvalidBenchmarkException("[RuntimeInstrument] timed method " + method.name +
                                    " must take exactly one integer rep-count parameter");
}

WorkerLoopSpec RuntimeInstrument::calibrationLoop(std::int64_t repsPerLoop) const {
  WorkerLoopSpec loop;
  loop.kind = WorkerLoopSpec::Kind::FixedReps;
  loop.reps = repsPerLoop;
  loop.emits = { MessageKind::RuntimeMeasurement, MessageKind::GcLogMessage };
  return loop;
}

WorkerLoopSpec RuntimeInstrument::newWorkerLoop(std::int64_t repsPerLoop) const {
  WorkerLoopSpec loop = calibrationLoop(repsPerLoop);
  if (timeBoxNanos_ > 0) {
    loop.kind = WorkerLoopSpec::Kind::TimeBoxed;
    loop.timeBoxNanos = timeBoxNanos_;
  }
  return loop;
}

tempo::core::Measurement RuntimeInstrument::toMeasurement(const std::vector<LogMessage>& messages) const {
  std::int64_t reps = 0;
  std::int64_t nanos = 0;
  bool seen = false;
  for (const auto& msg : messages) {
    if (const auto* rt = std::get_if<RuntimeMeasurement>(&msg)) {
      if (rt->elapsedNanos < 0)
        throw MeasurementFailure("[RuntimeInstrument] negative elapsed time reported");
      if (__builtin_add_overflow(reps, rt->reps, &reps) ||
          __builtin_add_overflow(nanos, rt->elapsedNanos, &nanos))
        throw MeasurementFailure("[RuntimeInstrument] accumulated reps or elapsed time overflows");
      seen = true;
    }
  }
  if (!seen)
    throw MeasurementFailure("[RuntimeInstrument] execution produced no RuntimeMeasurement");

  return core::makeMeasurement(static_cast<double>(nanos), "ns", "runtime", reps);
}

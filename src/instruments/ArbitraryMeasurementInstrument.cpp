/* @file ArbitraryMeasurementInstrument.cpp
 * @brief value-reporting instrument
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <string>
#include <utility>
#include <variant>

// Tempo headers
#include "core/Errors.hpp"
#include "instruments/ArbitraryMeasurementInstrument.hpp"

using namespace tempo::instruments;
using namespace tempo::protocols;
using tempo::core::ConfigurationError;
using tempo::core::InvalidBenchmarkException;
using tempo::core::MeasurementFailure;

ArbitraryMeasurementInstrument::ArbitraryMeasurementInstrument(
    std::shared_ptr<const core::InstrumentConfig> config)
    : Instrument(std::move(config)) {
  if (auto raw = this->config().option("measurements")) {
    try {
      measurements_ = std::stoi(*raw);
    } catch (const std::exception&) {
      measurements_ = 0;
    }
    if (measurements_ < 1)
      throw ConfigurationError("[ArbitraryMeasurementInstrument] option measurements of " + name() +
                               " must be a positive integer, got '" + *raw + "'");
  }
}

bool ArbitraryMeasurementInstrument::isBenchmarkMethod(const core::BenchmarkMethod& method) const {
  return method.invocation == core::InvocationKind::SingleShotValue;
}

void ArbitraryMeasurementInstrument::checkSignature(const core::BenchmarkMethod& method) const {
  if (!method.parameterTypes.empty())
    throw InvalidBenchmarkException("[ArbitraryMeasurementInstrument] " + method.name +
                                    " must not take parameters");
}

WorkerLoopSpec ArbitraryMeasurementInstrument::newWorkerLoop(std::int64_t) const {
  WorkerLoopSpec loop;
  loop.kind = WorkerLoopSpec::Kind::SingleInvocation;
  loop.reps = 1;
  loop.emits = { MessageKind::ArbitraryMeasurement };
  return loop;
}

tempo::core::Measurement
ArbitraryMeasurementInstrument::toMeasurement(const std::vector<LogMessage>& messages) const {
  const ArbitraryMeasurement* found = nullptr;
  for (const auto& msg : messages) {
    if (const auto* am = std::get_if<ArbitraryMeasurement>(&msg)) {
      if (found)
        throw MeasurementFailure("[ArbitraryMeasurementInstrument] more than one value reported");
      found = am;
    }
  }
  if (!found)
    throw MeasurementFailure("[ArbitraryMeasurementInstrument] execution reported no value");

  std::string unit = config().option("unit").value_or(found->unit);
  return core::makeMeasurement(found->value, std::move(unit), found->description, 1);
}

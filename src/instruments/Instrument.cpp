/* @file Instrument.cpp
 * @brief shared part of the instrument contract
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <utility>

// Tempo headers
#include "core/Errors.hpp"
#include "instruments/Instrument.hpp"

using namespace tempo::instruments;
using tempo::core::InvalidBenchmarkException;

Instrument::Instrument(std::shared_ptr<const core::InstrumentConfig> config)
    : config_(std::move(config)) {
  assert(config_ && "[Instrument] config is nullptr");
}

InstrumentedMethod Instrument::createInstrumentedMethod(const core::BenchmarkMethod& method) const {
  if (!isBenchmarkMethod(method))
    throw InvalidBenchmarkException("[Instrument] " + method.name + " is not a benchmark method for " +
                                    name());
  checkSignature(method);

  InstrumentedMethod bound;
  bound.method = method;
  bound.instrument = shared_from_this();
  return bound;
}

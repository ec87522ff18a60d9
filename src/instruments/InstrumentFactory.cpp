/* @file InstrumentFactory.cpp
 * @brief string key -> instrument creator registry
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <utility>

// Tempo headers
#include "core/Errors.hpp"
#include "instruments/ArbitraryMeasurementInstrument.hpp"
#include "instruments/InstrumentFactory.hpp"
#include "instruments/RuntimeInstrument.hpp"

using namespace tempo::instruments;

InstrumentFactory InstrumentFactory::withBuiltins() {
  InstrumentFactory factory;
  factory.registerInstrument(RuntimeInstrument::kClassName, [](auto config) {
    return std::make_shared<RuntimeInstrument>(std::move(config));
  });
  factory.registerInstrument(ArbitraryMeasurementInstrument::kClassName, [](auto config) {
    return std::make_shared<ArbitraryMeasurementInstrument>(std::move(config));
  });
  return factory;
}

bool InstrumentFactory::registerInstrument(const std::string& className, Creator maker) {
  return creators_.emplace(className, std::move(maker)).second;
}

std::shared_ptr<Instrument>
InstrumentFactory::create(std::shared_ptr<const core::InstrumentConfig> config) const {
  auto it = creators_.find(config->className);
  if (it == creators_.end())
    throw core::InvalidCommandException("[InstrumentFactory] instrument " + config->className +
                                        " not supported");
  return it->second(std::move(config));
}

std::vector<std::string> InstrumentFactory::classNames() const {
  std::vector<std::string> names;
  names.reserve(creators_.size());
  for (const auto& [name, creator] : creators_)
    names.push_back(name);
  std::sort(names.begin(), names.end());
  return names;
}

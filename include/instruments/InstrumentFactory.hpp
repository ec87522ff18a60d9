#pragma once
/** @file  InstrumentFactory.hpp
 *  @brief Runtime registry that maps instrument class keys to creators.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

// Tempo headers
#include "core/RunConfig.hpp"

namespace tempo::instruments {

  class Instrument;

  /**
 * @class InstrumentFactory
 * @brief Register & instantiate instruments by stable string key.
 *
 *  * Keeps the coordinator decoupled from concrete instruments.
 *  * Creators are lambdas returning `shared_ptr<Instrument>` for a given config.
 */
  class InstrumentFactory {
  public:
    using Creator =
        std::function<std::shared_ptr<Instrument>(std::shared_ptr<const core::InstrumentConfig>)>;

    /// Factory pre-loaded with RuntimeInstrument and ArbitraryMeasurementInstrument.
    static InstrumentFactory withBuiltins();

    /// Register an instrument under \p className.  Returns false on duplicate.
    bool registerInstrument(const std::string& className, Creator maker);

    bool contains(const std::string& className) const { return creators_.count(className) > 0; }

    /// Create a configured instance or throw `core::InvalidCommandException` if unknown.
    std::shared_ptr<Instrument> create(std::shared_ptr<const core::InstrumentConfig> config) const;

    std::vector<std::string> classNames() const;

  private:
    std::unordered_map<std::string, Creator> creators_;
  };

} // namespace tempo::instruments

#pragma once
/** @file  ReportWriter.hpp
 *  @brief JSON rendering of a Report for the `tempo` runner.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <nlohmann/json_fwd.hpp>

// Tempo headers
#include "core/ResultAggregator.hpp"

namespace tempo::core {

  /// {"dryRun", "outlierPolicy", "trials":[...], "entries":[...], "events":[...]}
  nlohmann::json toJson(const Report& report);

} // namespace tempo::core

/* @file ReportWriter.cpp
 * @brief Report -> nlohmann::json
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cmath>
#include <string>

#include <nlohmann/json.hpp>

// Tempo headers
#include "core/ReportWriter.hpp"

using namespace tempo::core;
using nlohmann::json;

namespace {

  const char* policyName(OutlierPolicy p) {
    switch (p) {
    case OutlierPolicy::None:
      return "none";
    case OutlierPolicy::Flag:
      return "flag";
    case OutlierPolicy::Trim:
      return "trim";
    }
    return "unknown";
  }

  json keyJson(const TrialKey& key) {
    return json{ { "method", key.method }, { "instrument", key.instrument }, { "parameters", key.parameters } };
  }

  std::string percentileLabel(double p) {
    // 50 -> "p50", 99.9 -> "p99.9"
    if (p == std::floor(p))
      return "p" + std::to_string(static_cast<long long>(p));
    std::string text = std::to_string(p);
    text.erase(text.find_last_not_of('0') + 1);
    return "p" + text;
  }

} // namespace

json tempo::core::toJson(const Report& report) {
  json out;
  out["dryRun"] = report.dryRun();
  out["outlierPolicy"] = policyName(report.outlierPolicy());

  json trials = json::array();
  for (const auto& t : report.trials()) {
    trials.push_back(json{ { "id", t.trialId },
                           { "key", keyJson(t.key) },
                           { "vm", t.vmName },
                           { "state", toString(t.state) },
                           { "reason", t.reason },
                           { "measurements", t.measurementCount },
                           { "partialWarmup", t.partialWarmup },
                           { "gcEvents", t.gcEvents } });
  }
  out["trials"] = std::move(trials);

  json entries = json::array();
  for (const auto& e : report.entries()) {
    json entry{ { "key", keyJson(e.key) },
                { "trialIds", e.trialIds },
                { "failedTrials", e.failedTrials },
                { "outliers", e.outliers },
                { "partialWarmup", e.partialWarmup } };
    if (e.statistics) {
      const auto& s = *e.statistics;
      json stats{ { "count", s.count },       { "totalWeight", s.totalWeight }, { "unit", s.unit },
                  { "mean", s.mean },         { "min", s.min },                 { "max", s.max },
                  { "median", s.median },     { "variance", s.variance },       { "stddev", s.stddev } };
      for (const auto& [p, v] : s.percentiles)
        stats[percentileLabel(p)] = v;
      entry["statistics"] = std::move(stats);
    } else {
      entry["statistics"] = nullptr;
    }
    entries.push_back(std::move(entry));
  }
  out["entries"] = std::move(entries);

  json events = json::array();
  for (const auto& ev : report.events()) {
    events.push_back(json{ { "severity", ev.severity == RunEvent::Severity::Warning ? "warning" : "failure" },
                           { "source", ev.source },
                           { "message", ev.message } });
  }
  out["events"] = std::move(events);
  return out;
}

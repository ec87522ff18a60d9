/* @file ResultAggregator.cpp
 * @brief per-key statistics, outlier handling, report assembly
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cmath>
#include <utility>

// Tempo headers
#include "core/ResultAggregator.hpp"

using namespace tempo::core;

//---Report-------------------------------------------------------------------

Report::Report(std::vector<TrialSummary> trials, std::vector<ReportEntry> entries, std::vector<RunEvent> events,
               bool dryRun, OutlierPolicy policy)
    : trials_(std::move(trials)), entries_(std::move(entries)), events_(std::move(events)), dryRun_(dryRun),
      policy_(policy) {}

const ReportEntry* Report::find(const TrialKey& key) const {
  for (const auto& e : entries_)
    if (e.key == key)
      return &e;
  return nullptr;
}

std::size_t Report::count(TrialState state) const {
  return static_cast<std::size_t>(
      std::count_if(trials_.begin(), trials_.end(), [state](const TrialSummary& t) { return t.state == state; }));
}

//---ResultAggregator---------------------------------------------------------

ResultAggregator::ResultAggregator(AggregatorConfig config) : config_(std::move(config)) {}

void ResultAggregator::add(const TrialResult& result) { results_.push_back(result); }

double ResultAggregator::percentile(const std::vector<double>& sorted, double p) {
  if (sorted.size() == 1)
    return sorted.front();
  const double rank = std::clamp(p, 0.0, 100.0) / 100.0 * static_cast<double>(sorted.size() - 1);
  const auto lo = static_cast<std::size_t>(std::floor(rank));
  const auto hi = static_cast<std::size_t>(std::ceil(rank));
  return sorted[lo] + (rank - static_cast<double>(lo)) * (sorted[hi] - sorted[lo]);
}

SummaryStatistics ResultAggregator::summarize(const std::vector<Measurement>& measurements,
                                              const std::vector<double>& percentiles) {
  SummaryStatistics s;
  if (measurements.empty())
    return s;

  std::vector<double> perRep;
  perRep.reserve(measurements.size());
  double totalValue = 0.0;
  for (const auto& m : measurements) {
    perRep.push_back(m.perRep());
    totalValue += m.value;
    s.totalWeight += m.weight;
  }
  std::sort(perRep.begin(), perRep.end());

  s.count = perRep.size();
  s.unit = measurements.front().unit;
  s.mean = totalValue / static_cast<double>(s.totalWeight);
  s.min = perRep.front();
  s.max = perRep.back();
  s.median = percentile(perRep, 50.0);
  for (double p : percentiles)
    s.percentiles[p] = percentile(perRep, p);

  if (perRep.size() > 1) {
    double plainMean = 0.0;
    for (double v : perRep)
      plainMean += v;
    plainMean /= static_cast<double>(perRep.size());
    double sq = 0.0;
    for (double v : perRep)
      sq += (v - plainMean) * (v - plainMean);
    s.variance = sq / static_cast<double>(perRep.size() - 1);
  }
  s.stddev = std::sqrt(s.variance);
  return s;
}

Report ResultAggregator::build(std::vector<RunEvent> events, bool dryRun) const {
  std::vector<TrialSummary> trials;
  std::map<TrialKey, ReportEntry> entries;
  std::map<TrialKey, std::vector<Measurement>> measured;

  std::vector<TrialResult> ordered = results_;
  std::sort(ordered.begin(), ordered.end(),
            [](const TrialResult& a, const TrialResult& b) { return a.trialId < b.trialId; });

  for (const auto& r : ordered) {
    trials.push_back(TrialSummary{ r.trialId, r.key, r.vmName, r.state, r.reason, r.measurements.size(),
                                   r.partialWarmup, r.gcEvents });

    auto& entry = entries[r.key];
    entry.key = r.key;
    entry.trialIds.push_back(r.trialId);
    if (r.state != TrialState::Success) {
      entry.failedTrials.push_back(r.trialId);
      continue;
    }
    entry.partialWarmup = entry.partialWarmup || r.partialWarmup;
    auto& bucket = measured[r.key];
    bucket.insert(bucket.end(), r.measurements.begin(), r.measurements.end());
  }

  std::vector<ReportEntry> out;
  out.reserve(entries.size());
  for (auto& [key, entry] : entries) {
    auto it = measured.find(key);
    if (it != measured.end() && !it->second.empty()) {
      std::vector<Measurement> kept = it->second;

      if (config_.outlierPolicy != OutlierPolicy::None && kept.size() >= 4) {
        std::vector<double> perRep;
        for (const auto& m : kept)
          perRep.push_back(m.perRep());
        std::sort(perRep.begin(), perRep.end());
        const double q1 = percentile(perRep, 25.0);
        const double q3 = percentile(perRep, 75.0);
        const double fence = config_.tukeyFactor * (q3 - q1);
        auto isOutlier = [&](const Measurement& m) { return m.perRep() < q1 - fence || m.perRep() > q3 + fence; };

        entry.outliers = static_cast<std::size_t>(std::count_if(kept.begin(), kept.end(), isOutlier));
        if (config_.outlierPolicy == OutlierPolicy::Trim)
          kept.erase(std::remove_if(kept.begin(), kept.end(), isOutlier), kept.end());
      }
      if (!kept.empty())
        entry.statistics = summarize(kept, config_.percentiles);
    }
    out.push_back(std::move(entry));
  }

  return Report(std::move(trials), std::move(out), std::move(events), dryRun, config_.outlierPolicy);
}

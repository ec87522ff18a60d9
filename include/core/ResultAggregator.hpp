#pragma once
/** @file  ResultAggregator.hpp
 *  @brief Merges TrialResults per key into summary statistics and an immutable Report.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

// Tempo headers
#include "core/ErrorMonitor.hpp"
#include "core/Measurement.hpp"
#include "core/RunConfig.hpp"
#include "core/Trial.hpp"

namespace tempo::core {

  /// Statistics over per-rep values (value / weight) of the surviving measurements.
  struct SummaryStatistics {
    std::size_t count{ 0 };
    std::int64_t totalWeight{ 0 };
    double mean{ 0.0 }; ///< weighted: sum(value) / sum(weight)
    double min{ 0.0 };
    double max{ 0.0 };
    double median{ 0.0 };
    double variance{ 0.0 }; ///< sample variance, 0 for a single value
    double stddev{ 0.0 };
    std::map<double, double> percentiles{};
    std::string unit{};
  };

  struct ReportEntry {
    TrialKey key{};
    std::vector<std::int64_t> trialIds{};
    std::optional<SummaryStatistics> statistics{}; ///< absent when nothing was measured
    std::size_t outliers{ 0 };                     ///< flagged or trimmed, per policy
    bool partialWarmup{ false };
    std::vector<std::int64_t> failedTrials{}; ///< FAILED or TIMED_OUT ids, never merged into stats
  };

  /// One line per enumerated trial, whatever its outcome.
  struct TrialSummary {
    std::int64_t trialId{ 0 };
    TrialKey key{};
    std::string vmName{};
    TrialState state{ TrialState::Pending };
    std::string reason{};
    std::size_t measurementCount{ 0 };
    bool partialWarmup{ false };
    int gcEvents{ 0 };
  };

  /**
 * @class Report
 * @brief Immutable outcome of one run.
 */
  class Report {
  public:
    Report(std::vector<TrialSummary> trials, std::vector<ReportEntry> entries, std::vector<RunEvent> events,
           bool dryRun, OutlierPolicy policy);

    const std::vector<TrialSummary>& trials() const { return trials_; }
    const std::vector<ReportEntry>& entries() const { return entries_; }
    const std::vector<RunEvent>& events() const { return events_; }
    bool dryRun() const { return dryRun_; }
    OutlierPolicy outlierPolicy() const { return policy_; }

    const ReportEntry* find(const TrialKey& key) const;
    std::size_t count(TrialState state) const;

  private:
    std::vector<TrialSummary> trials_;
    std::vector<ReportEntry> entries_;
    std::vector<RunEvent> events_;
    bool dryRun_;
    OutlierPolicy policy_;
  };

  /**
 * @class ResultAggregator
 * @brief Collects results (in any order) and builds the Report on demand.
 *
 *  * Outliers: Tukey fences [Q1 - k*IQR, Q3 + k*IQR] on per-rep values.
 */
  class ResultAggregator {
  public:
    explicit ResultAggregator(AggregatorConfig config = {});

    void add(const TrialResult& result);
    Report build(std::vector<RunEvent> events = {}, bool dryRun = false) const;

    /// Linear interpolation between closest ranks; \p sorted must be non-empty.
    static double percentile(const std::vector<double>& sorted, double p);
    static SummaryStatistics summarize(const std::vector<Measurement>& measurements,
                                       const std::vector<double>& percentiles);

  private:
    AggregatorConfig config_;
    std::vector<TrialResult> results_{};
  };

} // namespace tempo::core

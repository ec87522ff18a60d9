#pragma once
/** @file  RunConfig.hpp
 *  @brief Plain configuration structs, resolved once per run and then read-only.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace tempo::core {

  /**
 * @struct VmConfig
 * @brief How to launch one kind of worker process.
 *
 *  * `options` are forwarded to the worker as `--vm-option k=v` and echoed back.
 *  * `supportedInstruments` lists instrument class keys; empty means "all".
 */
  struct VmConfig {
    std::string name{ "default" };
    std::string executable{};
    std::vector<std::string> args{};
    std::map<std::string, std::string> env{};
    std::map<std::string, std::string> options{};
    std::set<std::string> supportedInstruments{};

    bool supports(const std::string& instrumentClass) const {
      return supportedInstruments.empty() || supportedInstruments.count(instrumentClass) > 0;
    }
  };

  /// One configured instrument: registry key plus ordered option map.
  struct InstrumentConfig {
    std::string name{};
    std::string className{};
    std::map<std::string, std::string> options{};

    std::optional<std::string> option(const std::string& key) const {
      auto it = options.find(key);
      if (it == options.end())
        return std::nullopt;
      return it->second;
    }
  };

  enum class WarmupPolicy { CoefficientOfVariation, MinDuration };

  struct CalibrationConfig {
    double resolutionMargin{ 100.0 };           ///< loop time must exceed margin x resolution
    int maxProbeAttempts{ 20 };                 ///< granularity probe retry budget
    std::int64_t maxRepsPerLoop{ 1LL << 30 };
    std::optional<std::int64_t> timerResolutionNanos{}; ///< overrides the worker's report
    WarmupPolicy warmupPolicy{ WarmupPolicy::CoefficientOfVariation };
    std::size_t cvWindow{ 5 };
    double cvThreshold{ 0.05 };
    std::int64_t minWarmupNanos{ 100'000'000 };   ///< MinDuration policy
    std::int64_t maxWarmupNanos{ 10'000'000'000 }; ///< best-effort cap, both policies
    int maxWarmupLoops{ 1000 };
  };

  struct SchedulerConfig {
    std::size_t parallelism{ 1 };
    int measurementReps{ 0 }; ///< 0 = instrument default
    std::chrono::milliseconds trialTimeout{ 60'000 };
    std::chrono::milliseconds startupTimeout{ 10'000 };
    std::chrono::milliseconds terminateGrace{ 1'000 };
    std::chrono::milliseconds spawnRetryBackoff{ 100 };
    bool freshWorkerPerTrial{ false };
    bool dryRun{ false };
  };

  enum class OutlierPolicy { None, Flag, Trim };

  struct AggregatorConfig {
    OutlierPolicy outlierPolicy{ OutlierPolicy::Flag };
    double tukeyFactor{ 1.5 };
    std::vector<double> percentiles{ 50.0, 90.0, 99.0 };
  };

  /// Explicit selections (normally from the command line); empty = use defaults.
  struct RunOptions {
    std::vector<std::string> instrumentNames{};
    std::vector<std::string> benchmarkMethodNames{};
  };

  struct RunConfig {
    std::map<std::string, InstrumentConfig> instruments{};
    std::vector<std::string> defaultInstruments{};
    std::vector<VmConfig> vms{};
    RunOptions options{};
    CalibrationConfig calibration{};
    SchedulerConfig scheduler{};
    AggregatorConfig aggregator{};
    std::string logPath{}; ///< empty = std::clog
  };

} // namespace tempo::core

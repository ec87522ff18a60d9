#pragma once
/** @file  Trial.hpp
 *  @brief One (instrumented method, VM, parameter assignment) triple and its outcome.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <compare>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// Tempo headers
#include "core/Measurement.hpp"
#include "core/RunConfig.hpp"
#include "instruments/Instrument.hpp"
#include "protocols/LogMessage.hpp"

namespace tempo::core {

  enum class TrialState : std::uint8_t { Pending, Running, Success, Failed, TimedOut };

  const char* toString(TrialState state);

  /// Aggregation key: results with equal keys are merged across VMs.
  struct TrialKey {
    std::string method{};
    std::string instrument{};
    protocols::Parameters parameters{};

    auto operator<=>(const TrialKey&) const = default;
    bool operator==(const TrialKey&) const = default;
  };

  struct Trial {
    std::int64_t id{ 0 };
    instruments::InstrumentedMethod target{};
    std::shared_ptr<const VmConfig> vm{};
    protocols::Parameters parameters{};
    TrialState state{ TrialState::Pending };

    TrialKey key() const { return TrialKey{ target.method.name, target.instrument->name(), parameters }; }
  };

  struct TrialResult {
    std::int64_t trialId{ 0 };
    TrialKey key{};
    std::string vmName{};
    std::vector<Measurement> measurements{};
    TrialState state{ TrialState::Pending };
    std::string reason{};        ///< empty on success
    bool partialWarmup{ false }; ///< warmup cap was hit
    int gcEvents{ 0 };
    bool dryRun{ false };
    std::int64_t workerPid{ -1 };
  };

} // namespace tempo::core

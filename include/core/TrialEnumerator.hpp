#pragma once
/** @file  TrialEnumerator.hpp
 *  @brief Startup validation: instrument selection, method discovery, trial cross product.
 *
 *  Everything here runs before the first worker is spawned and reports
 *  problems as ConfigurationError (or one of its subclasses).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <memory>
#include <vector>

// Tempo headers
#include "core/Benchmark.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/RunConfig.hpp"
#include "core/Trial.hpp"
#include "instruments/Instrument.hpp"
#include "instruments/InstrumentFactory.hpp"

namespace tempo::core {

  /**
   * Explicit selection (RunOptions) else the configured defaults, in that order.
   * Instruments not supported by every VM are dropped with a warning.
   * @throws InvalidCommandException if a name is not configured, a class key is
   *         unknown, or nothing is left after the VM filter.
   */
  std::vector<std::shared_ptr<const instruments::Instrument>>
  selectInstruments(const RunConfig& config, const instruments::InstrumentFactory& factory,
                    ErrorMonitor& monitor);

  /**
   * Methods \p instrument can measure, sorted by name.
   * @throws InvalidBenchmarkException when two of them share a name.
   */
  std::vector<BenchmarkMethod> findBenchmarkMethods(const BenchmarkTarget& target,
                                                    const instruments::Instrument& instrument);

  /// Binds methods to instruments, honouring RunOptions::benchmarkMethodNames.
  std::vector<instruments::InstrumentedMethod>
  instrumentMethods(const std::vector<std::shared_ptr<const instruments::Instrument>>& selected,
                    const BenchmarkTarget& target, const RunOptions& options);

  /// Cross product with VMs and parameter combinations; ids are 1..N in that order.
  std::vector<Trial> enumerateTrials(const std::vector<instruments::InstrumentedMethod>& methods,
                                     const std::vector<VmConfig>& vms,
                                     const std::map<std::string, std::vector<std::string>>& parameters);

} // namespace tempo::core

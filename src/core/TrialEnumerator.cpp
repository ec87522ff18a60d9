/* @file TrialEnumerator.cpp
 * @brief instrument selection and trial enumeration
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <iterator>
#include <set>

// Tempo headers
#include "core/Errors.hpp"
#include "core/TrialEnumerator.hpp"

using namespace tempo::core;
using tempo::instruments::Instrument;
using tempo::instruments::InstrumentedMethod;
using tempo::instruments::InstrumentFactory;

namespace {

  template <typename Range> std::string listOf(const Range& names) {
    std::string out = "[";
    for (const auto& n : names) {
      if (out.size() > 1)
        out += ", ";
      out += n;
    }
    return out + "]";
  }

  // Method names are unique within a target regardless of how each is invoked.
  void rejectOverloads(const std::vector<BenchmarkMethod>& methods, const std::string& targetName) {
    std::set<std::string> names;
    std::set<std::string> overloaded;
    for (const auto& m : methods)
      if (!names.insert(m.name).second)
        overloaded.insert(m.name);
    if (!overloaded.empty())
      throw InvalidBenchmarkException("Overloads are disallowed for benchmark methods, found overloads of " +
                                      listOf(overloaded) + " in benchmark " + targetName);
  }

} // namespace

std::vector<std::shared_ptr<const Instrument>>
tempo::core::selectInstruments(const RunConfig& config, const InstrumentFactory& factory,
                               ErrorMonitor& monitor) {
  const auto& requested =
      config.options.instrumentNames.empty() ? config.defaultInstruments : config.options.instrumentNames;
  if (requested.empty())
    throw InvalidCommandException("[InstrumentSelection] no instruments selected and no defaults configured");

  std::vector<std::string> configured;
  for (const auto& [name, cfg] : config.instruments)
    configured.push_back(name);

  std::vector<std::shared_ptr<const Instrument>> selected;
  std::set<std::string> seen;
  for (const auto& name : requested) {
    if (!seen.insert(name).second)
      continue;

    auto it = config.instruments.find(name);
    if (it == config.instruments.end())
      throw InvalidCommandException("[InstrumentSelection] instrument " + name +
                                    " is not configured; configured instruments: " + listOf(configured));

    auto cfg = std::make_shared<InstrumentConfig>(it->second);
    if (cfg->name.empty())
      cfg->name = name;
    std::shared_ptr<const Instrument> instrument = factory.create(cfg);

    bool everywhere = std::all_of(config.vms.begin(), config.vms.end(),
                                  [&](const VmConfig& vm) { return vm.supports(cfg->className); });
    if (!everywhere) {
      monitor.notifyWarning("InstrumentSelection",
                            "Instrument " + name + " not supported on at least one target VM; ignoring");
      continue;
    }
    selected.push_back(std::move(instrument));
  }

  if (selected.empty())
    throw InvalidCommandException("[InstrumentSelection] no selected instrument is supported by every target VM");
  return selected;
}

std::vector<BenchmarkMethod> tempo::core::findBenchmarkMethods(const BenchmarkTarget& target,
                                                               const Instrument& instrument) {
  std::vector<BenchmarkMethod> found;
  for (const auto& m : target.methods)
    if (instrument.isBenchmarkMethod(m))
      found.push_back(m);

  std::stable_sort(found.begin(), found.end(),
                   [](const BenchmarkMethod& a, const BenchmarkMethod& b) { return a.name < b.name; });

  rejectOverloads(found, target.name);
  return found;
}

std::vector<InstrumentedMethod>
tempo::core::instrumentMethods(const std::vector<std::shared_ptr<const Instrument>>& selected,
                               const BenchmarkTarget& target, const RunOptions& options) {
  rejectOverloads(target.methods, target.name);

  const std::set<std::string> wanted(options.benchmarkMethodNames.begin(),
                                     options.benchmarkMethodNames.end());
  std::set<std::string> used;
  std::vector<InstrumentedMethod> out;

  for (const auto& instrument : selected) {
    for (const auto& method : findBenchmarkMethods(target, *instrument)) {
      if (!wanted.empty() && wanted.count(method.name) == 0)
        continue;
      out.push_back(instrument->createInstrumentedMethod(method));
      used.insert(method.name);
    }
  }

  std::vector<std::string> unused;
  std::set_difference(wanted.begin(), wanted.end(), used.begin(), used.end(), std::back_inserter(unused));
  if (!unused.empty())
    throw InvalidBenchmarkException("Invalid benchmark method(s) specified in options: " + listOf(unused));

  if (out.empty()) {
    std::vector<std::string> names;
    for (const auto& i : selected)
      names.push_back(i->name());
    throw InvalidBenchmarkException("There were no experiments to be performed for " + target.name +
                                    " using the instruments " + listOf(names));
  }
  return out;
}

std::vector<Trial> tempo::core::enumerateTrials(const std::vector<InstrumentedMethod>& methods,
                                                const std::vector<VmConfig>& vms,
                                                const std::map<std::string, std::vector<std::string>>& parameters) {
  if (vms.empty())
    throw ConfigurationError("[TrialEnumerator] no VM configuration given");

  std::vector<std::shared_ptr<const VmConfig>> sharedVms;
  for (const auto& vm : vms)
    sharedVms.push_back(std::make_shared<const VmConfig>(vm));
  const auto combos = parameterCombinations(parameters);

  std::vector<Trial> trials;
  trials.reserve(methods.size() * sharedVms.size() * combos.size());
  std::int64_t nextId = 1;
  for (const auto& m : methods)
    for (const auto& vm : sharedVms)
      for (const auto& params : combos)
        trials.push_back(Trial{ nextId++, m, vm, params, TrialState::Pending });
  return trials;
}

const char* tempo::core::toString(TrialState state) {
  switch (state) {
  case TrialState::Pending:
    return "PENDING";
  case TrialState::Running:
    return "RUNNING";
  case TrialState::Success:
    return "SUCCESS";
  case TrialState::Failed:
    return "FAILED";
  case TrialState::TimedOut:
    return "TIMED_OUT";
  }
  return "UNKNOWN";
}

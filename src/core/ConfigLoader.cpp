/* @file ConfigLoader.cpp
 * @brief JSON -> RunConfig / BenchmarkTarget
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <fstream>
#include <utility>

#include <nlohmann/json.hpp>

// Tempo headers
#include "core/ConfigLoader.hpp"
#include "core/Errors.hpp"

using namespace tempo::core;
using nlohmann::json;

namespace {

  /// Option values may be written as strings, numbers or booleans; they are stored as text.
  std::string optionText(const json& v) {
    if (v.is_string())
      return v.get<std::string>();
    if (v.is_number() || v.is_boolean())
      return v.dump();
    throw ConfigurationError("[ConfigLoader] option values must be scalars, got " + v.dump());
  }

  std::map<std::string, std::string> optionMap(const json& obj, const char* where) {
    std::map<std::string, std::string> out;
    if (obj.is_null())
      return out;
    if (!obj.is_object())
      throw ConfigurationError(std::string("[ConfigLoader] ") + where + " must be an object");
    for (const auto& [k, v] : obj.items())
      out[k] = optionText(v);
    return out;
  }

  void require(bool ok, const std::string& what) {
    if (!ok)
      throw ConfigurationError("[ConfigLoader] " + what);
  }

  std::chrono::milliseconds millis(const json& obj, const char* key, std::chrono::milliseconds fallback) {
    auto ms = std::chrono::milliseconds{ obj.value(key, static_cast<std::int64_t>(fallback.count())) };
    require(ms.count() > 0, std::string(key) + " must be > 0");
    return ms;
  }

  InstrumentConfig parseInstrument(const std::string& name, const json& j) {
    InstrumentConfig cfg;
    cfg.name = name;
    cfg.className = j.at("class").get<std::string>();
    cfg.options = optionMap(j.value("options", json::object()), "instrument options");
    return cfg;
  }

  VmConfig parseVm(const json& j) {
    VmConfig vm;
    vm.name = j.value("name", vm.name);
    vm.executable = j.value("executable", std::string{});
    vm.args = j.value("args", std::vector<std::string>{});
    vm.env = optionMap(j.value("env", json::object()), "vm env");
    vm.options = optionMap(j.value("options", json::object()), "vm options");
    for (const auto& s : j.value("supportedInstruments", std::vector<std::string>{}))
      vm.supportedInstruments.insert(s);
    return vm;
  }

  CalibrationConfig parseCalibration(const json& j) {
    CalibrationConfig c;
    c.resolutionMargin = j.value("resolutionMargin", c.resolutionMargin);
    c.maxProbeAttempts = j.value("maxProbeAttempts", c.maxProbeAttempts);
    c.maxRepsPerLoop = j.value("maxRepsPerLoop", c.maxRepsPerLoop);
    if (j.contains("timerResolutionNanos"))
      c.timerResolutionNanos = j.at("timerResolutionNanos").get<std::int64_t>();

    const std::string policy = j.value("warmupPolicy", std::string{ "cv" });
    if (policy == "cv")
      c.warmupPolicy = WarmupPolicy::CoefficientOfVariation;
    else if (policy == "min-duration")
      c.warmupPolicy = WarmupPolicy::MinDuration;
    else
      throw ConfigurationError("[ConfigLoader] unknown warmupPolicy '" + policy + "' (cv | min-duration)");

    const auto window = j.value("cvWindow", static_cast<std::int64_t>(c.cvWindow));
    require(window >= 1, "cvWindow must be >= 1");
    c.cvWindow = static_cast<std::size_t>(window);
    c.cvThreshold = j.value("cvThreshold", c.cvThreshold);
    c.minWarmupNanos = j.value("minWarmupNanos", c.minWarmupNanos);
    c.maxWarmupNanos = j.value("maxWarmupNanos", c.maxWarmupNanos);
    c.maxWarmupLoops = j.value("maxWarmupLoops", c.maxWarmupLoops);

    require(c.resolutionMargin > 0.0, "resolutionMargin must be > 0");
    require(c.maxProbeAttempts >= 1, "maxProbeAttempts must be >= 1");
    require(c.maxRepsPerLoop >= 1, "maxRepsPerLoop must be >= 1");
    require(!c.timerResolutionNanos || *c.timerResolutionNanos >= 1, "timerResolutionNanos must be >= 1");
    require(c.cvThreshold >= 0.0, "cvThreshold must be >= 0");
    require(c.maxWarmupLoops >= 1, "maxWarmupLoops must be >= 1");
    require(c.maxWarmupNanos > 0, "maxWarmupNanos must be > 0");
    return c;
  }

  SchedulerConfig parseScheduler(const json& j) {
    SchedulerConfig s;
    const auto parallelism = j.value("parallelism", static_cast<std::int64_t>(s.parallelism));
    require(parallelism >= 1, "parallelism must be >= 1");
    s.parallelism = static_cast<std::size_t>(parallelism);
    s.measurementReps = j.value("measurementReps", s.measurementReps);
    s.trialTimeout = millis(j, "trialTimeoutMs", s.trialTimeout);
    s.startupTimeout = millis(j, "startupTimeoutMs", s.startupTimeout);
    s.terminateGrace = millis(j, "terminateGraceMs", s.terminateGrace);
    s.spawnRetryBackoff = std::chrono::milliseconds{ j.value(
        "spawnRetryBackoffMs", static_cast<std::int64_t>(s.spawnRetryBackoff.count())) };
    s.freshWorkerPerTrial = j.value("freshWorkerPerTrial", s.freshWorkerPerTrial);
    s.dryRun = j.value("dryRun", s.dryRun);

    require(s.measurementReps >= 0, "measurementReps must be >= 0");
    require(s.spawnRetryBackoff.count() >= 0, "spawnRetryBackoffMs must be >= 0");
    return s;
  }

  AggregatorConfig parseAggregator(const json& j) {
    AggregatorConfig a;
    const std::string policy = j.value("outlierPolicy", std::string{ "flag" });
    if (policy == "none")
      a.outlierPolicy = OutlierPolicy::None;
    else if (policy == "flag")
      a.outlierPolicy = OutlierPolicy::Flag;
    else if (policy == "trim")
      a.outlierPolicy = OutlierPolicy::Trim;
    else
      throw ConfigurationError("[ConfigLoader] unknown outlierPolicy '" + policy + "' (none | flag | trim)");

    a.tukeyFactor = j.value("tukeyFactor", a.tukeyFactor);
    a.percentiles = j.value("percentiles", a.percentiles);
    require(a.tukeyFactor >= 0.0, "tukeyFactor must be >= 0");
    for (double p : a.percentiles)
      require(p >= 0.0 && p <= 100.0, "percentiles must lie in [0, 100]");
    return a;
  }

} // namespace

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

json ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw ConfigurationError("[ConfigLoader] cannot open " + path_);
  try {
    return json::parse(in);
  } catch (const json::exception& e) {
    throw ConfigurationError("[ConfigLoader] " + path_ + ": " + e.what());
  }
}

RunConfig tempo::core::parseRunConfig(const json& doc) {
  require(doc.is_object(), "run configuration must be a JSON object");
  RunConfig cfg;
  try {
    const json instruments = doc.value("instruments", json::object());
    for (const auto& [name, j] : instruments.items())
      cfg.instruments[name] = parseInstrument(name, j);
    cfg.defaultInstruments = doc.value("defaultInstruments", std::vector<std::string>{});

    const json vms = doc.value("vms", json::array());
    for (const auto& j : vms)
      cfg.vms.push_back(parseVm(j));

    const json options = doc.value("options", json::object());
    cfg.options.instrumentNames = options.value("instruments", std::vector<std::string>{});
    cfg.options.benchmarkMethodNames = options.value("benchmarkMethods", std::vector<std::string>{});

    cfg.calibration = parseCalibration(doc.value("calibration", json::object()));
    cfg.scheduler = parseScheduler(doc.value("scheduler", json::object()));
    cfg.aggregator = parseAggregator(doc.value("aggregator", json::object()));
    cfg.logPath = doc.value("logPath", std::string{});
  } catch (const json::exception& e) {
    throw ConfigurationError(std::string("[ConfigLoader] run configuration: ") + e.what());
  }
  return cfg;
}

BenchmarkTarget tempo::core::parseBenchmarkTarget(const json& doc) {
  require(doc.is_object(), "benchmark description must be a JSON object");
  BenchmarkTarget target;
  try {
    target.name = doc.at("name").get<std::string>();
    for (const auto& j : doc.at("methods")) {
      BenchmarkMethod m;
      m.name = j.at("name").get<std::string>();
      m.parameterTypes = j.value("parameterTypes", std::vector<std::string>{});
      const std::string kind = j.value("invocation", std::string{ "timed-loop" });
      if (kind == "timed-loop")
        m.invocation = InvocationKind::TimedLoop;
      else if (kind == "single-shot-value")
        m.invocation = InvocationKind::SingleShotValue;
      else
        throw ConfigurationError("[ConfigLoader] method " + m.name + ": unknown invocation '" + kind + "'");
      target.methods.push_back(std::move(m));
    }
    target.parameters =
        doc.value("parameters", std::map<std::string, std::vector<std::string>>{});
  } catch (const json::exception& e) {
    throw ConfigurationError(std::string("[ConfigLoader] benchmark description: ") + e.what());
  }
  return target;
}

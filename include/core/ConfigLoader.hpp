#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads the run configuration and benchmark description (JSON) from disk.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include <nlohmann/json_fwd.hpp>

// Tempo headers
#include "core/Benchmark.hpp"
#include "core/RunConfig.hpp"

namespace tempo::core {

  /**
 * @class ConfigLoader
 * @brief Thin helper that reads a JSON file and hands the parsed object to the caller.
 *
 *  * No caching: every call to `load()` re-reads the file.
 *  * Schema mapping lives in `parseRunConfig()` / `parseBenchmarkTarget()`.
 */
  class ConfigLoader {
  public:
    /// @param configPath  Absolute or relative path on the host FS.
    explicit ConfigLoader(std::string configPath);

    /// Parse the file into a nlohmann::json object or throw `ConfigurationError`.
    nlohmann::json load() const;

  private:
    std::string path_;
  };

  /// Maps the "run" document onto RunConfig; missing fields keep their defaults.
  RunConfig parseRunConfig(const nlohmann::json& doc);

  /// {"name", "methods":[{"name","parameterTypes","invocation"}], "parameters":{k:[v...]}}
  BenchmarkTarget parseBenchmarkTarget(const nlohmann::json& doc);

} // namespace tempo::core

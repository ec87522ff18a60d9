#pragma once
/** @file  Benchmark.hpp
 *  @brief Read-only description of the code under test (the "benchmark handle").
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <map>
#include <string>
#include <vector>

// Tempo headers
#include "protocols/LogMessage.hpp"

namespace tempo::core {

  /// How the worker has to call a method to measure it.
  enum class InvocationKind : std::uint8_t {
    TimedLoop,       ///< void method(int64 reps)
    SingleShotValue, ///< double method(), the method reports the value itself
  };

  struct BenchmarkMethod {
    std::string name{};
    std::vector<std::string> parameterTypes{};
    InvocationKind invocation{ InvocationKind::TimedLoop };

    bool operator==(const BenchmarkMethod&) const = default;
  };

  /**
 * @struct BenchmarkTarget
 * @brief Name, methods (in declaration order) and declared parameter values.
 *
 *  * Supplied by whoever locates the benchmark code; treated as immutable input.
 */
  struct BenchmarkTarget {
    std::string name{};
    std::vector<BenchmarkMethod> methods{};
    std::map<std::string, std::vector<std::string>> parameters{};
  };

  /// Cross product of the declared values (keys in name order). Never empty.
  std::vector<protocols::Parameters>
  parameterCombinations(const std::map<std::string, std::vector<std::string>>& declared);

  /// "a=1,b=x" rendering used in logs and report keys.
  std::string toString(const protocols::Parameters& params);

} // namespace tempo::core

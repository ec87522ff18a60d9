/* @file Benchmark.cpp
 * @brief parameter space expansion
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// Tempo headers
#include "core/Benchmark.hpp"

using namespace tempo::core;
using tempo::protocols::Parameters;

std::vector<Parameters>
tempo::core::parameterCombinations(const std::map<std::string, std::vector<std::string>>& declared) {
  std::vector<Parameters> combos{ Parameters{} };

  for (const auto& [name, values] : declared) {
    if (values.empty())
      continue; // a parameter without values does not multiply anything
    std::vector<Parameters> next;
    next.reserve(combos.size() * values.size());
    for (const auto& partial : combos) {
      for (const auto& v : values) {
        Parameters p = partial;
        p[name] = v;
        next.push_back(std::move(p));
      }
    }
    combos = std::move(next);
  }
  return combos;
}

std::string tempo::core::toString(const Parameters& params) {
  std::string out;
  for (const auto& [k, v] : params) {
    if (!out.empty())
      out += ',';
    out += k + "=" + v;
  }
  return out;
}

/* @file demo_worker_main.cpp
 * @brief tempo_demo_worker: example worker with a few built-in benchmarks
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <exception>
#include <iostream>
#include <map>
#include <string>
#include <vector>

// Tempo headers
#include "worker/WorkerRuntime.hpp"

using namespace tempo::worker;
using tempo::protocols::Parameters;

namespace {

  volatile std::uint64_t sink = 0; ///< keeps the optimiser from deleting loop bodies

  std::int64_t sizeParam(const Parameters& p, std::int64_t fallback) {
    auto it = p.find("size");
    return it == p.end() ? fallback : std::stoll(it->second);
  }

} // namespace

int main(int argc, char** argv) {
  try {
    WorkerRuntime runtime(WorkerRuntime::stdioChannel(), WorkerRuntime::parseArgs(argc, argv));

    runtime.registerTimedLoop("hashMix", [](std::int64_t reps, const Parameters&) {
      std::uint64_t h = 0x9E3779B97F4A7C15ULL;
      for (std::int64_t i = 0; i < reps; ++i) {
        h ^= static_cast<std::uint64_t>(i);
        h *= 0xBF58476D1CE4E5B9ULL;
        h ^= h >> 31;
      }
      sink = h;
    });

    runtime.registerTimedLoop("vectorFill", [](std::int64_t reps, const Parameters& p) {
      const auto n = static_cast<std::size_t>(sizeParam(p, 64));
      for (std::int64_t i = 0; i < reps; ++i) {
        std::vector<std::uint64_t> v;
        for (std::size_t k = 0; k < n; ++k)
          v.push_back(k);
        sink = v.back();
      }
    });

    runtime.registerTimedLoop("mapInsert", [](std::int64_t reps, const Parameters& p) {
      const auto n = sizeParam(p, 64);
      for (std::int64_t i = 0; i < reps; ++i) {
        std::map<std::int64_t, std::int64_t> m;
        for (std::int64_t k = 0; k < n; ++k)
          m.emplace(k * 7919 % n, k);
        sink = m.size();
      }
    });

    runtime.registerValueMethod(
        "stringGrowth",
        [](const Parameters& p) {
          std::string s;
          const auto n = sizeParam(p, 1000);
          std::size_t reallocations = 0;
          for (std::int64_t i = 0; i < n; ++i) {
            const auto before = s.capacity();
            s.push_back('x');
            if (s.capacity() != before)
              ++reallocations;
          }
          return static_cast<double>(reallocations);
        },
        "reallocations");

    return runtime.run();
  } catch (const std::exception& e) {
    std::cerr << "[tempo_demo_worker] " << e.what() << '\n';
    return 1;
  }
}

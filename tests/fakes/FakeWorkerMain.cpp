/* @file FakeWorkerMain.cpp
 * @brief tempo_fake_worker: deterministic worker for process-level tests
 *
 * Runs the real WorkerRuntime on a simulated clock, so timed benchmarks report
 * exactly `cost x reps` nanoseconds.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <thread>

// Linux headers
#include <unistd.h>

// Tempo headers
#include "worker/WorkerRuntime.hpp"

using namespace tempo::worker;
using tempo::protocols::GcLogMessage;
using tempo::protocols::Parameters;

namespace {

  std::int64_t simulatedNanos = 0;

  void advance(std::int64_t nanos) { simulatedNanos += nanos; }

  bool hasFlag(const WorkerOptions& options, const std::string& flag) {
    return std::find(options.extraArgs.begin(), options.extraArgs.end(), flag) != options.extraArgs.end();
  }

  [[noreturn]] void sleepForever() {
    while (true)
      std::this_thread::sleep_for(std::chrono::hours{ 1 });
  }

} // namespace

int main(int argc, char** argv) {
  WorkerOptions options = WorkerRuntime::parseArgs(argc, argv);

  if (hasFlag(options, "--no-handshake"))
    sleepForever();
  if (hasFlag(options, "--garbage")) {
    const char junk[] = "this is not a message\r\n";
    (void)!::write(STDOUT_FILENO, junk, sizeof(junk) - 1);
    sleepForever();
  }

  options.clock = [] { return simulatedNanos; };
  options.timerGranularityNanos = 1;
  WorkerRuntime runtime(WorkerRuntime::stdioChannel(), options);

  runtime.registerTimedLoop("stableA", [](std::int64_t reps, const Parameters&) { advance(100 * reps); });
  runtime.registerTimedLoop("stableB", [](std::int64_t reps, const Parameters&) { advance(250 * reps); });
  runtime.registerTimedLoop("sized", [](std::int64_t reps, const Parameters& p) {
    advance(10 * std::stoll(p.at("size")) * reps);
  });
  runtime.registerTimedLoop("unstable", [](std::int64_t reps, const Parameters&) {
    static int calls = 0;
    advance((++calls % 2 ? 100 : 300) * reps);
  });
  runtime.registerTimedLoop("hang", [](std::int64_t, const Parameters&) { sleepForever(); });
  runtime.registerTimedLoop("crash", [](std::int64_t, const Parameters&) { ::_exit(3); });
  runtime.registerTimedLoop("crashLate", [](std::int64_t reps, const Parameters&) {
    // survives calibration (2 probes + 5 warmup loops) and one measurement
    static int calls = 0;
    if (++calls > 8)
      ::_exit(3);
    advance(100 * reps);
  });
  runtime.registerTimedLoop("failing", [](std::int64_t, const Parameters&) {
    throw std::runtime_error("benchmark exploded");
  });
  runtime.registerTimedLoop("gcNoisy", [&runtime](std::int64_t reps, const Parameters&) {
    advance(100 * reps);
    runtime.emit(GcLogMessage{ GcLogMessage::Kind::Minor, 1000, "young collection" });
  });

  runtime.registerValueMethod("valueOk", [](const Parameters&) { return 42.0; }, "widgets");
  runtime.registerValueMethod(
      "valueNaN", [](const Parameters&) { return std::numeric_limits<double>::quiet_NaN(); }, "widgets");

  return runtime.run();
}

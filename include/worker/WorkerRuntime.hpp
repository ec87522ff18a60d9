#pragma once
/** @file  WorkerRuntime.hpp
 *  @brief Worker side of the protocol: handshake, run requests, graceful stop.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Tempo headers
#include "io/MessageChannel.hpp"
#include "protocols/LogMessage.hpp"

namespace tempo::worker {

  struct WorkerOptions {
    std::function<std::int64_t()> clock{};                ///< nanoseconds; empty = steady_clock
    std::optional<std::int64_t> timerGranularityNanos{}; ///< skip the measurement when set
    std::map<std::string, std::string> vmOptions{};       ///< echoed in VmOptionsMessage
    std::string workerId{};                               ///< empty = "worker-<pid>"
    std::vector<std::string> extraArgs{};                 ///< command line args not consumed here
  };

  /**
 * @class WorkerRuntime
 * @brief Registry of benchmark callables plus the request loop that runs them.
 *
 *  * Every RunRequest is answered by its measurement messages (or a
 *    FailureLogMessage) and then exactly one StopMeasurementLogMessage.
 *  * Exceptions thrown by a benchmark never escape `run()`.
 *  * EOF on the channel or StopWorkerRequest ends `run()` with exit code 0.
 */
  class WorkerRuntime {
  public:
    using TimedLoop = std::function<void(std::int64_t reps, const protocols::Parameters&)>;
    using ValueMethod = std::function<double(const protocols::Parameters&)>;

    explicit WorkerRuntime(std::unique_ptr<io::MessageChannel> channel, WorkerOptions options = {});

    //---public API------------------------------------------------------
    void registerTimedLoop(const std::string& name, TimedLoop fn);
    void registerValueMethod(const std::string& name, ValueMethod fn, std::string unit = {});

    /// Blocks until stopped; returns the process exit code.
    int run();

    /// Send a message (e.g. a GcLogMessage from inside a benchmark). False when the channel is gone.
    bool emit(const protocols::LogMessage& msg);

    /// Smallest positive step of the configured clock over a short sample.
    std::int64_t measureGranularity() const;

    /// `--vm-option k=v`, `--worker-id id`; everything else lands in extraArgs.
    static WorkerOptions parseArgs(int argc, char** argv);

    /// Channel over stdin and a private copy of stdout; fd 1 is redirected to stderr.
    static std::unique_ptr<io::MessageChannel> stdioChannel();

  private:
    struct ValueEntry {
      ValueMethod fn;
      std::string unit;
    };

    std::optional<protocols::LogMessage> next();
    void execute(const protocols::RunRequest& request);
    std::int64_t now() const;

    std::unique_ptr<io::MessageChannel> channel_;
    WorkerOptions options_;
    std::map<std::string, TimedLoop> timed_{};
    std::map<std::string, ValueEntry> values_{};
  };

} // namespace tempo::worker

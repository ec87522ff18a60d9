#pragma once
/** @file  WorkerProcess.hpp
 *  @brief Owns one worker process and its message channel.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Linux headers
#include <sys/types.h> // pid_t

// Tempo headers
#include "core/RunConfig.hpp"
#include "io/MessageChannel.hpp"
#include "protocols/LogMessage.hpp"

namespace tempo {
  namespace io {

    /// Spawnable command line + environment overrides for one worker.
    struct LaunchSpec {
      std::string executable{};
      std::vector<std::string> args{};
      std::map<std::string, std::string> env{};
    };

    /// Maps a VM configuration to the process to start.
    using WorkerLauncher = std::function<LaunchSpec(const core::VmConfig&)>;

    /// executable + args + `--vm-option k=v` per option, env copied as-is.
    LaunchSpec defaultLaunchSpec(const core::VmConfig& vm);

    struct ChannelClosed {};
    struct ReceiveTimeout {};
    using ReceiveResult = std::variant<protocols::LogMessage, ChannelClosed, ReceiveTimeout>;

    /**
 * @class WorkerProcess
 * @brief RAII handle: the destructor always terminates and reaps the child.
 *
 *  * One outstanding request at a time; not thread-safe, owned by one trial.
 *  * `terminate()` / `kill()` are idempotent.
 */
    class WorkerProcess {
    public:
      /**
       * Fork/exec \p launch, wire stdin/stdout to a channel and run the handshake.
       * @throws core::WorkerStartupFailure on spawn error or handshake timeout.
       */
      static std::unique_ptr<WorkerProcess> start(const core::VmConfig& vm, const LaunchSpec& launch,
                                                  std::chrono::milliseconds startupTimeout,
                                                  std::chrono::milliseconds terminateGrace);

      /// Adopts an already running process (pid <= 0 means "no process", e.g. tests).
      WorkerProcess(std::unique_ptr<MessageChannel> channel, pid_t pid, std::string vmName,
                    std::chrono::milliseconds terminateGrace);
      ~WorkerProcess();

      //---public API------------------------------------------------------
      /// ProcessStarted -> HandshakeAck -> VmOptionsMessage, within \p timeout.
      void handshake(std::chrono::milliseconds timeout);

      /// @returns false when the channel is already gone.
      bool send(const protocols::LogMessage& msg);

      /// Never blocks longer than \p timeout. @throws core::ProtocolError on garbage.
      ReceiveResult receive(std::chrono::milliseconds timeout);

      void terminate(); ///< stop request, grace period, then SIGKILL; always reaps
      void kill();      ///< SIGKILL + reap, no grace

      bool isAlive();   ///< non-blocking waitpid probe
      bool terminated() const { return terminated_; }

      pid_t pid() const { return pid_; }
      const std::string& vmName() const { return vmName_; }
      const std::string& workerId() const { return started_.workerId; }
      std::int64_t timerGranularityNanos() const { return started_.timerGranularityNanos; }
      const std::map<std::string, std::string>& vmOptions() const { return vmOptions_; }
      std::optional<int> exitStatus() const { return exitStatus_; }

      //---non-copyable, non-movable (owned through unique_ptr)-------------
      WorkerProcess(const WorkerProcess&) = delete;
      WorkerProcess& operator=(const WorkerProcess&) = delete;

    private:
      bool reap(bool block);

      std::unique_ptr<MessageChannel> channel_;
      pid_t pid_{ -1 };
      std::string vmName_;
      std::chrono::milliseconds terminateGrace_;
      protocols::ProcessStarted started_{};
      std::map<std::string, std::string> vmOptions_{};
      std::optional<int> exitStatus_{};
      bool terminated_{ false };
    };

  } // namespace io
} // namespace tempo

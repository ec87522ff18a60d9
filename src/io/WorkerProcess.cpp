/* @file WorkerProcess.cpp
 * @brief spawn / handshake / supervise / reap one worker process
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstring> // for strerror
#include <mutex>
#include <thread>
#include <utility>

// Linux headers
#include <errno.h>
#include <fcntl.h> // O_CLOEXEC
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

// Tempo headers
#include "core/Errors.hpp"
#include "io/WorkerProcess.hpp"
#include "protocols/MessageCodec.hpp"

extern char** environ;

using namespace tempo::io;
using tempo::core::WorkerStartupFailure;
using namespace tempo::protocols;

namespace {

  using Clock = std::chrono::steady_clock;

  std::chrono::milliseconds remaining(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds{ 0 };
  }

  std::string errnoText(const char* what) { return std::string(what) + ": " + strerror(errno); }

  void closePair(int fds[2]) {
    ::close(fds[0]);
    ::close(fds[1]);
  }

  // Inherit the controller's environment, then apply the VM overrides.
  std::vector<std::string> buildEnvironment(const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    for (char** e = environ; e && *e; ++e) {
      std::string entry(*e);
      auto eq = entry.find('=');
      if (eq != std::string::npos)
        merged[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    for (const auto& [k, v] : overrides)
      merged[k] = v;

    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto& [k, v] : merged)
      out.push_back(k + "=" + v);
    return out;
  }

  std::vector<char*> toArgv(std::vector<std::string>& strings) {
    std::vector<char*> argv;
    argv.reserve(strings.size() + 1);
    for (auto& s : strings)
      argv.push_back(s.data());
    argv.push_back(nullptr);
    return argv;
  }

  std::once_flag ignoreSigpipeOnce;

} // namespace

LaunchSpec tempo::io::defaultLaunchSpec(const core::VmConfig& vm) {
  LaunchSpec spec;
  spec.executable = vm.executable;
  spec.args = vm.args;
  for (const auto& [k, v] : vm.options) {
    spec.args.push_back("--vm-option");
    spec.args.push_back(k + "=" + v);
  }
  spec.env = vm.env;
  return spec;
}

std::unique_ptr<WorkerProcess> WorkerProcess::start(const core::VmConfig& vm, const LaunchSpec& launch,
                                                    std::chrono::milliseconds startupTimeout,
                                                    std::chrono::milliseconds terminateGrace) {
  // a dead worker must surface as EPIPE on write, not kill the controller
  std::call_once(ignoreSigpipeOnce, [] { ::signal(SIGPIPE, SIG_IGN); });

  if (launch.executable.empty())
    throw WorkerStartupFailure("[WorkerProcess] VM " + vm.name + " has no executable");

  int toChild[2];
  int fromChild[2];
  if (::pipe2(toChild, O_CLOEXEC) != 0)
    throw WorkerStartupFailure("[WorkerProcess] " + errnoText("pipe2"));
  if (::pipe2(fromChild, O_CLOEXEC) != 0) {
    std::string err = errnoText("pipe2");
    closePair(toChild);
    throw WorkerStartupFailure("[WorkerProcess] " + err);
  }

  // everything the child needs is built before fork(): only async-signal-safe calls after it
  std::vector<std::string> argvStrings{ launch.executable };
  argvStrings.insert(argvStrings.end(), launch.args.begin(), launch.args.end());
  std::vector<std::string> envStrings = buildEnvironment(launch.env);
  std::vector<char*> argv = toArgv(argvStrings);
  std::vector<char*> envp = toArgv(envStrings);

  pid_t pid = ::fork();
  if (pid < 0) {
    std::string err = errnoText("fork");
    closePair(toChild);
    closePair(fromChild);
    throw WorkerStartupFailure("[WorkerProcess] " + err);
  }

  if (pid == 0) {
    // dup2 clears O_CLOEXEC on the targets
    ::dup2(toChild[0], STDIN_FILENO);
    ::dup2(fromChild[1], STDOUT_FILENO);
    ::execve(launch.executable.c_str(), argv.data(), envp.data());
    const char msg[] = "[WorkerProcess] execve failed\n";
    (void)!::write(STDERR_FILENO, msg, sizeof(msg) - 1);
    ::_exit(127);
  }

  ::close(toChild[0]);
  ::close(fromChild[1]);

  auto worker = std::make_unique<WorkerProcess>(
      std::make_unique<MessageChannel>(fromChild[0], toChild[1]), pid, vm.name, terminateGrace);
  worker->handshake(startupTimeout);
  return worker;
}

WorkerProcess::WorkerProcess(std::unique_ptr<MessageChannel> channel, pid_t pid, std::string vmName,
                             std::chrono::milliseconds terminateGrace)
    : channel_(std::move(channel)), pid_(pid), vmName_(std::move(vmName)),
      terminateGrace_(terminateGrace) {}

WorkerProcess::~WorkerProcess() { terminate(); }

void WorkerProcess::handshake(std::chrono::milliseconds timeout) {
  const auto deadline = Clock::now() + timeout;

  auto next = [&](const char* expected) -> LogMessage {
    ReceiveResult r;
    try {
      r = receive(remaining(deadline));
    } catch (const core::ProtocolError& e) {
      throw WorkerStartupFailure(std::string("[WorkerProcess] handshake garbage: ") + e.what());
    }
    if (std::holds_alternative<ChannelClosed>(r))
      throw WorkerStartupFailure("[WorkerProcess] worker exited before " + std::string(expected));
    if (std::holds_alternative<ReceiveTimeout>(r))
      throw WorkerStartupFailure("[WorkerProcess] no " + std::string(expected) + " within " +
                                 std::to_string(timeout.count()) + " ms");
    return std::get<LogMessage>(std::move(r));
  };

  try {
    LogMessage first = next("ProcessStarted");
    const auto* started = std::get_if<ProcessStarted>(&first);
    if (!started)
      throw WorkerStartupFailure(std::string("[WorkerProcess] expected ProcessStarted, got ") +
                                 typeName(first));
    started_ = *started;

    if (!send(HandshakeAck{}))
      throw WorkerStartupFailure("[WorkerProcess] channel closed while acknowledging start");

    LogMessage second = next("VmOptionsMessage");
    const auto* options = std::get_if<VmOptionsMessage>(&second);
    if (!options)
      throw WorkerStartupFailure(std::string("[WorkerProcess] expected VmOptionsMessage, got ") +
                                 typeName(second));
    vmOptions_ = options->options;
  } catch (const WorkerStartupFailure&) {
    kill();
    throw;
  }
}

bool WorkerProcess::send(const LogMessage& msg) {
  if (!channel_ || terminated_)
    return false;
  return channel_->writeLine(MessageCodec::toWire(msg));
}

ReceiveResult WorkerProcess::receive(std::chrono::milliseconds timeout) {
  if (!channel_ || terminated_)
    return ChannelClosed{};
  auto line = channel_->readLine(timeout);
  if (!line)
    return channel_->isOpen() ? ReceiveResult{ ReceiveTimeout{} } : ReceiveResult{ ChannelClosed{} };
  return MessageCodec::fromWire(*line);
}

void WorkerProcess::terminate() {
  if (terminated_)
    return;

  const auto deadline = Clock::now() + terminateGrace_;
  if (channel_ && channel_->isOpen() && send(StopWorkerRequest{})) {
    // wait for the ack (or EOF); anything else still in flight is discarded
    while (channel_->isOpen()) {
      auto line = channel_->readLine(remaining(deadline));
      if (!line)
        break;
      try {
        if (std::holds_alternative<StopWorkerAck>(MessageCodec::fromWire(*line)))
          break;
      } catch (const core::ProtocolError&) {
        continue; // teardown: trailing garbage is irrelevant
      }
    }
  }
  terminated_ = true;

  if (pid_ > 0) {
    while (!reap(false) && Clock::now() < deadline)
      std::this_thread::sleep_for(std::chrono::milliseconds{ 5 });
    if (!exitStatus_) {
      ::kill(pid_, SIGKILL);
      reap(true);
    }
  }
  if (channel_)
    channel_->close();
}

void WorkerProcess::kill() {
  if (terminated_)
    return;
  terminated_ = true;
  if (pid_ > 0 && !reap(false)) {
    ::kill(pid_, SIGKILL);
    reap(true);
  }
  if (channel_)
    channel_->close();
}

bool WorkerProcess::isAlive() {
  if (terminated_)
    return false;
  if (pid_ <= 0)
    return channel_ && channel_->isOpen();
  return !reap(false);
}

bool WorkerProcess::reap(bool block) {
  if (exitStatus_)
    return true;
  if (pid_ <= 0)
    return false;
  while (true) {
    int status = 0;
    pid_t r = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
    if (r == pid_) {
      exitStatus_ = status;
      return true;
    }
    if (r == 0)
      return false;
    if (errno == EINTR)
      continue;
    // ECHILD: somebody else reaped it; it is gone either way
    exitStatus_ = -1;
    return true;
  }
}

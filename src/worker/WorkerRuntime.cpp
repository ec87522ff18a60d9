/* @file WorkerRuntime.cpp
 * @brief worker process main loop
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstring> // for strerror
#include <iostream>
#include <stdexcept>
#include <typeinfo>
#include <utility>

// Linux headers
#include <errno.h>
#include <fcntl.h> // F_DUPFD_CLOEXEC
#include <unistd.h>

// Tempo headers
#include "core/Errors.hpp"
#include "protocols/MessageCodec.hpp"
#include "worker/WorkerRuntime.hpp"

using namespace tempo::worker;
using namespace tempo::protocols;

WorkerRuntime::WorkerRuntime(std::unique_ptr<io::MessageChannel> channel, WorkerOptions options)
    : channel_(std::move(channel)), options_(std::move(options)) {
  if (options_.workerId.empty())
    options_.workerId = "worker-" + std::to_string(::getpid());
}

void WorkerRuntime::registerTimedLoop(const std::string& name, TimedLoop fn) { timed_[name] = std::move(fn); }

void WorkerRuntime::registerValueMethod(const std::string& name, ValueMethod fn, std::string unit) {
  values_[name] = ValueEntry{ std::move(fn), std::move(unit) };
}

std::int64_t WorkerRuntime::now() const {
  if (options_.clock)
    return options_.clock();
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

std::int64_t WorkerRuntime::measureGranularity() const {
  std::int64_t best = 0;
  std::int64_t prev = now();
  for (int i = 0; i < 1000; ++i) {
    std::int64_t t = now();
    if (t > prev && (best == 0 || t - prev < best))
      best = t - prev;
    prev = t;
  }
  return best > 0 ? best : 1;
}

bool WorkerRuntime::emit(const LogMessage& msg) { return channel_->writeLine(MessageCodec::toWire(msg)); }

std::optional<LogMessage> WorkerRuntime::next() {
  while (channel_->isOpen()) {
    auto line = channel_->readLine(std::chrono::milliseconds{ 1000 });
    if (!line)
      continue;
    try {
      return MessageCodec::fromWire(*line);
    } catch (const core::ProtocolError& e) {
      std::cerr << "[WorkerRuntime] ignoring malformed request: " << e.what() << '\n';
    }
  }
  return std::nullopt;
}

int WorkerRuntime::run() {
  const std::int64_t granularity =
      options_.timerGranularityNanos ? *options_.timerGranularityNanos : measureGranularity();
  if (!emit(ProcessStarted{ options_.workerId, static_cast<std::int64_t>(::getpid()), granularity }))
    return 1;

  auto ack = next();
  if (!ack)
    return 0;
  if (!std::holds_alternative<HandshakeAck>(*ack)) {
    std::cerr << "[WorkerRuntime] expected HandshakeAck, got " << typeName(*ack) << '\n';
    return 2;
  }
  if (!emit(VmOptionsMessage{ options_.vmOptions }))
    return 1;

  while (auto msg = next()) {
    if (const auto* request = std::get_if<RunRequest>(&*msg)) {
      execute(*request);
    } else if (std::holds_alternative<StopWorkerRequest>(*msg)) {
      emit(StopWorkerAck{});
      return 0;
    } else {
      std::cerr << "[WorkerRuntime] unexpected " << typeName(*msg) << " ignored\n";
    }
  }
  return 0; // controller closed the channel
}

void WorkerRuntime::execute(const RunRequest& request) {
  const auto& loop = request.loop;
  try {
    if (loop.kind == WorkerLoopSpec::Kind::SingleInvocation) {
      auto it = values_.find(request.method);
      if (it == values_.end())
        throw std::invalid_argument("no value method named " + request.method);
      const double value = it->second.fn(request.parameters);
      if (!request.dryRun)
        emit(ArbitraryMeasurement{ value, it->second.unit, request.method });
    } else {
      auto it = timed_.find(request.method);
      if (it == timed_.end())
        throw std::invalid_argument("no timed-loop method named " + request.method);
      if (loop.reps < 1)
        throw std::invalid_argument("reps must be >= 1");

      std::int64_t boxed = 0;
      do {
        const std::int64_t start = now();
        it->second(loop.reps, request.parameters);
        const std::int64_t elapsed = now() - start;
        boxed += elapsed;
        if (!request.dryRun)
          emit(RuntimeMeasurement{ loop.reps, elapsed });
      } while (!request.dryRun && loop.kind == WorkerLoopSpec::Kind::TimeBoxed && boxed < loop.timeBoxNanos);
    }
    if (request.dryRun)
      emit(DryRunSuccessLogMessage{ { request.trialId } });
  } catch (const std::exception& e) {
    emit(FailureLogMessage{ typeid(e).name(), e.what(), {} });
  }
  emit(StopMeasurementLogMessage{ request.trialId });
}

WorkerOptions WorkerRuntime::parseArgs(int argc, char** argv) {
  WorkerOptions options;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--vm-option" && i + 1 < argc) {
      std::string kv = argv[++i];
      auto eq = kv.find('=');
      if (eq == std::string::npos)
        options.vmOptions[kv] = "";
      else
        options.vmOptions[kv.substr(0, eq)] = kv.substr(eq + 1);
    } else if (arg == "--worker-id" && i + 1 < argc) {
      options.workerId = argv[++i];
    } else {
      options.extraArgs.push_back(std::move(arg));
    }
  }
  return options;
}

std::unique_ptr<tempo::io::MessageChannel> WorkerRuntime::stdioChannel() {
  int out = ::fcntl(STDOUT_FILENO, F_DUPFD_CLOEXEC, 3);
  if (out < 0)
    throw std::runtime_error(std::string("[WorkerRuntime] dup stdout: ") + strerror(errno));
  // benchmark code printing to stdout must not corrupt the channel
  if (::dup2(STDERR_FILENO, STDOUT_FILENO) < 0) {
    std::string err = strerror(errno);
    ::close(out);
    throw std::runtime_error("[WorkerRuntime] redirect stdout: " + err);
  }
  return std::make_unique<io::MessageChannel>(STDIN_FILENO, out);
}

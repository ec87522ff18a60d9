#pragma once
/** @file  LogMessage.hpp
 *  @brief Closed set of messages exchanged between controller and worker.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace tempo::protocols {

  /// Parameter assignment of one trial: parameter name -> textual value.
  using Parameters = std::map<std::string, std::string>;

  /// Message kinds a worker loop may be asked to emit.
  enum class MessageKind : std::uint8_t {
    RuntimeMeasurement,
    ArbitraryMeasurement,
    GcLogMessage,
  };

  /**
 * @struct WorkerLoopSpec
 * @brief How the worker should invoke a benchmark method for one execution.
 *
 *  * FixedReps        one timed call with `reps` iterations.
 *  * TimeBoxed        timed calls of `reps` iterations until `timeBoxNanos` elapsed.
 *  * SingleInvocation one call of a value-returning method.
 */
  struct WorkerLoopSpec {
    enum class Kind : std::uint8_t { FixedReps, TimeBoxed, SingleInvocation };

    Kind kind{ Kind::FixedReps };
    std::int64_t reps{ 1 };
    std::int64_t timeBoxNanos{ 0 };
    std::set<MessageKind> emits{};

    bool operator==(const WorkerLoopSpec&) const = default;
  };

  //---worker -> controller: handshake -------------------------------------
  struct ProcessStarted {
    std::string workerId{};
    std::int64_t pid{ 0 };
    std::int64_t timerGranularityNanos{ 1 };
    bool operator==(const ProcessStarted&) const = default;
  };

  //---controller -> worker: handshake ack ----------------------------------
  struct HandshakeAck {
    bool operator==(const HandshakeAck&) const = default;
  };

  /// Worker echoes the VM options it was launched with.
  struct VmOptionsMessage {
    std::map<std::string, std::string> options{};
    bool operator==(const VmOptionsMessage&) const = default;
  };

  //---controller -> worker: one execution ---------------------------------
  struct RunRequest {
    std::int64_t trialId{ 0 };
    std::string method{};
    Parameters parameters{};
    WorkerLoopSpec loop{};
    bool dryRun{ false };
    bool operator==(const RunRequest&) const = default;
  };

  struct RuntimeMeasurement {
    std::int64_t reps{ 0 };
    std::int64_t elapsedNanos{ 0 };
    bool operator==(const RuntimeMeasurement&) const = default;
  };

  struct ArbitraryMeasurement {
    double value{ 0.0 };
    std::string unit{};
    std::string description{};
    bool operator==(const ArbitraryMeasurement&) const = default;
  };

  struct GcLogMessage {
    enum class Kind : std::uint8_t { Minor, Major };
    Kind kind{ Kind::Minor };
    std::int64_t durationNanos{ 0 };
    std::string description{};
    bool operator==(const GcLogMessage&) const = default;
  };

  struct FailureLogMessage {
    std::string exceptionType{};
    std::string message{};
    std::string stackTrace{}; ///< optional, may be empty
    bool operator==(const FailureLogMessage&) const = default;
  };

  /// Terminates the messages belonging to one RunRequest.
  struct StopMeasurementLogMessage {
    std::int64_t trialId{ 0 };
    bool operator==(const StopMeasurementLogMessage&) const = default;
  };

  /// Trial ids whose dry run completed without failure.
  struct DryRunSuccessLogMessage {
    std::vector<std::int64_t> ids{};
    bool operator==(const DryRunSuccessLogMessage&) const = default;
  };

  //---graceful stop ---------------------------------------------------------
  struct StopWorkerRequest {
    bool operator==(const StopWorkerRequest&) const = default;
  };

  struct StopWorkerAck {
    bool operator==(const StopWorkerAck&) const = default;
  };

  using LogMessage =
      std::variant<ProcessStarted, HandshakeAck, VmOptionsMessage, RunRequest, RuntimeMeasurement,
                   ArbitraryMeasurement, GcLogMessage, FailureLogMessage,
                   StopMeasurementLogMessage, DryRunSuccessLogMessage, StopWorkerRequest,
                   StopWorkerAck>;

  /// Stable wire name of the active alternative (e.g. "RunRequest").
  const char* typeName(const LogMessage& msg);

} // namespace tempo::protocols

/* @file MessageCodec.cpp
 * @brief JSON encode / decode of every LogMessage alternative
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cmath>
#include <cstdint>
#include <iterator>
#include <limits>
#include <type_traits>

// Third-party headers
#include <nlohmann/json.hpp>

// Tempo headers
#include "core/Errors.hpp"
#include "protocols/MessageCodec.hpp"

using namespace tempo::protocols;
using nlohmann::json;
using tempo::core::ProtocolError;

namespace {

  // Non-finite doubles travel as strings so the instrument, not the codec, rejects them.
  json putDouble(double v) {
    if (std::isnan(v))
      return "nan";
    if (std::isinf(v))
      return v > 0 ? "inf" : "-inf";
    return v;
  }

  double getDouble(const json& j) {
    if (j.is_number())
      return j.get<double>();
    if (j.is_string()) {
      const auto s = j.get<std::string>();
      if (s == "nan")
        return std::numeric_limits<double>::quiet_NaN();
      if (s == "inf")
        return std::numeric_limits<double>::infinity();
      if (s == "-inf")
        return -std::numeric_limits<double>::infinity();
    }
    throw ProtocolError("[MessageCodec] expected a number, got " + j.dump());
  }

  // Integral fields must be JSON integers that fit in int64; fractions and exponents are rejected.
  std::int64_t getInt(const json& j) {
    if (j.is_number_unsigned()) {
      const auto u = j.get<std::uint64_t>();
      if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
        throw ProtocolError("[MessageCodec] integer out of range: " + j.dump());
      return static_cast<std::int64_t>(u);
    }
    if (!j.is_number_integer())
      throw ProtocolError("[MessageCodec] expected an integer, got " + j.dump());
    return j.get<std::int64_t>();
  }

  std::int64_t getInt(const json& j, const char* key) {
    return getInt(j.at(key));
  }

  const char* kindName(MessageKind k) {
    switch (k) {
    case MessageKind::RuntimeMeasurement:
      return "RuntimeMeasurement";
    case MessageKind::ArbitraryMeasurement:
      return "ArbitraryMeasurement";
    case MessageKind::GcLogMessage:
      return "GcLogMessage";
    }
    return "Unknown";
  }

  MessageKind kindFromName(const std::string& s) {
    if (s == "RuntimeMeasurement")
      return MessageKind::RuntimeMeasurement;
    if (s == "ArbitraryMeasurement")
      return MessageKind::ArbitraryMeasurement;
    if (s == "GcLogMessage")
      return MessageKind::GcLogMessage;
    throw ProtocolError("[MessageCodec] unknown message kind: " + s);
  }

  const char* loopKindName(WorkerLoopSpec::Kind k) {
    switch (k) {
    case WorkerLoopSpec::Kind::FixedReps:
      return "fixed-reps";
    case WorkerLoopSpec::Kind::TimeBoxed:
      return "time-boxed";
    case WorkerLoopSpec::Kind::SingleInvocation:
      return "single-invocation";
    }
    return "unknown";
  }

  WorkerLoopSpec::Kind loopKindFromName(const std::string& s) {
    if (s == "fixed-reps")
      return WorkerLoopSpec::Kind::FixedReps;
    if (s == "time-boxed")
      return WorkerLoopSpec::Kind::TimeBoxed;
    if (s == "single-invocation")
      return WorkerLoopSpec::Kind::SingleInvocation;
    throw ProtocolError("[MessageCodec] unknown loop kind: " + s);
  }

  json encodeLoop(const WorkerLoopSpec& loop) {
    json emits = json::array();
    for (auto k : loop.emits)
      emits.push_back(kindName(k));
    return json{ { "kind", loopKindName(loop.kind) },
                 { "reps", loop.reps },
                 { "timeBoxNanos", loop.timeBoxNanos },
                 { "emits", emits } };
  }

  WorkerLoopSpec decodeLoop(const json& j) {
    WorkerLoopSpec loop;
    loop.kind = loopKindFromName(j.at("kind").get<std::string>());
    loop.reps = getInt(j, "reps");
    loop.timeBoxNanos = getInt(j, "timeBoxNanos");
    for (const auto& e : j.at("emits"))
      loop.emits.insert(kindFromName(e.get<std::string>()));
    return loop;
  }

  json encodeBody(const ProcessStarted& m) {
    return { { "workerId", m.workerId },
             { "pid", m.pid },
             { "timerGranularityNanos", m.timerGranularityNanos } };
  }
  json encodeBody(const HandshakeAck&) { return json::object(); }
  json encodeBody(const VmOptionsMessage& m) { return { { "options", m.options } }; }
  json encodeBody(const RunRequest& m) {
    return { { "trialId", m.trialId },
             { "method", m.method },
             { "parameters", m.parameters },
             { "loop", encodeLoop(m.loop) },
             { "dryRun", m.dryRun } };
  }
  json encodeBody(const RuntimeMeasurement& m) {
    return { { "reps", m.reps }, { "elapsedNanos", m.elapsedNanos } };
  }
  json encodeBody(const ArbitraryMeasurement& m) {
    return { { "value", putDouble(m.value) },
             { "unit", m.unit },
             { "description", m.description } };
  }
  json encodeBody(const GcLogMessage& m) {
    return { { "kind", m.kind == GcLogMessage::Kind::Major ? "major" : "minor" },
             { "durationNanos", m.durationNanos },
             { "description", m.description } };
  }
  json encodeBody(const FailureLogMessage& m) {
    return { { "exceptionType", m.exceptionType },
             { "message", m.message },
             { "stackTrace", m.stackTrace } };
  }
  json encodeBody(const StopMeasurementLogMessage& m) { return { { "trialId", m.trialId } }; }
  json encodeBody(const DryRunSuccessLogMessage& m) { return { { "ids", m.ids } }; }
  json encodeBody(const StopWorkerRequest&) { return json::object(); }
  json encodeBody(const StopWorkerAck&) { return json::object(); }

  LogMessage decodeBody(const std::string& type, const json& j) {
    if (type == "ProcessStarted") {
      ProcessStarted m;
      m.workerId = j.at("workerId").get<std::string>();
      m.pid = getInt(j, "pid");
      m.timerGranularityNanos = getInt(j, "timerGranularityNanos");
      return m;
    }
    if (type == "HandshakeAck")
      return HandshakeAck{};
    if (type == "VmOptionsMessage") {
      VmOptionsMessage m;
      m.options = j.at("options").get<std::map<std::string, std::string>>();
      return m;
    }
    if (type == "RunRequest") {
      RunRequest m;
      m.trialId = getInt(j, "trialId");
      m.method = j.at("method").get<std::string>();
      m.parameters = j.at("parameters").get<Parameters>();
      m.loop = decodeLoop(j.at("loop"));
      m.dryRun = j.at("dryRun").get<bool>();
      return m;
    }
    if (type == "RuntimeMeasurement") {
      RuntimeMeasurement m;
      m.reps = getInt(j, "reps");
      m.elapsedNanos = getInt(j, "elapsedNanos");
      return m;
    }
    if (type == "ArbitraryMeasurement") {
      ArbitraryMeasurement m;
      m.value = getDouble(j.at("value"));
      m.unit = j.at("unit").get<std::string>();
      m.description = j.at("description").get<std::string>();
      return m;
    }
    if (type == "GcLogMessage") {
      GcLogMessage m;
      const auto kind = j.at("kind").get<std::string>();
      if (kind != "major" && kind != "minor")
        throw ProtocolError("[MessageCodec] unknown gc kind: " + kind);
      m.kind = kind == "major" ? GcLogMessage::Kind::Major : GcLogMessage::Kind::Minor;
      m.durationNanos = getInt(j, "durationNanos");
      m.description = j.at("description").get<std::string>();
      return m;
    }
    if (type == "FailureLogMessage") {
      FailureLogMessage m;
      m.exceptionType = j.at("exceptionType").get<std::string>();
      m.message = j.at("message").get<std::string>();
      m.stackTrace = j.value("stackTrace", std::string{});
      return m;
    }
    if (type == "StopMeasurementLogMessage") {
      StopMeasurementLogMessage m;
      m.trialId = getInt(j, "trialId");
      return m;
    }
    if (type == "DryRunSuccessLogMessage") {
      DryRunSuccessLogMessage m;
      const auto& ids = j.at("ids");
      if (!ids.is_array())
        throw ProtocolError("[MessageCodec] ids must be an array, got " + ids.dump());
      for (const auto& id : ids)
        m.ids.push_back(getInt(id));
      return m;
    }
    if (type == "StopWorkerRequest")
      return StopWorkerRequest{};
    if (type == "StopWorkerAck")
      return StopWorkerAck{};

    throw ProtocolError("[MessageCodec] unknown message type: " + type);
  }

} // namespace

const char* tempo::protocols::typeName(const LogMessage& msg) {
  static constexpr const char* kNames[] = {
    "ProcessStarted",       "HandshakeAck",       "VmOptionsMessage",
    "RunRequest",           "RuntimeMeasurement", "ArbitraryMeasurement",
    "GcLogMessage",         "FailureLogMessage",  "StopMeasurementLogMessage",
    "DryRunSuccessLogMessage", "StopWorkerRequest", "StopWorkerAck",
  };
  static_assert(std::size(kNames) == std::variant_size_v<LogMessage>,
                "LogMessage alternatives changed please update kNames");
  return kNames[msg.index()];
}

std::string MessageCodec::toWire(const LogMessage& msg) {
  json body = std::visit([](const auto& m) { return encodeBody(m); }, msg);
  body["type"] = typeName(msg);
  return body.dump();
}

LogMessage MessageCodec::fromWire(const std::string& line) {
  try {
    const json j = json::parse(line);
    if (!j.is_object())
      throw ProtocolError("[MessageCodec] message is not a JSON object");
    if (!j.contains("type") || !j.at("type").is_string())
      throw ProtocolError("[MessageCodec] message has no type");
    return decodeBody(j.at("type").get<std::string>(), j);
  } catch (const json::exception& e) {
    throw ProtocolError(std::string("[MessageCodec] malformed message: ") + e.what());
  }
}

#pragma once
/** @file  Errors.hpp
 *  @brief Exception taxonomy shared by the controller and the worker runtime.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>

namespace tempo::core {

  /**
 * @class ConfigurationError
 * @brief Fatal for the whole run; always raised before any worker is spawned.
 */
  class ConfigurationError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  /// Instrument selection problems (unknown, unconfigured or none left).
  class InvalidCommandException : public ConfigurationError {
  public:
    using ConfigurationError::ConfigurationError;
  };

  /// Benchmark target problems (overloads, unknown method names, bad signatures).
  class InvalidBenchmarkException : public ConfigurationError {
  public:
    using ConfigurationError::ConfigurationError;
  };

  /// Unrecognised or malformed bytes on a worker channel.
  class ProtocolError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  class WorkerStartupFailure : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  class CalibrationFailure : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  /// Raised by an Instrument for non-finite / negative values or weight < 1.
  class MeasurementFailure : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  /// The worker closed its channel while a request was outstanding.
  class WorkerCrashed : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  class TrialTimedOut : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  /// The benchmark itself failed inside the worker (FailureLogMessage).
  class TrialFailure : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

} // namespace tempo::core

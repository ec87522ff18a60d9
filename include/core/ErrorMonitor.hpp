#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central warning / failure aggregator for one run.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace tempo::core {

  struct RunEvent {
    enum class Severity { Warning, Failure };

    Severity severity{ Severity::Warning };
    std::string source{};  ///< e.g. "InstrumentSelection", "trial 3"
    std::string message{};

    bool operator==(const RunEvent&) const = default;
  };

  /**
 * @class ErrorMonitor
 * @brief Other threads call `notifyWarning()` / `notifyFailure()`; events are
 *        kept for the final report and forwarded once to the listener.
 *
 * * Thread-safe (mutex-protected vector).
 * * Debounces duplicate events so the listener doesn’t get spammed.
 */
  class ErrorMonitor {
  public:
    ErrorMonitor() = default;
    virtual ~ErrorMonitor() = default;

    /// Register a lambda that sees every new event (e.g. to log it live).
    void registerListener(std::function<void(const RunEvent&)> cb);

    virtual void notifyWarning(const std::string& source, const std::string& message);
    virtual void notifyFailure(const std::string& source, const std::string& message);

    /// Snapshot in arrival order.
    std::vector<RunEvent> events() const;

  private:
    void forwardIfNew(RunEvent event);

    std::function<void(const RunEvent&)> listener_{};
    std::vector<RunEvent> seen_; ///< de-dupe list, also the report's event stream
    mutable std::mutex mtx_;
  };

} // namespace tempo::core

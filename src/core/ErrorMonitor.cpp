/* @file ErrorMonitor.cpp
 * @brief de-duplicating event collector
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <utility>

// Tempo headers
#include "core/ErrorMonitor.hpp"

namespace tempo {
  namespace core {

    void ErrorMonitor::registerListener(std::function<void(const RunEvent&)> cb) {
      std::lock_guard<std::mutex> lock(mtx_);
      listener_ = std::move(cb);
    }

    void ErrorMonitor::notifyWarning(const std::string& source, const std::string& message) {
      forwardIfNew(RunEvent{ RunEvent::Severity::Warning, source, message });
    }

    void ErrorMonitor::notifyFailure(const std::string& source, const std::string& message) {
      forwardIfNew(RunEvent{ RunEvent::Severity::Failure, source, message });
    }

    std::vector<RunEvent> ErrorMonitor::events() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return seen_;
    }

    void ErrorMonitor::forwardIfNew(RunEvent event) {
      std::function<void(const RunEvent&)> listener;
      {
        std::lock_guard<std::mutex> lock(mtx_);
        if (std::find(seen_.begin(), seen_.end(), event) != seen_.end())
          return;
        seen_.push_back(event);
        listener = listener_;
      }
      // called outside the lock so a listener may query events()
      if (listener)
        listener(event);
    }

  } // namespace core
} // namespace tempo

/* @file ErrorMonitor.cpp
 * @brief de-duplicating fault escalation
 *
 * © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

// STL headers
#include <algorithm>

// Booth headers
#include "core/ErrorMonitor.hpp"

namespace booth {
  namespace core {

    void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
      std::lock_guard<std::mutex> lock(mtx_);
      escalation_ = std::move(cb);
    }

    void ErrorMonitor::notifyFailure(const std::string& message) { forwardIfNew(message); }

    void ErrorMonitor::reset() {
      std::lock_guard<std::mutex> lock(mtx_);
      seen_.clear();
    }

    std::size_t ErrorMonitor::uniqueFailures() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return seen_.size();
    }

    void ErrorMonitor::forwardIfNew(const std::string& message) {
      std::function<void(const std::string&)> cb;
      {
        std::lock_guard<std::mutex> lock(mtx_);
        if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
          return;
        seen_.push_back(message);
        cb = escalation_;
      }
      // called outside the lock so the callback may log or re-enter
      if (cb)
        cb(message);
    }

  } // namespace core
} // namespace booth

#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central hardware-fault aggregator & escalation helper.
 *
 *  © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace booth::core {

  /**
 * @class ErrorMonitor
 * @brief Camera and GPIO adapters call `notifyFailure()`; we call the registered
 *        escalation callback exactly once per unique error.
 *
 * * Thread-safe (mutex-protected vector).
 * * Debounces duplicate failures so a dead camera at 20 Hz doesn’t flood the log.
 * * `reset()` re-arms every message once the fault has cleared.
 */
  class ErrorMonitor {
  public:
    ErrorMonitor() = default;
    virtual ~ErrorMonitor() = default;

    /// Register a lambda that escalates a fault (log line, operator notice).
    void registerEscalation(std::function<void(const std::string&)> cb);

    /// Called by subsystems on fault; will forward to the escalation callback.
    virtual void notifyFailure(const std::string& message);

    /// Subsystem recovered; forget seen messages.
    virtual void reset();

    std::size_t uniqueFailures() const;

  private:
    void forwardIfNew(const std::string& message);

    std::function<void(const std::string&)> escalation_{};
    std::vector<std::string> seen_; ///< de-dupe list
    mutable std::mutex mtx_;
  };

} // namespace booth::core

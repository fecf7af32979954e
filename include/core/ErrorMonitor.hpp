#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central fault aggregator & escalation helper.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace salvage::core {

  /**
 * @class ErrorMonitor
 * @brief Subsystems call `notifyFailure()`; we call the registered
 *        escalation callback exactly once per unique error.
 *
 * * Thread-safe (mutex-protected vector); the Logger worker may report too.
 * * Debounces duplicate failures so the front end doesn’t get spammed.
 * * The callback runs outside the lock, so it may call back into the monitor.
 */
  class ErrorMonitor {
  public:
    ErrorMonitor() = default;
    virtual ~ErrorMonitor() = default;

    /// Register a lambda that escalates a fault to the front end / run log.
    void registerEscalation(std::function<void(const std::string&)> cb);

    /// Called by subsystems on fault; will forward to the escalation callback.
    virtual void notifyFailure(const std::string& message);

    /// Number of distinct failures seen so far.
    std::size_t failureCount() const;

    /// Forget the de-dupe list (a new session may legitimately hit the same fault).
    void clear();

  private:
    bool markIfNew(const std::string& message);

    std::function<void(const std::string&)> escalation_{};
    std::vector<std::string> seen_; ///< de-dupe list
    mutable std::mutex mtx_;
  };

} // namespace salvage::core

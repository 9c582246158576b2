#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central fault aggregator & escalation helper.
 *
 *  © 2025 Avior Driver contributors — MIT-licensed.
 */

#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>

namespace avior::core {

  /**
 * @class ErrorMonitor
 * @brief Sessions call `notifyFailure()` before throwing; we call the registered
 *        escalation callback exactly once per unique error.
 *
 * * Thread-safe (mutex-protected deque).
 * * Debounces duplicate failures so a flapping link doesn't spam the host.
 * * Remembers at most `maxTracked` messages; the oldest is forgotten first.
 */
  class ErrorMonitor {
  public:
    static constexpr std::size_t kDefaultMaxTracked = 64;

    explicit ErrorMonitor(std::size_t maxTracked = kDefaultMaxTracked);
    virtual ~ErrorMonitor() = default;

    /// Register a lambda that escalates a fault to the host application.
    void registerEscalation(std::function<void(const std::string&)> cb);

    /// Called by sessions on fault; will forward to the escalation callback.
    virtual void notifyFailure(const std::string& message);

    /// Number of distinct failures currently remembered.
    std::size_t distinctFailures() const;

    /// Forget the de-dupe list, e.g. after the host replaced a dead connection.
    void reset();

  private:
    void forwardIfNew(const std::string& message);

    std::function<void(const std::string&)> escalation_{};
    std::size_t maxTracked_;
    std::deque<std::string> seen_; ///< de-dupe list, oldest first
    mutable std::mutex mtx_;
  };

} // namespace avior::core

/* @file ErrorMonitor.cpp
 * @brief de-duplicating fault fan-in for the Avior sessions
 *
 * © 2025 Avior Driver contributors — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <stdexcept>

// Avior headers
#include "core/ErrorMonitor.hpp"

namespace avior {
  namespace core {

    ErrorMonitor::ErrorMonitor(std::size_t maxTracked) : maxTracked_(maxTracked) {
      if (maxTracked_ == 0)
        throw std::invalid_argument("[ErrorMonitor] maxTracked must be > 0");
    }

    void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
      std::lock_guard<std::mutex> lock(mtx_);
      escalation_ = std::move(cb);
    }

    void ErrorMonitor::notifyFailure(const std::string& message) { forwardIfNew(message); }

    std::size_t ErrorMonitor::distinctFailures() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return seen_.size();
    }

    void ErrorMonitor::reset() {
      std::lock_guard<std::mutex> lock(mtx_);
      seen_.clear();
    }

    void ErrorMonitor::forwardIfNew(const std::string& message) {
      std::function<void(const std::string&)> cb;
      {
        std::lock_guard<std::mutex> lock(mtx_);
        if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
          return;
        if (seen_.size() == maxTracked_)
          seen_.pop_front();
        seen_.push_back(message);
        cb = escalation_;
      }
      // invoked outside the lock so the callback may call back into us
      if (cb)
        cb(message);
    }

  } // namespace core
} // namespace avior

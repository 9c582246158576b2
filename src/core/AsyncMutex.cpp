/* @file AsyncMutex.cpp
 * @brief timer-parked FIFO lock for the cooperative session
 *
 * © 2025 Avior Driver contributors — MIT-licensed.
 */

// STL headers
#include <utility>

// 3rd-party headers
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

// Avior headers
#include "core/AsyncMutex.hpp"

namespace avior::core {

  namespace asio = boost::asio;

  asio::awaitable<void> AsyncMutex::lock() {
    if (!locked_) {
      locked_ = true;
      co_return;
    }

    auto waiter = std::make_shared<asio::steady_timer>(io_, asio::steady_timer::time_point::max());
    waiters_.push_back(waiter);

    boost::system::error_code ec;
    co_await waiter->async_wait(asio::redirect_error(asio::use_awaitable, ec));
    // woken by unlock(): locked_ was left true on our behalf
  }

  bool AsyncMutex::tryLock() {
    if (locked_)
      return false;
    locked_ = true;
    return true;
  }

  void AsyncMutex::unlock() {
    if (waiters_.empty()) {
      locked_ = false;
      return;
    }
    auto next = std::move(waiters_.front());
    waiters_.pop_front();
    next->cancel();
  }

} // namespace avior::core

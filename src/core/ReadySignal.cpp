/* @file ReadySignal.cpp
 * @brief shared never-expiring timer doubles as the waiter list
 *
 * © 2025 Avior Driver contributors — MIT-licensed.
 */

// STL headers
#include <utility>

// 3rd-party headers
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

// Avior headers
#include "core/ReadySignal.hpp"

namespace avior::core {

  namespace asio = boost::asio;

  ReadySignal::ReadySignal(asio::io_context& io)
      : timer_(io, asio::steady_timer::time_point::max()) {}

  asio::awaitable<bool> ReadySignal::wait() {
    while (state_ == State::Pending) {
      boost::system::error_code ec;
      co_await timer_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
    }
    co_return state_ == State::Ready;
  }

  void ReadySignal::set() {
    if (state_ != State::Pending)
      return;
    state_ = State::Ready;
    wakeAll();
  }

  void ReadySignal::fail(std::string reason) {
    if (state_ != State::Pending)
      return;
    state_ = State::Failed;
    reason_ = std::move(reason);
    wakeAll();
  }

  void ReadySignal::wakeAll() { timer_.cancel(); }

} // namespace avior::core

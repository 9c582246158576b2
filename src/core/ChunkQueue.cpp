/* @file ChunkQueue.cpp
 * @brief timed pop: the deadline timer is cancelled early by push()/close()
 *
 * © 2025 Avior Driver contributors — MIT-licensed.
 */

// STL headers
#include <utility>

// 3rd-party headers
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

// Avior headers
#include "core/ChunkQueue.hpp"

namespace avior::core {

  namespace asio = boost::asio;

  void ChunkQueue::push(std::string_view chunk) {
    if (closed_ || chunk.empty())
      return;
    chunks_.emplace_back(chunk);
    if (waiting_)
      timer_.cancel();
  }

  void ChunkQueue::close() {
    closed_ = true;
    if (waiting_)
      timer_.cancel();
  }

  asio::awaitable<std::optional<std::string>> ChunkQueue::pop(std::chrono::milliseconds timeout) {
    if (chunks_.empty() && !closed_) {
      timer_.expires_after(timeout);
      waiting_ = true;
      boost::system::error_code ec;
      co_await timer_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
      waiting_ = false;
    }
    // the queue, not the timer's error code, decides: a cancel can race the expiry
    if (chunks_.empty())
      co_return std::nullopt;

    std::string chunk = std::move(chunks_.front());
    chunks_.pop_front();
    co_return chunk;
  }

} // namespace avior::core

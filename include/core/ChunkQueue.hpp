#pragma once
/** @file  ChunkQueue.hpp
 *  @brief Inbound chunk queue fed by the link's push callback.
 *
 *  © 2025 Avior Driver contributors — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

// 3rd-party headers
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

namespace avior::core {

  /**
 * @class ChunkQueue
 * @brief `push()` from the link, `pop()` from the (single) transaction holding the lock.
 *
 *  * `pop()` waits at most `timeout` for the next chunk; std::nullopt means nothing came
 *    (or the queue was closed, see `closed()`).
 *  * One consumer at a time; the AsyncMutex guarantees that.
 */
  class ChunkQueue {
  public:
    explicit ChunkQueue(boost::asio::io_context& io) : timer_(io) {}

    void push(std::string_view chunk);
    void clear() { chunks_.clear(); }
    void close();

    boost::asio::awaitable<std::optional<std::string>> pop(std::chrono::milliseconds timeout);

    bool empty() const { return chunks_.empty(); }
    bool closed() const { return closed_; }

  private:
    std::deque<std::string> chunks_;
    boost::asio::steady_timer timer_;
    bool waiting_{ false };
    bool closed_{ false };
  };

} // namespace avior::core

#pragma once
/** @file  AsyncMutex.hpp
 *  @brief FIFO-fair, single-owner lock for coroutines on one io_context.
 *
 *  © 2025 Avior Driver contributors — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex> // std::adopt_lock_t
#include <utility>

// 3rd-party headers
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

namespace avior::core {

  /**
 * @class AsyncMutex
 * @brief Waiters park on a never-expiring timer; `unlock()` hands ownership straight to
 *        the oldest waiter by cancelling its timer.
 *
 *  * Suspends the coroutine, never the io thread.
 *  * Not thread-safe: every call must come from the io_context's (single) thread.
 */
  class AsyncMutex {
  public:
    explicit AsyncMutex(boost::asio::io_context& io) : io_(io) {}

    boost::asio::awaitable<void> lock();
    bool tryLock();
    void unlock();

    bool locked() const { return locked_; }
    std::size_t waiting() const { return waiters_.size(); }

    /// Releases on scope exit, exceptions included.
    class Guard {
    public:
      Guard(AsyncMutex& mutex, std::adopt_lock_t) : mutex_(&mutex) {}
      ~Guard() {
        if (mutex_)
          mutex_->unlock();
      }
      Guard(const Guard&) = delete;
      Guard& operator=(const Guard&) = delete;

    private:
      AsyncMutex* mutex_;
    };

    AsyncMutex(const AsyncMutex&) = delete;
    AsyncMutex& operator=(const AsyncMutex&) = delete;

  private:
    boost::asio::io_context& io_;
    bool locked_{ false };
    std::deque<std::shared_ptr<boost::asio::steady_timer>> waiters_;
  };

} // namespace avior::core

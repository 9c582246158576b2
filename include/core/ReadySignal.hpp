#pragma once
/** @file  ReadySignal.hpp
 *  @brief One-time "link established" event awaited by every async transaction.
 *
 *  © 2025 Avior Driver contributors — MIT-licensed.
 */

// STL headers
#include <string>
#include <utility>

// 3rd-party headers
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

namespace avior::core {

  /**
 * @class ReadySignal
 * @brief Pending until `set()` or `fail()`; both wake every waiter and are final.
 *
 *  * Same threading rule as AsyncMutex: io_context thread only.
 */
  class ReadySignal {
  public:
    enum class State { Pending, Ready, Failed };

    explicit ReadySignal(boost::asio::io_context& io);

    /// Resolves immediately once the state is final.  true = Ready.
    boost::asio::awaitable<bool> wait();

    void set();
    void fail(std::string reason);

    State state() const { return state_; }
    const std::string& reason() const { return reason_; }

  private:
    void wakeAll();

    boost::asio::steady_timer timer_;
    State state_{ State::Pending };
    std::string reason_{};
  };

} // namespace avior::core

#pragma once
/** @file  AsyncSession.hpp
 *  @brief Cooperative (Boost.Asio coroutine) transaction serializer over one AsyncLink.
 *
 *  © 2025 Avior Driver contributors — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

// 3rd-party headers
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

// Avior headers
#include "core/AsyncMutex.hpp"
#include "core/ChunkQueue.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/ReadySignal.hpp"
#include "core/SessionReporter.hpp"
#include "io/AsyncLink.hpp"
#include "protocols/Command.hpp"

namespace avior {
  namespace core {

    /**
 * @class AsyncSession
 * @brief Same contract as BlockingSession, but callers are coroutines.
 *
 *  * Suspension points: the connection-ready signal, the FIFO AsyncMutex, each inbound chunk.
 *  * The link pushes chunks into `inbox_`; a transaction clears it before writing.
 *  * Must be driven from a single io_context thread (no internal strand).
 */
    class AsyncSession {
    public:
      using result_type = boost::asio::awaitable<std::string>;

      AsyncSession(boost::asio::io_context& io, std::unique_ptr<io::AsyncLink> link,
                   std::chrono::milliseconds timeout, std::shared_ptr<ErrorMonitor> errorMonitor,
                   std::shared_ptr<Logger> logger = nullptr);
      ~AsyncSession();

      //---public APIs------------------------------------------------------
      /// Start opening the link.  Returns at once; transactions wait for the ready signal.
      void connect();
      result_type transact(protocols::EncodedRequest request, std::size_t skip = 0);
      void close();

      bool connected() const { return ready_.state() == ReadySignal::State::Ready && !lost_; }
      void warn(const std::string& message) const { reporter_.warn(message); }
      std::chrono::milliseconds timeout() const { return timeout_; }

      AsyncSession(const AsyncSession&) = delete;
      AsyncSession& operator=(const AsyncSession&) = delete;

    private:
      void onConnected();
      void onData(std::string_view chunk);
      void onLost(const std::string& reason);
      void shutdown(const std::string& reason);

      std::unique_ptr<io::AsyncLink> link_;
      std::chrono::milliseconds timeout_;
      SessionReporter reporter_;
      AsyncMutex mutex_;
      ReadySignal ready_;
      ChunkQueue inbox_;
      bool started_{ false };
      bool lost_{ false };
    };

  } // namespace core
} // namespace avior

#pragma once
/** @file  AsyncLink.hpp
 *  @brief Event-driven byte stream to the switch (Boost.Asio), push-style receive.
 *
 *  © 2025 Avior Driver contributors — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

// 3rd-party headers
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

// Avior headers
#include "io/PortLocator.hpp"

namespace avior {
  namespace io {

    /**
 * @class AsyncLink
 * @brief Transport half of the cooperative session.
 *
 *  * `start()` opens the link; completion is reported through `onConnected` exactly once,
 *    or `onLost` if the link never came up.
 *  * Every inbound chunk is pushed through `onData`; nothing is buffered here.
 *  * All handlers run on the owning io_context thread.
 */
    class AsyncLink {
    public:
      struct Handlers {
        std::function<void()> onConnected;
        std::function<void(std::string_view chunk)> onData;
        std::function<void(const std::string& reason)> onLost; ///< open failure, EOF, I/O error
      };

      virtual ~AsyncLink() = default;

      virtual void start(Handlers handlers) = 0;

      /// Drop driver-level unread input / unsent output.  False if the link is down.
      virtual bool resetBuffers() = 0;

      /// Write all of \p bytes; throws `boost::system::system_error` on failure.
      virtual boost::asio::awaitable<void> write(std::string bytes) = 0;

      virtual void close() = 0;

      /// Locator string, used in logs and error messages.
      virtual std::string describe() const = 0;
    };

    /// AsioSerialLink for tty locators, AsioTcpLink for socket:// ones.
    std::unique_ptr<AsyncLink> makeAsyncLink(boost::asio::io_context& io, const PortLocator& port,
                                             std::chrono::milliseconds connectTimeout);

  } // namespace io
} // namespace avior

#pragma once
/** @file  BlockingSession.hpp
 *  @brief Thread-blocking transaction serializer over one SerialChannel.
 *
 *  © 2025 Avior Driver contributors — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

// Avior headers
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/SessionReporter.hpp"
#include "io/PortLocator.hpp"
#include "io/SerialChannel.hpp"
#include "protocols/Command.hpp"

namespace avior {
  namespace core {

    /**
 * @class BlockingSession
 * @brief One request on the wire at a time: callers queue on a recursive mutex and
 *        run clear → write → read-until-'\r' while holding it.
 *
 *  * Each silent read may block the caller for up to `timeout`.
 *  * Timeouts leave the session usable; open failures and a lost link close it for good.
 */
    class BlockingSession {
    public:
      using result_type = std::string;

      BlockingSession(std::unique_ptr<io::SerialChannel> channel, io::PortLocator port,
                      std::chrono::milliseconds timeout, std::shared_ptr<ErrorMonitor> errorMonitor,
                      std::shared_ptr<Logger> logger = nullptr);
      ~BlockingSession();

      //---public APIs------------------------------------------------------
      void connect(); ///<- opens the channel, throws ConnectionError
      std::string transact(protocols::EncodedRequest request, std::size_t skip = 0);
      void close();

      bool connected() const;
      void warn(const std::string& message) const { reporter_.warn(message); }
      std::chrono::milliseconds timeout() const { return timeout_; }

      BlockingSession(const BlockingSession&) = delete;
      BlockingSession& operator=(const BlockingSession&) = delete;

    private:
      enum class State { Idle, Open, Closed };

      std::string transmitAndReceive(const protocols::EncodedRequest& request, std::size_t skip);
      [[noreturn]] void linkLost(const std::string& during);

      std::unique_ptr<io::SerialChannel> channel_;
      io::PortLocator port_;
      std::chrono::milliseconds timeout_;
      SessionReporter reporter_;
      State state_{ State::Idle };
      mutable std::recursive_mutex mtx_;
    };

  } // namespace core
} // namespace avior

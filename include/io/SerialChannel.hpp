#pragma once
/** @file  SerialChannel.hpp
 *  @brief Blocking-with-timeout byte I/O to the switch (termios tty or TCP bridge).
 *
 *  © 2025 Avior Driver contributors — MIT-licensed.
 */

#include <chrono>
#include <optional>
#include <string>

// Linux header
#include <termios.h> // for speed_t types e.g., B19200

// Avior headers
#include "io/PortLocator.hpp"

namespace avior {
  namespace io {

    /**
 * @class SerialChannel
 * @brief RAII wrapper around a single /dev/tty* (or TCP socket) file descriptor.
 *
 *  * Raw bytes only; framing is the session's job.
 *  * Failures are logged to stderr and reported as false / std::nullopt.
 *  * *Non-copyable*, but move-constructible.
 *  * Methods are virtual so tests can substitute a scripted device.
 */

    class SerialChannel {

    public:
      static constexpr speed_t kBaud = B19200; ///< fixed by the Avior firmware

      //---ctr / dtr--------------------------------------------
      SerialChannel() = default;
      virtual ~SerialChannel(); // close the fd at destruction

      //---public API-------------------------------------------
      /// Open \p port as 19200 8-N-1 raw; \p timeout bounds a TCP connect.
      virtual bool open(const PortLocator& port, std::chrono::milliseconds timeout);

      /// Drop unread input and unsent output (tcflush / socket drain).
      virtual bool resetBuffers();

      /// Write every byte of \p bytes, then drain; false on EIO or \p timeout.
      virtual bool writeAll(const std::string& bytes, std::chrono::milliseconds timeout);

      /// Whatever is readable within \p timeout.  std::nullopt on timeout, EOF or error;
      /// EOF and errors also close the channel, so `isOpen()` tells them apart.
      virtual std::optional<std::string> readChunk(std::chrono::milliseconds timeout);

      virtual bool isOpen() const { return fd_ >= 0; }
      void close();

      //---non-copyable-----------------------------------------
      SerialChannel(const SerialChannel&) = delete;
      SerialChannel& operator=(const SerialChannel&) = delete;

      //---mv and mv assign-------------------------------------
      SerialChannel(SerialChannel&& other) noexcept;
      SerialChannel& operator=(SerialChannel&& other) noexcept;

    private:
      bool openTty(const std::string& dev);
      bool openSocket(const std::string& host, std::uint16_t port, std::chrono::milliseconds timeout);

      int fd_{ -1 }; ///< POSIX fd (-1==closed)
      PortLocator::Kind kind_{ PortLocator::Kind::Tty };
    };
  } // namespace io
} // namespace avior

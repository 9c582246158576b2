#pragma once
/** @file  PortLocator.hpp
 *  @brief Parses "where is the switch" strings: a tty path or a TCP serial bridge.
 *
 *  © 2025 Avior Driver contributors — MIT-licensed.
 */

#include <cstdint>
#include <string>

namespace avior {
  namespace io {

    /**
 * @struct PortLocator
 * @brief  "/dev/ttyUSB0"            -> Kind::Tty,    device = path
 *         "socket://10.0.0.5:4001"  -> Kind::Socket, host/port filled
 *         "tcp://bridge.lan:4001"   -> same as socket://
 *
 *  by-path tty names contain ':' too, so a bare "host:port" is treated as a path.
 */
    struct PortLocator {
      enum class Kind { Tty, Socket };

      Kind kind{ Kind::Tty };
      std::string device; ///< tty path (Kind::Tty)
      std::string host;   ///< Kind::Socket
      std::uint16_t port{ 0 };

      std::string toString() const;
    };

    /// Throws `std::invalid_argument` on an empty string or malformed host:port.
    PortLocator parseLocator(const std::string& locator);

  } // namespace io
} // namespace avior

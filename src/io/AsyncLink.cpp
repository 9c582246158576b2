/* @file AsyncLink.cpp
 * @brief picks the asio transport that matches a port locator
 *
 * © 2025 Avior Driver contributors — MIT-licensed.
 */

// Avior headers
#include "io/AsyncLink.hpp"
#include "io/AsioSerialLink.hpp"
#include "io/AsioTcpLink.hpp"

namespace avior {
  namespace io {

    std::unique_ptr<AsyncLink> makeAsyncLink(boost::asio::io_context& io, const PortLocator& port,
                                             std::chrono::milliseconds connectTimeout) {
      if (port.kind == PortLocator::Kind::Socket)
        return std::make_unique<AsioTcpLink>(io, port.host, port.port, connectTimeout);
      return std::make_unique<AsioSerialLink>(io, port.device);
    }

  } // namespace io
} // namespace avior

/* @file PortLocator.cpp
 * @brief locator string parsing shared by the blocking channel and the asio links
 *
 * © 2025 Avior Driver contributors — MIT-licensed.
 */

// STL headers
#include <array>
#include <charconv>
#include <stdexcept>
#include <string_view>

// Avior headers
#include "io/PortLocator.hpp"

using namespace avior::io;

namespace {

  constexpr std::array<std::string_view, 2> kSocketSchemes{ "socket://", "tcp://" };

  PortLocator parseHostPort(const std::string& original, std::string_view rest) {
    const auto colon = rest.rfind(':');
    if (colon == std::string_view::npos || colon == 0 || colon + 1 == rest.size())
      throw std::invalid_argument("[PortLocator] expected host:port in '" + original + "'");

    std::string_view host = rest.substr(0, colon);
    std::string_view portStr = rest.substr(colon + 1);
    // [::1]:4001
    if (host.size() > 2 && host.front() == '[' && host.back() == ']')
      host = host.substr(1, host.size() - 2);

    unsigned int port = 0;
    auto [ptr, ec] = std::from_chars(portStr.data(), portStr.data() + portStr.size(), port);
    if (ec != std::errc{} || ptr != portStr.data() + portStr.size() || port == 0 || port > 65535)
      throw std::invalid_argument("[PortLocator] bad TCP port in '" + original + "'");

    PortLocator loc;
    loc.kind = PortLocator::Kind::Socket;
    loc.host = std::string(host);
    loc.port = static_cast<std::uint16_t>(port);
    return loc;
  }

} // namespace

std::string PortLocator::toString() const {
  if (kind == Kind::Tty)
    return device;
  return "socket://" + host + ":" + std::to_string(port);
}

PortLocator avior::io::parseLocator(const std::string& locator) {
  if (locator.empty())
    throw std::invalid_argument("[PortLocator] empty port locator");

  std::string_view view{ locator };
  for (auto scheme : kSocketSchemes) {
    if (view.starts_with(scheme))
      return parseHostPort(locator, view.substr(scheme.size()));
  }

  PortLocator loc;
  loc.kind = PortLocator::Kind::Tty;
  loc.device = locator;
  return loc;
}

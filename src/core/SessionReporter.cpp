/* @file SessionReporter.cpp
 * @brief error escalation / trace glue for the two session flavours
 *
 * © 2025 Avior Driver contributors — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <stdexcept>

// Avior headers
#include "core/SessionReporter.hpp"
#include "protocols/Response.hpp"

using namespace avior::core;

SessionReporter::SessionReporter(std::string port, std::shared_ptr<ErrorMonitor> errorMonitor,
                                 std::shared_ptr<Logger> logger)
    : port_(std::move(port)), errorMonitor_(std::move(errorMonitor)), logger_(std::move(logger)) {
  if (!errorMonitor_)
    throw std::invalid_argument("[SessionReporter] error monitor is nullptr");
}

void SessionReporter::trace(Direction direction, const std::string& payload) const {
  if (!logger_)
    return;
  LogEvent event;
  event.port = port_;
  event.direction = direction;
  event.payload = payload;
  logger_->log(std::move(event));
}

void SessionReporter::warn(const std::string& message) const {
  std::cerr << "[" << port_ << "] warning: " << message << "\n";
  trace(Direction::Warning, message);
}

void SessionReporter::notify(const std::string& message, Direction direction) const {
  errorMonitor_->notifyFailure(message);
  trace(direction, message);
}

std::string SessionReporter::decode(const protocols::ResponseFramer& framer) const {
  auto response = protocols::Response::fromWire(framer.buffer());
  if (!response) {
    raise(DecodeError("[" + port_ + "] response is not ASCII: " + hexDump(framer.buffer()),
                      framer.buffer()));
  }
  trace(Direction::Rx, framer.buffer());
  return std::move(response->text);
}

/* @file BlockingSession.cpp
 * @brief serialized request/response over a SerialChannel - one caller on the wire at a time
 *
 * © 2025 Avior Driver contributors — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>

// Avior headers
#include "core/BlockingSession.hpp"
#include "protocols/ResponseFramer.hpp"

using namespace avior::core;

BlockingSession::BlockingSession(std::unique_ptr<io::SerialChannel> channel, io::PortLocator port,
                                 std::chrono::milliseconds timeout,
                                 std::shared_ptr<ErrorMonitor> errorMonitor,
                                 std::shared_ptr<Logger> logger)
    : channel_(std::move(channel)), port_(std::move(port)), timeout_(timeout),
      reporter_(port_.toString(), std::move(errorMonitor), std::move(logger)) {
  if (!channel_)
    throw std::invalid_argument("[BlockingSession] channel is nullptr");
  if (timeout_.count() <= 0)
    throw std::invalid_argument("[BlockingSession] timeout must be positive");
}

BlockingSession::~BlockingSession() { close(); }

void BlockingSession::connect() {
  std::lock_guard<std::recursive_mutex> lock(mtx_);
  if (state_ == State::Open)
    return;
  if (state_ == State::Closed)
    reporter_.raise(ConnectionError("[BlockingSession] " + reporter_.port() +
                                    " was closed; open a new session"));

  if (!channel_->open(port_, timeout_)) {
    state_ = State::Closed;
    reporter_.raise(ConnectionError("[BlockingSession] serial device: " + reporter_.port() +
                                    " open failed"));
  }
  state_ = State::Open;
}

std::string BlockingSession::transact(protocols::EncodedRequest request, std::size_t skip) {
  std::lock_guard<std::recursive_mutex> lock(mtx_);

  if (state_ == State::Idle)
    reporter_.raise(TransportError("[BlockingSession] " + reporter_.port() + " not connected"));
  if (state_ == State::Closed)
    reporter_.raise(ConnectionError("[BlockingSession] " + reporter_.port() + " is closed"));

  return transmitAndReceive(request, skip);
}

void BlockingSession::close() {
  std::lock_guard<std::recursive_mutex> lock(mtx_);
  channel_->close();
  if (state_ != State::Idle)
    state_ = State::Closed;
}

bool BlockingSession::connected() const {
  std::lock_guard<std::recursive_mutex> lock(mtx_);
  return state_ == State::Open;
}

std::string BlockingSession::transmitAndReceive(const protocols::EncodedRequest& request,
                                                std::size_t skip) {
  // stale bytes from an earlier timed-out transaction would corrupt this frame
  if (!channel_->resetBuffers()) {
    if (!channel_->isOpen())
      linkLost("buffer reset");
    reporter_.raise(TransportError("[BlockingSession] " + reporter_.port() +
                                   ": failed to clear serial buffers"));
  }

  reporter_.trace(Direction::Tx, request.bytes());
  if (!channel_->writeAll(request.bytes(), timeout_)) {
    if (!channel_->isOpen())
      linkLost("write");
    reporter_.raise(TransportError("[BlockingSession] failed to write to serial device: " +
                                   reporter_.port()));
  }

  protocols::ResponseFramer framer(skip);
  while (!framer.complete()) {
    auto chunk = channel_->readChunk(timeout_);
    if (!chunk) {
      if (!channel_->isOpen())
        linkLost("read");
      reporter_.raise(TimeoutError("[BlockingSession] " + reporter_.port() +
                                       ": connection timed out! Last received bytes [" +
                                       hexDump(framer.buffer()) + "]",
                                   framer.buffer()),
                      Direction::Timeout);
    }
    framer.feed(*chunk);
  }

  if (framer.discarded() > 0)
    reporter_.warn(std::to_string(framer.discarded()) + " byte(s) after the terminator dropped");

  return reporter_.decode(framer);
}

void BlockingSession::linkLost(const std::string& during) {
  state_ = State::Closed;
  reporter_.raise(ConnectionError("[BlockingSession] " + reporter_.port() + ": link lost during " +
                                  during));
}

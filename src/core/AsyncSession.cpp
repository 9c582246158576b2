/* @file AsyncSession.cpp
 * @brief coroutine flavour of the transaction serializer: ready → lock → clear → write → await '\r'
 *
 * © 2025 Avior Driver contributors — MIT-licensed.
 */

// STL headers
#include <mutex> // std::adopt_lock
#include <stdexcept>

// 3rd-party headers
#include <boost/system/system_error.hpp>

// Avior headers
#include "core/AsyncSession.hpp"
#include "protocols/ResponseFramer.hpp"

using namespace avior::core;
namespace asio = boost::asio;

AsyncSession::AsyncSession(asio::io_context& io, std::unique_ptr<io::AsyncLink> link,
                           std::chrono::milliseconds timeout,
                           std::shared_ptr<ErrorMonitor> errorMonitor, std::shared_ptr<Logger> logger)
    : link_(std::move(link)), timeout_(timeout),
      reporter_(link_ ? link_->describe() : std::string(), std::move(errorMonitor), std::move(logger)),
      mutex_(io), ready_(io), inbox_(io) {
  if (!link_)
    throw std::invalid_argument("[AsyncSession] link is nullptr");
  if (timeout_.count() <= 0)
    throw std::invalid_argument("[AsyncSession] timeout must be positive");
}

AsyncSession::~AsyncSession() { link_->close(); }

void AsyncSession::connect() {
  if (started_)
    return;
  started_ = true;
  link_->start({ [this] { onConnected(); }, [this](std::string_view chunk) { onData(chunk); },
                 [this](const std::string& reason) { onLost(reason); } });
}

asio::awaitable<std::string> AsyncSession::transact(protocols::EncodedRequest request,
                                                    std::size_t skip) {
  if (!started_)
    reporter_.raise(TransportError("[AsyncSession] " + reporter_.port() + " not connected"));

  if (!co_await ready_.wait())
    reporter_.raise(ConnectionError("[AsyncSession] " + reporter_.port() +
                                    " failed to open: " + ready_.reason()));

  // Only one transaction at a time
  co_await mutex_.lock();
  AsyncMutex::Guard guard(mutex_, std::adopt_lock);

  if (lost_)
    reporter_.raise(ConnectionError("[AsyncSession] " + reporter_.port() + " is closed"));

  // stale bytes from an earlier timed-out transaction would corrupt this frame
  if (!link_->resetBuffers())
    reporter_.raise(TransportError("[AsyncSession] " + reporter_.port() +
                                   ": failed to clear serial buffers"));
  inbox_.clear();

  reporter_.trace(Direction::Tx, request.bytes());
  std::string writeError;
  try {
    co_await link_->write(request.bytes());
  } catch (const boost::system::system_error& e) {
    writeError = e.what();
  }
  if (!writeError.empty())
    reporter_.raise(TransportError("[AsyncSession] failed to write to " + reporter_.port() + ": " +
                                   writeError));

  protocols::ResponseFramer framer(skip);
  while (!framer.complete()) {
    auto chunk = co_await inbox_.pop(timeout_);
    if (!chunk) {
      if (inbox_.closed())
        reporter_.raise(ConnectionError("[AsyncSession] " + reporter_.port() +
                                        ": link lost while awaiting response"));
      reporter_.raise(TimeoutError("[AsyncSession] " + reporter_.port() +
                                       ": timeout during receiving response, received [" +
                                       hexDump(framer.buffer()) + "]",
                                   framer.buffer()),
                      Direction::Timeout);
    }
    framer.feed(*chunk);
  }

  if (framer.discarded() > 0)
    reporter_.warn(std::to_string(framer.discarded()) + " byte(s) after the terminator dropped");

  co_return reporter_.decode(framer);
}

void AsyncSession::close() {
  link_->close();
  shutdown("closed by caller");
}

void AsyncSession::onConnected() { ready_.set(); }

void AsyncSession::onData(std::string_view chunk) { inbox_.push(chunk); }

void AsyncSession::onLost(const std::string& reason) {
  if (lost_)
    return;
  shutdown(reason);
  reporter_.notify("[AsyncSession] " + reporter_.port() + ": link lost: " + reason);
}

// wakes the ready-signal waiters and any transaction parked on the inbox
void AsyncSession::shutdown(const std::string& reason) {
  if (lost_)
    return;
  lost_ = true;
  ready_.fail(reason);
  inbox_.close();
}

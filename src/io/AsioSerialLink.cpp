/* @file AsioSerialLink.cpp
 * @brief serial_port based AsyncLink - 19200 8-N-1, continuous async_read_some loop
 *
 * © 2025 Avior Driver contributors — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <utility>

// Linux headers
#include <errno.h>
#include <string.h>  // strerror
#include <termios.h> // tcflush

// 3rd-party headers
#include <boost/asio/buffer.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

// Avior headers
#include "io/AsioSerialLink.hpp"

using namespace avior::io;
namespace asio = boost::asio;

AsioSerialLink::AsioSerialLink(asio::io_context& io, std::string device)
    : io_(io), port_(io), device_(std::move(device)) {}

AsioSerialLink::~AsioSerialLink() {
  alive_.reset();
  close();
}

void AsioSerialLink::start(Handlers handlers) {
  handlers_ = std::move(handlers);

  boost::system::error_code ec;
  port_.open(device_, ec);
  if (!ec)
    port_.set_option(asio::serial_port::baud_rate(kBaud), ec);
  if (!ec)
    port_.set_option(asio::serial_port::character_size(8), ec);
  if (!ec)
    port_.set_option(asio::serial_port::parity(asio::serial_port::parity::none), ec);
  if (!ec)
    port_.set_option(asio::serial_port::stop_bits(asio::serial_port::stop_bits::one), ec);
  if (!ec)
    port_.set_option(asio::serial_port::flow_control(asio::serial_port::flow_control::none), ec);

  std::weak_ptr<int> alive = alive_;
  if (ec) {
    std::cerr << "Error opening " << device_ << ": " << ec.message() << "\n";
    close();
    asio::post(io_, [this, alive, reason = ec.message()] {
      if (alive.lock())
        reportLost("open failed: " + reason);
    });
    return;
  }

  // a tty is usable as soon as open() returns; still signal through the queue
  asio::post(io_, [this, alive] {
    if (alive.lock() && handlers_.onConnected)
      handlers_.onConnected();
  });
  readLoop();
}

void AsioSerialLink::readLoop() {
  std::weak_ptr<int> alive = alive_;
  port_.async_read_some(asio::buffer(rx_),
                        [this, alive](const boost::system::error_code& ec, std::size_t n) {
                          if (!alive.lock())
                            return;
                          if (ec) {
                            if (ec != asio::error::operation_aborted)
                              reportLost(ec.message());
                            return;
                          }
                          if (handlers_.onData)
                            handlers_.onData(std::string_view(rx_.data(), n));
                          readLoop();
                        });
}

bool AsioSerialLink::resetBuffers() {
  if (!port_.is_open())
    return false;
  if (::tcflush(port_.native_handle(), TCIOFLUSH) != 0) {
    std::cerr << "Error " << errno << " from tcflush: " << strerror(errno) << "\n";
    return false;
  }
  return true;
}

asio::awaitable<void> AsioSerialLink::write(std::string bytes) {
  co_await asio::async_write(port_, asio::buffer(bytes), asio::use_awaitable);
}

void AsioSerialLink::close() {
  boost::system::error_code ec;
  if (port_.is_open())
    port_.close(ec);
}

void AsioSerialLink::reportLost(const std::string& reason) {
  std::cerr << "[AsioSerialLink] " << device_ << ": " << reason << "\n";
  close();
  if (handlers_.onLost)
    handlers_.onLost(reason);
}

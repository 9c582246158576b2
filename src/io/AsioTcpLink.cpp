/* @file AsioTcpLink.cpp
 * @brief tcp::socket based AsyncLink - async resolve/connect with deadline, then read loop
 *
 * © 2025 Avior Driver contributors — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <utility>

// 3rd-party headers
#include <boost/asio/buffer.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

// Avior headers
#include "io/AsioTcpLink.hpp"

using namespace avior::io;
namespace asio = boost::asio;
using asio::ip::tcp;

AsioTcpLink::AsioTcpLink(asio::io_context& io, std::string host, std::uint16_t port,
                         std::chrono::milliseconds connectTimeout)
    : resolver_(io), socket_(io), connectTimer_(io), host_(std::move(host)), port_(port),
      connectTimeout_(connectTimeout) {}

AsioTcpLink::~AsioTcpLink() {
  alive_.reset();
  close();
}

std::string AsioTcpLink::describe() const {
  return "socket://" + host_ + ":" + std::to_string(port_);
}

void AsioTcpLink::start(Handlers handlers) {
  handlers_ = std::move(handlers);
  std::weak_ptr<int> alive = alive_;

  connectTimer_.expires_after(connectTimeout_);
  connectTimer_.async_wait([this, alive](const boost::system::error_code& ec) {
    if (!alive.lock() || ec || connected_)
      return;
    reportLost("connect timed out");
  });

  resolver_.async_resolve(host_, std::to_string(port_),
                          [this, alive](const boost::system::error_code& ec,
                                        const tcp::resolver::results_type& endpoints) {
                            if (!alive.lock() || lost_)
                              return;
                            if (ec) {
                              reportLost("resolve failed: " + ec.message());
                              return;
                            }
                            onResolved(endpoints);
                          });
}

void AsioTcpLink::onResolved(const tcp::resolver::results_type& endpoints) {
  std::weak_ptr<int> alive = alive_;
  asio::async_connect(socket_, endpoints,
                      [this, alive](const boost::system::error_code& ec, const tcp::endpoint&) {
                        if (!alive.lock() || lost_)
                          return;
                        if (ec) {
                          reportLost("connect failed: " + ec.message());
                          return;
                        }
                        connected_ = true;
                        connectTimer_.cancel();

                        boost::system::error_code optEc;
                        socket_.set_option(tcp::no_delay(true), optEc); // best effort

                        if (handlers_.onConnected)
                          handlers_.onConnected();
                        readLoop();
                      });
}

void AsioTcpLink::readLoop() {
  std::weak_ptr<int> alive = alive_;
  socket_.async_read_some(asio::buffer(rx_),
                          [this, alive](const boost::system::error_code& ec, std::size_t n) {
                            if (!alive.lock())
                              return;
                            if (ec) {
                              if (ec != asio::error::operation_aborted)
                                reportLost(ec == asio::error::eof ? "bridge closed the connection"
                                                                  : ec.message());
                              return;
                            }
                            if (handlers_.onData)
                              handlers_.onData(std::string_view(rx_.data(), n));
                            readLoop();
                          });
}

bool AsioTcpLink::resetBuffers() {
  // no driver-level queue to flush on a socket; the session drops queued chunks
  return socket_.is_open() && connected_;
}

asio::awaitable<void> AsioTcpLink::write(std::string bytes) {
  co_await asio::async_write(socket_, asio::buffer(bytes), asio::use_awaitable);
}

void AsioTcpLink::close() {
  boost::system::error_code ec;
  resolver_.cancel();
  connectTimer_.cancel();
  if (socket_.is_open()) {
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
  }
}

void AsioTcpLink::reportLost(const std::string& reason) {
  if (lost_)
    return;
  lost_ = true;
  std::cerr << "[AsioTcpLink] " << describe() << ": " << reason << "\n";
  close();
  if (handlers_.onLost)
    handlers_.onLost(reason);
}

#pragma once
/** @file  AsioTcpLink.hpp
 *  @brief AsyncLink over TCP, for switches behind a serial-to-network bridge.
 *
 *  © 2025 Avior Driver contributors — MIT-licensed.
 */

// STL headers
#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

// 3rd-party headers
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

// Avior headers
#include "io/AsyncLink.hpp"

namespace avior {
  namespace io {

    /**
 * @class AsioTcpLink
 * @brief Resolve + connect asynchronously; `onConnected` fires once the socket is up.
 *
 *  * A connect that has not finished after `connectTimeout` is reported through `onLost`.
 *  * The bridge owns the UART settings, so there is nothing to configure here.
 */
    class AsioTcpLink : public AsyncLink {
    public:
      AsioTcpLink(boost::asio::io_context& io, std::string host, std::uint16_t port,
                  std::chrono::milliseconds connectTimeout);
      ~AsioTcpLink() override;

      void start(Handlers handlers) override;
      bool resetBuffers() override;
      boost::asio::awaitable<void> write(std::string bytes) override;
      void close() override;
      std::string describe() const override;

      AsioTcpLink(const AsioTcpLink&) = delete;
      AsioTcpLink& operator=(const AsioTcpLink&) = delete;

    private:
      void onResolved(const boost::asio::ip::tcp::resolver::results_type& endpoints);
      void readLoop();
      void reportLost(const std::string& reason);

      boost::asio::ip::tcp::resolver resolver_;
      boost::asio::ip::tcp::socket socket_;
      boost::asio::steady_timer connectTimer_;
      std::string host_;
      std::uint16_t port_;
      std::chrono::milliseconds connectTimeout_;
      bool connected_{ false };
      bool lost_{ false };
      Handlers handlers_{};
      std::array<char, 256> rx_{};
      std::shared_ptr<int> alive_{ std::make_shared<int>(0) }; ///< handlers bail once expired
    };

  } // namespace io
} // namespace avior

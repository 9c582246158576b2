#pragma once
/** @file  AsioSerialLink.hpp
 *  @brief boost::asio::serial_port implementation of AsyncLink.
 *
 *  © 2025 Avior Driver contributors — MIT-licensed.
 */

// STL headers
#include <array>
#include <memory>
#include <string>

// 3rd-party headers
#include <boost/asio/io_context.hpp>
#include <boost/asio/serial_port.hpp>

// Avior headers
#include "io/AsyncLink.hpp"

namespace avior {
  namespace io {

    class AsioSerialLink : public AsyncLink {
    public:
      static constexpr unsigned int kBaud = 19200;

      AsioSerialLink(boost::asio::io_context& io, std::string device);
      ~AsioSerialLink() override;

      void start(Handlers handlers) override;
      bool resetBuffers() override;
      boost::asio::awaitable<void> write(std::string bytes) override;
      void close() override;
      std::string describe() const override { return device_; }

      AsioSerialLink(const AsioSerialLink&) = delete;
      AsioSerialLink& operator=(const AsioSerialLink&) = delete;

    private:
      void readLoop();
      void reportLost(const std::string& reason);

      boost::asio::io_context& io_;
      boost::asio::serial_port port_;
      std::string device_;
      Handlers handlers_{};
      std::array<char, 256> rx_{};
      std::shared_ptr<int> alive_{ std::make_shared<int>(0) }; ///< handlers bail once expired
    };

  } // namespace io
} // namespace avior

#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "core/MatrixFactory.hpp"
#include "io/AsioSerialLink.hpp"
#include "io/AsioTcpLink.hpp"
#include "io/AsyncLink.hpp"
#include "io/PortLocator.hpp"
#include "io/SerialChannel.hpp"

#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/write.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdio>
#include <cstring>
#include <exception>
#include <fstream>
#include <mutex>
#include <optional>
#include <poll.h>
#include <pty.h> // openpty
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace asio = boost::asio;
using asio::ip::tcp;
using namespace std::chrono_literals;
using avior::io::AsioSerialLink;
using avior::io::AsioTcpLink;
using avior::io::AsyncLink;
using avior::io::parseLocator;
using avior::io::PortLocator;
using avior::io::SerialChannel;
using ::testing::HasSubstr;

namespace {

  // a false ttyUSB0 "device": the test plays the switch on the master side
  struct Pty {
    int masterFd{ -1 };
    int slaveFd{ -1 };
    char slaveName[64]{};

    Pty() {
      if (openpty(&masterFd, &slaveFd, slaveName, nullptr, nullptr) != 0)
        throw std::runtime_error("openpty failed");
    }
    ~Pty() {
      ::close(masterFd);
      ::close(slaveFd);
    }

    /// What the driver wrote, up to and including '\n' or until \p timeout.
    std::string readLine(std::chrono::milliseconds timeout) const {
      std::string line;
      const auto deadline = std::chrono::steady_clock::now() + timeout;
      while (line.empty() || line.back() != '\n') {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        pollfd pfd{ masterFd, POLLIN, 0 };
        if (left.count() <= 0 || ::poll(&pfd, 1, static_cast<int>(left.count())) <= 0)
          break;
        char buf[64];
        ssize_t n = ::read(masterFd, buf, sizeof(buf));
        if (n <= 0)
          break;
        line.append(buf, static_cast<std::size_t>(n));
      }
      return line;
    }
  };

  /**
   * One-client TCP serial bridge on 127.0.0.1.  After accepting it sends `greeting`, then for
   * each entry of `replies` reads one "\r\n" request and answers with the entry ("" = silent).
   */
  class LoopbackBridge {
  public:
    LoopbackBridge() : acceptor_(io_, tcp::endpoint(asio::ip::address_v4::loopback(), 0)) {}

    ~LoopbackBridge() {
      // unblock accept() if no client ever came
      boost::system::error_code ec;
      tcp::socket poke(io_);
      poke.connect(acceptor_.local_endpoint(), ec);
      poke.close(ec);
      if (worker_.joinable())
        worker_.join();
    }

    std::uint16_t port() const { return acceptor_.local_endpoint().port(); }
    std::string locator() const { return "socket://127.0.0.1:" + std::to_string(port()); }

    /// \p holdOpen keeps the connection until the client closes it.
    void serve(std::vector<std::string> replies, std::string greeting = "", bool holdOpen = true) {
      worker_ = std::thread([this, replies = std::move(replies), greeting, holdOpen] {
        boost::system::error_code ec;
        tcp::socket client(io_);
        acceptor_.accept(client, ec);
        if (ec)
          return;
        if (!greeting.empty())
          asio::write(client, asio::buffer(greeting), ec);

        asio::streambuf pending;
        for (const auto& reply : replies) {
          std::size_t n = asio::read_until(client, pending, "\r\n", ec);
          if (ec)
            return;
          auto begin = asio::buffers_begin(pending.data());
          record(std::string(begin, begin + static_cast<std::ptrdiff_t>(n)));
          pending.consume(n);
          if (!reply.empty())
            asio::write(client, asio::buffer(reply), ec);
        }
        if (holdOpen)
          asio::read(client, pending, asio::transfer_all(), ec); // until the client hangs up
      });
    }

    std::vector<std::string> requests() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return requests_;
    }

  private:
    void record(std::string request) {
      std::lock_guard<std::mutex> lock(mtx_);
      requests_.push_back(std::move(request));
    }

    asio::io_context io_;
    tcp::acceptor acceptor_;
    std::thread worker_;
    mutable std::mutex mtx_;
    std::vector<std::string> requests_;
  };

  /// A loopback port with nobody listening.
  std::uint16_t closedPort() {
    asio::io_context io;
    tcp::acceptor scratch(io, tcp::endpoint(asio::ip::address_v4::loopback(), 0));
    return scratch.local_endpoint().port();
  }

} // namespace

TEST(serial_channel, opens_writes_reads_closes) {
  Pty pty;

  // check that we can open a serial channel to slave dev
  SerialChannel chan;
  ASSERT_TRUE(chan.open(parseLocator(pty.slaveName), 500ms));
  ASSERT_TRUE(chan.isOpen());

  // Writer on master side
  const char* msg = "OK\r";
  ASSERT_EQ(write(pty.masterFd, msg, strlen(msg)), static_cast<ssize_t>(strlen(msg)));

  auto chunk = chan.readChunk(500ms);
  ASSERT_TRUE(chunk);
  EXPECT_EQ(*chunk, "OK\r");

  ASSERT_TRUE(chan.writeAll("reset\r\n", 500ms));
  char buf[16] = { 0 };
  ASSERT_GT(read(pty.masterFd, buf, sizeof(buf) - 1), 0);
  EXPECT_STREQ(buf, "reset\r\n");

  chan.close();
  EXPECT_FALSE(chan.isOpen());
}

TEST(serial_channel, read_honours_timeouts_beyond_int_milliseconds) {
  Pty pty;
  SerialChannel chan;
  ASSERT_TRUE(chan.open(parseLocator(pty.slaveName), 500ms));

  // 2^32 + 100 ms: truncated to a poll() int this would expire after ~100 ms
  std::thread device([&] {
    std::this_thread::sleep_for(250ms);
    ASSERT_EQ(write(pty.masterFd, "OK\r", 3), 3);
  });
  auto chunk = chan.readChunk(std::chrono::milliseconds{ 4294967396LL });
  device.join();

  ASSERT_TRUE(chunk);
  EXPECT_EQ(*chunk, "OK\r");
}

TEST(serial_channel, write_accepts_saturating_timeout) {
  Pty pty;
  SerialChannel chan;
  ASSERT_TRUE(chan.open(parseLocator(pty.slaveName), 500ms));
  EXPECT_TRUE(chan.writeAll("read\r\n", std::chrono::milliseconds::max()));
  EXPECT_EQ(pty.readLine(500ms), "read\r\n");
}

TEST(serial_channel, read_times_out_when_device_is_silent) {
  Pty pty;
  SerialChannel chan;
  ASSERT_TRUE(chan.open(parseLocator(pty.slaveName), 500ms));

  const auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(chan.readChunk(50ms));
  EXPECT_GE(std::chrono::steady_clock::now() - start, 40ms);
  EXPECT_TRUE(chan.isOpen()); // a timeout is not a disconnect
}

TEST(serial_channel, reset_buffers_discards_pending_input) {
  Pty pty;
  SerialChannel chan;
  ASSERT_TRUE(chan.open(parseLocator(pty.slaveName), 500ms));

  const char* stale = "stale\r";
  ASSERT_GT(write(pty.masterFd, stale, strlen(stale)), 0);
  usleep(20000); // let the line discipline queue it

  ASSERT_TRUE(chan.resetBuffers());
  EXPECT_FALSE(chan.readChunk(50ms));
}

TEST(serial_channel, open_fails_for_missing_device) {
  SerialChannel chan;
  EXPECT_FALSE(chan.open(parseLocator("/dev/does-not-exist-avior"), 100ms));
  EXPECT_FALSE(chan.isOpen());
  EXPECT_FALSE(chan.writeAll("read\r\n", 100ms));
  EXPECT_FALSE(chan.readChunk(10ms));
}

TEST(serial_channel, move_transfers_ownership) {
  Pty pty;
  SerialChannel a;
  ASSERT_TRUE(a.open(parseLocator(pty.slaveName), 500ms));

  SerialChannel b(std::move(a));
  EXPECT_FALSE(a.isOpen());
  EXPECT_TRUE(b.isOpen());
}

TEST(port_locator, tty_paths) {
  auto loc = parseLocator("/dev/ttyUSB0");
  EXPECT_EQ(loc.kind, PortLocator::Kind::Tty);
  EXPECT_EQ(loc.device, "/dev/ttyUSB0");

  // by-path names contain ':' and must stay paths
  auto byPath = parseLocator("/dev/serial/by-path/pci-0000:00:14.0-usb-0:1:1.0-port0");
  EXPECT_EQ(byPath.kind, PortLocator::Kind::Tty);
}

TEST(port_locator, socket_urls) {
  auto loc = parseLocator("socket://10.0.0.5:4001");
  EXPECT_EQ(loc.kind, PortLocator::Kind::Socket);
  EXPECT_EQ(loc.host, "10.0.0.5");
  EXPECT_EQ(loc.port, 4001);
  EXPECT_EQ(loc.toString(), "socket://10.0.0.5:4001");

  auto tcp = parseLocator("tcp://bridge.lan:23");
  EXPECT_EQ(tcp.host, "bridge.lan");
  EXPECT_EQ(tcp.port, 23);

  auto v6 = parseLocator("socket://[::1]:4001");
  EXPECT_EQ(v6.host, "::1");
}

TEST(port_locator, rejects_malformed) {
  EXPECT_THROW(parseLocator(""), std::invalid_argument);
  EXPECT_THROW(parseLocator("socket://host"), std::invalid_argument);
  EXPECT_THROW(parseLocator("socket://host:"), std::invalid_argument);
  EXPECT_THROW(parseLocator("socket://:4001"), std::invalid_argument);
  EXPECT_THROW(parseLocator("socket://host:99999"), std::invalid_argument);
  EXPECT_THROW(parseLocator("socket://host:12ab"), std::invalid_argument);
}

// ---- TCP bridge, blocking channel ---------------------------------------------------

TEST(serial_channel_socket, drains_stale_bytes_then_exchanges) {
  LoopbackBridge bridge;
  bridge.serve({ "OK\r" }, "STALE\r");

  SerialChannel chan;
  ASSERT_TRUE(chan.open(parseLocator(bridge.locator()), 500ms));
  std::this_thread::sleep_for(50ms); // let the greeting land in the socket buffer

  ASSERT_TRUE(chan.resetBuffers());
  EXPECT_FALSE(chan.readChunk(30ms));
  EXPECT_TRUE(chan.isOpen());

  ASSERT_TRUE(chan.writeAll("read\r\n", 500ms));
  std::string reply;
  while (reply.empty() || reply.back() != '\r') {
    auto chunk = chan.readChunk(500ms);
    ASSERT_TRUE(chunk);
    reply += *chunk;
  }
  EXPECT_EQ(reply, "OK\r");
  EXPECT_EQ(bridge.requests(), (std::vector<std::string>{ "read\r\n" }));
}

TEST(serial_channel_socket, peer_hangup_closes_the_channel) {
  LoopbackBridge bridge;
  bridge.serve({ "OK\r" }, "", false);

  SerialChannel chan;
  ASSERT_TRUE(chan.open(parseLocator(bridge.locator()), 500ms));
  ASSERT_TRUE(chan.writeAll("reset\r\n", 500ms));

  // reply, then EOF
  std::optional<std::string> chunk;
  do {
    chunk = chan.readChunk(500ms);
  } while (chunk);
  EXPECT_FALSE(chan.isOpen());
}

TEST(serial_channel_socket, connect_refused) {
  SerialChannel chan;
  EXPECT_FALSE(chan.open(parseLocator("socket://127.0.0.1:" + std::to_string(closedPort())), 500ms));
  EXPECT_FALSE(chan.isOpen());
}

// ---- asio links -----------------------------------------------------------------------

namespace {

  // Collects what an AsyncLink reports; stops \p io on a complete '\r' frame or a loss.
  struct LinkRecorder {
    asio::io_context& io;
    bool connected{ false };
    std::string received;
    std::string lostReason;

    AsyncLink::Handlers handlers() {
      return { [this] {
                connected = true;
                io.stop();
              },
               [this](std::string_view chunk) {
                 received.append(chunk);
                 if (!received.empty() && received.back() == '\r')
                   io.stop();
               },
               [this](const std::string& reason) {
                 lostReason = reason;
                 io.stop();
               } };
    }
  };

  // Run the io_context until a handler stops it (or 2 s pass).
  void runUntilStopped(asio::io_context& io) {
    io.restart();
    io.run_for(2s);
  }

  bool writeThrough(asio::io_context& io, AsyncLink& link, const std::string& bytes) {
    bool ok = false;
    asio::co_spawn(io, link.write(bytes), [&](std::exception_ptr e) {
      ok = !e;
      io.stop();
    });
    runUntilStopped(io);
    return ok;
  }

} // namespace

TEST(asio_serial_link, reads_and_writes_through_pty) {
  Pty pty;
  asio::io_context io;
  AsioSerialLink link(io, pty.slaveName);
  LinkRecorder recorder{ io };

  link.start(recorder.handlers());
  runUntilStopped(io);
  ASSERT_TRUE(recorder.connected);
  EXPECT_EQ(link.describe(), pty.slaveName);
  EXPECT_TRUE(link.resetBuffers());

  ASSERT_TRUE(writeThrough(io, link, "sw i01 o02\r\n"));
  EXPECT_EQ(pty.readLine(500ms), "sw i01 o02\r\n");

  ASSERT_EQ(write(pty.masterFd, "OK\r", 3), 3);
  runUntilStopped(io);
  EXPECT_EQ(recorder.received, "OK\r");
  EXPECT_TRUE(recorder.lostReason.empty());
}

TEST(asio_serial_link, open_failure_is_reported_as_lost) {
  asio::io_context io;
  AsioSerialLink link(io, "/dev/does-not-exist-avior");
  LinkRecorder recorder{ io };

  link.start(recorder.handlers());
  runUntilStopped(io);
  EXPECT_FALSE(recorder.connected);
  EXPECT_THAT(recorder.lostReason, HasSubstr("open failed"));
  EXPECT_FALSE(link.resetBuffers());
}

TEST(asio_tcp_link, exchanges_with_bridge) {
  LoopbackBridge bridge;
  bridge.serve({ "OK\r" });

  asio::io_context io;
  AsioTcpLink link(io, "127.0.0.1", bridge.port(), 500ms);
  LinkRecorder recorder{ io };

  link.start(recorder.handlers());
  runUntilStopped(io);
  ASSERT_TRUE(recorder.connected);
  EXPECT_TRUE(link.resetBuffers());

  ASSERT_TRUE(writeThrough(io, link, "read\r\n"));
  runUntilStopped(io);
  EXPECT_EQ(recorder.received, "OK\r");
  EXPECT_EQ(bridge.requests(), (std::vector<std::string>{ "read\r\n" }));
  link.close();
}

TEST(asio_tcp_link, bridge_hangup_is_reported_as_lost) {
  LoopbackBridge bridge;
  bridge.serve({ "OK\r" }, "", false);

  asio::io_context io;
  AsioTcpLink link(io, "127.0.0.1", bridge.port(), 500ms);
  LinkRecorder recorder{ io };
  link.start(recorder.handlers());
  runUntilStopped(io);
  ASSERT_TRUE(recorder.connected);

  ASSERT_TRUE(writeThrough(io, link, "reset\r\n"));
  // the reply stops the loop first, the hangup second
  const auto deadline = std::chrono::steady_clock::now() + 2s;
  while (recorder.lostReason.empty() && std::chrono::steady_clock::now() < deadline)
    runUntilStopped(io);
  EXPECT_EQ(recorder.lostReason, "bridge closed the connection");
  EXPECT_FALSE(link.resetBuffers());
}

TEST(asio_tcp_link, connect_refused_is_reported_as_lost) {
  asio::io_context io;
  AsioTcpLink link(io, "127.0.0.1", closedPort(), 500ms);
  LinkRecorder recorder{ io };

  link.start(recorder.handlers());
  runUntilStopped(io);
  EXPECT_FALSE(recorder.connected);
  EXPECT_THAT(recorder.lostReason, HasSubstr("connect failed"));
}

TEST(async_link_factory, picks_transport_by_locator) {
  asio::io_context io;
  auto tcpLink = avior::io::makeAsyncLink(io, parseLocator("socket://127.0.0.1:4001"), 100ms);
  EXPECT_NE(dynamic_cast<AsioTcpLink*>(tcpLink.get()), nullptr);
  EXPECT_EQ(tcpLink->describe(), "socket://127.0.0.1:4001");

  auto ttyLink = avior::io::makeAsyncLink(io, parseLocator("/dev/ttyUSB3"), 100ms);
  EXPECT_NE(dynamic_cast<AsioSerialLink*>(ttyLink.get()), nullptr);
  EXPECT_EQ(ttyLink->describe(), "/dev/ttyUSB3");
}

// ---- connection factory over a real socket ---------------------------------------------

TEST(matrix_factory, blocking_switch_over_bridge) {
  LoopbackBridge bridge;
  bridge.serve({ "PART", "OK\r" }, "STALE\r");
  const std::string tracePath = "/tmp/avior_factory_trace_" + std::to_string(::getpid()) + ".csv";

  {
    avior::core::DriverConfig config;
    config.port = bridge.locator();
    config.timeout = 200ms;
    config.traceLog = tracePath;
    auto device =
        avior::core::openBlockingSwitch(config, std::make_shared<avior::core::ErrorMonitor>());
    ASSERT_TRUE(device->session().connected());
    std::this_thread::sleep_for(50ms); // greeting is now stale input

    try {
      device->read();
      FAIL() << "expected TimeoutError";
    } catch (const avior::core::TimeoutError& e) {
      EXPECT_EQ(e.partial(), "PART");
    }
    EXPECT_EQ(device->reset(), "OK");
  }

  EXPECT_EQ(bridge.requests(), (std::vector<std::string>{ "read\r\n", "reset\r\n" }));

  std::ifstream trace(tracePath);
  std::string header;
  std::getline(trace, header);
  EXPECT_EQ(header, "timestamp,port,direction,payload");
  int rows = 0;
  for (std::string line; std::getline(trace, line);)
    ++rows;
  EXPECT_GE(rows, 4); // TX, TIMEOUT, TX, RX
  std::remove(tracePath.c_str());
}

TEST(matrix_factory, blocking_switch_open_failure_throws) {
  avior::core::DriverConfig config;
  config.port = "socket://127.0.0.1:" + std::to_string(closedPort());
  config.timeout = 200ms;
  EXPECT_THROW(avior::core::openBlockingSwitch(config, std::make_shared<avior::core::ErrorMonitor>()),
               avior::core::ConnectionError);
}

TEST(matrix_factory, async_switch_over_bridge) {
  LoopbackBridge bridge;
  bridge.serve({ "OK\r" });

  asio::io_context io;
  avior::core::DriverConfig config;
  config.port = bridge.locator();
  config.timeout = 500ms;
  auto device =
      avior::core::openAsyncSwitch(io, config, std::make_shared<avior::core::ErrorMonitor>());

  std::optional<std::string> reply;
  std::exception_ptr error;
  asio::co_spawn(io, device->setZoneSource(2, 3), [&](std::exception_ptr e, std::string r) {
    error = e;
    if (!e)
      reply = std::move(r);
    io.stop();
  });
  io.run_for(2s);

  ASSERT_FALSE(error);
  EXPECT_EQ(reply, "OK");
  EXPECT_TRUE(device->session().connected());
  EXPECT_EQ(bridge.requests(), (std::vector<std::string>{ "sw i03 o02\r\n" }));
}

/* @file SerialChannel.cpp
 * @brief IO abstraction layer that wraps ttyUSBx or a TCP serial bridge - handles file descriptor,
 *        termios setup, timed raw byte io and RAII - POSIX compliant
 *
 * © 2025 Avior Driver contributors — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cstddef>
#include <cstring> // for strerror
#include <iostream>
#include <limits>
#include <utility>

// Linux headers
#include <errno.h> // Error integer and strerror() function
#include <fcntl.h> // Contains file controls like O_RDWR
#include <netdb.h> // getaddrinfo
#include <netinet/in.h>
#include <netinet/tcp.h> // TCP_NODELAY
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h> // write(), read(), close()

// Avior headers
#include "io/SerialChannel.hpp"

using namespace avior::io;

namespace {

  using Clock = std::chrono::steady_clock;

  // now + timeout, saturating at time_point::max() instead of overflowing
  Clock::time_point deadlineAfter(std::chrono::milliseconds timeout) {
    const auto now = Clock::now();
    const auto room = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - now);
    return timeout >= room ? Clock::time_point::max() : now + timeout;
  }

  // poll() takes an int, so one wait covers at most INT_MAX ms
  int msLeft(Clock::time_point deadline) {
    auto left = std::chrono::ceil<std::chrono::milliseconds>(deadline - Clock::now());
    if (left.count() <= 0)
      return 0;
    return static_cast<int>(
        std::min<std::chrono::milliseconds::rep>(left.count(), std::numeric_limits<int>::max()));
  }

  // poll() one fd for \p events until \p deadline; 1 ready, 0 timeout, -1 error
  int waitFor(int fd, short events, Clock::time_point deadline) {
    pollfd pfd{ fd, events, 0 };
    while (true) {
      int rc = ::poll(&pfd, 1, msLeft(deadline));
      if (rc == -1 && errno == EINTR)
        continue; // interrupted → retry
      if (rc == -1) {
        std::cerr << "poll: " << strerror(errno) << '\n';
        return -1;
      }
      if (rc == 0) {
        if (Clock::now() < deadline)
          continue; // clamped wait ran out, deadline has not
        return 0;
      }
      // POLLHUP/POLLERR still let read() report EOF / the errno
      return 1;
    }
  }

} // namespace

SerialChannel::~SerialChannel() { close(); }

SerialChannel::SerialChannel(SerialChannel&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), kind_(other.kind_) {}

SerialChannel& SerialChannel::operator=(SerialChannel&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
    kind_ = other.kind_;
  }
  return *this;
}

bool SerialChannel::open(const PortLocator& port, std::chrono::milliseconds timeout) {
  close();
  kind_ = port.kind;
  if (port.kind == PortLocator::Kind::Socket)
    return openSocket(port.host, port.port, timeout);
  return openTty(port.device);
}

bool SerialChannel::openTty(const std::string& dev) {
  // open non-blocking, dont become ctrl-TTY
  fd_ = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
  if (fd_ < 0) {
    std::cerr << "Error " << errno << " from open(" << dev << "): " << strerror(errno) << "\n";
    return false;
  }

  // fetch current attrs
  struct termios tty;
  if (tcgetattr(fd_, &tty) != 0) {
    std::cerr << "Error " << errno << " from tcgetattr: " << strerror(errno) << "\n";
    close();
    return false;
  }

  // 19200 8-N-1, no flow control, reads paced by poll()
  cfmakeraw(&tty);
  tty.c_cflag &= ~CSIZE;
  tty.c_cflag |= CS8;
  tty.c_cflag &= ~PARENB;
  tty.c_cflag &= ~CSTOPB;
  tty.c_cflag &= ~CRTSCTS;
  tty.c_cflag |= (CLOCAL | CREAD);
  tty.c_iflag &= ~(IXON | IXOFF | IXANY);
  tty.c_cc[VMIN] = 0;
  tty.c_cc[VTIME] = 0;

  cfsetispeed(&tty, kBaud);
  cfsetospeed(&tty, kBaud);

  if (tcsetattr(fd_, TCSANOW, &tty) != 0) {
    std::cerr << "Error " << errno << " from tcsetattr: " << strerror(errno) << "\n";
    close();
    return false;
  }
  return true;
}

bool SerialChannel::openSocket(const std::string& host, std::uint16_t port,
                               std::chrono::milliseconds timeout) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo* found = nullptr;
  const std::string service = std::to_string(port);
  if (int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &found); rc != 0) {
    std::cerr << "getaddrinfo(" << host << "): " << gai_strerror(rc) << "\n";
    return false;
  }

  const auto deadline = deadlineAfter(timeout);
  for (addrinfo* ai = found; ai != nullptr && fd_ < 0; ai = ai->ai_next) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, ai->ai_protocol);
    if (fd < 0)
      continue;

    bool connected = ::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0;
    if (!connected && errno == EINPROGRESS && waitFor(fd, POLLOUT, deadline) == 1) {
      int soError = 0;
      socklen_t len = sizeof(soError);
      connected = ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len) == 0 && soError == 0;
      if (!connected && soError != 0)
        std::cerr << "connect(" << host << ":" << port << "): " << strerror(soError) << "\n";
    }

    if (connected) {
      int one = 1;
      ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)); // best effort
      fd_ = fd;
    } else {
      ::close(fd);
    }
  }
  ::freeaddrinfo(found);

  if (fd_ < 0) {
    std::cerr << "Error: could not connect to " << host << ":" << port << "\n";
    return false;
  }
  return true;
}

bool SerialChannel::resetBuffers() {
  if (fd_ < 0)
    return false;

  if (kind_ == PortLocator::Kind::Tty) {
    if (tcflush(fd_, TCIOFLUSH) != 0) {
      std::cerr << "Error " << errno << " from tcflush: " << strerror(errno) << "\n";
      return false;
    }
    return true;
  }

  // sockets have no tcflush: drain whatever the bridge already delivered
  char temp[256];
  while (true) {
    ssize_t n = ::recv(fd_, temp, sizeof(temp), MSG_DONTWAIT);
    if (n > 0)
      continue;
    if (n == 0) { // EOF / disconnect
      close();
      return false;
    }
    if (errno == EINTR)
      continue;
    if (errno == EAGAIN || errno == EWOULDBLOCK)
      return true;
    std::cerr << "recv: " << strerror(errno) << '\n';
    return false;
  }
}

bool SerialChannel::writeAll(const std::string& bytes, std::chrono::milliseconds timeout) {

  if (fd_ < 0) {
    return false;
  }

  const auto deadline = deadlineAfter(timeout);
  std::size_t total = 0;
  while (total < bytes.size()) {
    ssize_t written = kind_ == PortLocator::Kind::Socket
                          ? ::send(fd_, bytes.data() + total, bytes.size() - total, MSG_NOSIGNAL)
                          : ::write(fd_, bytes.data() + total, bytes.size() - total);
    if (written > 0) {
      total += written;
    } else if (written == -1 && errno == EINTR) {
      continue; // try again
    } else if (written == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      int rc = waitFor(fd_, POLLOUT, deadline);
      if (rc == 0) {
        std::cerr << "Error: write timed out after " << total << " of " << bytes.size()
                  << " bytes\n";
        return false;
      }
      if (rc < 0)
        return false;
    } else {
      std::cerr << "Error: " << errno << " from write: " << strerror(errno) << "\n";
      return false;
    }
  }

  // flush: block until the UART shifted everything out
  if (kind_ == PortLocator::Kind::Tty) {
    while (tcdrain(fd_) != 0) {
      if (errno == EINTR)
        continue;
      std::cerr << "Error " << errno << " from tcdrain: " << strerror(errno) << "\n";
      return false;
    }
  }
  return true;
}

// -------------------------------------------------------------------
// SerialChannel::readChunk
// Waits up to `timeout` for the next readable bytes and returns them.
// Returns std::nullopt on timeout, disconnect, or error.
// -------------------------------------------------------------------
std::optional<std::string> SerialChannel::readChunk(std::chrono::milliseconds timeout) {
  if (fd_ < 0)
    return std::nullopt;

  char temp[256];
  const auto deadline = deadlineAfter(timeout);

  while (true) {
    int rc = waitFor(fd_, POLLIN, deadline);
    if (rc == 0)
      return std::nullopt; // timeout
    if (rc < 0) {
      close();
      return std::nullopt;
    }

    ssize_t n = ::read(fd_, temp, sizeof(temp));
    if (n > 0)
      return std::string(temp, static_cast<std::size_t>(n));
    if (n == 0) { // EOF / disconnect
      close();
      return std::nullopt;
    }
    if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)
      continue; // transient → retry
    std::cerr << "read: " << strerror(errno) << '\n';
    close();
    return std::nullopt;
  }
}

void SerialChannel::close() {
  if (fd_ >= 0)
    ::close(fd_);
  fd_ = -1;
}

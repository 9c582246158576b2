/* @file Logger.cpp
 * @brief CSV trace writer - worker thread drains the ring buffer into the run file
 *
 * © 2025 Avior Driver contributors — MIT-licensed.
 */

// STL headers
#include <cstdio>
#include <ctime>
#include <iostream>
#include <stdexcept>

// Avior headers
#include "core/Logger.hpp"
#include "core/RingBuffer.hpp"

using namespace avior::core;

namespace {

  constexpr std::chrono::milliseconds kPollInterval{ 50 };

  std::string isoTimestamp(std::chrono::system_clock::time_point when) {
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()).count() %
        1000;
    const std::time_t secs = std::chrono::system_clock::to_time_t(when);
    std::tm utc{};
    gmtime_r(&secs, &utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &utc);
    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(ms));
    return out;
  }

  // CR/LF are the interesting bytes on this wire, keep them visible
  std::string escapeField(const std::string& raw) {
    std::string out;
    out.reserve(raw.size() + 2);
    out += '"';
    for (char c : raw) {
      switch (c) {
      case '\r':
        out += "\\r";
        break;
      case '\n':
        out += "\\n";
        break;
      case '"':
        out += "\"\"";
        break;
      default:
        out += c;
      }
    }
    out += '"';
    return out;
  }

} // namespace

const char* avior::core::toString(Direction d) {
  switch (d) {
  case Direction::Tx:
    return "TX";
  case Direction::Rx:
    return "RX";
  case Direction::Timeout:
    return "TIMEOUT";
  case Direction::Error:
    return "ERROR";
  case Direction::Warning:
    return "WARNING";
  default:
    return "UNKNOWN";
  }
}

Logger::Logger(std::size_t capacity) {
  if (capacity == 0)
    throw std::invalid_argument("[Logger] ring buffer capacity must be > 0");
  buffer_ = std::make_unique<RingBuffer<LogEvent>>(capacity);
}

Logger::~Logger() { finishRun(); }

void Logger::startNewRun(const std::string& csvPath) {
  if (running_)
    finishRun();

  csvFile_.open(csvPath, std::ios::out | std::ios::trunc);
  if (!csvFile_)
    throw std::runtime_error("[Logger] cannot open trace file: " + csvPath);
  csvFile_ << "timestamp,port,direction,payload\n";

  running_ = true;
  worker_ = std::thread([this] { drain(); });
}

void Logger::log(LogEvent event) {
  if (!running_)
    return;
  if (!buffer_->tryPush(std::move(event)))
    ++dropped_;
}

void Logger::finishRun() {
  if (!running_.exchange(false))
    return;
  if (worker_.joinable())
    worker_.join();
  csvFile_.flush();
  csvFile_.close();
}

void Logger::drain() {
  // keep going after finishRun() flips the flag until the backlog is written
  while (running_ || buffer_->size() > 0) {
    if (auto event = buffer_->popFor(kPollInterval))
      writeRow(*event);
  }
}

void Logger::writeRow(const LogEvent& event) {
  csvFile_ << isoTimestamp(event.when) << ',' << escapeField(event.port) << ','
           << toString(event.direction) << ',' << escapeField(event.payload) << '\n';
  if (!csvFile_) {
    std::cerr << "[Logger] write to trace file failed\n";
    csvFile_.clear();
  }
}

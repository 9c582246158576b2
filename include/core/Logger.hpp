#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous CSV transaction trace (runs its own worker thread).
 *
 *  © 2025 Avior Driver contributors — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <thread>

namespace avior {
  namespace core {

    enum class Direction : std::uint8_t { Tx, Rx, Timeout, Error, Warning };

    const char* toString(Direction d);

    struct LogEvent {
      std::chrono::system_clock::time_point when{ std::chrono::system_clock::now() };
      std::string port;    ///< locator of the link the event belongs to
      Direction direction{ Direction::Tx };
      std::string payload; ///< raw bytes or message; escaped on write
    };

    template <typename T> class RingBuffer; // forward decl to avoid heavy include

    /**
 * @class Logger
 * @brief One CSV row per event: `timestamp,port,direction,payload`.
 *
 *  * `log()` never blocks the caller; a full buffer drops the event and bumps `dropped()`.
 *  * Shared between sessions through `std::shared_ptr`.
 */
    class Logger {

    public:
      static constexpr std::size_t kDefaultCapacity = 1024;

      explicit Logger(std::size_t capacity = kDefaultCapacity);
      ~Logger(); ///< finishRun() if still running

      // --- public API ---
      void startNewRun(const std::string& csvPath); ///< open file + launch worker thread
      void log(LogEvent event);                      ///< enqueue event (non-blocking)
      void finishRun();                              ///< flush + join worker thread

      bool running() const { return running_.load(); }
      std::size_t dropped() const { return dropped_.load(); }

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      void drain();
      void writeRow(const LogEvent& event);

      std::ofstream csvFile_;
      std::unique_ptr<RingBuffer<LogEvent>> buffer_;
      std::thread worker_;
      std::atomic<bool> running_{ false };
      std::atomic<std::size_t> dropped_{ 0 };
    };

  } // namespace core
} // namespace avior

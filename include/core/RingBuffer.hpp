#pragma once
/** @file  RingBuffer.hpp
 *  @brief Bounded multi-producer / single-consumer queue for the Logger worker.
 *
 *  © 2025 Avior Driver contributors — MIT-licensed.
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <vector>

namespace avior {
  namespace core {

    /**
 * @class RingBuffer
 * @brief Fixed-capacity FIFO.  Producers never block: `tryPush()` fails when full.
 *
 *  * `popFor()` waits up to \p timeout for an element so the consumer can poll a stop flag.
 */
    template <typename T> class RingBuffer {
    public:
      explicit RingBuffer(std::size_t capacity) : slots_(capacity) {}

      bool tryPush(T value) {
        {
          std::lock_guard<std::mutex> lock(mtx_);
          if (count_ == slots_.size())
            return false;
          slots_[(head_ + count_) % slots_.size()] = std::move(value);
          ++count_;
        }
        cv_.notify_one();
        return true;
      }

      std::optional<T> popFor(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mtx_);
        if (!cv_.wait_for(lock, timeout, [this] { return count_ > 0; }))
          return std::nullopt;
        T value = std::move(slots_[head_]);
        head_ = (head_ + 1) % slots_.size();
        --count_;
        return value;
      }

      std::size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return count_;
      }

    private:
      std::vector<T> slots_;
      std::size_t head_{ 0 };
      std::size_t count_{ 0 };
      mutable std::mutex mtx_;
      std::condition_variable cv_;
    };

  } // namespace core
} // namespace avior

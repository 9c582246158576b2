#pragma once
/** @file  ResponseFramer.hpp
 *  @brief Accumulates inbound bytes until the '\r' end-of-frame condition holds.
 *
 *  © 2025 Avior Driver contributors — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <string>
#include <string_view>

// Avior headers
#include "protocols/Response.hpp"

namespace avior {
  namespace protocols {

    /**
 * @class ResponseFramer
 * @brief Byte-wise frame detector shared by the blocking and the event-driven session.
 *
 *  * A frame is complete once more than `skip` bytes are buffered and the last one is '\r'.
 *  * The wire has no length field, so chunks are scanned byte by byte; whatever follows
 *    the terminator in the same chunk is counted in `discarded()` and dropped.
 */
    class ResponseFramer {
    public:
      explicit ResponseFramer(std::size_t skip = 0) : skip_{ skip } {}

      /// Feed one chunk.  Returns true once the frame is complete.
      bool feed(std::string_view chunk) {
        for (std::size_t i = 0; i < chunk.size(); ++i) {
          if (complete_) {
            discarded_ += chunk.size() - i;
            break;
          }
          buffer_.push_back(chunk[i]);
          complete_ = buffer_.size() > skip_ && buffer_.back() == kResponseTerminator;
        }
        return complete_;
      }

      bool complete() const { return complete_; }
      const std::string& buffer() const { return buffer_; }
      std::size_t discarded() const { return discarded_; }

    private:
      std::size_t skip_;
      std::string buffer_{};
      std::size_t discarded_{ 0 };
      bool complete_{ false };
    };

  } // namespace protocols
} // namespace avior

#pragma once
/** @file  Errors.hpp
 *  @brief Exception types thrown by the Avior sessions.
 *
 *  © 2025 Avior Driver contributors — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>

namespace avior::core {

  /// Any failure to move a request or its response across the link.
  class TransportError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  /// Open/configure failure or a lost link.  The session is unusable afterwards.
  class ConnectionError : public TransportError {
  public:
    using TransportError::TransportError;
  };

  /**
 * @class TimeoutError
 * @brief No terminator before the read deadline.
 *
 *  * Carries whatever arrived so far for diagnostics.
 *  * The session stays usable; the next transaction clears the stale bytes.
 */
  class TimeoutError : public TransportError {
  public:
    TimeoutError(const std::string& what, std::string partial)
        : TransportError(what), partial_(std::move(partial)) {}

    const std::string& partial() const noexcept { return partial_; }

  private:
    std::string partial_;
  };

  /// The response frame is not 7-bit ASCII.
  class DecodeError : public std::runtime_error {
  public:
    DecodeError(const std::string& what, std::string raw)
        : std::runtime_error(what), raw_(std::move(raw)) {}

    const std::string& raw() const noexcept { return raw_; }

  private:
    std::string raw_;
  };

  /// Render bytes as "0x4f 0x4b 0x0d" for error messages.
  std::string hexDump(const std::string& bytes);

} // namespace avior::core

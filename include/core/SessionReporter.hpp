#pragma once
/** @file  SessionReporter.hpp
 *  @brief Trace + fault reporting shared by BlockingSession and AsyncSession.
 *
 *  © 2025 Avior Driver contributors — MIT-licensed.
 */

// STL headers
#include <memory>
#include <string>

// Avior headers
#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "protocols/ResponseFramer.hpp"

namespace avior::core {

  /**
 * @class SessionReporter
 * @brief Every failure goes through `raise()`: ErrorMonitor first, trace log second, then throw.
 *
 *  * The logger is optional; a null logger disables tracing.
 */
  class SessionReporter {
  public:
    SessionReporter(std::string port, std::shared_ptr<ErrorMonitor> errorMonitor,
                    std::shared_ptr<Logger> logger);

    void trace(Direction direction, const std::string& payload) const;

    /// Trace + stderr, no escalation.  Used for carried-over quirks worth seeing.
    void warn(const std::string& message) const;

    /// Notify the ErrorMonitor and trace, without throwing.
    void notify(const std::string& message, Direction direction = Direction::Error) const;

    /// Notify the ErrorMonitor, trace, and throw \p error.
    template <typename E> [[noreturn]] void raise(const E& error, Direction direction = Direction::Error) const {
      notify(error.what(), direction);
      throw error;
    }

    /// Decode a completed frame, raising DecodeError for non-ASCII bytes.
    std::string decode(const protocols::ResponseFramer& framer) const;

    const std::string& port() const { return port_; }

  private:
    std::string port_;
    std::shared_ptr<ErrorMonitor> errorMonitor_;
    std::shared_ptr<Logger> logger_;
  };

} // namespace avior::core

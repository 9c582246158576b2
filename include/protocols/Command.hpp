#pragma once
/** @file  Command.hpp
 *  @brief Typed Avior switch commands and their ASCII wire encoding.
 *
 *  © 2025 Avior Driver contributors — MIT-licensed.
 */

// STL headers
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace avior {
  namespace protocols {

    /// Route input \p source to output \p zone ("sw i0S o0Z").
    struct SetZoneSource {
      int zone;
      int source;
    };

    /// Route input \p source to every output ("sw i0S o*").
    struct SetAllZoneSource {
      int source;
    };

    /// Dump device information. Firmware support varies.
    struct Read {};

    /// Acknowledge front-panel / IR actions over RS-232.
    struct SetEcho {
      bool on;
    };

    /// Auto-switch to the next powered source when the active one powers off.
    struct SetPowerOnDetection {
      bool on;
    };

    struct SetMute {
      int zone;
      bool on;
    };

    struct SetCec {
      int zone;
      bool on;
    };

    /// Enable or disable the front-panel pushbuttons.
    struct SetButtonEnable {
      bool on;
    };

    /// Select the EDID reported upstream: "port1", "remix" or "default".
    struct SetEdidMode {
      std::string mode;
    };

    /// Factory reset.
    struct Reset {};

    using Command = std::variant<SetZoneSource, SetAllZoneSource, Read, SetEcho, SetPowerOnDetection,
                                 SetMute, SetCec, SetButtonEnable, SetEdidMode, Reset>;

    /**
 * @class EncodedRequest
 * @brief Immutable wire bytes of one command, always ending in "\r\n".
 *
 *  * Only `encode()` builds one, so the terminator is guaranteed.
 */
    class EncodedRequest {
    public:
      const std::string& bytes() const { return bytes_; }
      std::size_t size() const { return bytes_.size(); }

    private:
      explicit EncodedRequest(std::string bytes) : bytes_(std::move(bytes)) {}
      friend EncodedRequest encode(const Command& cmd);

      std::string bytes_;
    };

    inline constexpr std::string_view kRequestTerminator = "\r\n";
    inline constexpr int kMinPort = 1;
    inline constexpr int kMaxPort = 4;

    /// Pure and total: out-of-range ports are clamped, unknown EDID modes become "default".
    EncodedRequest encode(const Command& cmd);

    /// True for the EDID tokens the switch understands.
    bool isKnownEdidMode(std::string_view mode);

  } // namespace protocols
} // namespace avior

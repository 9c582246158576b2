/* @file Command.cpp
 * @brief Avior command grammar - one formatter per Command alternative
 *
 * © 2025 Avior Driver contributors — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <array>
#include <string>

// Avior headers
#include "protocols/Command.hpp"

namespace avior {
  namespace protocols {

    namespace {

      constexpr std::array<std::string_view, 3> kEdidModes{ "port1", "remix", "default" };

      int clampPort(int port) { return std::clamp(port, kMinPort, kMaxPort); }

      const char* onOff(bool on) { return on ? "on" : "off"; }

      // Switch Port Command
      //   sw i01 o03  //  input 1 to output 3
      //   sw i02 o*   //  input 2 to every output
      struct Formatter {
        std::string operator()(const SetZoneSource& c) const {
          return "sw i0" + std::to_string(clampPort(c.source)) + " o0" +
                 std::to_string(clampPort(c.zone));
        }
        std::string operator()(const SetAllZoneSource& c) const {
          return "sw i0" + std::to_string(clampPort(c.source)) + " o*";
        }
        std::string operator()(const Read&) const { return "read"; }
        std::string operator()(const SetEcho& c) const { return std::string("echo ") + onOff(c.on); }
        std::string operator()(const SetPowerOnDetection& c) const {
          return std::string("pod ") + onOff(c.on);
        }
        // mute/cec take the zone verbatim, no padding (device accepts "o3")
        std::string operator()(const SetMute& c) const {
          return "mute o" + std::to_string(c.zone) + " " + onOff(c.on);
        }
        std::string operator()(const SetCec& c) const {
          return "cec o" + std::to_string(c.zone) + " " + onOff(c.on);
        }
        std::string operator()(const SetButtonEnable& c) const {
          return std::string("button ") + onOff(c.on);
        }
        std::string operator()(const SetEdidMode& c) const {
          return "edid " + (isKnownEdidMode(c.mode) ? c.mode : std::string("default"));
        }
        std::string operator()(const Reset&) const { return "reset"; }
      };

    } // namespace

    bool isKnownEdidMode(std::string_view mode) {
      return std::find(kEdidModes.begin(), kEdidModes.end(), mode) != kEdidModes.end();
    }

    EncodedRequest encode(const Command& cmd) {
      std::string line = std::visit(Formatter{}, cmd);
      line += kRequestTerminator;
      return EncodedRequest(std::move(line));
    }

  } // namespace protocols
} // namespace avior

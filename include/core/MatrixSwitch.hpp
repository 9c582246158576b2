#pragma once
/** @file  MatrixSwitch.hpp
 *  @brief Public Avior 4x4 HDMI matrix API, one method per switch command.
 *
 *  © 2025 Avior Driver contributors — MIT-licensed.
 */

// STL headers
#include <string>
#include <utility>

// Avior headers
#include "core/AsyncSession.hpp"
#include "core/BlockingSession.hpp"
#include "protocols/Command.hpp"

namespace avior {
  namespace core {

    /**
 * @class MatrixSwitch
 * @brief Encodes each call and hands it to the session; returns the raw reply text.
 *
 *  * `Session` supplies `result_type transact(EncodedRequest, std::size_t)` and `warn()`.
 *    BlockingSession yields `std::string`, AsyncSession `awaitable<std::string>`.
 *  * No reply interpretation here: checking for "OK" is the caller's business.
 *  * Zones and sources are 1-4; the encoder clamps anything else.
 */
    template <typename Session> class MatrixSwitch {
    public:
      using result_type = typename Session::result_type;

      template <typename... Args>
      explicit MatrixSwitch(Args&&... args) : session_(std::forward<Args>(args)...) {}

      //---public API------------------------------------------------------
      result_type setZoneSource(int zone, int source) {
        return send(protocols::SetZoneSource{ zone, source });
      }
      result_type setAllZoneSource(int source) { return send(protocols::SetAllZoneSource{ source }); }

      /// View information from the device.  Not every firmware answers.
      result_type read() { return send(protocols::Read{}); }

      /// Acknowledge front-panel / IR actions over RS-232.
      result_type setEcho(bool on) { return send(protocols::SetEcho{ on }); }
      result_type setPowerOnDetection(bool on) { return send(protocols::SetPowerOnDetection{ on }); }
      result_type setMute(int zone, bool on) { return send(protocols::SetMute{ zone, on }); }
      result_type setCec(int zone, bool on) { return send(protocols::SetCec{ zone, on }); }
      result_type setButtonEnable(bool on) { return send(protocols::SetButtonEnable{ on }); }

      /// "port1", "remix" or "default"; anything else is sent as "default".
      result_type setEdidMode(const std::string& mode) {
        if (!protocols::isKnownEdidMode(mode))
          session_.warn("unknown EDID mode '" + mode + "', sending 'default'");
        return send(protocols::SetEdidMode{ mode });
      }

      /// Factory reset.
      result_type reset() { return send(protocols::Reset{}); }

      Session& session() { return session_; }
      const Session& session() const { return session_; }

    private:
      result_type send(const protocols::Command& cmd) { return session_.transact(protocols::encode(cmd)); }

      Session session_;
    };

    using BlockingMatrixSwitch = MatrixSwitch<BlockingSession>;
    using AsyncMatrixSwitch = MatrixSwitch<AsyncSession>;

  } // namespace core
} // namespace avior

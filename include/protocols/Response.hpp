#pragma once
/** @file  Response.hpp
 *  @brief Decoded Avior reply with fromWire.
 *
 *  © 2025 Avior Driver contributors — MIT-licensed.
 */

// STL headers
#include <optional>
#include <string>
#include <string_view>

namespace avior {
  namespace protocols {

    inline constexpr char kResponseTerminator = '\r';

    struct Response {
      std::string text; ///< payload without the trailing '\r'

      /// Decode a raw frame; std::nullopt if any byte is outside 7-bit ASCII.
      static std::optional<Response> fromWire(const std::string& raw) {
        for (unsigned char c : raw) {
          if (c > 0x7F)
            return std::nullopt;
        }
        Response response;
        response.text = raw;
        if (!response.text.empty() && response.text.back() == kResponseTerminator)
          response.text.pop_back();
        return response;
      }

      /// Convenience for the caller's "did the switch say OK" check.
      bool contains(std::string_view needle) const {
        return text.find(needle) != std::string::npos;
      }
    };

  } // namespace protocols
} // namespace avior

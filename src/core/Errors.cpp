/* @file Errors.cpp
 * @brief diagnostics helpers for the session exceptions
 *
 * © 2025 Avior Driver contributors — MIT-licensed.
 */

// STL headers
#include <cstdio>

// Avior headers
#include "core/Errors.hpp"

namespace avior::core {

  std::string hexDump(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size() * 5);
    char hex[8];
    for (unsigned char c : bytes) {
      std::snprintf(hex, sizeof(hex), "0x%02x", c);
      if (!out.empty())
        out += ' ';
      out += hex;
    }
    return out;
  }

} // namespace avior::core

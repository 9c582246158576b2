#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads driver configuration (JSON) from the host FS.
 *
 *  © 2025 Avior Driver contributors — MIT-licensed.
 */

#include <chrono>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace avior::core {

  /**
 * @struct DriverConfig
 * @brief Validated settings for one switch connection.
 *
 *  * Baud rate and 8-N-1 framing are fixed by the device and not configurable.
 */
  struct DriverConfig {
    static constexpr std::chrono::milliseconds kDefaultTimeout{ 2000 };
    static constexpr std::chrono::milliseconds kMaxTimeout{ 3600000 }; ///< one hour

    std::string port;                                 ///< tty path or socket://host:port
    std::chrono::milliseconds timeout{ kDefaultTimeout }; ///< read and write timeout
    std::string traceLog;                             ///< empty = no CSV trace

    /// Validate \p j; throws `std::invalid_argument` naming the offending key.
    static DriverConfig fromJson(const nlohmann::json& j);
  };

  /**
 * @class ConfigLoader
 * @brief Thin helper that reads a JSON file and hands the parsed object to the caller.
 *
 *  * No caching: every call to `load()` re-reads the file.
 *  * Schema validation lives in `DriverConfig::fromJson()`.
 */
  class ConfigLoader {
  public:
    /// @param configPath  Absolute or relative path on the host FS.
    explicit ConfigLoader(std::string configPath);

    /// Parse the file into a nlohmann::json object or throw `std::runtime_error`.
    nlohmann::json load() const;

    /// `load()` followed by `DriverConfig::fromJson()`.
    DriverConfig loadDriverConfig() const;

  private:
    std::string path_;
  };

} // namespace avior::core

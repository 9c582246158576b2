/* @file ConfigLoader.cpp
 * @brief JSON driver settings - file read + schema checks
 *
 * © 2025 Avior Driver contributors — MIT-licensed.
 */

// STL headers
#include <fstream>
#include <stdexcept>

// 3rd-party headers
#include <nlohmann/json.hpp>

// Avior headers
#include "core/ConfigLoader.hpp"
#include "io/PortLocator.hpp"

using namespace avior::core;

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

nlohmann::json ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw std::runtime_error("[ConfigLoader] cannot open config file: " + path_);

  try {
    return nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("[ConfigLoader] invalid JSON in " + path_ + ": " + e.what());
  }
}

DriverConfig ConfigLoader::loadDriverConfig() const { return DriverConfig::fromJson(load()); }

DriverConfig DriverConfig::fromJson(const nlohmann::json& j) {
  if (!j.is_object())
    throw std::invalid_argument("[ConfigLoader] driver config must be a JSON object");

  DriverConfig cfg;

  auto port = j.find("port");
  if (port == j.end() || !port->is_string())
    throw std::invalid_argument("[ConfigLoader] 'port' is required and must be a string");
  cfg.port = port->get<std::string>();
  io::parseLocator(cfg.port); // throws on malformed locators

  if (auto timeout = j.find("timeout_ms"); timeout != j.end()) {
    if (!timeout->is_number_integer() || timeout->get<long long>() <= 0)
      throw std::invalid_argument("[ConfigLoader] 'timeout_ms' must be a positive integer");
    if (timeout->get<long long>() > kMaxTimeout.count())
      throw std::invalid_argument("[ConfigLoader] 'timeout_ms' must not exceed " +
                                  std::to_string(kMaxTimeout.count()));
    cfg.timeout = std::chrono::milliseconds{ timeout->get<long long>() };
  }

  if (auto trace = j.find("trace_log"); trace != j.end()) {
    if (!trace->is_string())
      throw std::invalid_argument("[ConfigLoader] 'trace_log' must be a string");
    cfg.traceLog = trace->get<std::string>();
  }

  return cfg;
}

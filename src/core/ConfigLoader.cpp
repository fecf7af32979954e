/* @file ConfigLoader.cpp
 * @brief config file parsing and key mapping
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <fstream>
#include <stdexcept>
#include <utility>

// 3rd-party headers
#include <nlohmann/json.hpp>

// salvage headers
#include "core/ConfigLoader.hpp"

using namespace salvage::core;
using nlohmann::json;

namespace {
  LogLevel parseLogLevel(const std::string& s) {
    if (s == "debug")
      return LogLevel::Debug;
    if (s == "info")
      return LogLevel::Info;
    if (s == "warning")
      return LogLevel::Warning;
    if (s == "error")
      return LogLevel::Error;
    throw std::runtime_error("[ConfigLoader] unknown logLevel '" + s + "'");
  }

  ControlFailurePolicy parsePolicy(const std::string& s) {
    if (s == "keep-status")
      return ControlFailurePolicy::KeepStatus;
    if (s == "error")
      return ControlFailurePolicy::EnterError;
    throw std::runtime_error("[ConfigLoader] unknown controlFailurePolicy '" + s + "'");
  }

  template <typename T> T valueOr(const json& j, const char* key, T fallback) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
      return fallback;
    try {
      return it->get<T>();
    } catch (const json::exception& e) {
      throw std::runtime_error(std::string("[ConfigLoader] bad value for '") + key + "': " + e.what());
    }
  }

  std::chrono::milliseconds positiveMs(const json& j, const char* key, std::chrono::milliseconds fallback) {
    const auto ms = valueOr<long long>(j, key, fallback.count());
    if (ms <= 0)
      throw std::runtime_error(std::string("[ConfigLoader] '") + key + "' must be positive");
    return std::chrono::milliseconds(ms);
  }
} // namespace

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

json ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw std::runtime_error("[ConfigLoader] cannot open " + path_);
  try {
    return json::parse(in);
  } catch (const json::parse_error& e) {
    throw std::runtime_error("[ConfigLoader] " + path_ + ": " + e.what());
  }
}

ClientConfig ClientConfig::fromJson(const json& j) {
  if (!j.is_object())
    throw std::runtime_error("[ConfigLoader] config root must be an object");

  ClientConfig cfg;
  cfg.hostSocket = valueOr<std::string>(j, "hostSocket", cfg.hostSocket);
  cfg.replyTimeout = positiveMs(j, "replyTimeoutMs", cfg.replyTimeout);
  cfg.pumpInterval = positiveMs(j, "pumpIntervalMs", cfg.pumpInterval);
  cfg.logPath = valueOr<std::string>(j, "logPath", cfg.logPath);
  cfg.logLevel = parseLogLevel(valueOr<std::string>(j, "logLevel", "info"));
  cfg.controller.controlFailurePolicy =
      parsePolicy(valueOr<std::string>(j, "controlFailurePolicy", "keep-status"));
  cfg.controller.singleActiveSession = valueOr<bool>(j, "singleActiveSession", true);
  return cfg;
}

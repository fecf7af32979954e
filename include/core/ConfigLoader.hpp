#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads the client configuration (JSON) from the host FS.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "core/Logger.hpp"
#include "core/SessionController.hpp"

namespace salvage::core {

  /**
 * @class ConfigLoader
 * @brief Thin helper that reads a JSON file and hands the parsed object to the caller.
 *
 *  * No caching: every call to `load()` re-reads the file.
 *  * Schema mapping lives in `ClientConfig::fromJson`.
 */
  class ConfigLoader {
  public:
    /// @param configPath  Absolute or relative path on the host FS.
    explicit ConfigLoader(std::string configPath);

    /// Parse the file into a nlohmann::json object or throw `std::runtime_error`.
    nlohmann::json load() const;

    const std::string& path() const { return path_; }

  private:
    std::string path_;
  };

  /// Typed view of the config file; every key is optional.
  struct ClientConfig {
    std::string hostSocket{ "/run/salvage/host.sock" };
    std::chrono::milliseconds replyTimeout{ 30000 };
    std::chrono::milliseconds pumpInterval{ 100 };
    std::string logPath{ "salvage-client.csv" };
    LogLevel logLevel{ LogLevel::Info };
    ControllerOptions controller{};

    /// @throws std::runtime_error on a wrong type or an unknown enumerated value.
    static ClientConfig fromJson(const nlohmann::json& j);
  };

} // namespace salvage::core

#pragma once
/** @file  Response.hpp
 *  @brief Incoming frame: a reply to an invoke, or a pushed event.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <optional>
#include <string>

// 3rd-party headers
#include <nlohmann/json.hpp>

namespace salvage {
  namespace protocols {

    struct Response {
      enum class Kind { Reply, Event };

      Kind kind{ Kind::Reply };
      std::uint64_t id{ 0 };            ///< Reply only
      std::optional<std::string> fault; ///< Reply only: host could not dispatch the call
      nlohmann::json result;            ///< Reply only; may be null
      std::string channel;              ///< Event only
      nlohmann::json args = nlohmann::json::array(); ///< Event only: positional arguments

      /// Parse one line; std::nullopt if it is not a well-formed frame.
      static std::optional<Response> fromWire(const std::string& line);
    };

  } // namespace protocols
} // namespace salvage

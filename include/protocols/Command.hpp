#pragma once
/** @file  Command.hpp
 *  @brief Outgoing invoke frame.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <string>

// 3rd-party headers
#include <nlohmann/json.hpp>

namespace salvage {
  namespace protocols {

    /// One request; `id` matches it to exactly one reply frame.
    struct Command {
      std::uint64_t id{ 0 };
      std::string channel;
      nlohmann::json payload; ///< null when the operation takes no argument

      std::string toWire() const {
        nlohmann::json frame{ { "type", "invoke" }, { "id", id }, { "channel", channel } };
        frame["payload"] = payload;
        return frame.dump() + "\r\n";
      }
    };

  } // namespace protocols
} // namespace salvage

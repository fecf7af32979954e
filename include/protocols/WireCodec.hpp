#pragma once
/** @file  WireCodec.hpp
 *  @brief JSON <-> value-type conversion at the boundary edge.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>
#include <vector>

// 3rd-party headers
#include <nlohmann/json.hpp>

// salvage headers
#include "core/Types.hpp"
#include "protocols/SessionEvent.hpp"

namespace salvage {
  namespace protocols {

    /// Payload or frame does not match the channel schema.
    class DecodeError : public std::runtime_error {
    public:
      explicit DecodeError(const std::string& message) : std::runtime_error(message) {}
    };

    //---64-bit quantities travel as decimal text----------------------------
    std::string encodeU64(core::ByteCount value);
    /// Accepts only a non-empty string of ASCII digits that fits in 64 bits.
    core::ByteCount decodeU64(const nlohmann::json& value);

    //---outgoing payloads---------------------------------------------------
    nlohmann::json toJson(const core::ScanConfig& config);
    nlohmann::json toJson(const core::RecoverableFile& file);
    nlohmann::json toJson(const core::RecoveryConfig& config);

    //---incoming payloads (throw DecodeError)-------------------------------
    core::Device deviceFromJson(const nlohmann::json& j);
    std::vector<core::Device> devicesFromJson(const nlohmann::json& j);
    core::RecoverableFile fileFromJson(const nlohmann::json& j);
    core::ScanProgress scanProgressFromJson(const nlohmann::json& j);
    core::RecoveryProgress recoveryProgressFromJson(const nlohmann::json& j);
    core::PrivilegeStatus privilegeFromJson(const nlohmann::json& j);

    //---push events---------------------------------------------------------
    bool isEventChannel(const std::string& channel);

    /**
     * @brief Unpack the positional arguments of one pushed event into its typed form.
     *
     * `args` is `[payload]` or `[sessionId, payload]`. Error channels accept a
     * bare string as the message; `recovery.complete` accepts a bare id.
     *
     * @throws DecodeError on an unknown channel or a payload that fails the schema.
     */
    SessionEvent decodeEvent(const std::string& channel, const nlohmann::json& args);

  } // namespace protocols
} // namespace salvage

#pragma once
/** @file  CommandGateway.hpp
 *  @brief One typed call per host operation; failures surface as CommandFailure.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// 3rd-party headers
#include <nlohmann/json.hpp>

// salvage headers
#include "core/Types.hpp"
#include "io/Transport.hpp"

namespace salvage {
  namespace core {

    /**
 * @class CommandGateway
 * @brief Turns each logical operation into exactly one boundary request.
 *
 *  * A reply with `success: false` raises `CommandFailure` carrying the host
 *    message, or the operation's fixed fallback text when the host sent none.
 *  * Transport failures are re-raised as `CommandFailure` too; callers see one kind.
 *  * No retries and no state: the gateway only shapes requests and replies.
 */
    class CommandGateway {
    public:
      explicit CommandGateway(io::Transport& transport);
      virtual ~CommandGateway() = default;

      //---devices---------------------------------------------------------
      virtual std::vector<Device> listDevices();
      virtual std::vector<Device> refreshDevices();

      //---scan------------------------------------------------------------
      /// @returns the host-assigned session id.
      virtual std::string startScan(const ScanConfig& config);
      virtual void pauseScan(const std::string& sessionId);
      virtual void resumeScan(const std::string& sessionId);
      virtual void cancelScan(const std::string& sessionId);

      //---recovery--------------------------------------------------------
      /// @returns the recovery id when the host reports one in the reply.
      virtual std::optional<std::string> startRecovery(const RecoveryConfig& config);
      virtual void pauseRecovery(const std::string& recoveryId);
      virtual void resumeRecovery(const std::string& recoveryId);
      virtual void cancelRecovery(const std::string& recoveryId);

      //---privilege-------------------------------------------------------
      virtual PrivilegeStatus checkPrivilege();
      virtual PrivilegeStatus requestPrivilege();

      //---preview---------------------------------------------------------
      /// @returns std::nullopt when the host has no preview for this file.
      virtual std::optional<PreviewImage> generatePreview(const std::string& devicePath,
                                                          const std::string& fileId,
                                                          ByteCount offset, ByteCount size);
      virtual std::string hexDump(const std::string& devicePath, ByteCount offset,
                                  std::uint32_t length);

      //---dialog----------------------------------------------------------
      /// @returns std::nullopt when the user dismissed the dialog.
      virtual std::optional<std::string> selectDirectory();

    private:
      nlohmann::json call(const char* channel, const nlohmann::json& payload, const char* fallback);
      nlohmann::json callNullable(const char* channel, const nlohmann::json& payload,
                                  const char* fallback);

      io::Transport& transport_;
    };

  } // namespace core
} // namespace salvage

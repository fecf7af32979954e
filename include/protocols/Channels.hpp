#pragma once
/** @file  Channels.hpp
 *  @brief Channel names shared with the host process.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

namespace salvage {
  namespace protocols {
    namespace channels {

      // ---- request / reply ----
      inline constexpr const char* kDeviceList = "device.list";
      inline constexpr const char* kDeviceRefresh = "device.refresh";

      inline constexpr const char* kScanStart = "scan.start";
      inline constexpr const char* kScanPause = "scan.pause";
      inline constexpr const char* kScanResume = "scan.resume";
      inline constexpr const char* kScanCancel = "scan.cancel";

      inline constexpr const char* kRecoveryStart = "recovery.start";
      inline constexpr const char* kRecoveryPause = "recovery.pause";
      inline constexpr const char* kRecoveryResume = "recovery.resume";
      inline constexpr const char* kRecoveryCancel = "recovery.cancel";

      inline constexpr const char* kPrivilegeCheck = "privilege.check";
      inline constexpr const char* kPrivilegeRequest = "privilege.request";

      inline constexpr const char* kPreviewGenerate = "preview.generate";
      inline constexpr const char* kPreviewHex = "preview.hex";

      inline constexpr const char* kDialogSelectDirectory = "dialog.selectDirectory";

      // ---- push events ----
      inline constexpr const char* kScanProgress = "scan.progress";
      inline constexpr const char* kScanFileFound = "scan.fileFound";
      inline constexpr const char* kScanComplete = "scan.complete";
      inline constexpr const char* kScanError = "scan.error";

      inline constexpr const char* kRecoveryProgress = "recovery.progress";
      inline constexpr const char* kRecoveryComplete = "recovery.complete";
      inline constexpr const char* kRecoveryError = "recovery.error";

    } // namespace channels
  } // namespace protocols
} // namespace salvage

/* @file CommandGateway.cpp
 * @brief request shaping and reply-envelope checks for every host command
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <string>

// salvage headers
#include "core/CommandGateway.hpp"
#include "core/Errors.hpp"
#include "protocols/Channels.hpp"
#include "protocols/WireCodec.hpp"

using namespace salvage::core;
using nlohmann::json;
namespace ch = salvage::protocols::channels;

namespace {
  constexpr const char* kListFailed = "Failed to list devices";
  constexpr const char* kRefreshFailed = "Failed to refresh devices";
  constexpr const char* kScanStartFailed = "Failed to start scan";
  constexpr const char* kScanPauseFailed = "Failed to pause scan";
  constexpr const char* kScanResumeFailed = "Failed to resume scan";
  constexpr const char* kScanCancelFailed = "Failed to cancel scan";
  constexpr const char* kRecoveryStartFailed = "Failed to start recovery";
  constexpr const char* kRecoveryPauseFailed = "Failed to pause recovery";
  constexpr const char* kRecoveryResumeFailed = "Failed to resume recovery";
  constexpr const char* kRecoveryCancelFailed = "Failed to cancel recovery";
  constexpr const char* kPrivilegeCheckFailed = "Failed to check privileges";
  constexpr const char* kPrivilegeRequestFailed = "Failed to request elevation";
  constexpr const char* kPreviewFailed = "Failed to generate preview";
  constexpr const char* kHexFailed = "Failed to read hex dump";
  constexpr const char* kDialogFailed = "Failed to open directory dialog";

  /// `success: false` → CommandFailure with the host text, or \p fallback if it sent none.
  void checkEnvelope(const json& reply, const char* fallback) {
    auto success = reply.find("success");
    if (success == reply.end() || !success->is_boolean())
      throw CommandFailure(std::string(fallback) + ": reply carries no success flag");
    if (success->get<bool>())
      return;

    auto error = reply.find("error");
    if (error != reply.end() && error->is_string() && !error->get_ref<const std::string&>().empty())
      throw CommandFailure(error->get<std::string>());
    throw CommandFailure(fallback);
  }

  template <typename Fn> auto decodeOrFail(const char* fallback, Fn&& fn) -> decltype(fn()) {
    try {
      return fn();
    } catch (const salvage::protocols::DecodeError& e) {
      throw CommandFailure(std::string(fallback) + ": " + e.what());
    }
  }
} // namespace

CommandGateway::CommandGateway(io::Transport& transport) : transport_(transport) {}

json CommandGateway::callNullable(const char* channel, const json& payload, const char* fallback) {
  json reply;
  try {
    reply = transport_.invoke(channel, payload);
  } catch (const TransportFailure& e) {
    throw CommandFailure(e.what());
  }
  if (reply.is_null())
    return reply;
  if (!reply.is_object())
    throw CommandFailure(std::string(fallback) + ": reply is not an object");
  return reply;
}

json CommandGateway::call(const char* channel, const json& payload, const char* fallback) {
  json reply = callNullable(channel, payload, fallback);
  if (reply.is_null())
    throw CommandFailure(std::string(fallback) + ": empty reply");
  checkEnvelope(reply, fallback);
  return reply;
}

std::vector<Device> CommandGateway::listDevices() {
  json reply = call(ch::kDeviceList, nullptr, kListFailed);
  return decodeOrFail(kListFailed, [&] { return protocols::devicesFromJson(reply.value("devices", json::array())); });
}

std::vector<Device> CommandGateway::refreshDevices() {
  json reply = call(ch::kDeviceRefresh, nullptr, kRefreshFailed);
  return decodeOrFail(kRefreshFailed, [&] { return protocols::devicesFromJson(reply.value("devices", json::array())); });
}

std::string CommandGateway::startScan(const ScanConfig& config) {
  json reply = call(ch::kScanStart, protocols::toJson(config), kScanStartFailed);
  auto id = reply.find("sessionId");
  if (id == reply.end() || !id->is_string() || id->get_ref<const std::string&>().empty())
    throw CommandFailure(std::string(kScanStartFailed) + ": reply carries no session id");
  return id->get<std::string>();
}

void CommandGateway::pauseScan(const std::string& sessionId) {
  call(ch::kScanPause, sessionId, kScanPauseFailed);
}

void CommandGateway::resumeScan(const std::string& sessionId) {
  call(ch::kScanResume, sessionId, kScanResumeFailed);
}

void CommandGateway::cancelScan(const std::string& sessionId) {
  call(ch::kScanCancel, sessionId, kScanCancelFailed);
}

std::optional<std::string> CommandGateway::startRecovery(const RecoveryConfig& config) {
  json reply = call(ch::kRecoveryStart, protocols::toJson(config), kRecoveryStartFailed);
  auto id = reply.find("recoveryId");
  if (id == reply.end() || !id->is_string() || id->get_ref<const std::string&>().empty())
    return std::nullopt;
  return id->get<std::string>();
}

void CommandGateway::pauseRecovery(const std::string& recoveryId) {
  call(ch::kRecoveryPause, recoveryId, kRecoveryPauseFailed);
}

void CommandGateway::resumeRecovery(const std::string& recoveryId) {
  call(ch::kRecoveryResume, recoveryId, kRecoveryResumeFailed);
}

void CommandGateway::cancelRecovery(const std::string& recoveryId) {
  call(ch::kRecoveryCancel, recoveryId, kRecoveryCancelFailed);
}

PrivilegeStatus CommandGateway::checkPrivilege() {
  json reply = call(ch::kPrivilegeCheck, nullptr, kPrivilegeCheckFailed);
  return decodeOrFail(kPrivilegeCheckFailed, [&] {
    // older hosts answer with the status fields inline
    return protocols::privilegeFromJson(reply.contains("status") ? reply["status"] : reply);
  });
}

PrivilegeStatus CommandGateway::requestPrivilege() {
  json reply = call(ch::kPrivilegeRequest, nullptr, kPrivilegeRequestFailed);
  return decodeOrFail(kPrivilegeRequestFailed, [&] { return protocols::privilegeFromJson(reply); });
}

std::optional<PreviewImage> CommandGateway::generatePreview(const std::string& devicePath,
                                                            const std::string& fileId,
                                                            ByteCount offset, ByteCount size) {
  json payload{ { "devicePath", devicePath },
                { "fileId", fileId },
                { "offset", protocols::encodeU64(offset) },
                { "size", protocols::encodeU64(size) } };
  json reply = callNullable(ch::kPreviewGenerate, payload, kPreviewFailed);
  if (reply.is_null())
    return std::nullopt;
  checkEnvelope(reply, kPreviewFailed);

  auto data = reply.find("base64");
  if (data == reply.end() || data->is_null())
    return std::nullopt;
  if (!data->is_string())
    throw CommandFailure(std::string(kPreviewFailed) + ": preview data must be a string");

  PreviewImage image;
  image.fileId = reply.value("fileId", fileId);
  image.base64 = data->get<std::string>();
  return image;
}

std::string CommandGateway::hexDump(const std::string& devicePath, ByteCount offset,
                                    std::uint32_t length) {
  json payload{ { "devicePath", devicePath }, { "offset", protocols::encodeU64(offset) }, { "length", length } };
  json reply = call(ch::kPreviewHex, payload, kHexFailed);
  auto dump = reply.find("hexDump");
  if (dump == reply.end() || !dump->is_string())
    throw CommandFailure(std::string(kHexFailed) + ": reply carries no dump");
  return dump->get<std::string>();
}

std::optional<std::string> CommandGateway::selectDirectory() {
  json reply = callNullable(ch::kDialogSelectDirectory, nullptr, kDialogFailed);
  if (reply.is_null())
    return std::nullopt;
  if (reply.contains("success"))
    checkEnvelope(reply, kDialogFailed);

  auto path = reply.find("path");
  if (path == reply.end() || path->is_null())
    return std::nullopt;
  if (!path->is_string())
    throw CommandFailure(std::string(kDialogFailed) + ": path must be a string");
  return path->get<std::string>();
}

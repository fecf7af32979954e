/* @file RecoveryController.cpp
 * @brief recovery.* commands and channels
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <optional>
#include <utility>

#include "core/CommandGateway.hpp"
#include "core/Errors.hpp"
#include "core/RecoveryController.hpp"
#include "core/SelectionStore.hpp"
#include "protocols/Channels.hpp"

using namespace salvage::core;
namespace ch = salvage::protocols::channels;

RecoveryController::RecoveryController(CommandGateway& gateway, EventRegistry& events,
                                       const SelectionStore& selection, const SessionStore& scanStore,
                                       std::shared_ptr<ErrorMonitor> errMonitor,
                                       std::shared_ptr<Logger> logger, ControllerOptions options)
    : SessionController(SessionKind::Recovery, gateway, events, std::move(errMonitor),
                        std::move(logger), options),
      selection_(selection), scanStore_(scanStore) {}

RecoveryConfig RecoveryController::buildConfig(const std::string& sourceDevicePath) const {
  RecoveryConfig config;
  for (const auto& file : scanStore_.snapshot().files) {
    if (selection_.isFileSelected(file.id))
      config.files.push_back(file);
  }
  config.destinationPath = selection_.destination();
  config.conflictStrategy = selection_.conflictStrategy();
  config.preserveStructure = selection_.preserveStructure();
  config.sourceDevicePath = sourceDevicePath;
  return config;
}

bool RecoveryController::start() {
  auto device = selection_.selectedDevice();
  if (!device) {
    log(LogLevel::Warning, "start ignored: no device selected");
    return false;
  }
  if (selection_.destination().empty()) {
    log(LogLevel::Warning, "start ignored: no destination directory");
    return false;
  }
  if (!beginStart())
    return false;

  const RecoveryConfig config = buildConfig(device->path);
  log(LogLevel::Info, "recovering " + std::to_string(config.files.size()) + " files to " +
                          config.destinationPath);
  std::optional<std::string> recoveryId;
  try {
    recoveryId = gateway_.startRecovery(config);
  } catch (const CommandFailure& e) {
    applyStartFailure(e.what());
    return true;
  }
  applyStartSuccess(recoveryId);
  return true;
}

std::vector<RecoveryError> RecoveryController::fileErrors() const {
  const auto& progress = store_.snapshot().recoveryProgress;
  return progress ? progress->errors : std::vector<RecoveryError>{};
}

std::vector<std::string> RecoveryController::eventChannels() const {
  return { ch::kRecoveryProgress, ch::kRecoveryComplete, ch::kRecoveryError };
}

void RecoveryController::issuePause(const std::string& id) { gateway_.pauseRecovery(id); }
void RecoveryController::issueResume(const std::string& id) { gateway_.resumeRecovery(id); }
void RecoveryController::issueCancel(const std::string& id) { gateway_.cancelRecovery(id); }

/* @file ScanController.cpp
 * @brief scan.* commands and channels
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <utility>

#include "core/ScanController.hpp"
#include "core/CommandGateway.hpp"
#include "core/Errors.hpp"
#include "core/SelectionStore.hpp"
#include "protocols/Channels.hpp"

using namespace salvage::core;
namespace ch = salvage::protocols::channels;

ScanController::ScanController(CommandGateway& gateway, EventRegistry& events,
                               const SelectionStore& selection, std::shared_ptr<ErrorMonitor> errMonitor,
                               std::shared_ptr<Logger> logger, ControllerOptions options)
    : SessionController(SessionKind::Scan, gateway, events, std::move(errMonitor), std::move(logger),
                        options),
      selection_(selection) {}

bool ScanController::start() {
  auto config = selection_.buildScanConfig();
  if (!config) {
    log(LogLevel::Warning, "start ignored: no device selected");
    return false;
  }
  if (!beginStart())
    return false;

  log(LogLevel::Info, std::string(toString(config->mode)) + " scan of " + config->devicePath +
                          (config->partitionPath ? " (" + *config->partitionPath + ")" : ""));
  std::string sessionId;
  try {
    sessionId = gateway_.startScan(*config);
  } catch (const CommandFailure& e) {
    applyStartFailure(e.what());
    return true;
  }
  applyStartSuccess(sessionId);
  return true;
}

std::vector<std::string> ScanController::eventChannels() const {
  return { ch::kScanProgress, ch::kScanFileFound, ch::kScanComplete, ch::kScanError };
}

void ScanController::issuePause(const std::string& id) { gateway_.pauseScan(id); }
void ScanController::issueResume(const std::string& id) { gateway_.resumeScan(id); }
void ScanController::issueCancel(const std::string& id) { gateway_.cancelScan(id); }

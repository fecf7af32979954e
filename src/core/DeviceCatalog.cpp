/* @file DeviceCatalog.cpp
 * @brief device.list / device.refresh and selection reconciliation
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <algorithm>
#include <cassert>
#include <utility>

#include "core/CommandGateway.hpp"
#include "core/DeviceCatalog.hpp"
#include "core/Errors.hpp"
#include "core/SelectionStore.hpp"

using namespace salvage::core;

DeviceCatalog::DeviceCatalog(CommandGateway& gateway, SelectionStore& selection,
                             std::shared_ptr<Logger> logger)
    : gateway_(gateway), selection_(selection), logger_(std::move(logger)) {
  assert(logger_ && "[DeviceCatalog] logger is nullptr");
}

template <typename Fetch> bool DeviceCatalog::update(const char* what, Fetch fetch) {
  loading_ = true;
  error_.reset();
  try {
    devices_ = fetch();
  } catch (const CommandFailure& e) {
    loading_ = false;
    error_ = e.what();
    logger_->log(LogLevel::Error, "devices", std::string(what) + " failed: " + e.what());
    return false;
  }
  loading_ = false;
  logger_->log(LogLevel::Info, "devices", std::to_string(devices_.size()) + " devices after " + what);
  reconcileSelection();
  return true;
}

bool DeviceCatalog::load() {
  return update("list", [this] { return gateway_.listDevices(); });
}

bool DeviceCatalog::refresh() {
  return update("refresh", [this] { return gateway_.refreshDevices(); });
}

std::optional<Device> DeviceCatalog::find(const std::string& path) const {
  auto it = std::find_if(devices_.begin(), devices_.end(),
                         [&](const Device& d) { return d.path == path; });
  if (it == devices_.end())
    return std::nullopt;
  return *it;
}

void DeviceCatalog::reconcileSelection() {
  auto selected = selection_.selectedDevice();
  if (!selected)
    return;
  auto current = find(selected->path);
  if (!current) {
    logger_->log(LogLevel::Warning, "devices", selected->path + " disappeared, selection cleared");
    selection_.selectDevice(std::nullopt);
    return;
  }
  // same path keeps the partition choice, refreshed, unless the partition is gone
  auto partition = selection_.selectedPartition();
  selection_.selectDevice(*current);
  if (!partition)
    return;
  auto refreshed = std::find_if(current->partitions.begin(), current->partitions.end(),
                                [&](const Partition& p) { return p.path == partition->path; });
  if (refreshed == current->partitions.end())
    selection_.selectPartition(std::nullopt);
  else
    selection_.selectPartition(*refreshed);
}

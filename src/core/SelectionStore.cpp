/* @file SelectionStore.cpp
 * @brief user choices behind scan and recovery configs
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <utility>

// salvage headers
#include "core/SelectionStore.hpp"

using namespace salvage::core;

SelectionStore::SelectionStore()
    : categories_{ FileCategory::Photo, FileCategory::Video, FileCategory::Document } {}

void SelectionStore::selectDevice(std::optional<Device> device) {
  std::lock_guard<std::mutex> lock(mtx_);
  const bool samePath = device && device_ && device->path == device_->path;
  if (!samePath)
    partition_.reset();
  device_ = std::move(device);
}

std::optional<Device> SelectionStore::selectedDevice() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return device_;
}

void SelectionStore::selectPartition(std::optional<Partition> partition) {
  std::lock_guard<std::mutex> lock(mtx_);
  partition_ = std::move(partition);
}

std::optional<Partition> SelectionStore::selectedPartition() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return partition_;
}

void SelectionStore::setScanMode(ScanMode mode) {
  std::lock_guard<std::mutex> lock(mtx_);
  mode_ = mode;
}

ScanMode SelectionStore::scanMode() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return mode_;
}

void SelectionStore::setCategories(std::vector<FileCategory> categories) {
  std::lock_guard<std::mutex> lock(mtx_);
  categories_ = std::move(categories);
}

void SelectionStore::toggleCategory(FileCategory category) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = std::find(categories_.begin(), categories_.end(), category);
  if (it != categories_.end())
    categories_.erase(it);
  else
    categories_.push_back(category);
}

std::vector<FileCategory> SelectionStore::categories() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return categories_;
}

void SelectionStore::setFileTypes(std::vector<std::string> types) {
  std::lock_guard<std::mutex> lock(mtx_);
  fileTypes_ = std::move(types);
}

std::vector<std::string> SelectionStore::fileTypes() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return fileTypes_;
}

std::optional<ScanConfig> SelectionStore::buildScanConfig() const {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!device_)
    return std::nullopt;

  ScanConfig config;
  config.devicePath = device_->path;
  config.mode = mode_;
  config.categories = categories_;
  config.fileTypes = fileTypes_;
  if (partition_) {
    config.partitionPath = partition_->path;
    config.deviceSize = partition_->size;
  } else {
    config.deviceSize = device_->size;
  }
  return config;
}

void SelectionStore::setDestination(std::string path) {
  std::lock_guard<std::mutex> lock(mtx_);
  destination_ = std::move(path);
}

std::string SelectionStore::destination() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return destination_;
}

void SelectionStore::setConflictStrategy(ConflictStrategy strategy) {
  std::lock_guard<std::mutex> lock(mtx_);
  conflict_ = strategy;
}

ConflictStrategy SelectionStore::conflictStrategy() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return conflict_;
}

void SelectionStore::setPreserveStructure(bool preserve) {
  std::lock_guard<std::mutex> lock(mtx_);
  preserveStructure_ = preserve;
}

bool SelectionStore::preserveStructure() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return preserveStructure_;
}

void SelectionStore::toggleFile(const std::string& fileId) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!selectedFiles_.erase(fileId))
    selectedFiles_.insert(fileId);
}

void SelectionStore::selectAllFiles(const std::vector<RecoverableFile>& files) {
  std::lock_guard<std::mutex> lock(mtx_);
  selectedFiles_.clear();
  for (const auto& f : files)
    selectedFiles_.insert(f.id);
}

void SelectionStore::clearFileSelection() {
  std::lock_guard<std::mutex> lock(mtx_);
  selectedFiles_.clear();
}

bool SelectionStore::isFileSelected(const std::string& fileId) const {
  std::lock_guard<std::mutex> lock(mtx_);
  return selectedFiles_.count(fileId) != 0;
}

std::size_t SelectionStore::selectedFileCount() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return selectedFiles_.size();
}

void SelectionStore::setPrivilege(PrivilegeStatus status) {
  std::lock_guard<std::mutex> lock(mtx_);
  privilege_ = status;
}

std::optional<PrivilegeStatus> SelectionStore::privilege() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return privilege_;
}

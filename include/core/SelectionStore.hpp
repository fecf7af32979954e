#pragma once
/** @file  SelectionStore.hpp
 *  @brief What the user picked: target device, scan options, recovery options.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "core/Types.hpp"

namespace salvage {
  namespace core {

    /** @class SelectionStore
 *  @brief Lock-protected user choices read by the session controllers.
 *
 *  * Written by the front end, read (never written) by controllers.
 *  * `buildScanConfig()` is the only place a ScanConfig is assembled.
 */
    class SelectionStore {

    public:
      SelectionStore();
      ~SelectionStore() = default;

      //---target------------------------------------------------------------
      /// Selecting another device drops the partition choice.
      void selectDevice(std::optional<Device> device);
      std::optional<Device> selectedDevice() const;
      void selectPartition(std::optional<Partition> partition);
      std::optional<Partition> selectedPartition() const;

      //---scan options------------------------------------------------------
      void setScanMode(ScanMode mode);
      ScanMode scanMode() const;
      void setCategories(std::vector<FileCategory> categories);
      void toggleCategory(FileCategory category);
      std::vector<FileCategory> categories() const;
      void setFileTypes(std::vector<std::string> types);
      std::vector<std::string> fileTypes() const;

      /// std::nullopt while no device is selected.
      std::optional<ScanConfig> buildScanConfig() const;

      //---recovery options--------------------------------------------------
      void setDestination(std::string path);
      std::string destination() const;
      void setConflictStrategy(ConflictStrategy strategy);
      ConflictStrategy conflictStrategy() const;
      void setPreserveStructure(bool preserve);
      bool preserveStructure() const;

      void toggleFile(const std::string& fileId);
      void selectAllFiles(const std::vector<RecoverableFile>& files);
      void clearFileSelection();
      bool isFileSelected(const std::string& fileId) const;
      std::size_t selectedFileCount() const;

      //---host----------------------------------------------------------------
      void setPrivilege(PrivilegeStatus status);
      std::optional<PrivilegeStatus> privilege() const;

    private:
      mutable std::mutex mtx_;
      std::optional<Device> device_;
      std::optional<Partition> partition_;
      ScanMode mode_{ ScanMode::Quick };
      std::vector<FileCategory> categories_;
      std::vector<std::string> fileTypes_;
      std::string destination_;
      ConflictStrategy conflict_{ ConflictStrategy::Rename };
      bool preserveStructure_{ false };
      std::set<std::string> selectedFiles_;
      std::optional<PrivilegeStatus> privilege_;
    };

  } // namespace core
} // namespace salvage

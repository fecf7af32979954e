#pragma once
/** @file  Types.hpp
 *  @brief Value types exchanged with the host: devices, scan/recovery configs,
 *         discovered files, progress snapshots and privilege status.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace salvage {
  namespace core {

    /// Byte offsets and sizes; decimal text on the wire.
    using ByteCount = std::uint64_t;

    enum class DeviceType : std::uint8_t { SD, HDD, SSD, USB, Unknown };
    enum class ScanMode : std::uint8_t { Quick, Deep };
    enum class FileCategory : std::uint8_t { Photo, Video, Document, Audio, Archive, Database };
    enum class Recoverability : std::uint8_t { Good, Partial, Poor };
    enum class FileSource : std::uint8_t { Carving, Metadata };
    enum class ConflictStrategy : std::uint8_t { Rename, Overwrite, Skip };
    enum class Platform : std::uint8_t { Linux, Darwin, Win32 };

    const char* toString(DeviceType t);
    const char* toString(ScanMode m);
    const char* toString(FileCategory c);
    const char* toString(Recoverability r);
    const char* toString(FileSource s);
    const char* toString(ConflictStrategy s);
    const char* toString(Platform p);

    // parse helpers return std::nullopt for unknown tags
    std::optional<DeviceType> parseDeviceType(const std::string& s);
    std::optional<ScanMode> parseScanMode(const std::string& s);
    std::optional<FileCategory> parseFileCategory(const std::string& s);
    std::optional<Recoverability> parseRecoverability(const std::string& s);
    std::optional<FileSource> parseFileSource(const std::string& s);
    std::optional<ConflictStrategy> parseConflictStrategy(const std::string& s);
    std::optional<Platform> parsePlatform(const std::string& s);

    /// Platform this client was built for.
    Platform buildPlatform();

    struct MountPoint {
      std::string path;
      std::string filesystem;
    };

    struct Partition {
      std::string id;
      std::string path;
      std::string label;
      ByteCount size{ 0 };
      ByteCount offset{ 0 };
      std::optional<std::string> filesystem;
      std::optional<std::string> mountPoint;
    };

    struct Device {
      std::string id;
      std::string name;
      std::string path;
      ByteCount size{ 0 };
      DeviceType type{ DeviceType::Unknown };
      std::string model;
      bool removable{ false };
      bool readOnly{ false };
      std::vector<MountPoint> mountPoints;
      std::optional<std::string> filesystem;
      std::vector<Partition> partitions;
    };

    struct ScanConfig {
      std::string devicePath;
      std::optional<std::string> partitionPath;
      ScanMode mode{ ScanMode::Quick };
      std::vector<FileCategory> categories;
      std::vector<std::string> fileTypes; ///< overrides categories when non-empty
      std::optional<ByteCount> deviceSize;
      std::optional<ByteCount> startOffset;
      std::optional<ByteCount> endOffset;
    };

    struct FileFragment {
      ByteCount offset{ 0 };
      ByteCount size{ 0 };
    };

    struct FileMetadata {
      std::optional<std::uint32_t> width;
      std::optional<std::uint32_t> height;
      std::optional<double> duration; ///< seconds
      std::optional<std::string> createdAt;
      std::optional<std::string> modifiedAt;
      std::optional<std::string> cameraModel;
      std::optional<std::string> originalName;
    };

    struct RecoverableFile {
      std::string id;
      std::string type; ///< format tag, e.g. "jpeg"
      FileCategory category{ FileCategory::Photo };
      ByteCount offset{ 0 };
      ByteCount size{ 0 };
      bool sizeEstimated{ false };
      std::optional<std::string> name;
      std::string extension;
      std::optional<std::string> thumbnail; ///< base64 data URI
      std::optional<FileMetadata> metadata;
      Recoverability recoverability{ Recoverability::Good };
      FileSource source{ FileSource::Carving };
      std::vector<FileFragment> fragments;
    };

    struct ScanProgress {
      ByteCount bytesScanned{ 0 };
      ByteCount totalBytes{ 0 };
      double percentage{ 0.0 };
      std::uint32_t filesFound{ 0 };
      ByteCount currentSector{ 0 };
      std::optional<double> estimatedSecondsRemaining;
      std::uint32_t sectorsWithErrors{ 0 };
    };

    struct RecoveryError {
      std::string fileId;
      std::string fileName;
      std::string error;
    };

    struct RecoveryConfig {
      std::vector<RecoverableFile> files;
      std::string destinationPath;
      ConflictStrategy conflictStrategy{ ConflictStrategy::Rename };
      bool preserveStructure{ false };
      std::string sourceDevicePath;
    };

    struct RecoveryProgress {
      std::uint32_t totalFiles{ 0 };
      std::uint32_t completedFiles{ 0 };
      std::optional<std::string> currentFile;
      ByteCount bytesWritten{ 0 };
      ByteCount totalBytes{ 0 };
      double percentage{ 0.0 };
      std::vector<RecoveryError> errors;
    };

    struct PrivilegeStatus {
      bool elevated{ false };
      Platform platform{ Platform::Linux };
      std::optional<std::int64_t> helperPid;
    };

    struct PreviewImage {
      std::string fileId;
      std::string base64;
    };

  } // namespace core
} // namespace salvage

/* @file Types.cpp
 * @brief wire tags for the value-type enums
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <array>
#include <cstddef>
#include <utility>

// salvage headers
#include "core/Types.hpp"

namespace salvage {
  namespace core {

    namespace {
      template <typename E, std::size_t N>
      std::optional<E> lookup(const std::array<std::pair<E, const char*>, N>& table,
                              const std::string& s) {
        for (const auto& [value, tag] : table) {
          if (s == tag)
            return value;
        }
        return std::nullopt;
      }

      template <typename E, std::size_t N>
      const char* tagOf(const std::array<std::pair<E, const char*>, N>& table, E value) {
        for (const auto& [v, tag] : table) {
          if (v == value)
            return tag;
        }
        return "unknown";
      }

      constexpr std::array<std::pair<DeviceType, const char*>, 5> kDeviceTypes{
        { { DeviceType::SD, "sd" },
          { DeviceType::HDD, "hdd" },
          { DeviceType::SSD, "ssd" },
          { DeviceType::USB, "usb" },
          { DeviceType::Unknown, "unknown" } }
      };
      constexpr std::array<std::pair<ScanMode, const char*>, 2> kScanModes{
        { { ScanMode::Quick, "quick" }, { ScanMode::Deep, "deep" } }
      };
      constexpr std::array<std::pair<FileCategory, const char*>, 6> kCategories{
        { { FileCategory::Photo, "photo" },
          { FileCategory::Video, "video" },
          { FileCategory::Document, "document" },
          { FileCategory::Audio, "audio" },
          { FileCategory::Archive, "archive" },
          { FileCategory::Database, "database" } }
      };
      constexpr std::array<std::pair<Recoverability, const char*>, 3> kRecoverability{
        { { Recoverability::Good, "good" },
          { Recoverability::Partial, "partial" },
          { Recoverability::Poor, "poor" } }
      };
      constexpr std::array<std::pair<FileSource, const char*>, 2> kSources{
        { { FileSource::Carving, "carving" }, { FileSource::Metadata, "metadata" } }
      };
      constexpr std::array<std::pair<ConflictStrategy, const char*>, 3> kConflicts{
        { { ConflictStrategy::Rename, "rename" },
          { ConflictStrategy::Overwrite, "overwrite" },
          { ConflictStrategy::Skip, "skip" } }
      };
      constexpr std::array<std::pair<Platform, const char*>, 3> kPlatforms{
        { { Platform::Linux, "linux" }, { Platform::Darwin, "darwin" }, { Platform::Win32, "win32" } }
      };
    } // namespace

    const char* toString(DeviceType t) { return tagOf(kDeviceTypes, t); }
    const char* toString(ScanMode m) { return tagOf(kScanModes, m); }
    const char* toString(FileCategory c) { return tagOf(kCategories, c); }
    const char* toString(Recoverability r) { return tagOf(kRecoverability, r); }
    const char* toString(FileSource s) { return tagOf(kSources, s); }
    const char* toString(ConflictStrategy s) { return tagOf(kConflicts, s); }
    const char* toString(Platform p) { return tagOf(kPlatforms, p); }

    std::optional<DeviceType> parseDeviceType(const std::string& s) { return lookup(kDeviceTypes, s); }
    std::optional<ScanMode> parseScanMode(const std::string& s) { return lookup(kScanModes, s); }
    std::optional<FileCategory> parseFileCategory(const std::string& s) { return lookup(kCategories, s); }
    std::optional<Recoverability> parseRecoverability(const std::string& s) {
      return lookup(kRecoverability, s);
    }
    std::optional<FileSource> parseFileSource(const std::string& s) { return lookup(kSources, s); }
    std::optional<ConflictStrategy> parseConflictStrategy(const std::string& s) {
      return lookup(kConflicts, s);
    }
    std::optional<Platform> parsePlatform(const std::string& s) { return lookup(kPlatforms, s); }

    Platform buildPlatform() {
#if defined(_WIN32)
      return Platform::Win32;
#elif defined(__APPLE__)
      return Platform::Darwin;
#else
      return Platform::Linux;
#endif
    }

  } // namespace core
} // namespace salvage

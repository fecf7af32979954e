/* @file WireCodec.cpp
 * @brief schema checks and conversions for every payload that crosses the boundary
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <charconv>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <system_error>

// salvage headers
#include "protocols/Channels.hpp"
#include "protocols/WireCodec.hpp"

using nlohmann::json;

namespace salvage {
  namespace protocols {

    namespace {

      const json& field(const json& obj, const char* key) {
        if (!obj.is_object())
          throw DecodeError(std::string("expected object while reading '") + key + "'");
        auto it = obj.find(key);
        if (it == obj.end() || it->is_null())
          throw DecodeError(std::string("missing field '") + key + "'");
        return *it;
      }

      const json* optionalField(const json& obj, const char* key) {
        if (!obj.is_object())
          throw DecodeError(std::string("expected object while reading '") + key + "'");
        auto it = obj.find(key);
        if (it == obj.end() || it->is_null())
          return nullptr;
        return &*it;
      }

      std::string asString(const json& v, const char* key) {
        if (!v.is_string())
          throw DecodeError(std::string("field '") + key + "' must be a string");
        return v.get<std::string>();
      }

      std::string requireString(const json& obj, const char* key) {
        return asString(field(obj, key), key);
      }

      std::optional<std::string> optString(const json& obj, const char* key) {
        const json* v = optionalField(obj, key);
        if (!v)
          return std::nullopt;
        return asString(*v, key);
      }

      bool optBool(const json& obj, const char* key, bool fallback) {
        const json* v = optionalField(obj, key);
        if (!v)
          return fallback;
        if (!v->is_boolean())
          throw DecodeError(std::string("field '") + key + "' must be a boolean");
        return v->get<bool>();
      }

      core::ByteCount requireU64(const json& obj, const char* key) {
        try {
          return decodeU64(field(obj, key));
        } catch (const DecodeError& e) {
          throw DecodeError(std::string("field '") + key + "': " + e.what());
        }
      }

      std::optional<core::ByteCount> optU64(const json& obj, const char* key) {
        if (!optionalField(obj, key))
          return std::nullopt;
        return requireU64(obj, key);
      }

      double optNumber(const json& obj, const char* key, double fallback) {
        const json* v = optionalField(obj, key);
        if (!v)
          return fallback;
        if (!v->is_number())
          throw DecodeError(std::string("field '") + key + "' must be a number");
        return v->get<double>();
      }

      std::optional<std::uint32_t> optCount(const json& obj, const char* key) {
        const json* v = optionalField(obj, key);
        if (!v)
          return std::nullopt;
        if (!v->is_number_unsigned() &&
            !(v->is_number_integer() && v->get<std::int64_t>() >= 0))
          throw DecodeError(std::string("field '") + key + "' must be a non-negative integer");
        const auto n = v->get<std::uint64_t>();
        if (n > std::numeric_limits<std::uint32_t>::max())
          throw DecodeError(std::string("field '") + key + "' out of range");
        return static_cast<std::uint32_t>(n);
      }

      template <typename E, typename Parser>
      E requireTag(const json& obj, const char* key, Parser parse) {
        const auto raw = requireString(obj, key);
        auto value = parse(raw);
        if (!value)
          throw DecodeError(std::string("field '") + key + "' has unknown value '" + raw + "'");
        return *value;
      }

      template <typename E, typename Parser>
      E optTag(const json& obj, const char* key, Parser parse, E fallback) {
        if (!optionalField(obj, key))
          return fallback;
        return requireTag<E>(obj, key, parse);
      }

      void putOptional(json& obj, const char* key, const std::optional<std::string>& v) {
        if (v)
          obj[key] = *v;
      }

      core::Partition partitionFromJson(const json& j) {
        core::Partition p;
        p.id = requireString(j, "id");
        p.path = requireString(j, "path");
        p.label = optString(j, "label").value_or("");
        p.size = requireU64(j, "size");
        p.offset = requireU64(j, "offset");
        p.filesystem = optString(j, "filesystem");
        p.mountPoint = optString(j, "mountPoint");
        return p;
      }

      core::FileMetadata metadataFromJson(const json& j) {
        core::FileMetadata m;
        m.width = optCount(j, "width");
        m.height = optCount(j, "height");
        if (optionalField(j, "duration"))
          m.duration = optNumber(j, "duration", 0.0);
        m.createdAt = optString(j, "createdAt");
        m.modifiedAt = optString(j, "modifiedAt");
        m.cameraModel = optString(j, "cameraModel");
        m.originalName = optString(j, "originalName");
        return m;
      }

      json toJson(const core::FileMetadata& m) {
        json j = json::object();
        if (m.width)
          j["width"] = *m.width;
        if (m.height)
          j["height"] = *m.height;
        if (m.duration)
          j["duration"] = *m.duration;
        putOptional(j, "createdAt", m.createdAt);
        putOptional(j, "modifiedAt", m.modifiedAt);
        putOptional(j, "cameraModel", m.cameraModel);
        putOptional(j, "originalName", m.originalName);
        return j;
      }

      /// `[payload]` or `[sessionId, payload]`; a bare non-array value counts as `[value]`.
      struct Positional {
        std::optional<std::string> sessionId;
        json body;
      };

      Positional unpack(const json& args) {
        Positional out;
        if (!args.is_array()) {
          out.body = args;
          return out;
        }
        switch (args.size()) {
        case 0:
          break;
        case 1:
          out.body = args[0];
          break;
        default:
          if (!args[0].is_string())
            throw DecodeError("leading positional argument must be a session id");
          out.sessionId = args[0].get<std::string>();
          out.body = args[1];
          break;
        }
        return out;
      }

      /// Positional id wins; otherwise the payload may name the session itself.
      std::optional<std::string> sessionOf(const Positional& p) {
        if (p.sessionId)
          return p.sessionId;
        if (p.body.is_object())
          return optString(p.body, "sessionId");
        return std::nullopt;
      }

      FilesFoundEvent decodeFilesFound(const Positional& p) {
        FilesFoundEvent ev;
        ev.sessionId = p.sessionId;
        if (p.body.is_array()) {
          ev.files.reserve(p.body.size());
          for (const auto& item : p.body)
            ev.files.push_back(fileFromJson(item));
        } else if (p.body.is_object()) {
          ev.files.push_back(fileFromJson(p.body));
        } else {
          throw DecodeError("file-found payload must be an object or an array of objects");
        }
        return ev;
      }

      CompleteEvent decodeComplete(const Positional& p) {
        CompleteEvent ev;
        if (p.body.is_string()) {
          ev.sessionId = p.body.get<std::string>();
        } else if (p.body.is_object()) {
          ev.sessionId = sessionOf(p);
          ev.filesFound = optCount(p.body, "filesFound");
        } else if (p.body.is_null()) {
          ev.sessionId = p.sessionId;
        } else {
          throw DecodeError("complete payload must be an object or a session id");
        }
        return ev;
      }

      ErrorEvent decodeError(const Positional& p) {
        ErrorEvent ev;
        ev.sessionId = p.sessionId;
        if (p.body.is_string()) {
          ev.message = p.body.get<std::string>();
        } else if (p.body.is_object()) {
          ev.sessionId = sessionOf(p);
          ev.message = optString(p.body, "message");
        } else if (!p.body.is_null()) {
          throw DecodeError("error payload must be an object or a message string");
        }
        if (ev.message && ev.message->empty())
          ev.message.reset();
        return ev;
      }

    } // namespace

    std::string encodeU64(core::ByteCount value) { return std::to_string(value); }

    core::ByteCount decodeU64(const json& value) {
      if (!value.is_string())
        throw DecodeError("64-bit quantity must be decimal text");
      const auto& text = value.get_ref<const std::string&>();
      if (text.empty())
        throw DecodeError("64-bit quantity is empty");
      for (char c : text) {
        if (c < '0' || c > '9')
          throw DecodeError("64-bit quantity '" + text + "' is not decimal");
      }
      core::ByteCount out = 0;
      auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
      if (ec == std::errc::result_out_of_range)
        throw DecodeError("64-bit quantity '" + text + "' overflows");
      if (ec != std::errc{} || ptr != text.data() + text.size())
        throw DecodeError("64-bit quantity '" + text + "' is malformed");
      return out;
    }

    json toJson(const core::ScanConfig& config) {
      json j{ { "devicePath", config.devicePath }, { "scanType", core::toString(config.mode) } };
      json categories = json::array();
      for (auto c : config.categories)
        categories.push_back(core::toString(c));
      j["fileCategories"] = std::move(categories);
      putOptional(j, "partitionPath", config.partitionPath);
      if (!config.fileTypes.empty())
        j["fileTypes"] = config.fileTypes;
      if (config.deviceSize)
        j["deviceSize"] = encodeU64(*config.deviceSize);
      if (config.startOffset)
        j["startOffset"] = encodeU64(*config.startOffset);
      if (config.endOffset)
        j["endOffset"] = encodeU64(*config.endOffset);
      return j;
    }

    json toJson(const core::RecoverableFile& file) {
      json j{ { "id", file.id },
              { "type", file.type },
              { "category", core::toString(file.category) },
              { "offset", encodeU64(file.offset) },
              { "size", encodeU64(file.size) },
              { "sizeEstimated", file.sizeEstimated },
              { "extension", file.extension },
              { "recoverability", core::toString(file.recoverability) },
              { "source", core::toString(file.source) } };
      putOptional(j, "name", file.name);
      putOptional(j, "thumbnail", file.thumbnail);
      if (file.metadata)
        j["metadata"] = toJson(*file.metadata);
      if (!file.fragments.empty()) {
        json fragments = json::array();
        for (const auto& f : file.fragments)
          fragments.push_back(json{ { "offset", encodeU64(f.offset) }, { "size", encodeU64(f.size) } });
        j["fragments"] = std::move(fragments);
      }
      return j;
    }

    json toJson(const core::RecoveryConfig& config) {
      json files = json::array();
      for (const auto& f : config.files)
        files.push_back(toJson(f));
      return json{ { "files", std::move(files) },
                   { "destinationPath", config.destinationPath },
                   { "conflictStrategy", core::toString(config.conflictStrategy) },
                   { "preserveStructure", config.preserveStructure },
                   { "sourceDevicePath", config.sourceDevicePath } };
    }

    core::Device deviceFromJson(const json& j) {
      core::Device d;
      d.id = requireString(j, "id");
      d.name = optString(j, "name").value_or("");
      d.path = requireString(j, "path");
      d.size = requireU64(j, "size");
      d.type = optTag<core::DeviceType>(j, "type", core::parseDeviceType, core::DeviceType::Unknown);
      d.model = optString(j, "model").value_or("");
      d.removable = optBool(j, "removable", false);
      d.readOnly = optBool(j, "readOnly", false);
      if (const json* mounts = optionalField(j, "mountPoints")) {
        if (!mounts->is_array())
          throw DecodeError("field 'mountPoints' must be an array");
        for (const auto& m : *mounts)
          d.mountPoints.push_back({ requireString(m, "path"), optString(m, "filesystem").value_or("") });
      }
      d.filesystem = optString(j, "filesystem");
      if (const json* parts = optionalField(j, "partitions")) {
        if (!parts->is_array())
          throw DecodeError("field 'partitions' must be an array");
        for (const auto& p : *parts)
          d.partitions.push_back(partitionFromJson(p));
      }
      return d;
    }

    std::vector<core::Device> devicesFromJson(const json& j) {
      if (!j.is_array())
        throw DecodeError("device list must be an array");
      std::vector<core::Device> out;
      out.reserve(j.size());
      for (const auto& d : j)
        out.push_back(deviceFromJson(d));
      return out;
    }

    core::RecoverableFile fileFromJson(const json& j) {
      core::RecoverableFile f;
      f.id = requireString(j, "id");
      f.type = requireString(j, "type");
      f.category = requireTag<core::FileCategory>(j, "category", core::parseFileCategory);
      f.offset = requireU64(j, "offset");
      f.size = requireU64(j, "size");
      f.sizeEstimated = optBool(j, "sizeEstimated", false);
      f.name = optString(j, "name");
      f.extension = optString(j, "extension").value_or(f.type);
      f.thumbnail = optString(j, "thumbnail");
      if (const json* meta = optionalField(j, "metadata"))
        f.metadata = metadataFromJson(*meta);
      f.recoverability = optTag<core::Recoverability>(j, "recoverability", core::parseRecoverability,
                                                      core::Recoverability::Good);
      f.source = optTag<core::FileSource>(j, "source", core::parseFileSource, core::FileSource::Carving);
      if (const json* frags = optionalField(j, "fragments")) {
        if (!frags->is_array())
          throw DecodeError("field 'fragments' must be an array");
        for (const auto& fr : *frags)
          f.fragments.push_back({ requireU64(fr, "offset"), requireU64(fr, "size") });
      }
      return f;
    }

    core::ScanProgress scanProgressFromJson(const json& j) {
      core::ScanProgress p;
      p.bytesScanned = requireU64(j, "bytesScanned");
      p.totalBytes = requireU64(j, "totalBytes");
      p.percentage = optNumber(j, "percentage", 0.0);
      p.filesFound = optCount(j, "filesFound").value_or(0);
      p.currentSector = optU64(j, "currentSector").value_or(0);
      if (optionalField(j, "estimatedTimeRemaining"))
        p.estimatedSecondsRemaining = optNumber(j, "estimatedTimeRemaining", 0.0);
      p.sectorsWithErrors = optCount(j, "sectorsWithErrors").value_or(0);
      return p;
    }

    core::RecoveryProgress recoveryProgressFromJson(const json& j) {
      core::RecoveryProgress p;
      p.totalFiles = optCount(j, "totalFiles").value_or(0);
      p.completedFiles = optCount(j, "completedFiles").value_or(0);
      p.currentFile = optString(j, "currentFile");
      p.bytesWritten = requireU64(j, "bytesWritten");
      p.totalBytes = requireU64(j, "totalBytes");
      p.percentage = optNumber(j, "percentage", 0.0);
      if (const json* errors = optionalField(j, "errors")) {
        if (!errors->is_array())
          throw DecodeError("field 'errors' must be an array");
        for (const auto& e : *errors) {
          p.errors.push_back({ optString(e, "fileId").value_or(""),
                               optString(e, "fileName").value_or(""),
                               requireString(e, "error") });
        }
      }
      return p;
    }

    core::PrivilegeStatus privilegeFromJson(const json& j) {
      core::PrivilegeStatus s;
      if (!j.is_object() || !j.contains("elevated") || !j["elevated"].is_boolean())
        throw DecodeError("privilege status must carry a boolean 'elevated'");
      s.elevated = j["elevated"].get<bool>();
      s.platform = optTag<core::Platform>(j, "platform", core::parsePlatform, core::buildPlatform());
      if (const json* pid = optionalField(j, "helperPid")) {
        if (!pid->is_number_integer())
          throw DecodeError("field 'helperPid' must be an integer");
        s.helperPid = pid->get<std::int64_t>();
      }
      return s;
    }

    bool isEventChannel(const std::string& channel) {
      using namespace channels;
      for (const char* c : { kScanProgress, kScanFileFound, kScanComplete, kScanError,
                             kRecoveryProgress, kRecoveryComplete, kRecoveryError }) {
        if (channel == c)
          return true;
      }
      return false;
    }

    SessionEvent decodeEvent(const std::string& channel, const json& args) {
      using namespace channels;
      const Positional p = unpack(args);

      if (channel == kScanProgress)
        return ScanProgressEvent{ p.sessionId, scanProgressFromJson(p.body) };
      if (channel == kRecoveryProgress)
        return RecoveryProgressEvent{ p.sessionId, recoveryProgressFromJson(p.body) };
      if (channel == kScanFileFound)
        return decodeFilesFound(p);
      if (channel == kScanComplete || channel == kRecoveryComplete)
        return decodeComplete(p);
      if (channel == kScanError || channel == kRecoveryError)
        return decodeError(p);

      throw DecodeError("no event schema for channel '" + channel + "'");
    }

  } // namespace protocols
} // namespace salvage

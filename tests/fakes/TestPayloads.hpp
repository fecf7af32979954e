#pragma once
/** @file  TestPayloads.hpp
 *  @brief Host-side JSON payloads shared by the test suites.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include <nlohmann/json.hpp>

namespace salvage {
  namespace test {

    inline nlohmann::json deviceJson(const std::string& path, const std::string& size = "64000000000") {
      return { { "id", "dev-" + path }, { "name", "Card " + path }, { "path", path },
               { "size", size },        { "type", "sd" },          { "model", "SDXC" },
               { "removable", true },   { "readOnly", false },
               { "partitions",
                 nlohmann::json::array({ { { "id", "p1" },
                                           { "path", path + "1" },
                                           { "label", "DCIM" },
                                           { "size", "32000000000" },
                                           { "offset", "1048576" },
                                           { "filesystem", "exfat" } } }) } };
    }

    inline nlohmann::json fileJson(const std::string& id, const std::string& offset = "4096") {
      return { { "id", id },          { "type", "jpeg" },       { "category", "photo" },
               { "offset", offset },  { "size", "2048" },       { "extension", "jpg" },
               { "recoverability", "good" }, { "source", "carving" } };
    }

    inline nlohmann::json scanProgressJson(const std::string& scanned, double percentage) {
      return { { "bytesScanned", scanned }, { "totalBytes", "1000" }, { "percentage", percentage },
               { "filesFound", 0 },         { "currentSector", "0" } };
    }

    inline nlohmann::json ok() { return { { "success", true } }; }

    inline nlohmann::json failed(const std::string& message) {
      return { { "success", false }, { "error", message } };
    }

  } // namespace test
} // namespace salvage

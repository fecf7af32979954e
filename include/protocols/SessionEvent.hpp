#pragma once
/** @file  SessionEvent.hpp
 *  @brief Closed set of typed events decoded from the push channels.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// salvage headers
#include "core/Types.hpp"

namespace salvage {
  namespace protocols {

    struct ScanProgressEvent {
      std::optional<std::string> sessionId;
      core::ScanProgress progress;
    };

    struct RecoveryProgressEvent {
      std::optional<std::string> sessionId;
      core::RecoveryProgress progress;
    };

    /// One discovery or a batch; batch order is host discovery order.
    struct FilesFoundEvent {
      std::optional<std::string> sessionId;
      std::vector<core::RecoverableFile> files;
    };

    struct CompleteEvent {
      std::optional<std::string> sessionId;
      std::optional<std::uint32_t> filesFound;
    };

    struct ErrorEvent {
      std::optional<std::string> sessionId;
      std::optional<std::string> message; ///< never holds an empty string
    };

    using SessionEvent = std::variant<ScanProgressEvent, RecoveryProgressEvent, FilesFoundEvent,
                                      CompleteEvent, ErrorEvent>;

  } // namespace protocols
} // namespace salvage

#pragma once
/** @file  ConsoleView.hpp
 *  @brief Text front end: prints device lists and session snapshots.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "core/SessionStore.hpp"
#include "core/Types.hpp"

namespace salvage {
  namespace ui {

    /**
 * @class ConsoleView
 * @brief Renders store snapshots to a stream.
 *
 * * `attach()` returns a Subscription; the view prints on every store change
 *   but only when the visible line differs from the last one printed.
 * * Holds no session state of its own.
 */
    class ConsoleView {

    public:
      explicit ConsoleView(std::ostream& out) : out_(out) {}

      // ---- public API ----------------------------------------------------------
      core::Subscription attach(const core::SessionStore& store);

      void showDevices(const std::vector<core::Device>& devices);
      void showSnapshot(const core::SessionSnapshot& snapshot);
      void showMessage(const std::string& text);

      /// One status line, e.g. "scan scanning 42.0% 1.5 GiB/3.0 GiB files=12".
      static std::string statusLine(const core::SessionSnapshot& snapshot);

    private:
      std::ostream& out_;
      std::string lastLine_{};
    };

    /// "512 B", "1.5 KiB", "3.0 GiB".
    std::string formatBytes(core::ByteCount bytes);

  } // namespace ui
} // namespace salvage

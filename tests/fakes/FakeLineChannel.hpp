#pragma once
/** @file  FakeLineChannel.hpp
 *  @brief LineChannel derivative with scripted reads for HostLink testing.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <deque>
#include <functional>
#include <string>
#include <vector>

#include "io/LineChannel.hpp"

namespace salvage {
  namespace test {

    /**
 * @class FakeLineChannel
 * @brief Records every written line and serves queued lines to readLine().
 *
 * An empty queue reads as a timeout, or as a closed link once
 * `close_when_drained` is set. `on_write` lets a test answer a request
 * after seeing it.
 */
    class FakeLineChannel : public salvage::io::LineChannel {
    public:
      bool open = true;
      bool connect_called = false;
      bool connect_succeeds = true;
      bool write_succeeds = true;
      bool close_when_drained = false;
      std::deque<std::string> incoming;
      std::vector<std::string> written;
      std::function<void(const std::string&)> on_write;

      bool connect(const std::string&) override {
        connect_called = true;
        open = connect_succeeds;
        return connect_succeeds;
      }

      bool writeLine(const std::string& line) override {
        if (!open || !write_succeeds)
          return false;
        written.push_back(line);
        if (on_write)
          on_write(line);
        return true;
      }

      std::optional<std::string> readLine(std::chrono::milliseconds) override {
        if (!incoming.empty()) {
          std::string line = incoming.front();
          incoming.pop_front();
          return line;
        }
        if (close_when_drained)
          open = false;
        return std::nullopt;
      }

      bool isOpen() const override { return open; }
    };

  } // namespace test
} // namespace salvage

#pragma once
/** @file  FakeTransport.hpp
 *  @brief In-memory Transport with scripted replies and manual event pushes.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <algorithm>
#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/Errors.hpp"
#include "io/Transport.hpp"

namespace salvage {
  namespace test {

    class FakeTransport : public salvage::io::Transport {
    public:
      using Handler = std::function<nlohmann::json(const nlohmann::json& payload)>;

      struct Call {
        std::string channel;
        nlohmann::json payload;
      };

      std::vector<Call> calls;
      std::size_t removed = 0;

      /// Every later call on \p channel returns \p result.
      void reply(const std::string& channel, nlohmann::json result) {
        handlers_[channel] = [result](const nlohmann::json&) { return result; };
      }

      /// Full control: the handler may emit() events before returning, or throw.
      void onInvoke(const std::string& channel, Handler handler) {
        handlers_[channel] = std::move(handler);
      }

      void failWith(const std::string& channel, const std::string& message) {
        handlers_[channel] = [message](const nlohmann::json&) -> nlohmann::json {
          throw salvage::core::TransportFailure(message);
        };
      }

      nlohmann::json invoke(const std::string& channel, const nlohmann::json& payload) override {
        calls.push_back(Call{ channel, payload });
        auto it = handlers_.find(channel);
        if (it == handlers_.end())
          throw salvage::core::TransportFailure("no scripted reply for " + channel);
        return it->second(payload);
      }

      ListenerId addListener(const std::string& channel, RawListener listener) override {
        const ListenerId id = nextId_++;
        listeners_[channel].push_back({ id, std::move(listener) });
        return id;
      }

      bool removeListener(const std::string& channel, ListenerId id) noexcept override {
        auto it = listeners_.find(channel);
        if (it == listeners_.end())
          return false;
        auto& entries = it->second;
        auto pos = std::find_if(entries.begin(), entries.end(),
                                [id](const Entry& e) { return e.id == id; });
        if (pos == entries.end())
          return false;
        entries.erase(pos);
        ++removed;
        return true;
      }

      /// Deliver one pushed event to the listeners registered right now.
      void emit(const std::string& channel, const nlohmann::json& args) {
        const auto snapshot = listeners_[channel];
        for (const auto& entry : snapshot) {
          const auto& live = listeners_[channel];
          if (std::any_of(live.begin(), live.end(), [&](const Entry& e) { return e.id == entry.id; }))
            entry.fn(args);
        }
      }

      std::size_t listenerCount(const std::string& channel) const {
        auto it = listeners_.find(channel);
        return it == listeners_.end() ? 0 : it->second.size();
      }

      std::size_t totalListeners() const {
        std::size_t n = 0;
        for (const auto& [channel, entries] : listeners_)
          n += entries.size();
        return n;
      }

      std::size_t callsTo(const std::string& channel) const {
        return static_cast<std::size_t>(std::count_if(
            calls.begin(), calls.end(), [&](const Call& c) { return c.channel == channel; }));
      }

    private:
      struct Entry {
        ListenerId id;
        RawListener fn;
      };

      std::map<std::string, Handler> handlers_;
      std::map<std::string, std::vector<Entry>> listeners_;
      ListenerId nextId_{ 1 };
    };

  } // namespace test
} // namespace salvage

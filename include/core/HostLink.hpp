#pragma once
/** @file  HostLink.hpp
 *  @brief Transport to the privileged host: JSON frames over a line channel.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

// salvage headers
#include "core/ErrorMonitor.hpp" // HostLink reports link loss to the error monitor
#include "core/Logger.hpp"
#include "io/LineChannel.hpp" // HostLink owns its LineChannel and requires full type knowledge
#include "io/Transport.hpp"
#include "protocols/Response.hpp"

namespace salvage {
  namespace core {

    /**
 * @class HostLink
 * @brief Single-threaded request/reply multiplexer plus event fan-out.
 *
 *  * `invoke()` writes one invoke frame, then keeps reading frames until the
 *    reply with the same id arrives; events read meanwhile are dispatched in
 *    arrival order on the calling thread.
 *  * A reply belonging to an outer call (a listener invoked again while the
 *    outer call was waiting) is parked until that call picks it up. Late
 *    replies to calls that already gave up are dropped.
 *  * `pump()` drains pushed events while no call is in flight.
 */
    class HostLink : public io::Transport {
    public:
      HostLink(std::shared_ptr<ErrorMonitor> errMonitor, std::shared_ptr<Logger> logger,
               std::unique_ptr<io::LineChannel> channel = std::make_unique<io::LineChannel>());
      ~HostLink() override = default;

      //---public APIs------------------------------------------------------
      void connect(const std::string& socketPath); ///< throws TransportFailure
      void disconnect();
      bool connected() const;

      nlohmann::json invoke(const std::string& channel, const nlohmann::json& payload) override;
      ListenerId addListener(const std::string& channel, RawListener listener) override;
      bool removeListener(const std::string& channel, ListenerId id) noexcept override;

      /// Dispatch events for up to \p budget; returns frames handled. Throws on link loss.
      std::size_t pump(std::chrono::milliseconds budget);

      void setReplyTimeout(std::chrono::milliseconds timeout) { replyTimeout_ = timeout; }
      std::size_t listenerCount(const std::string& channel) const;
      std::size_t parkedReplies() const { return parked_.size(); }

    private:
      struct Entry {
        ListenerId id;
        RawListener fn;
      };

      [[noreturn]] void fail(const std::string& message);
      void handleEvent(const protocols::Response& frame);
      bool isRegistered(const std::string& channel, ListenerId id) const;

      static constexpr std::chrono::milliseconds kDefaultReplyTimeout{ 30000 };

      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::shared_ptr<Logger> logger_;
      std::unique_ptr<io::LineChannel> channel_;
      std::unordered_map<std::string, std::vector<Entry>> listeners_;
      std::unordered_map<std::uint64_t, protocols::Response> parked_; ///< replies for outer calls
      std::unordered_set<std::uint64_t> waiting_;                     ///< ids of calls in flight
      std::chrono::milliseconds replyTimeout_{ kDefaultReplyTimeout };
      std::uint64_t nextRequestId_{ 1 };
      ListenerId nextListenerId_{ 1 };
      bool connected_{ false };
    };

  } // namespace core
} // namespace salvage

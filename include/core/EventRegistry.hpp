#pragma once
/** @file  EventRegistry.hpp
 *  @brief Typed subscriptions over the transport's raw push channels.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <functional>
#include <memory>
#include <string>

// salvage headers
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/Subscription.hpp"
#include "io/Transport.hpp"
#include "protocols/SessionEvent.hpp"

namespace salvage {
  namespace core {

    /**
 * @class EventRegistry
 * @brief `subscribe(channel, callback)` registers exactly one raw listener that
 *        decodes the positional arguments into a `protocols::SessionEvent`.
 *
 *  * Payloads failing the channel schema never reach the callback; they are
 *    logged and reported to the ErrorMonitor.
 *  * The returned Subscription removes exactly that listener. Disposing twice,
 *    or after the transport is gone, is a no-op.
 *  * Once disposed, a registration receives nothing more, even from an event
 *    dispatch already in progress.
 */
    class EventRegistry {
    public:
      using Callback = std::function<void(const protocols::SessionEvent&)>;

      EventRegistry(std::shared_ptr<io::Transport> transport, std::shared_ptr<ErrorMonitor> errMonitor,
                    std::shared_ptr<Logger> logger);

      /// @throws std::invalid_argument if \p channel is not a push channel.
      Subscription subscribe(const std::string& channel, Callback callback);

    private:
      std::shared_ptr<io::Transport> transport_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::shared_ptr<Logger> logger_;
    };

  } // namespace core
} // namespace salvage

/* @file EventRegistry.cpp
 * @brief positional-argument translation and idempotent listener removal
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <stdexcept>
#include <utility>

// salvage headers
#include "core/EventRegistry.hpp"
#include "protocols/WireCodec.hpp"

using namespace salvage::core;

EventRegistry::EventRegistry(std::shared_ptr<io::Transport> transport,
                             std::shared_ptr<ErrorMonitor> errMonitor, std::shared_ptr<Logger> logger)
    : transport_(std::move(transport)), errorMonitor_(std::move(errMonitor)), logger_(std::move(logger)) {
  assert(transport_ && "[EventRegistry] transport is nullptr");
  assert(errorMonitor_ && "[EventRegistry] error monitor is nullptr");
  assert(logger_ && "[EventRegistry] logger is nullptr");
}

Subscription EventRegistry::subscribe(const std::string& channel, Callback callback) {
  if (!protocols::isEventChannel(channel))
    throw std::invalid_argument("[EventRegistry] not a push channel: " + channel);

  auto live = std::make_shared<bool>(true);

  auto listener = [channel, live, cb = std::move(callback), errorMonitor = errorMonitor_,
                   logger = logger_](const nlohmann::json& args) {
    if (!*live)
      return;

    protocols::SessionEvent event;
    try {
      event = protocols::decodeEvent(channel, args);
    } catch (const protocols::DecodeError& e) {
      const std::string message = "[EventRegistry] bad " + channel + " payload: " + e.what();
      logger->log(LogLevel::Warning, "events", message);
      errorMonitor->notifyFailure(message);
      return;
    }
    cb(event);
  };

  const auto id = transport_->addListener(channel, std::move(listener));

  std::weak_ptr<io::Transport> weak = transport_;
  return Subscription([weak, channel, id, live]() {
    *live = false;
    if (auto transport = weak.lock()) {
      // false only means the channel is already gone
      transport->removeListener(channel, id);
    }
  });
}

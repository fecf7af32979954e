/* @file HostLink.cpp
 * @brief request/reply matching and event fan-out over the host socket
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cassert>
#include <string>
#include <unordered_set>

// salvage headers
#include "core/Errors.hpp"
#include "core/HostLink.hpp"
#include "protocols/Command.hpp"

using namespace salvage::core;
using nlohmann::json;

namespace {
  constexpr const char* kSource = "host-link";
}

HostLink::HostLink(std::shared_ptr<ErrorMonitor> errorMonitor, std::shared_ptr<Logger> logger,
                   std::unique_ptr<io::LineChannel> channel)
    : errorMonitor_(std::move(errorMonitor)), logger_(std::move(logger)), channel_(std::move(channel)) {
  assert(errorMonitor_ && "[HostLink] error monitor is nullptr");
  assert(logger_ && "[HostLink] logger is nullptr");
  assert(channel_ && "[HostLink] line channel is nullptr");
  // an injected channel may arrive already connected (socketpair, test fake)
  connected_ = channel_->isOpen();
}

void HostLink::connect(const std::string& socketPath) {
  if (connected())
    return;

  if (!channel_->connect(socketPath))
    fail("[HostLink] host socket: " + socketPath + " connect failed");

  connected_ = true;
  logger_->log(LogLevel::Info, kSource, "connected to " + socketPath);
}

void HostLink::disconnect() {
  channel_->close();
  connected_ = false;
  parked_.clear();
}

bool HostLink::connected() const { return connected_ && channel_->isOpen(); }

void HostLink::fail(const std::string& message) {
  logger_->log(LogLevel::Error, kSource, message);
  errorMonitor_->notifyFailure(message);
  throw TransportFailure(message);
}

json HostLink::invoke(const std::string& channel, const json& payload) {
  if (!connected())
    fail("[HostLink] not connected, cannot invoke " + channel);

  protocols::Command cmd{ nextRequestId_++, channel, payload };
  std::string wire;
  try {
    wire = cmd.toWire();
  } catch (const json::exception& e) {
    fail("[HostLink] cannot encode " + channel + " request: " + e.what());
  }
  if (!channel_->writeLine(wire)) {
    connected_ = false;
    fail("[HostLink] failed to write " + channel + " request");
  }

  // replies are parked only for calls still waiting
  struct Waiting {
    std::unordered_set<std::uint64_t>& ids;
    std::uint64_t id;
    ~Waiting() { ids.erase(id); }
  } waiting{ waiting_, cmd.id };
  waiting_.insert(cmd.id);

  const auto deadline = std::chrono::steady_clock::now() + replyTimeout_;
  for (;;) {
    // a nested call may have read our reply for us
    if (auto parked = parked_.find(cmd.id); parked != parked_.end()) {
      protocols::Response reply = std::move(parked->second);
      parked_.erase(parked);
      if (reply.fault)
        fail("[HostLink] " + channel + ": " + *reply.fault);
      return std::move(reply.result);
    }

    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0)
      fail("[HostLink] timed out waiting for " + channel + " reply");

    auto line = channel_->readLine(left);
    if (!line) {
      if (!channel_->isOpen()) {
        connected_ = false;
        fail("[HostLink] host closed the link during " + channel);
      }
      continue; // deadline is re-checked above
    }

    auto frame = protocols::Response::fromWire(*line);
    if (!frame) {
      logger_->log(LogLevel::Warning, kSource, "dropping malformed frame: " + *line);
      continue;
    }

    if (frame->kind == protocols::Response::Kind::Event) {
      handleEvent(*frame);
      continue;
    }

    if (frame->id == cmd.id) {
      if (frame->fault)
        fail("[HostLink] " + channel + ": " + *frame->fault);
      return std::move(frame->result);
    }
    if (waiting_.count(frame->id) != 0) {
      parked_.emplace(frame->id, std::move(*frame));
    } else {
      logger_->log(LogLevel::Warning, kSource,
                   "dropping reply for unknown request " + std::to_string(frame->id));
    }
  }
}

std::size_t HostLink::pump(std::chrono::milliseconds budget) {
  if (!connected())
    fail("[HostLink] not connected, cannot pump events");

  std::size_t handled = 0;
  const auto deadline = std::chrono::steady_clock::now() + budget;
  do {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    auto line = channel_->readLine(std::max(left, std::chrono::milliseconds{ 0 }));
    if (!line) {
      if (!channel_->isOpen()) {
        connected_ = false;
        fail("[HostLink] host closed the link");
      }
      break;
    }

    auto frame = protocols::Response::fromWire(*line);
    if (!frame) {
      logger_->log(LogLevel::Warning, kSource, "dropping malformed frame: " + *line);
      continue;
    }
    ++handled;
    if (frame->kind == protocols::Response::Kind::Event) {
      handleEvent(*frame);
    } else {
      logger_->log(LogLevel::Warning, kSource,
                   "dropping reply " + std::to_string(frame->id) + " with no caller waiting");
    }
  } while (std::chrono::steady_clock::now() < deadline);

  return handled;
}

HostLink::ListenerId HostLink::addListener(const std::string& channel, RawListener listener) {
  const ListenerId id = nextListenerId_++;
  listeners_[channel].push_back(Entry{ id, std::move(listener) });
  return id;
}

bool HostLink::removeListener(const std::string& channel, ListenerId id) noexcept {
  auto it = listeners_.find(channel);
  if (it == listeners_.end())
    return false;
  auto& entries = it->second;
  auto pos = std::find_if(entries.begin(), entries.end(), [id](const Entry& e) { return e.id == id; });
  if (pos == entries.end())
    return false;
  entries.erase(pos);
  return true;
}

std::size_t HostLink::listenerCount(const std::string& channel) const {
  auto it = listeners_.find(channel);
  return it == listeners_.end() ? 0 : it->second.size();
}

bool HostLink::isRegistered(const std::string& channel, ListenerId id) const {
  auto it = listeners_.find(channel);
  if (it == listeners_.end())
    return false;
  return std::any_of(it->second.begin(), it->second.end(),
                     [id](const Entry& e) { return e.id == id; });
}

void HostLink::handleEvent(const protocols::Response& frame) {
  auto it = listeners_.find(frame.channel);
  if (it == listeners_.end() || it->second.empty()) {
    logger_->log(LogLevel::Debug, kSource, "no listener for " + frame.channel);
    return;
  }

  // listeners may subscribe/unsubscribe while we iterate
  const std::vector<Entry> snapshot = it->second;
  for (const auto& entry : snapshot) {
    if (isRegistered(frame.channel, entry.id))
      entry.fn(frame.args);
  }
}

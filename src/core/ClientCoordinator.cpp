/* @file ClientCoordinator.cpp
 * @brief subsystem wiring and the client lifecycle FSM
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <utility>

// salvage headers
#include "core/ClientCoordinator.hpp"
#include "core/CommandGateway.hpp"
#include "core/DeviceCatalog.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "core/EventRegistry.hpp"
#include "core/HostLink.hpp"
#include "core/Logger.hpp"
#include "core/RecoveryController.hpp"
#include "core/ScanController.hpp"
#include "core/SelectionStore.hpp"

using namespace salvage::core;

namespace {
  constexpr const char* kSource = "coordinator";
}

const char* salvage::core::toString(ClientCoordinator::State state) {
  switch (state) {
  case ClientCoordinator::State::BOOT:
    return "boot";
  case ClientCoordinator::State::CONNECTING:
    return "connecting";
  case ClientCoordinator::State::READY:
    return "ready";
  case ClientCoordinator::State::SHUTDOWN:
    return "shutdown";
  case ClientCoordinator::State::ERROR:
    return "error";
  }
  return "unknown";
}

ClientCoordinator::ClientCoordinator(ClientConfig config, std::unique_ptr<io::LineChannel> channel)
    : config_(std::move(config)), errorMonitor_(std::make_shared<ErrorMonitor>()),
      logger_(std::make_shared<Logger>(config_.logLevel)) {
  link_ = std::make_shared<HostLink>(errorMonitor_, logger_, std::move(channel));
  link_->setReplyTimeout(config_.replyTimeout);

  gateway_ = std::make_unique<CommandGateway>(*link_);
  registry_ = std::make_unique<EventRegistry>(link_, errorMonitor_, logger_);
  selection_ = std::make_unique<SelectionStore>();
  catalog_ = std::make_unique<DeviceCatalog>(*gateway_, *selection_, logger_);
  scan_ = std::make_unique<ScanController>(*gateway_, *registry_, *selection_, errorMonitor_, logger_,
                                           config_.controller);
  recovery_ = std::make_unique<RecoveryController>(*gateway_, *registry_, *selection_, scan_->store(),
                                                   errorMonitor_, logger_, config_.controller);

  std::weak_ptr<Logger> weakLog = logger_;
  errorMonitor_->registerEscalation([weakLog](const std::string& message) {
    if (auto log = weakLog.lock())
      log->log(LogLevel::Error, "escalation", message);
  });
}

ClientCoordinator::~ClientCoordinator() {
  if (currentState_ != State::SHUTDOWN)
    shutdown();
}

void ClientCoordinator::transitionTo(State next) {
  if (currentState_ == next)
    return;
  logger_->log(LogLevel::Info, kSource,
               std::string(toString(currentState_)) + " -> " + toString(next));
  currentState_ = next;
}

void ClientCoordinator::handleError(const std::string& reason) {
  lastError_ = reason;
  logger_->log(LogLevel::Error, kSource, reason);
  transitionTo(State::ERROR);
}

bool ClientCoordinator::initialize() {
  if (currentState_ != State::BOOT)
    return currentState_ == State::READY;

  if (!logger_->startNewRun(config_.logPath))
    std::cerr << "[ClientCoordinator] run log " << config_.logPath << " unavailable\n";

  transitionTo(State::CONNECTING);
  try {
    link_->connect(config_.hostSocket);
  } catch (const TransportFailure& e) {
    handleError(e.what());
    return false;
  }

  scan_->activate();
  recovery_->activate();

  try {
    selection_->setPrivilege(gateway_->checkPrivilege());
  } catch (const CommandFailure& e) {
    // not fatal: the host may still list devices it can read
    logger_->log(LogLevel::Warning, kSource, e.what());
  }

  if (!catalog_->load() && !link_->connected()) {
    handleError(catalog_->error().value_or("host link lost"));
    return false;
  }

  transitionTo(State::READY);
  return true;
}

bool ClientCoordinator::pumpEvents() {
  if (currentState_ != State::READY)
    return false;
  try {
    link_->pump(config_.pumpInterval);
  } catch (const TransportFailure& e) {
    handleError(e.what());
    return false;
  }
  return true;
}

void ClientCoordinator::shutdown() {
  if (currentState_ == State::SHUTDOWN)
    return;

  if (link_->connected()) {
    for (SessionController* session : { static_cast<SessionController*>(scan_.get()),
                                         static_cast<SessionController*>(recovery_.get()) }) {
      const auto status = session->store().status();
      if (status == SessionStatus::Running || status == SessionStatus::Paused)
        session->cancel();
    }
  }

  recovery_->deactivate();
  scan_->deactivate();
  link_->disconnect();
  transitionTo(State::SHUTDOWN);
  logger_->finishRun();
}

/* @file SessionController.cpp
 * @brief lifecycle FSM shared by scan and recovery: command replies, stream events, teardown
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <utility>
#include <variant>

// salvage headers
#include "core/CommandGateway.hpp"
#include "core/Errors.hpp"
#include "core/EventRegistry.hpp"
#include "core/SessionController.hpp"

using namespace salvage::core;

namespace {
  bool edgeAllowed(SessionStatus from, SessionStatus to) {
    switch (from) {
    case SessionStatus::Idle:
      return to == SessionStatus::Running || to == SessionStatus::Error;
    case SessionStatus::Running:
      return to == SessionStatus::Paused || to == SessionStatus::Cancelled ||
             to == SessionStatus::Completed || to == SessionStatus::Error;
    case SessionStatus::Paused:
      return to == SessionStatus::Running || to == SessionStatus::Cancelled ||
             to == SessionStatus::Completed || to == SessionStatus::Error;
    default:
      return false; // terminal: only a new start leaves it
    }
  }
} // namespace

SessionController::SessionController(SessionKind kind, CommandGateway& gateway, EventRegistry& events,
                                     std::shared_ptr<ErrorMonitor> errMonitor,
                                     std::shared_ptr<Logger> logger, ControllerOptions options)
    : gateway_(gateway), store_(kind), events_(events), errorMonitor_(std::move(errMonitor)),
      logger_(std::move(logger)), options_(options),
      subscriptions_([this](const std::string& message) { reportFailure(message); }) {
  assert(errorMonitor_ && "[SessionController] error monitor is nullptr");
  assert(logger_ && "[SessionController] logger is nullptr");
}

SessionController::~SessionController() { deactivate(); }

void SessionController::activate() {
  if (active())
    return;
  for (const auto& channel : eventChannels()) {
    subscriptions_.add(events_.subscribe(
        channel, [this](const protocols::SessionEvent& event) { onEvent(event); }));
  }
  log(LogLevel::Debug, "subscribed to " + std::to_string(subscriptions_.size()) + " channels");
}

void SessionController::deactivate() {
  if (!active())
    return;
  subscriptions_.disposeAll();
  log(LogLevel::Debug, "unsubscribed");
}

void SessionController::log(LogLevel level, const std::string& message) const {
  logger_->log(level, toString(kind()), message);
}

void SessionController::reportFailure(const std::string& message) {
  log(LogLevel::Error, message);
  errorMonitor_->notifyFailure(std::string("[") + toString(kind()) + "] " + message);
}

void SessionController::transitionTo(SessionStatus next) {
  const auto from = store_.status();
  if (from == next)
    return;
  log(LogLevel::Info, std::string(toString(kind(), from)) + " -> " + toString(kind(), next));
  store_.setStatus(next);
}

//---start-------------------------------------------------------------------

bool SessionController::beginStart() {
  const auto status = store_.status();
  if (options_.singleActiveSession &&
      (status == SessionStatus::Running || status == SessionStatus::Paused)) {
    log(LogLevel::Warning, "start refused: session " + store_.sessionId().value_or("<pending>") +
                               " is still " + toString(kind(), status));
    return false;
  }
  activate(); // no events may be missed between the reply and the first push
  store_.reset();
  errorMonitor_->clear(); // a new session may hit the same fault again
  return true;
}

void SessionController::applyStartSuccess(const std::optional<std::string>& sessionId) {
  if (sessionId && !store_.setSessionId(*sessionId)) {
    log(LogLevel::Warning, "start reply id " + *sessionId + " differs from recorded id " +
                               store_.sessionId().value_or(""));
  }
  log(LogLevel::Info, "session " + store_.sessionId().value_or("<unnamed>") + " started");

  // a terminal event may already have landed while start was in flight
  if (store_.status() == SessionStatus::Idle)
    transitionTo(SessionStatus::Running);
}

void SessionController::applyStartFailure(const std::string& message) {
  store_.setError(message);
  reportFailure("start failed: " + message);
  if (!isTerminal(store_.status()))
    transitionTo(SessionStatus::Error);
}

//---pause / resume / cancel-------------------------------------------------

bool SessionController::pause() { return control(Control::Pause); }
bool SessionController::resume() { return control(Control::Resume); }
bool SessionController::cancel() { return control(Control::Cancel); }

bool SessionController::control(Control op) {
  const char* verb = op == Control::Pause ? "pause" : op == Control::Resume ? "resume" : "cancel";
  if (!store_.sessionId()) {
    log(LogLevel::Debug, std::string(verb) + " ignored: no session id");
    return false;
  }

  const std::string id = *store_.sessionId();
  const auto from = store_.status();
  SessionStatus target = SessionStatus::Cancelled;

  try {
    switch (op) {
    case Control::Pause:
      target = SessionStatus::Paused;
      issuePause(id);
      break;
    case Control::Resume:
      target = SessionStatus::Running;
      issueResume(id);
      break;
    case Control::Cancel:
      target = SessionStatus::Cancelled;
      issueCancel(id);
      break;
    }
  } catch (const CommandFailure& e) {
    store_.setError(e.what());
    reportFailure(std::string(verb) + " failed: " + e.what());
    if (options_.controlFailurePolicy == ControlFailurePolicy::EnterError &&
        !isTerminal(store_.status()))
      transitionTo(SessionStatus::Error);
    return true;
  }

  if (store_.status() == from && edgeAllowed(from, target)) {
    transitionTo(target);
  } else {
    log(LogLevel::Info, std::string(verb) + " acknowledged, status stays " +
                            toString(kind(), store_.status()));
  }
  return true;
}

//---stream events-----------------------------------------------------------

bool SessionController::isStale(const std::optional<std::string>& eventSessionId) const {
  const auto& recorded = store_.sessionId();
  return eventSessionId && recorded && *eventSessionId != *recorded;
}

void SessionController::adoptId(const std::optional<std::string>& eventSessionId) {
  if (eventSessionId && !store_.sessionId())
    store_.setSessionId(*eventSessionId);
}

void SessionController::onEvent(const protocols::SessionEvent& event) {
  if (const auto* ev = std::get_if<protocols::ScanProgressEvent>(&event)) {
    if (isStale(ev->sessionId))
      return;
    if (adoptsIdFromEvents())
      adoptId(ev->sessionId);
    store_.mergeProgress(ev->progress);
  } else if (const auto* ev = std::get_if<protocols::RecoveryProgressEvent>(&event)) {
    if (isStale(ev->sessionId))
      return;
    if (adoptsIdFromEvents())
      adoptId(ev->sessionId);
    store_.mergeProgress(ev->progress);
  } else if (const auto* ev = std::get_if<protocols::FilesFoundEvent>(&event)) {
    if (isStale(ev->sessionId))
      return;
    store_.appendFiles(ev->files);
  } else if (const auto* ev = std::get_if<protocols::CompleteEvent>(&event)) {
    if (isStale(ev->sessionId))
      log(LogLevel::Warning, "completion names session " + *ev->sessionId + ", recorded " +
                                 *store_.sessionId());
    adoptId(ev->sessionId);
    log(LogLevel::Info, "session " + store_.sessionId().value_or("<unnamed>") + " completed" +
                            (ev->filesFound ? ", " + std::to_string(*ev->filesFound) + " files" : ""));
    transitionTo(SessionStatus::Completed);
  } else if (const auto* ev = std::get_if<protocols::ErrorEvent>(&event)) {
    if (isStale(ev->sessionId))
      log(LogLevel::Warning, "error names session " + *ev->sessionId + ", recorded " +
                                 *store_.sessionId());
    adoptId(ev->sessionId);
    const std::string message = ev->message.value_or(unknownStreamError());
    store_.setError(message);
    reportFailure(message);
    transitionTo(SessionStatus::Error);
  }
}

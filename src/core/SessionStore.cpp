/* @file SessionStore.cpp
 * @brief monotonic progress merge, append-only discoveries, change fan-out
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cstddef>
#include <memory>
#include <utility>

// salvage headers
#include "core/SessionStore.hpp"

using namespace salvage::core;

const char* salvage::core::toString(SessionKind kind) {
  return kind == SessionKind::Scan ? "scan" : "recovery";
}

const char* salvage::core::toString(SessionKind kind, SessionStatus status) {
  switch (status) {
  case SessionStatus::Idle:
    return "idle";
  case SessionStatus::Running:
    return kind == SessionKind::Scan ? "scanning" : "recovering";
  case SessionStatus::Paused:
    return "paused";
  case SessionStatus::Completed:
    return "completed";
  case SessionStatus::Cancelled:
    return "cancelled";
  case SessionStatus::Error:
    return "error";
  default:
    return "unknown";
  }
}

bool salvage::core::isTerminal(SessionStatus status) {
  return status == SessionStatus::Completed || status == SessionStatus::Cancelled ||
         status == SessionStatus::Error;
}

SessionStore::SessionStore(SessionKind kind) { state_.kind = kind; }

Subscription SessionStore::subscribe(Listener listener) const {
  const auto id = nextListener_++;
  listeners_.emplace(id, std::move(listener));
  auto alive = std::weak_ptr<bool>(alive_);
  return Subscription([this, id, alive]() {
    if (alive.lock())
      listeners_.erase(id);
  });
}

void SessionStore::reset() {
  const auto kind = state_.kind;
  state_ = SessionSnapshot{};
  state_.kind = kind;
  notify();
}

void SessionStore::setStatus(SessionStatus status) {
  if (state_.status == status)
    return;
  state_.status = status;
  notify();
}

void SessionStore::mergeProgress(const ScanProgress& update) {
  if (!state_.scanProgress) {
    state_.scanProgress = update;
  } else {
    auto& p = *state_.scanProgress;
    p.bytesScanned = std::max(p.bytesScanned, update.bytesScanned);
    p.totalBytes = std::max(p.totalBytes, update.totalBytes);
    p.percentage = std::max(p.percentage, update.percentage);
    p.filesFound = std::max(p.filesFound, update.filesFound);
    p.currentSector = std::max(p.currentSector, update.currentSector);
    p.sectorsWithErrors = std::max(p.sectorsWithErrors, update.sectorsWithErrors);
    // an estimate, not a counter: the newest one wins
    p.estimatedSecondsRemaining = update.estimatedSecondsRemaining;
  }
  notify();
}

void SessionStore::mergeProgress(const RecoveryProgress& update) {
  if (!state_.recoveryProgress) {
    state_.recoveryProgress = update;
  } else {
    auto& p = *state_.recoveryProgress;
    p.totalFiles = std::max(p.totalFiles, update.totalFiles);
    p.completedFiles = std::max(p.completedFiles, update.completedFiles);
    p.bytesWritten = std::max(p.bytesWritten, update.bytesWritten);
    p.totalBytes = std::max(p.totalBytes, update.totalBytes);
    p.percentage = std::max(p.percentage, update.percentage);
    if (update.currentFile)
      p.currentFile = update.currentFile;
    // the host resends its whole error list; keep ours append-only
    if (update.errors.size() > p.errors.size())
      p.errors.insert(p.errors.end(), update.errors.begin() + static_cast<std::ptrdiff_t>(p.errors.size()),
                      update.errors.end());
  }
  notify();
}

void SessionStore::appendFiles(const std::vector<RecoverableFile>& files) {
  if (files.empty())
    return;
  state_.files.insert(state_.files.end(), files.begin(), files.end());
  notify();
}

bool SessionStore::setSessionId(const std::string& id) {
  if (state_.sessionId)
    return *state_.sessionId == id;
  state_.sessionId = id;
  notify();
  return true;
}

void SessionStore::setError(std::optional<std::string> message) {
  state_.error = std::move(message);
  notify();
}

void SessionStore::notify() {
  // copy: a listener may unsubscribe itself
  const auto listeners = listeners_;
  for (const auto& [id, fn] : listeners) {
    if (listeners_.count(id))
      fn(state_);
  }
}

/* @file ErrorMonitor.cpp
 * @brief de-duplicating fault escalation
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <utility>

// salvage headers
#include "core/ErrorMonitor.hpp"

using namespace salvage::core;

void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
  std::lock_guard<std::mutex> lock(mtx_);
  escalation_ = std::move(cb);
}

void ErrorMonitor::notifyFailure(const std::string& message) {
  std::function<void(const std::string&)> escalate;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!markIfNew(message))
      return;
    escalate = escalation_;
  }
  if (escalate)
    escalate(message);
}

std::size_t ErrorMonitor::failureCount() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return seen_.size();
}

void ErrorMonitor::clear() {
  std::lock_guard<std::mutex> lock(mtx_);
  seen_.clear();
}

bool ErrorMonitor::markIfNew(const std::string& message) {
  if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
    return false;
  seen_.push_back(message);
  return true;
}

/* @file Subscription.cpp
 * @brief idempotent disposal, single and grouped
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <exception>
#include <iostream>
#include <utility>

// salvage headers
#include "core/Subscription.hpp"

using namespace salvage::core;

Subscription::Subscription(Release release) : release_(std::move(release)) {}

Subscription::~Subscription() {
  try {
    dispose();
  } catch (const std::exception& e) {
    std::cerr << "[Subscription] release failed during destruction: " << e.what() << '\n';
  } catch (...) {
    std::cerr << "[Subscription] release failed during destruction: unknown exception\n";
  }
}

Subscription::Subscription(Subscription&& other) noexcept : release_(std::move(other.release_)) {
  other.release_ = nullptr;
}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
  if (this != &other) {
    try {
      dispose();
    } catch (const std::exception& e) {
      std::cerr << "[Subscription] release failed on reassignment: " << e.what() << '\n';
    } catch (...) {
      std::cerr << "[Subscription] release failed on reassignment: unknown exception\n";
    }
    release_ = std::move(other.release_);
    other.release_ = nullptr;
  }
  return *this;
}

void Subscription::dispose() {
  if (!release_)
    return;
  // clear first: a throwing release still counts as disposed
  Release release = std::move(release_);
  release_ = nullptr;
  release();
}

SubscriptionGroup::SubscriptionGroup(FailureSink onFailure) : onFailure_(std::move(onFailure)) {}

SubscriptionGroup::~SubscriptionGroup() { disposeAll(); }

void SubscriptionGroup::add(Subscription sub) { subs_.push_back(std::move(sub)); }

void SubscriptionGroup::disposeAll() {
  std::vector<Subscription> subs = std::move(subs_);
  subs_.clear();
  for (auto& sub : subs) {
    try {
      sub.dispose();
    } catch (const std::exception& e) {
      report(std::string("[SubscriptionGroup] dispose failed: ") + e.what());
    } catch (...) {
      report("[SubscriptionGroup] dispose failed: unknown exception");
    }
  }
}

void SubscriptionGroup::report(const std::string& message) const {
  if (onFailure_)
    onFailure_(message);
  else
    std::cerr << message << '\n';
}

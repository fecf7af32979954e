#pragma once
/** @file  Subscription.hpp
 *  @brief Disposer handles: one per registration, plus an owning group.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace salvage {
  namespace core {

    /**
 * @class Subscription
 * @brief Move-only handle that releases one registration.
 *
 *  * `dispose()` runs the release function at most once; later calls are no-ops.
 *  * The destructor disposes, so a handle going out of scope unsubscribes.
 */
    class Subscription {
    public:
      using Release = std::function<void()>;

      Subscription() = default;
      explicit Subscription(Release release);
      ~Subscription();

      void dispose();
      bool active() const noexcept { return static_cast<bool>(release_); }

      //---move-only---------------------------------------------------------
      Subscription(Subscription&& other) noexcept;
      Subscription& operator=(Subscription&& other) noexcept;
      Subscription(const Subscription&) = delete;
      Subscription& operator=(const Subscription&) = delete;

    private:
      Release release_{};
    };

    /**
 * @class SubscriptionGroup
 * @brief Owns N subscriptions and disposes every one of them on teardown.
 *
 *  * A child whose release throws is reported to the failure sink and the
 *    remaining children are still disposed.
 *  * `disposeAll()` is idempotent; the destructor calls it.
 */
    class SubscriptionGroup {
    public:
      using FailureSink = std::function<void(const std::string&)>;

      explicit SubscriptionGroup(FailureSink onFailure = {});
      ~SubscriptionGroup();

      void add(Subscription sub);
      void disposeAll();

      std::size_t size() const noexcept { return subs_.size(); }
      bool empty() const noexcept { return subs_.empty(); }

      SubscriptionGroup(const SubscriptionGroup&) = delete;
      SubscriptionGroup& operator=(const SubscriptionGroup&) = delete;

    private:
      void report(const std::string& message) const;

      std::vector<Subscription> subs_;
      FailureSink onFailure_;
    };

  } // namespace core
} // namespace salvage

#pragma once
/** @file  SessionController.hpp
 *  @brief Shared lifecycle state machine for scan and recovery sessions.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// salvage headers
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/SessionStore.hpp"
#include "core/Subscription.hpp"
#include "protocols/SessionEvent.hpp"

namespace salvage::core { // forward decls only
  class CommandGateway;
  class EventRegistry;
} // namespace salvage::core

namespace salvage::core {

  /// What a failed pause/resume/cancel does to the status (the error text is always recorded).
  enum class ControlFailurePolicy : std::uint8_t { KeepStatus, EnterError };

  struct ControllerOptions {
    ControlFailurePolicy controlFailurePolicy{ ControlFailurePolicy::KeepStatus };
    bool singleActiveSession{ true }; ///< refuse start() while running or paused
  };

  /**
 * @class SessionController
 * @brief Common polymorphic base of ScanController and RecoveryController.
 *
 *  * Owns the SessionStore and the event subscriptions; nobody else mutates
 *    the store or disposes the subscriptions.
 *  * `activate()` subscribes to every event channel of the session kind once;
 *    `deactivate()` (and the destructor) disposes each subscription exactly once.
 *  * Command replies move the status only along the defined edges and only if
 *    the status is still the one the call started from; an event that arrived
 *    while the call was in flight wins.
 *  * Complete and error events apply from any status.
 *
 *  Transitions:
 *    idle --start ok--> running --pause ok--> paused --resume ok--> running
 *    running|paused --cancel ok--> cancelled
 *    idle --start fails--> error
 *    any --complete event--> completed,  any --error event--> error
 */
  class SessionController {
  public:
    virtual ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    //---public API------------------------------------------------------
    void activate();
    void deactivate();
    bool active() const { return !subscriptions_.empty(); }

    /// Each returns false (and changes nothing) when no session id is recorded.
    bool pause();
    bool resume();
    bool cancel();

    const SessionStore& store() const { return store_; }
    SessionKind kind() const { return store_.snapshot().kind; }

  protected:
    SessionController(SessionKind kind, CommandGateway& gateway, EventRegistry& events,
                      std::shared_ptr<ErrorMonitor> errMonitor, std::shared_ptr<Logger> logger,
                      ControllerOptions options);

    /// Guard + reset before a start call; false if another session is still live.
    bool beginStart();
    void applyStartSuccess(const std::optional<std::string>& sessionId);
    void applyStartFailure(const std::string& message);

    //---per-kind hooks--------------------------------------------------
    virtual std::vector<std::string> eventChannels() const = 0;
    virtual void issuePause(const std::string& id) = 0;
    virtual void issueResume(const std::string& id) = 0;
    virtual void issueCancel(const std::string& id) = 0;
    virtual const char* unknownStreamError() const = 0;
    /// Recovery hosts may only name the session in their events.
    virtual bool adoptsIdFromEvents() const { return false; }

    void log(LogLevel level, const std::string& message) const;

    CommandGateway& gateway_;
    SessionStore store_;

  private:
    enum class Control { Pause, Resume, Cancel };

    bool control(Control op);
    void transitionTo(SessionStatus next);
    void onEvent(const protocols::SessionEvent& event);
    bool isStale(const std::optional<std::string>& eventSessionId) const;
    void adoptId(const std::optional<std::string>& eventSessionId);
    void reportFailure(const std::string& message);

    EventRegistry& events_;
    std::shared_ptr<ErrorMonitor> errorMonitor_;
    std::shared_ptr<Logger> logger_;
    ControllerOptions options_;
    SubscriptionGroup subscriptions_;
  };

} // namespace salvage::core

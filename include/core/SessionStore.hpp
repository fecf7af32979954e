#pragma once
/** @file  SessionStore.hpp
 *  @brief UI-visible snapshot of one scan or recovery session.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// salvage headers
#include "core/Subscription.hpp"
#include "core/Types.hpp"

namespace salvage {
  namespace core {

    enum class SessionKind : std::uint8_t { Scan, Recovery };

    /// Closed status set; `Running` reads "scanning" or "recovering" by kind.
    enum class SessionStatus : std::uint8_t { Idle, Running, Paused, Completed, Cancelled, Error };

    const char* toString(SessionKind kind);
    const char* toString(SessionKind kind, SessionStatus status);
    bool isTerminal(SessionStatus status);

    struct SessionSnapshot {
      SessionKind kind{ SessionKind::Scan };
      SessionStatus status{ SessionStatus::Idle };
      std::optional<std::string> sessionId;
      std::optional<ScanProgress> scanProgress;         ///< Scan sessions
      std::optional<RecoveryProgress> recoveryProgress; ///< Recovery sessions
      std::vector<RecoverableFile> files;               ///< discoveries, arrival order
      std::optional<std::string> error;
    };

    /**
 * @class SessionStore
 * @brief Single-writer / multi-reader state of the active session.
 *
 *  * Only the owning SessionController calls the mutators.
 *  * Readers either poll `snapshot()` or `subscribe()` for change notification;
 *    listeners run synchronously after every effective mutation.
 *  * Enforces the session invariants: the id never changes once set, progress
 *    never moves backwards, discoveries are append-only.
 */
    class SessionStore {
    public:
      using Listener = std::function<void(const SessionSnapshot&)>;

      explicit SessionStore(SessionKind kind);

      SessionStore(const SessionStore&) = delete;
      SessionStore& operator=(const SessionStore&) = delete;

      //---read access-----------------------------------------------------
      const SessionSnapshot& snapshot() const { return state_; }
      SessionStatus status() const { return state_.status; }
      const std::optional<std::string>& sessionId() const { return state_.sessionId; }
      Subscription subscribe(Listener listener) const; ///< readers may hold a const store

      //---mutators (SessionController only)-------------------------------
      void reset(); ///< new logical session: idle, no id, no progress, no items, no error
      void setStatus(SessionStatus status);
      void mergeProgress(const ScanProgress& update);
      void mergeProgress(const RecoveryProgress& update);
      void appendFiles(const std::vector<RecoverableFile>& files);
      /// @returns false if a different id is already recorded (the id is left unchanged).
      bool setSessionId(const std::string& id);
      void setError(std::optional<std::string> message);

    private:
      void notify();

      SessionSnapshot state_;
      mutable std::map<std::uint64_t, Listener> listeners_;
      mutable std::uint64_t nextListener_{ 1 };
      std::shared_ptr<bool> alive_{ std::make_shared<bool>(true) }; ///< lets late disposers see the store is gone
    };

  } // namespace core
} // namespace salvage

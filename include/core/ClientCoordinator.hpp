#pragma once

/** @file  ClientCoordinator.hpp
 *  @brief Public API for salvage::core::ClientCoordinator.
 *
 *  © 2025 Milo Medical — licensed under MIT.
 */

#include <memory>
#include <optional>
#include <string>

#include "core/ConfigLoader.hpp"
#include "io/LineChannel.hpp"

namespace salvage {
  namespace core {

    class CommandGateway;
    class DeviceCatalog;
    class EventRegistry;
    class HostLink;
    class RecoveryController;
    class ScanController;
    class SelectionStore;

    /**
 * @class ClientCoordinator
 * @brief Owns every client subsystem and wires them together.
 *
 *  * The only place shared dependencies are created; everything else receives
 *    them by reference or shared_ptr.
 *  * Link loss moves the coordinator to ERROR; sessions keep their last snapshot.
 */
    class ClientCoordinator {

    public:
      enum class State { BOOT, CONNECTING, READY, SHUTDOWN, ERROR };

      explicit ClientCoordinator(ClientConfig config,
                                 std::unique_ptr<io::LineChannel> channel = std::make_unique<io::LineChannel>());
      ~ClientCoordinator();

      ClientCoordinator(const ClientCoordinator&) = delete;
      ClientCoordinator& operator=(const ClientCoordinator&) = delete;

      // ---- Public API ----
      bool initialize(); ///< open run log, connect, read privilege, list devices
      bool pumpEvents(); ///< one pump interval; false once the link is gone
      void shutdown();   ///< cancel live sessions, unsubscribe, disconnect, close the log
      void handleError(const std::string& reason);

      State state() const { return currentState_; }
      const std::optional<std::string>& lastError() const { return lastError_; }

      SelectionStore& selection() { return *selection_; }
      DeviceCatalog& devices() { return *catalog_; }
      ScanController& scan() { return *scan_; }
      RecoveryController& recovery() { return *recovery_; }
      CommandGateway& gateway() { return *gateway_; }
      ErrorMonitor& errorMonitor() { return *errorMonitor_; }
      Logger& logger() { return *logger_; }

    private:
      void transitionTo(State next);

      ClientConfig config_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::shared_ptr<Logger> logger_;
      std::shared_ptr<HostLink> link_;
      std::unique_ptr<CommandGateway> gateway_;
      std::unique_ptr<EventRegistry> registry_;
      std::unique_ptr<SelectionStore> selection_;
      std::unique_ptr<DeviceCatalog> catalog_;
      std::unique_ptr<ScanController> scan_;
      std::unique_ptr<RecoveryController> recovery_;

      State currentState_{ State::BOOT };
      std::optional<std::string> lastError_;
    };

    const char* toString(ClientCoordinator::State state);

  } // namespace core
} // namespace salvage

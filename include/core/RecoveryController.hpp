#pragma once
/** @file  RecoveryController.hpp
 *  @brief Recovery session: sends the selected discoveries to recovery.*.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>
#include <string>
#include <vector>

#include "core/SessionController.hpp"

namespace salvage::core {

  class SelectionStore;

  /**
 * @class RecoveryController
 * @brief Recovers the scan discoveries the user selected, in discovery order.
 *
 *  * Reads the scan store; never writes it.
 *  * The recovery id comes from the start reply, or from the first event that
 *    names one when the host leaves it out of the reply.
 */
  class RecoveryController : public SessionController {
  public:
    RecoveryController(CommandGateway& gateway, EventRegistry& events, const SelectionStore& selection,
                       const SessionStore& scanStore, std::shared_ptr<ErrorMonitor> errMonitor,
                       std::shared_ptr<Logger> logger, ControllerOptions options = {});
    ~RecoveryController() override = default;

    /// No-op (returns false) without a selected device, a destination, or while a session is live.
    bool start();

    /// Per-file failures reported so far (status unaffected).
    std::vector<RecoveryError> fileErrors() const;

  protected:
    std::vector<std::string> eventChannels() const override;
    void issuePause(const std::string& id) override;
    void issueResume(const std::string& id) override;
    void issueCancel(const std::string& id) override;
    const char* unknownStreamError() const override { return "Recovery failed with an unknown error"; }
    bool adoptsIdFromEvents() const override { return true; }

  private:
    RecoveryConfig buildConfig(const std::string& sourceDevicePath) const;

    const SelectionStore& selection_;
    const SessionStore& scanStore_;
  };

} // namespace salvage::core

#pragma once
/** @file  ScanController.hpp
 *  @brief Scan session: builds the ScanConfig from the selection and drives scan.*.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>
#include <string>
#include <vector>

#include "core/SessionController.hpp"

namespace salvage::core {

  class SelectionStore;

  class ScanController : public SessionController {
  public:
    ScanController(CommandGateway& gateway, EventRegistry& events, const SelectionStore& selection,
                   std::shared_ptr<ErrorMonitor> errMonitor, std::shared_ptr<Logger> logger,
                   ControllerOptions options = {});
    ~ScanController() override = default;

    /// No-op (returns false) without a selected device or while a session is live.
    bool start();

    const std::vector<RecoverableFile>& foundFiles() const { return store_.snapshot().files; }

  protected:
    std::vector<std::string> eventChannels() const override;
    void issuePause(const std::string& id) override;
    void issueResume(const std::string& id) override;
    void issueCancel(const std::string& id) override;
    const char* unknownStreamError() const override { return "Scan failed with an unknown error"; }

  private:
    const SelectionStore& selection_;
  };

} // namespace salvage::core

#pragma once
/** @file  DeviceCatalog.hpp
 *  @brief Host block-device list with loading flag and last error.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/Logger.hpp"
#include "core/Types.hpp"

namespace salvage::core {

  class CommandGateway;
  class SelectionStore;

  class DeviceCatalog {
  public:
    DeviceCatalog(CommandGateway& gateway, SelectionStore& selection, std::shared_ptr<Logger> logger);

    /// Both replace the list wholesale; on failure the old list stays and `error()` is set.
    bool load();
    bool refresh();

    const std::vector<Device>& devices() const { return devices_; }
    std::optional<Device> find(const std::string& path) const;
    bool loading() const { return loading_; }
    const std::optional<std::string>& error() const { return error_; }

  private:
    template <typename Fetch> bool update(const char* what, Fetch fetch);
    void reconcileSelection();

    CommandGateway& gateway_;
    SelectionStore& selection_;
    std::shared_ptr<Logger> logger_;
    std::vector<Device> devices_;
    std::optional<std::string> error_;
    bool loading_{ false };
  };

} // namespace salvage::core

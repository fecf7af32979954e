/* @file main.cpp
 * @brief salvage-console: list devices, scan one, optionally recover what was found
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <csignal>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

// third-party headers
#include <nlohmann/json.hpp>

// salvage headers
#include "core/ClientCoordinator.hpp"
#include "core/ConfigLoader.hpp"
#include "core/DeviceCatalog.hpp"
#include "core/RecoveryController.hpp"
#include "core/ScanController.hpp"
#include "core/SelectionStore.hpp"
#include "ui/ConsoleView.hpp"

using namespace salvage::core;

namespace {
  std::atomic<bool> gInterrupted{ false };

  void onSigint(int) { gInterrupted.store(true); }

  struct Options {
    std::optional<std::string> configPath;
    std::optional<std::string> devicePath;
    std::optional<std::string> partitionPath;
    std::optional<std::string> recoverTo;
    bool deep{ false };
  };

  void usage(const char* argv0) {
    std::cerr << "usage: " << argv0
              << " [--config FILE] [--deep] [--partition PATH] [--recover-to DIR] [DEVICE]\n";
  }

  std::optional<Options> parseArgs(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
      const std::string arg = argv[i];
      auto next = [&]() -> std::optional<std::string> {
        if (i + 1 >= argc)
          return std::nullopt;
        return std::string(argv[++i]);
      };
      if (arg == "--deep") {
        opts.deep = true;
      } else if (arg == "--config") {
        if (!(opts.configPath = next()))
          return std::nullopt;
      } else if (arg == "--partition") {
        if (!(opts.partitionPath = next()))
          return std::nullopt;
      } else if (arg == "--recover-to") {
        if (!(opts.recoverTo = next()))
          return std::nullopt;
      } else if (!arg.empty() && arg[0] == '-') {
        return std::nullopt;
      } else {
        opts.devicePath = arg;
      }
    }
    return opts;
  }

  /// Pump until \p session is no longer live; the first SIGINT cancels it.
  void runToEnd(ClientCoordinator& app, SessionController& session) {
    bool cancelSent = false;
    for (;;) {
      const auto status = session.store().status();
      if (status != SessionStatus::Running && status != SessionStatus::Paused)
        return;
      if (gInterrupted.load() && !cancelSent) {
        cancelSent = true;
        session.cancel();
        continue;
      }
      if (!app.pumpEvents())
        return;
    }
  }
} // namespace

int main(int argc, char** argv) {
  auto opts = parseArgs(argc, argv);
  if (!opts) {
    usage(argv[0]);
    return 2;
  }

  ClientConfig config;
  if (opts->configPath) {
    try {
      config = ClientConfig::fromJson(ConfigLoader(*opts->configPath).load());
    } catch (const std::runtime_error& e) {
      std::cerr << e.what() << '\n';
      return 2;
    }
  }

  std::signal(SIGINT, onSigint);

  ClientCoordinator app(config);
  salvage::ui::ConsoleView view(std::cout);
  if (!app.initialize()) {
    std::cerr << "cannot reach host: " << app.lastError().value_or("unknown error") << '\n';
    return 1;
  }

  if (app.devices().error())
    view.showMessage("device list: " + *app.devices().error());
  view.showDevices(app.devices().devices());
  if (!opts->devicePath) {
    app.shutdown();
    return 0;
  }

  auto device = app.devices().find(*opts->devicePath);
  if (!device) {
    std::cerr << *opts->devicePath << ": no such device\n";
    app.shutdown();
    return 1;
  }
  auto& selection = app.selection();
  selection.selectDevice(*device);
  if (opts->partitionPath) {
    for (const auto& p : device->partitions) {
      if (p.path == *opts->partitionPath)
        selection.selectPartition(p);
    }
    if (!selection.selectedPartition()) {
      std::cerr << *opts->partitionPath << ": no such partition on " << device->path << '\n';
      app.shutdown();
      return 1;
    }
  }
  selection.setScanMode(opts->deep ? ScanMode::Deep : ScanMode::Quick);

  auto& scan = app.scan();
  {
    auto watch = view.attach(scan.store());
    scan.start();
    runToEnd(app, scan);
  }

  int rc = scan.store().status() == SessionStatus::Completed ? 0 : 1;
  const auto& found = scan.store().snapshot().files;
  if (rc == 0 && opts->recoverTo && !found.empty() && !gInterrupted.load()) {
    selection.setDestination(*opts->recoverTo);
    selection.selectAllFiles(found);

    auto& recovery = app.recovery();
    auto watch = view.attach(recovery.store());
    recovery.start();
    runToEnd(app, recovery);
    for (const auto& err : recovery.fileErrors())
      view.showMessage("  " + err.fileName + ": " + err.error);
    rc = recovery.store().status() == SessionStatus::Completed ? 0 : 1;
  }

  app.shutdown();
  return rc;
}

#include "core/ClientCoordinator.hpp"
#include "core/CommandGateway.hpp"
#include "core/ConfigLoader.hpp"
#include "core/DeviceCatalog.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/RecoveryController.hpp"
#include "core/ScanController.hpp"
#include "core/SelectionStore.hpp"
#include "protocols/WireCodec.hpp"
#include "ui/ConsoleView.hpp"

#include "FakeLineChannel.hpp"
#include "FakeTransport.hpp"
#include "TestPayloads.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <unistd.h>

using namespace salvage::core;
using namespace salvage::test;
using nlohmann::json;
using ::testing::HasSubstr;

namespace {
  std::string tempPath(const std::string& name) {
    return ::testing::TempDir() + name + "-" + std::to_string(::getpid());
  }

  std::string writeFile(const std::string& name, const std::string& text) {
    const auto path = tempPath(name);
    std::ofstream(path) << text;
    return path;
  }
} // namespace

//---ErrorMonitor--------------------------------------------------------------

TEST(error_monitor, escalates_each_distinct_failure_once) {
  ErrorMonitor monitor;
  std::vector<std::string> escalated;
  monitor.registerEscalation([&](const std::string& msg) { escalated.push_back(msg); });

  monitor.notifyFailure("[HostLink] timed out");
  monitor.notifyFailure("[HostLink] timed out");
  monitor.notifyFailure("[scan] disk read failure");

  EXPECT_EQ(escalated.size(), 2u);
  EXPECT_EQ(monitor.failureCount(), 2u);

  monitor.clear();
  monitor.notifyFailure("[HostLink] timed out");
  EXPECT_EQ(escalated.size(), 3u);
}

TEST(error_monitor, escalation_may_report_again) {
  ErrorMonitor monitor;
  int calls = 0;
  monitor.registerEscalation([&](const std::string& msg) {
    ++calls;
    if (msg == "first")
      monitor.notifyFailure("second"); // callback runs outside the lock
  });

  monitor.notifyFailure("first");

  EXPECT_EQ(calls, 2);
}

//---SelectionStore------------------------------------------------------------

TEST(selection_store, scan_config_needs_a_device) {
  SelectionStore selection;
  EXPECT_FALSE(selection.buildScanConfig());
}

TEST(selection_store, scan_config_uses_partition_size_when_selected) {
  SelectionStore selection;
  Device device = salvage::protocols::deviceFromJson(deviceJson("/dev/sdb"));
  selection.selectDevice(device);

  auto whole = selection.buildScanConfig();
  ASSERT_TRUE(whole);
  EXPECT_EQ(whole->deviceSize, std::optional<ByteCount>(64000000000ull));
  EXPECT_FALSE(whole->partitionPath);
  ASSERT_EQ(whole->categories.size(), 3u); // photo, video, document by default

  selection.selectPartition(device.partitions[0]);
  auto part = selection.buildScanConfig();
  EXPECT_EQ(part->partitionPath, std::optional<std::string>("/dev/sdb1"));
  EXPECT_EQ(part->deviceSize, std::optional<ByteCount>(32000000000ull));

  // another device drops the partition
  selection.selectDevice(salvage::protocols::deviceFromJson(deviceJson("/dev/sdc")));
  EXPECT_FALSE(selection.selectedPartition());
}

TEST(selection_store, toggles_categories_and_files) {
  SelectionStore selection;
  selection.toggleCategory(FileCategory::Video);
  selection.toggleCategory(FileCategory::Audio);
  EXPECT_EQ(selection.categories(),
            (std::vector<FileCategory>{ FileCategory::Photo, FileCategory::Document, FileCategory::Audio }));

  selection.toggleFile("f1");
  selection.toggleFile("f2");
  selection.toggleFile("f1");
  EXPECT_FALSE(selection.isFileSelected("f1"));
  EXPECT_TRUE(selection.isFileSelected("f2"));
  EXPECT_EQ(selection.selectedFileCount(), 1u);

  selection.clearFileSelection();
  EXPECT_EQ(selection.selectedFileCount(), 0u);
}

//---ConfigLoader / ClientConfig-----------------------------------------------

TEST(config_loader, missing_file_throws) {
  ConfigLoader loader(tempPath("no-such-config.json"));
  EXPECT_THROW(loader.load(), std::runtime_error);
}

TEST(config_loader, malformed_file_throws) {
  const auto path = writeFile("bad-config.json", "{ \"hostSocket\": ");
  EXPECT_THROW(ConfigLoader(path).load(), std::runtime_error);
  std::remove(path.c_str());
}

TEST(client_config, defaults_for_empty_object) {
  auto cfg = ClientConfig::fromJson(json::object());

  EXPECT_EQ(cfg.hostSocket, "/run/salvage/host.sock");
  EXPECT_EQ(cfg.replyTimeout.count(), 30000);
  EXPECT_EQ(cfg.pumpInterval.count(), 100);
  EXPECT_EQ(cfg.logPath, "salvage-client.csv");
  EXPECT_EQ(cfg.logLevel, LogLevel::Info);
  EXPECT_EQ(cfg.controller.controlFailurePolicy, ControlFailurePolicy::KeepStatus);
  EXPECT_TRUE(cfg.controller.singleActiveSession);
}

TEST(client_config, reads_every_key_from_file) {
  const auto path = writeFile("config.json", R"({
    "hostSocket": "/tmp/host.sock",
    "replyTimeoutMs": 500,
    "pumpIntervalMs": 20,
    "logPath": "/tmp/run.csv",
    "logLevel": "debug",
    "controlFailurePolicy": "error",
    "singleActiveSession": false
  })");

  auto cfg = ClientConfig::fromJson(ConfigLoader(path).load());

  EXPECT_EQ(cfg.hostSocket, "/tmp/host.sock");
  EXPECT_EQ(cfg.replyTimeout.count(), 500);
  EXPECT_EQ(cfg.pumpInterval.count(), 20);
  EXPECT_EQ(cfg.logPath, "/tmp/run.csv");
  EXPECT_EQ(cfg.logLevel, LogLevel::Debug);
  EXPECT_EQ(cfg.controller.controlFailurePolicy, ControlFailurePolicy::EnterError);
  EXPECT_FALSE(cfg.controller.singleActiveSession);
  std::remove(path.c_str());
}

TEST(client_config, rejects_unknown_enum_values_and_bad_types) {
  EXPECT_THROW(ClientConfig::fromJson(json{ { "logLevel", "verbose" } }), std::runtime_error);
  EXPECT_THROW(ClientConfig::fromJson(json{ { "controlFailurePolicy", "retry" } }), std::runtime_error);
  EXPECT_THROW(ClientConfig::fromJson(json{ { "replyTimeoutMs", "soon" } }), std::runtime_error);
  EXPECT_THROW(ClientConfig::fromJson(json{ { "pumpIntervalMs", 0 } }), std::runtime_error);
  EXPECT_THROW(ClientConfig::fromJson(json::array()), std::runtime_error);
}

//---DeviceCatalog---------------------------------------------------------------

class DeviceCatalogTest : public ::testing::Test {
protected:
  FakeTransport transport;
  CommandGateway gateway{ transport };
  SelectionStore selection;
  DeviceCatalog catalog{ gateway, selection, std::make_shared<Logger>() };
};

TEST_F(DeviceCatalogTest, load_fills_list) {
  transport.reply("device.list",
                  json{ { "success", true }, { "devices", json::array({ deviceJson("/dev/sdb"), deviceJson("/dev/sdc") }) } });

  EXPECT_TRUE(catalog.load());

  EXPECT_FALSE(catalog.loading());
  EXPECT_FALSE(catalog.error());
  ASSERT_EQ(catalog.devices().size(), 2u);
  EXPECT_TRUE(catalog.find("/dev/sdc"));
  EXPECT_FALSE(catalog.find("/dev/sdd"));
}

TEST_F(DeviceCatalogTest, failure_keeps_list_and_records_error) {
  transport.reply("device.list", json{ { "success", true }, { "devices", json::array({ deviceJson("/dev/sdb") }) } });
  ASSERT_TRUE(catalog.load());
  transport.reply("device.refresh", failed("udev unavailable"));

  EXPECT_FALSE(catalog.refresh());

  EXPECT_EQ(catalog.error(), std::optional<std::string>("udev unavailable"));
  EXPECT_FALSE(catalog.loading());
  EXPECT_EQ(catalog.devices().size(), 1u);
}

TEST_F(DeviceCatalogTest, refresh_clears_selection_of_vanished_device) {
  transport.reply("device.list", json{ { "success", true }, { "devices", json::array({ deviceJson("/dev/sdb") }) } });
  ASSERT_TRUE(catalog.load());
  selection.selectDevice(*catalog.find("/dev/sdb"));
  selection.selectPartition(catalog.find("/dev/sdb")->partitions[0]);

  transport.reply("device.refresh", json{ { "success", true }, { "devices", json::array({ deviceJson("/dev/sdb") }) } });
  ASSERT_TRUE(catalog.refresh());
  EXPECT_TRUE(selection.selectedDevice());
  EXPECT_TRUE(selection.selectedPartition());

  transport.reply("device.refresh", json{ { "success", true }, { "devices", json::array({ deviceJson("/dev/sdc") }) } });
  ASSERT_TRUE(catalog.refresh());
  EXPECT_FALSE(selection.selectedDevice());
  EXPECT_FALSE(selection.selectedPartition());
}

TEST_F(DeviceCatalogTest, refresh_replaces_selected_partition_with_refreshed_values) {
  transport.reply("device.list", json{ { "success", true }, { "devices", json::array({ deviceJson("/dev/sdb") }) } });
  ASSERT_TRUE(catalog.load());
  selection.selectDevice(*catalog.find("/dev/sdb"));
  selection.selectPartition(catalog.find("/dev/sdb")->partitions[0]);

  json resized = deviceJson("/dev/sdb");
  resized["partitions"][0]["size"] = "16000000000";
  resized["partitions"][0]["offset"] = "2097152";
  transport.reply("device.refresh", json{ { "success", true }, { "devices", json::array({ resized }) } });
  ASSERT_TRUE(catalog.refresh());

  auto partition = selection.selectedPartition();
  ASSERT_TRUE(partition);
  EXPECT_EQ(partition->size, 16000000000u);
  EXPECT_EQ(partition->offset, 2097152u);
}

//---ConsoleView-------------------------------------------------------------------

TEST(console_view, formats_byte_counts) {
  EXPECT_EQ(salvage::ui::formatBytes(512), "512 B");
  EXPECT_EQ(salvage::ui::formatBytes(1536), "1.5 KiB");
  EXPECT_EQ(salvage::ui::formatBytes(3ull << 30), "3.0 GiB");
}

TEST(console_view, prints_only_changed_status_lines) {
  std::ostringstream out;
  salvage::ui::ConsoleView view(out);
  SessionSnapshot snap;
  snap.status = SessionStatus::Running;
  ScanProgress progress;
  progress.bytesScanned = 1536;
  progress.totalBytes = 3072;
  progress.percentage = 50.0;
  snap.scanProgress = progress;

  view.showSnapshot(snap);
  view.showSnapshot(snap);

  EXPECT_EQ(out.str(), "scan scanning 50.0% 1.5 KiB/3.0 KiB files=0\n");
}

//---ClientCoordinator-------------------------------------------------------------

class ClientCoordinatorTest : public ::testing::Test {
protected:
  void SetUp() override {
    config.logPath = tempPath("coordinator.csv");
    config.replyTimeout = std::chrono::milliseconds{ 50 };
    config.pumpInterval = std::chrono::milliseconds{ 5 };
    auto fake = std::make_unique<FakeLineChannel>();
    channel = fake.get();
    // the fake host answers every request by channel
    channel->on_write = [this](const std::string& line) {
      auto frame = json::parse(line);
      const auto id = frame["id"].get<std::uint64_t>();
      const auto name = frame["channel"].get<std::string>();
      json result = ok();
      if (name == "privilege.check")
        result = json{ { "success", true }, { "status", { { "elevated", true }, { "platform", "linux" } } } };
      else if (name == "device.list")
        result = json{ { "success", true }, { "devices", json::array({ deviceJson("/dev/sdb") }) } };
      else if (name == "scan.start")
        result = json{ { "success", true }, { "sessionId", "s1" } };
      requests.push_back(name);
      channel->incoming.push_back(json{ { "type", "reply" }, { "id", id }, { "result", result } }.dump());
    };
    app = std::make_unique<ClientCoordinator>(config, std::move(fake));
  }

  void TearDown() override {
    app.reset();
    std::remove(config.logPath.c_str());
  }

  void push(const std::string& channelName, const json& args) {
    channel->incoming.push_back(json{ { "type", "event" }, { "channel", channelName }, { "args", args } }.dump());
  }

  ClientConfig config;
  FakeLineChannel* channel = nullptr;
  std::vector<std::string> requests;
  std::unique_ptr<ClientCoordinator> app;
};

TEST_F(ClientCoordinatorTest, initialize_reads_privilege_and_devices) {
  ASSERT_TRUE(app->initialize());

  EXPECT_EQ(app->state(), ClientCoordinator::State::READY);
  EXPECT_EQ(requests, (std::vector<std::string>{ "privilege.check", "device.list" }));
  ASSERT_TRUE(app->selection().privilege());
  EXPECT_TRUE(app->selection().privilege()->elevated);
  EXPECT_EQ(app->devices().devices().size(), 1u);
  EXPECT_TRUE(app->scan().active());
  EXPECT_TRUE(app->recovery().active());
}

TEST_F(ClientCoordinatorTest, scan_runs_to_completion_through_pumped_events) {
  ASSERT_TRUE(app->initialize());
  app->selection().selectDevice(*app->devices().find("/dev/sdb"));
  ASSERT_TRUE(app->scan().start());
  ASSERT_EQ(app->scan().store().status(), SessionStatus::Running);

  push("scan.fileFound", json::array({ "s1", fileJson("f1") }));
  push("scan.progress", json::array({ "s1", scanProgressJson("1000", 100.0) }));
  push("scan.complete", json::array({ "s1", json{ { "filesFound", 1 } } }));
  EXPECT_TRUE(app->pumpEvents());

  EXPECT_EQ(app->scan().store().status(), SessionStatus::Completed);
  EXPECT_EQ(app->scan().foundFiles().size(), 1u);
}

TEST_F(ClientCoordinatorTest, link_loss_moves_to_error) {
  ASSERT_TRUE(app->initialize());
  channel->close_when_drained = true;

  EXPECT_FALSE(app->pumpEvents());

  EXPECT_EQ(app->state(), ClientCoordinator::State::ERROR);
  ASSERT_TRUE(app->lastError());
  EXPECT_THAT(*app->lastError(), HasSubstr("closed"));
}

TEST_F(ClientCoordinatorTest, shutdown_cancels_live_scan) {
  ASSERT_TRUE(app->initialize());
  app->selection().selectDevice(*app->devices().find("/dev/sdb"));
  ASSERT_TRUE(app->scan().start());

  app->shutdown();

  EXPECT_EQ(requests.back(), "scan.cancel");
  EXPECT_EQ(app->scan().store().status(), SessionStatus::Cancelled);
  EXPECT_EQ(app->state(), ClientCoordinator::State::SHUTDOWN);
  EXPECT_FALSE(app->scan().active());
}

TEST(client_coordinator, unreachable_host_is_an_error) {
  ClientConfig config;
  config.logPath = tempPath("coordinator-down.csv");
  auto fake = std::make_unique<FakeLineChannel>();
  fake->open = false;
  fake->connect_succeeds = false;
  ClientCoordinator app(config, std::move(fake));

  EXPECT_FALSE(app.initialize());
  EXPECT_EQ(app.state(), ClientCoordinator::State::ERROR);
  EXPECT_TRUE(app.lastError());
  app.shutdown();
  std::remove(config.logPath.c_str());
}

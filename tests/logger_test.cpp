#include "core/Logger.hpp"
#include "core/RingBuffer.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

using namespace salvage::core;

namespace {
  std::string slurp(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }
} // namespace

TEST(logger, csv_row_quotes_special_fields) {
  LogEvent ev;
  ev.when = std::chrono::system_clock::time_point{ std::chrono::milliseconds{ 1700000000123 } };
  ev.level = LogLevel::Warning;
  ev.source = "scan";
  ev.message = "bad \"frame\", dropped";

  EXPECT_EQ(toCsvRow(ev), "1700000000123,warning,scan,\"bad \"\"frame\"\", dropped\"\n");
}

TEST(logger, writes_rows_at_or_above_min_level) {
  const std::string path = ::testing::TempDir() + "salvage-logger-" + std::to_string(::getpid()) + ".csv";
  std::remove(path.c_str());

  Logger logger(LogLevel::Info);
  logger.log(LogLevel::Info, "coordinator", "queued before the run");
  ASSERT_TRUE(logger.startNewRun(path));
  EXPECT_TRUE(logger.running());
  logger.log(LogLevel::Debug, "host-link", "filtered");
  logger.log(LogLevel::Error, "scan", "disk read failure");
  logger.finishRun();
  EXPECT_FALSE(logger.running());

  const std::string csv = slurp(path);
  EXPECT_NE(csv.find(",info,coordinator,queued before the run\n"), std::string::npos);
  EXPECT_NE(csv.find(",error,scan,disk read failure\n"), std::string::npos);
  EXPECT_EQ(csv.find("filtered"), std::string::npos);
  std::remove(path.c_str());
}

TEST(logger, start_fails_for_unwritable_path) {
  Logger logger;
  EXPECT_FALSE(logger.startNewRun("/nonexistent-dir/run.csv"));
  EXPECT_FALSE(logger.running());
  logger.finishRun(); // harmless
}

TEST(ring_buffer, drops_oldest_when_full) {
  RingBuffer<int> ring(3);
  EXPECT_TRUE(ring.push(1));
  EXPECT_TRUE(ring.push(2));
  EXPECT_TRUE(ring.push(3));
  EXPECT_FALSE(ring.push(4));

  auto batch = ring.drain(std::chrono::milliseconds{ 0 });
  ASSERT_EQ(batch.size(), 3u);
  EXPECT_EQ(batch.front(), 2);
  EXPECT_EQ(batch.back(), 4);
  EXPECT_EQ(ring.dropped(), 1u);
}

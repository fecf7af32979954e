/* @file Logger.cpp
 * @brief background CSV run log
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <utility>
#include <vector>

// salvage headers
#include "core/Logger.hpp"
#include "core/RingBuffer.hpp"
#include "io/FileLogger.hpp"

using namespace salvage::core;

namespace {
  constexpr std::size_t kRingCapacity = 4096;
  constexpr auto kDrainInterval = std::chrono::milliseconds{ 200 };

  std::string csvField(const std::string& raw) {
    if (raw.find_first_of(",\"\r\n") == std::string::npos)
      return raw;
    std::string quoted = "\"";
    for (char c : raw) {
      if (c == '"')
        quoted += '"';
      quoted += c;
    }
    quoted += '"';
    return quoted;
  }
} // namespace

const char* salvage::core::toString(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "debug";
  case LogLevel::Info:
    return "info";
  case LogLevel::Warning:
    return "warning";
  case LogLevel::Error:
    return "error";
  default:
    return "unknown";
  }
}

std::string salvage::core::toCsvRow(const LogEvent& event) {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      event.when.time_since_epoch())
                      .count();
  return std::to_string(ms) + "," + toString(event.level) + "," + csvField(event.source) + "," +
         csvField(event.message) + "\n";
}

Logger::Logger(LogLevel minLevel)
    : file_(std::make_unique<io::FileLogger>()),
      buffer_(std::make_unique<RingBuffer<LogEvent>>(kRingCapacity)), minLevel_(minLevel) {}

Logger::~Logger() { finishRun(); }

bool Logger::startNewRun(const std::string& csvPath) {
  std::lock_guard<std::mutex> lock(runMtx_);
  if (running_)
    return true;
  if (!file_->open(csvPath))
    return false;

  running_ = true;
  worker_ = std::thread(&Logger::workerLoop, this);
  return true;
}

void Logger::log(LogEvent event) {
  if (event.level < minLevel_.load())
    return;
  buffer_->push(std::move(event));
}

void Logger::log(LogLevel level, std::string source, std::string message) {
  LogEvent event;
  event.level = level;
  event.source = std::move(source);
  event.message = std::move(message);
  log(std::move(event));
}

void Logger::finishRun() {
  std::lock_guard<std::mutex> lock(runMtx_);
  if (!running_)
    return;
  running_ = false;
  buffer_->wake();
  if (worker_.joinable())
    worker_.join();
  writeBatch(); // anything queued after the worker's last pass
  file_->close();
}

void Logger::workerLoop() {
  while (running_) {
    writeBatch();
  }
}

void Logger::writeBatch() {
  auto batch = buffer_->drain(running_ ? kDrainInterval : std::chrono::milliseconds{ 0 });
  if (batch.empty())
    return;
  for (const auto& event : batch)
    file_->write(toCsvRow(event));
  file_->flush();
}

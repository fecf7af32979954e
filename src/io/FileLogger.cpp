/* @file FileLogger.cpp
 * @brief buffered append-only writer behind core::Logger
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <utility>

// salvage headers
#include "io/FileLogger.hpp"

using namespace salvage::io;

FileLogger::~FileLogger() { close(); }

FileLogger::FileLogger(FileLogger&& other) noexcept
    : fp_(std::exchange(other.fp_, nullptr)), buffer_(std::move(other.buffer_)) {}

FileLogger& FileLogger::operator=(FileLogger&& other) noexcept {
  if (this != &other) {
    close();
    fp_ = std::exchange(other.fp_, nullptr);
    buffer_ = std::move(other.buffer_);
  }
  return *this;
}

bool FileLogger::open(const std::string& path) {
  close();
  fp_ = std::fopen(path.c_str(), "a");
  if (!fp_)
    return false;
  buffer_.reserve(kChunkBytes);
  return true;
}

void FileLogger::write(const std::string& csv) {
  if (!fp_)
    return;
  buffer_.insert(buffer_.end(), csv.begin(), csv.end());
  if (buffer_.size() >= kChunkBytes)
    flush();
}

bool FileLogger::flush() {
  if (!fp_)
    return false;

  std::size_t total = 0;
  while (total < buffer_.size()) {
    std::size_t chunk = std::min(kChunkBytes, buffer_.size() - total);
    std::size_t n = std::fwrite(buffer_.data() + total, 1, chunk, fp_);
    if (n == 0)
      break;
    total += n;
  }
  const bool complete = total == buffer_.size();
  buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(total));
  return complete && std::fflush(fp_) == 0;
}

void FileLogger::close() {
  if (!fp_)
    return;
  flush();
  std::fclose(fp_);
  fp_ = nullptr;
  buffer_.clear();
}

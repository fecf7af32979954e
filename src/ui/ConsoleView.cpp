/* @file ConsoleView.cpp
 * @brief snapshot and device rendering
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdio>
#include <cstddef>
#include <sstream>
#include <string>
#include <utility>

#include "ui/ConsoleView.hpp"

using namespace salvage::ui;
using namespace salvage::core;

std::string salvage::ui::formatBytes(ByteCount bytes) {
  static const char* kUnits[] = { "B", "KiB", "MiB", "GiB", "TiB", "PiB" };
  if (bytes < 1024)
    return std::to_string(bytes) + " B";

  double value = static_cast<double>(bytes);
  std::size_t unit = 0;
  while (value >= 1024.0 && unit + 1 < sizeof(kUnits) / sizeof(kUnits[0])) {
    value /= 1024.0;
    ++unit;
  }
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f %s", value, kUnits[unit]);
  return buf;
}

std::string ConsoleView::statusLine(const SessionSnapshot& snapshot) {
  std::ostringstream line;
  line << toString(snapshot.kind) << ' ' << toString(snapshot.kind, snapshot.status);

  char pct[16];
  if (snapshot.scanProgress) {
    const auto& p = *snapshot.scanProgress;
    std::snprintf(pct, sizeof(pct), "%.1f%%", p.percentage);
    line << ' ' << pct << ' ' << formatBytes(p.bytesScanned) << '/' << formatBytes(p.totalBytes);
    if (p.sectorsWithErrors > 0)
      line << " bad-sectors=" << p.sectorsWithErrors;
  }
  if (snapshot.recoveryProgress) {
    const auto& p = *snapshot.recoveryProgress;
    std::snprintf(pct, sizeof(pct), "%.1f%%", p.percentage);
    line << ' ' << pct << ' ' << p.completedFiles << '/' << p.totalFiles << " files";
    if (p.currentFile)
      line << " (" << *p.currentFile << ')';
    if (!p.errors.empty())
      line << " failed=" << p.errors.size();
  }
  if (snapshot.kind == SessionKind::Scan)
    line << " files=" << snapshot.files.size();
  if (snapshot.error)
    line << " error: " << *snapshot.error;
  return line.str();
}

Subscription ConsoleView::attach(const SessionStore& store) {
  return store.subscribe([this](const SessionSnapshot& snapshot) { showSnapshot(snapshot); });
}

void ConsoleView::showSnapshot(const SessionSnapshot& snapshot) {
  auto line = statusLine(snapshot);
  if (line == lastLine_)
    return;
  out_ << line << '\n';
  lastLine_ = std::move(line);
}

void ConsoleView::showDevices(const std::vector<Device>& devices) {
  if (devices.empty()) {
    out_ << "no devices\n";
    return;
  }
  for (const auto& d : devices) {
    out_ << d.path << "  " << toString(d.type) << "  " << formatBytes(d.size) << "  " << d.name;
    if (d.removable)
      out_ << " [removable]";
    if (d.readOnly)
      out_ << " [ro]";
    out_ << '\n';
    for (const auto& p : d.partitions) {
      out_ << "  " << p.path << "  " << formatBytes(p.size);
      if (p.filesystem)
        out_ << "  " << *p.filesystem;
      if (!p.label.empty())
        out_ << "  " << p.label;
      out_ << '\n';
    }
  }
}

void ConsoleView::showMessage(const std::string& text) { out_ << text << '\n'; }

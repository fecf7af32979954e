#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous CSV logger (runs its own worker thread).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace salvage {
  namespace io {
    class FileLogger;
  }

  namespace core {

    enum class LogLevel : std::uint8_t { Debug, Info, Warning, Error };

    const char* toString(LogLevel level);

    struct LogEvent {
      std::chrono::system_clock::time_point when{ std::chrono::system_clock::now() };
      LogLevel level{ LogLevel::Info };
      std::string source;  ///< subsystem tag, e.g. "scan", "host-link"
      std::string message;
    };

    template <typename T> class RingBuffer; // forward decl to avoid heavy include

    /**
 * @class Logger
 * @brief Producers enqueue `LogEvent`s; a worker thread appends them as CSV
 *        rows `timestamp_ms,level,source,message` to the run log.
 *
 *  * `log()` never blocks on disk I/O (bounded ring, oldest dropped when full).
 *  * Events below the minimum level are discarded at the call site.
 *  * Events logged before `startNewRun()` are kept and written once it runs.
 */
    class Logger {

    public:
      explicit Logger(LogLevel minLevel = LogLevel::Info);
      ~Logger(); ///< finishRun() if still running

      // --- public API ---
      bool startNewRun(const std::string& csvPath); ///< open file + launch worker thread
      void log(LogEvent event);                     ///< enqueue event (non-blocking)
      void log(LogLevel level, std::string source, std::string message);
      void finishRun();                             ///< flush + join worker thread

      void setMinLevel(LogLevel level) { minLevel_.store(level); }
      bool running() const { return running_.load(); }

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      void workerLoop();
      void writeBatch();

      std::unique_ptr<io::FileLogger> file_;
      std::unique_ptr<RingBuffer<LogEvent>> buffer_;
      std::thread worker_;
      std::mutex runMtx_; ///< serialises start/finish
      std::atomic<bool> running_{ false };
      std::atomic<LogLevel> minLevel_;
    };

    /// Formats one CSV row (quotes fields containing ',', '"' or newlines).
    std::string toCsvRow(const LogEvent& event);

  } // namespace core
} // namespace salvage

#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous CSV logger (runs its own worker thread).
 *
 *  © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace booth {
  namespace io {
    class FileLogger;
  } // namespace io

  namespace core {

    enum class LogLevel : std::uint8_t { Debug, Info, Warn, Error };

    inline const char* toString(LogLevel l) {
      switch (l) {
      case LogLevel::Debug:
        return "DEBUG";
      case LogLevel::Info:
        return "INFO";
      case LogLevel::Warn:
        return "WARN";
      case LogLevel::Error:
        return "ERROR";
      default:
        return "UNKNOWN";
      }
    }

    struct LogEvent {
      std::chrono::system_clock::time_point when{ std::chrono::system_clock::now() };
      LogLevel level{ LogLevel::Info };
      std::string source;
      std::string message;
    };

    template <typename T> class RingBuffer; // forward decl to avoid heavy include

    /**
 * @class Logger
 * @brief Session/run log shared by every subsystem through a `shared_ptr`.
 *
 *  * `log()` never blocks the control thread; the worker drains the ring buffer
 *    and writes `epoch_ms,level,source,message` lines through io::FileLogger.
 *  * Events at or above the console level are also echoed to std::cerr, even
 *    before `startNewRun()` (so a logger is usable in tests without a file).
 *  * A full buffer drops the event and bumps `dropped()`.
 */
    class Logger {

    public:
      explicit Logger(std::size_t capacity = 1024);
      ~Logger(); ///< finishRun()

      // --- public API ---
      bool startNewRun(const std::string& directory); ///< open file + launch worker thread
      void log(const LogEvent& event);                ///< enqueue event (non-blocking)
      void finishRun();                               ///< flush + join worker thread

      void debug(const std::string& source, const std::string& message);
      void info(const std::string& source, const std::string& message);
      void warn(const std::string& source, const std::string& message);
      void error(const std::string& source, const std::string& message);

      void setConsoleLevel(LogLevel level) { consoleLevel_.store(level); }
      std::uint64_t dropped() const { return dropped_.load(); }
      const std::string& runPath() const { return runPath_; }

      /// CSV line for one event (exposed for tests).
      static std::string formatCsv(const LogEvent& event);

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      void workerLoop();

      std::unique_ptr<io::FileLogger> csvFile_;
      std::unique_ptr<RingBuffer<LogEvent>> buffer_;
      std::thread worker_;
      std::atomic<bool> running_{ false };
      std::atomic<LogLevel> consoleLevel_{ LogLevel::Warn };
      std::atomic<std::uint64_t> dropped_{ 0 };
      std::string runPath_;
    };

  } // namespace core
} // namespace booth

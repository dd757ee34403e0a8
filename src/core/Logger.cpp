/* @file Logger.cpp
 * @brief async CSV run log: producers enqueue, one worker writes
 *
 * © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

// STL headers
#include <ctime>
#include <filesystem>
#include <iostream>
#include <sstream>

// Booth headers
#include "core/Logger.hpp"
#include "core/RingBuffer.hpp"
#include "io/FileLogger.hpp"

using namespace booth::core;

namespace {

  std::string csvEscape(const std::string& field) {
    if (field.find_first_of(",\"\n") == std::string::npos)
      return field;
    std::string out = "\"";
    for (char c : field) {
      if (c == '"')
        out += "\"\"";
      else if (c == '\n')
        out += ' ';
      else
        out += c;
    }
    out += '"';
    return out;
  }

} // namespace

Logger::Logger(std::size_t capacity)
    : csvFile_(std::make_unique<io::FileLogger>()),
      buffer_(std::make_unique<RingBuffer<LogEvent>>(capacity)) {}

Logger::~Logger() { finishRun(); }

bool Logger::startNewRun(const std::string& directory) {
  if (running_)
    return true;

  std::error_code ec;
  std::filesystem::create_directories(directory, ec);
  if (ec) {
    std::cerr << "[Logger] cannot create " << directory << ": " << ec.message() << "\n";
    return false;
  }

  std::time_t t = std::time(nullptr);
  std::tm tm{};
  localtime_r(&t, &tm);
  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &tm);

  runPath_ = (std::filesystem::path(directory) / ("run_" + std::string(stamp) + ".csv")).string();
  if (!csvFile_->open(runPath_))
    return false;

  running_ = true;
  worker_ = std::thread([this] { workerLoop(); });
  return true;
}

void Logger::log(const LogEvent& event) {
  if (event.level >= consoleLevel_.load()) {
    std::ostringstream line;
    line << "[" << toString(event.level) << "] [" << event.source << "] " << event.message << "\n";
    std::cerr << line.str();
  }

  if (!running_)
    return;
  if (!buffer_->push(event))
    ++dropped_;
}

void Logger::finishRun() {
  if (!running_.exchange(false))
    return;
  buffer_->wakeAll();
  if (worker_.joinable())
    worker_.join();
  // drain anything enqueued after the worker's last pass
  while (auto ev = buffer_->tryPop())
    csvFile_->write(formatCsv(*ev));
  csvFile_->close();
}

void Logger::debug(const std::string& source, const std::string& message) {
  log(LogEvent{ std::chrono::system_clock::now(), LogLevel::Debug, source, message });
}

void Logger::info(const std::string& source, const std::string& message) {
  log(LogEvent{ std::chrono::system_clock::now(), LogLevel::Info, source, message });
}

void Logger::warn(const std::string& source, const std::string& message) {
  log(LogEvent{ std::chrono::system_clock::now(), LogLevel::Warn, source, message });
}

void Logger::error(const std::string& source, const std::string& message) {
  log(LogEvent{ std::chrono::system_clock::now(), LogLevel::Error, source, message });
}

std::string Logger::formatCsv(const LogEvent& event) {
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(event.when.time_since_epoch());
  std::ostringstream out;
  out << ms.count() << ',' << toString(event.level) << ',' << csvEscape(event.source) << ','
      << csvEscape(event.message) << '\n';
  return out.str();
}

void Logger::workerLoop() {
  while (running_) {
    auto ev = buffer_->popFor(std::chrono::milliseconds{ 200 });
    if (!ev) {
      csvFile_->flush();
      continue;
    }
    csvFile_->write(formatCsv(*ev));
  }
}

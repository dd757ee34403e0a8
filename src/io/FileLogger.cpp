/* @file FileLogger.cpp
 * @brief buffered append-only writer backing the async run logger
 *
 * © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

// STL headers
#include <cstring> // for strerror
#include <iostream>
#include <utility>

// Linux headers
#include <errno.h>

// Booth headers
#include "io/FileLogger.hpp"

using namespace booth::io;

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
  if (!fp_) {
    std::cerr << "[FileLogger] open " << path << " failed: " << strerror(errno) << "\n";
    return false;
  }
  buffer_.reserve(kFlushThreshold * 2);
  return true;
}

void FileLogger::write(const std::string& csv) {
  if (!fp_)
    return;
  buffer_.insert(buffer_.end(), csv.begin(), csv.end());
  if (buffer_.size() >= kFlushThreshold)
    flush();
}

bool FileLogger::flush() {
  if (!fp_)
    return false;

  std::size_t total = 0;
  while (total < buffer_.size()) {
    std::size_t n = std::fwrite(buffer_.data() + total, 1, buffer_.size() - total, fp_);
    if (n == 0) {
      std::cerr << "[FileLogger] fwrite failed: " << strerror(errno) << "\n";
      buffer_.clear(); // drop rather than grow without bound
      return false;
    }
    total += n;
  }
  buffer_.clear();
  return std::fflush(fp_) == 0;
}

void FileLogger::close() {
  if (!fp_)
    return;
  flush();
  std::fclose(fp_);
  fp_ = nullptr;
}

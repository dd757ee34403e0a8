/* @file PhotoStore.cpp
 * @brief dated capture / artifact paths
 *
 * © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

// STL headers
#include <cstdio>
#include <ctime>
#include <iostream>

// Booth headers
#include "io/PhotoStore.hpp"

using namespace booth::io;

namespace {

  std::tm localTime(std::chrono::system_clock::time_point when) {
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
  }

  std::string format(const std::tm& tm, const char* fmt) {
    char buf[64];
    std::size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
    return std::string(buf, n);
  }

} // namespace

PhotoStore::PhotoStore(std::filesystem::path root) : root_(std::move(root)) {}

std::filesystem::path PhotoStore::dayDirectory(std::chrono::system_clock::time_point when) const {
  auto tm = localTime(when);
  auto dir = root_ / format(tm, "%Y") / format(tm, "%m") / format(tm, "%d");
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec)
    std::cerr << "[PhotoStore] cannot create " << dir << ": " << ec.message() << "\n";
  return dir;
}

std::filesystem::path PhotoStore::capturePath(std::size_t number,
                                              std::chrono::system_clock::time_point when) const {
  auto tm = localTime(when);
  auto name = format(tm, "%H%M%S") + "_" + std::to_string(number) + ".jpg";
  return uniquePath(dayDirectory(when) / name);
}

std::filesystem::path PhotoStore::artifactPath(std::chrono::system_clock::time_point when) const {
  auto tm = localTime(when);
  auto micros = std::chrono::duration_cast<std::chrono::microseconds>(when.time_since_epoch()).count() %
                1000000;
  char suffix[16];
  std::snprintf(suffix, sizeof(suffix), "%06lld", static_cast<long long>(micros));
  auto name = "A4_" + format(tm, "%H%M%S") + "_" + suffix + ".jpg";
  return uniquePath(dayDirectory(when) / name);
}

std::filesystem::path PhotoStore::uniquePath(const std::filesystem::path& candidate) {
  std::error_code ec;
  if (!std::filesystem::exists(candidate, ec))
    return candidate;

  const auto stem = candidate.stem().string();
  const auto ext = candidate.extension().string();
  for (int k = 1;; ++k) {
    auto next = candidate.parent_path() / (stem + "-" + std::to_string(k) + ext);
    if (!std::filesystem::exists(next, ec))
      return next;
  }
}

#pragma once
/** @file  PhotoRef.hpp
 *  @brief Handle to a persisted capture or composed page.
 *
 *  © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

#include <chrono>
#include <filesystem>

namespace booth::core {

  /** Never mutated after creation; ordering follows the capture timestamp. */
  struct PhotoRef {
    std::filesystem::path path;
    std::chrono::system_clock::time_point takenAt{};
    bool placeholder{ false }; ///< camera failed, file is a stand-in image

    bool operator==(const PhotoRef& other) const { return path == other.path; }
    bool operator<(const PhotoRef& other) const {
      return takenAt < other.takenAt || (takenAt == other.takenAt && path < other.path);
    }
  };

} // namespace booth::core

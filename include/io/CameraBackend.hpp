#pragma once
/** @file  CameraBackend.hpp
 *  @brief Abstract camera driver seam (preview frames + full-resolution stills).
 *
 *  © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

#include <filesystem>
#include <optional>
#include <string>

#include <opencv2/core.hpp>

namespace booth {
  namespace io {

    struct Resolution {
      int width{ 1920 };
      int height{ 1080 };
    };

    using Frame = cv::Mat; ///< 8-bit BGR

    /**
 * @class CameraBackend
 * @brief One physical pipeline. Implementations may throw on hardware faults;
 *        CaptureCoordinator is the boundary that contains them.
 *
 *  * `grabFrame()` returns nullopt when no new frame is ready yet (not a fault).
 *  * `captureStill()` writes a JPEG to \p out and returns false on failure.
 */
    class CameraBackend {
    public:
      virtual ~CameraBackend() = default;

      virtual std::string name() const = 0;
      virtual bool open() = 0;
      virtual void close() = 0;
      virtual std::optional<Frame> grabFrame() = 0;
      virtual bool captureStill(const std::filesystem::path& out, Resolution res) = 0;
    };

  } // namespace io
} // namespace booth

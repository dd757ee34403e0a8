#pragma once
/** @file  VideoCaptureCamera.hpp
 *  @brief V4L2 webcam backend through OpenCV's VideoCapture.
 *
 *  © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

#include <opencv2/videoio.hpp>

#include "io/CameraBackend.hpp"

namespace booth {
  namespace io {

    /**
 * @class VideoCaptureCamera
 * @brief Preview and stills from the same device; stills temporarily switch the
 *        capture size and restore the preview size afterwards.
 */
    class VideoCaptureCamera : public CameraBackend {
    public:
      VideoCaptureCamera(int deviceIndex, Resolution preview, bool mirror, int jpegQuality = 95);
      ~VideoCaptureCamera() override;

      std::string name() const override { return "opencv"; }
      bool open() override;
      void close() override;
      std::optional<Frame> grabFrame() override;
      bool captureStill(const std::filesystem::path& out, Resolution res) override;

    private:
      void applySize(Resolution res);

      static constexpr int kWarmupFrames = 3; ///< frames discarded after a size change

      cv::VideoCapture cap_;
      int deviceIndex_;
      Resolution preview_;
      bool mirror_;
      int jpegQuality_;
    };

  } // namespace io
} // namespace booth

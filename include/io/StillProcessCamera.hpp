#pragma once
/** @file  StillProcessCamera.hpp
 *  @brief Raspberry Pi camera backend driven through the rpicam-vid / rpicam-still tools.
 *
 *  © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

#include <memory>
#include <string>

#include "io/CameraBackend.hpp"
#include "io/MjpegSplitter.hpp"
#include "io/ProcessRunner.hpp"

namespace booth {
  namespace io {

    struct StillProcessOptions {
      std::string videoCommand{ "rpicam-vid" };
      std::string stillCommand{ "rpicam-still" };
      Resolution preview{ 1280, 720 };
      int framerate{ 15 };
      int previewQuality{ 65 };
      int stillQuality{ 95 };
      bool mirror{ true };
    };

    /**
 * @class StillProcessCamera
 * @brief Preview = MJPEG on the stdout of a long-running `rpicam-vid`;
 *        still = one-shot `rpicam-still` (the preview process is paused
 *        around it because both need exclusive access to the sensor).
 */
    class StillProcessCamera : public CameraBackend {
    public:
      StillProcessCamera(StillProcessOptions options, std::shared_ptr<ProcessRunner> runner);
      ~StillProcessCamera() override;

      std::string name() const override { return "rpicam"; }
      bool open() override;
      void close() override;
      std::optional<Frame> grabFrame() override;
      bool captureStill(const std::filesystem::path& out, Resolution res) override;

      std::vector<std::string> previewCommand() const;
      std::vector<std::string> stillCommand(const std::filesystem::path& out, Resolution res) const;

    private:
      StillProcessOptions options_;
      std::shared_ptr<ProcessRunner> runner_;
      ProcessPipe preview_;
      MjpegSplitter splitter_;
    };

  } // namespace io
} // namespace booth

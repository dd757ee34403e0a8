#pragma once
/** @file  FakeCameraBackend.hpp
 *  @brief CameraBackend derivative with scripted results for CaptureCoordinator / controller tests.
 *
 *  © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

#include <stdexcept>
#include <string>

#include <opencv2/imgcodecs.hpp>

#include "io/CameraBackend.hpp"

namespace booth {
  namespace test {

    /**
 * @class FakeCameraBackend
 * @brief Stills are solid-colour JPEGs at the requested size; every knob is a public field.
 */
    class FakeCameraBackend : public booth::io::CameraBackend {
    public:
      explicit FakeCameraBackend(std::string name = "fake") : name_(std::move(name)) {}

      bool open_ok = true;
      bool still_ok = true;
      bool throw_on_still = false;
      bool throw_on_grab = false;
      bool frame_available = true;
      cv::Scalar color{ 0, 0, 255 }; // BGR red

      int open_calls = 0;
      int close_calls = 0;
      int grab_calls = 0;
      int still_calls = 0;
      std::filesystem::path last_still;

      std::string name() const override { return name_; }

      bool open() override {
        ++open_calls;
        return open_ok;
      }

      void close() override { ++close_calls; }

      std::optional<booth::io::Frame> grabFrame() override {
        ++grab_calls;
        if (throw_on_grab)
          throw std::runtime_error("sensor timeout");
        if (!frame_available)
          return std::nullopt;
        return cv::Mat(48, 64, CV_8UC3, color);
      }

      bool captureStill(const std::filesystem::path& out, booth::io::Resolution res) override {
        ++still_calls;
        last_still = out;
        if (throw_on_still)
          throw std::runtime_error("pipeline stalled");
        if (!still_ok)
          return false;
        return cv::imwrite(out.string(), cv::Mat(res.height, res.width, CV_8UC3, color));
      }

    private:
      std::string name_;
    };

  } // namespace test
} // namespace booth

/* @file VideoCaptureCamera.cpp
 *
 * © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

// STL headers
#include <stdexcept>

// 3rd-party headers
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

// Booth headers
#include "io/VideoCaptureCamera.hpp"

using namespace booth::io;

VideoCaptureCamera::VideoCaptureCamera(int deviceIndex, Resolution preview, bool mirror,
                                       int jpegQuality)
    : deviceIndex_(deviceIndex), preview_(preview), mirror_(mirror), jpegQuality_(jpegQuality) {}

VideoCaptureCamera::~VideoCaptureCamera() { close(); }

bool VideoCaptureCamera::open() {
  if (cap_.isOpened())
    return true;
  if (!cap_.open(deviceIndex_, cv::CAP_V4L2))
    return false;
  applySize(preview_);
  return true;
}

void VideoCaptureCamera::close() {
  if (cap_.isOpened())
    cap_.release();
}

void VideoCaptureCamera::applySize(Resolution res) {
  cap_.set(cv::CAP_PROP_FRAME_WIDTH, res.width);
  cap_.set(cv::CAP_PROP_FRAME_HEIGHT, res.height);
}

std::optional<Frame> VideoCaptureCamera::grabFrame() {
  if (!cap_.isOpened())
    throw std::runtime_error("[VideoCaptureCamera] device not open");

  Frame frame;
  if (!cap_.read(frame) || frame.empty())
    throw std::runtime_error("[VideoCaptureCamera] read failed on /dev/video" +
                             std::to_string(deviceIndex_));
  if (mirror_)
    cv::flip(frame, frame, 1);
  return frame;
}

bool VideoCaptureCamera::captureStill(const std::filesystem::path& out, Resolution res) {
  if (!cap_.isOpened())
    return false;

  applySize(res);
  Frame frame;
  bool ok = false;
  for (int i = 0; i <= kWarmupFrames; ++i)
    ok = cap_.read(frame);
  applySize(preview_);

  if (!ok || frame.empty())
    return false;
  if (mirror_)
    cv::flip(frame, frame, 1);
  return cv::imwrite(out.string(), frame, { cv::IMWRITE_JPEG_QUALITY, jpegQuality_ });
}

/* @file CaptureCoordinator.cpp
 * @brief contains every camera fault; always hands back a PhotoRef
 *
 * © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <stdexcept>

// 3rd-party headers
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

// Booth headers
#include "core/CaptureCoordinator.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "io/PhotoStore.hpp"

using namespace booth::core;

namespace {
  constexpr const char* kTag = "CaptureCoordinator";
}

CaptureCoordinator::CaptureCoordinator(std::unique_ptr<io::CameraBackend> primary,
                                       std::unique_ptr<io::CameraBackend> secondary,
                                       io::PhotoStore& store,
                                       std::shared_ptr<ErrorMonitor> errorMonitor,
                                       std::shared_ptr<Logger> logger, CaptureSettings settings)
    : primary_(std::move(primary)), secondary_(std::move(secondary)), store_(store),
      errorMonitor_(std::move(errorMonitor)), logger_(std::move(logger)), settings_(settings) {
  if (!primary_ || !errorMonitor_ || !logger_)
    throw std::invalid_argument("[CaptureCoordinator] primary backend, error monitor and logger required");
}

CaptureCoordinator::~CaptureCoordinator() { stop(); }

bool CaptureCoordinator::start() {
  bool opened = false;
  try {
    opened = primary_->open();
  } catch (const std::exception& e) {
    reportFailure(std::string("[") + primary_->name() + "] open: " + e.what());
  }
  if (opened) {
    logger_->info(kTag, "camera backend " + primary_->name() + " ready");
    return true;
  }
  reportFailure("[" + primary_->name() + "] open failed");
  return switchToSecondary("primary did not open");
}

void CaptureCoordinator::stop() {
  for (auto* backend : { primary_.get(), secondary_.get() }) {
    if (!backend)
      continue;
    try {
      backend->close();
    } catch (const std::exception& e) {
      logger_->warn(kTag, std::string("close ") + backend->name() + ": " + e.what());
    }
  }
}

booth::io::CameraBackend* CaptureCoordinator::active() const {
  return usingSecondary_ ? secondary_.get() : primary_.get();
}

std::string CaptureCoordinator::activeBackend() const { return active()->name(); }

bool CaptureCoordinator::switchToSecondary(const std::string& reason) {
  if (usingSecondary_ || !secondary_)
    return false;

  try {
    primary_->close();
  } catch (const std::exception& e) {
    logger_->warn(kTag, std::string("close ") + primary_->name() + ": " + e.what());
  }

  bool opened = false;
  try {
    opened = secondary_->open();
  } catch (const std::exception& e) {
    reportFailure("[" + secondary_->name() + "] open: " + e.what());
  }
  if (!opened) {
    reportFailure("[" + secondary_->name() + "] open failed");
    return false;
  }

  usingSecondary_ = true;
  previewFailures_ = 0;
  logger_->warn(kTag, "falling back to camera backend " + secondary_->name() + " (" + reason + ")");
  return true;
}

void CaptureCoordinator::reportFailure(const std::string& message) {
  errorMonitor_->notifyFailure("[CaptureCoordinator] " + message);
}

std::optional<booth::io::Frame> CaptureCoordinator::capturePreviewFrame() {
  try {
    auto frame = active()->grabFrame();
    if (frame && !frame->empty()) {
      if (previewFailures_ > 0)
        errorMonitor_->reset();
      previewFailures_ = 0;
      lastGoodFrame_ = *frame;
    }
    return frame;
  } catch (const std::exception& e) {
    ++previewFailures_;
    reportFailure("[" + active()->name() + "] preview: " + e.what());
  }

  if (previewFailures_ >= settings_.previewFailureThreshold)
    switchToSecondary(std::to_string(previewFailures_) + " preview failures in a row");
  return std::nullopt;
}

PhotoRef CaptureCoordinator::captureStill(std::size_t number) {
  return captureStill(number, settings_.still);
}

PhotoRef CaptureCoordinator::captureStill(std::size_t number, io::Resolution resolution) {
  PhotoRef ref;
  ref.takenAt = std::chrono::system_clock::now();
  ref.path = store_.capturePath(number, ref.takenAt);

  if (tryStill(*active(), ref.path, resolution))
    return ref;

  if (switchToSecondary("still capture failed") && tryStill(*active(), ref.path, resolution))
    return ref;

  if (!lastGoodFrame_.empty() && writeFrame(lastGoodFrame_, ref.path)) {
    logger_->warn(kTag, "still replaced by last preview frame: " + ref.path.string());
    return ref;
  }

  ref.placeholder = true;
  if (!writePlaceholder(ref.path, resolution))
    logger_->error(kTag, "placeholder could not be written: " + ref.path.string());
  else
    logger_->warn(kTag, "still replaced by placeholder: " + ref.path.string());
  return ref;
}

bool CaptureCoordinator::tryStill(io::CameraBackend& backend, const std::filesystem::path& out,
                                  io::Resolution resolution) {
  try {
    if (backend.captureStill(out, resolution)) {
      logger_->info(kTag, "captured " + out.string() + " via " + backend.name());
      return true;
    }
    reportFailure("[" + backend.name() + "] still capture failed");
  } catch (const std::exception& e) {
    reportFailure("[" + backend.name() + "] still: " + e.what());
  }
  return false;
}

bool CaptureCoordinator::writeFrame(const io::Frame& frame, const std::filesystem::path& out) {
  try {
    return cv::imwrite(out.string(), frame, { cv::IMWRITE_JPEG_QUALITY, settings_.jpegQuality });
  } catch (const cv::Exception& e) {
    logger_->warn(kTag, std::string("write frame: ") + e.what());
    return false;
  }
}

bool CaptureCoordinator::writePlaceholder(const std::filesystem::path& out,
                                          io::Resolution resolution) {
  try {
    cv::Mat img(std::max(resolution.height, 1), std::max(resolution.width, 1), CV_8UC3,
                cv::Scalar(60, 60, 60));
    const std::string text = "PHOTO UNAVAILABLE";
    const double scale = std::max(1.0, img.cols / 600.0);
    int baseline = 0;
    cv::Size size = cv::getTextSize(text, cv::FONT_HERSHEY_SIMPLEX, scale, 2, &baseline);
    cv::putText(img, text, cv::Point((img.cols - size.width) / 2, (img.rows + size.height) / 2),
                cv::FONT_HERSHEY_SIMPLEX, scale, cv::Scalar(200, 200, 200), 2, cv::LINE_AA);
    return cv::imwrite(out.string(), img, { cv::IMWRITE_JPEG_QUALITY, settings_.jpegQuality });
  } catch (const cv::Exception& e) {
    logger_->error(kTag, std::string("placeholder: ") + e.what());
    return false;
  }
}

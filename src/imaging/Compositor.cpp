/* @file Compositor.cpp
 * @brief template layout, per-photo filters and artifact persistence
 *
 * © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cmath>
#include <stdexcept>

// 3rd-party headers
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

// Booth headers
#include "core/Logger.hpp"
#include "imaging/Compositor.hpp"
#include "io/PhotoStore.hpp"

using namespace booth::imaging;

namespace {
  constexpr const char* kTag = "Compositor";
}

std::optional<PlacementPolicy> booth::imaging::placementFromString(const std::string& name) {
  if (name == "fill_crop")
    return PlacementPolicy::FillCrop;
  if (name == "fit_inside")
    return PlacementPolicy::FitInside;
  return std::nullopt;
}

Compositor::Compositor(CompositorSettings settings, io::PhotoStore& store,
                       std::shared_ptr<core::Logger> logger)
    : settings_(settings), store_(store), logger_(std::move(logger)) {
  if (settings_.canvasWidth <= 0 || settings_.canvasHeight <= 0)
    throw std::invalid_argument("[Compositor] canvas size must be positive");
}

cv::Rect Compositor::toPixelRect(const core::Rect& r, cv::Size canvas) {
  return cv::Rect(static_cast<int>(r.leftPct / 100.f * canvas.width),
                  static_cast<int>(r.topPct / 100.f * canvas.height),
                  static_cast<int>(r.widthPct / 100.f * canvas.width),
                  static_cast<int>(r.heightPct / 100.f * canvas.height));
}

std::pair<cv::Mat, cv::Point> Compositor::fitToSlot(const cv::Mat& photo, cv::Size slot,
                                                    PlacementPolicy policy) {
  if (photo.empty() || slot.width <= 0 || slot.height <= 0)
    return { cv::Mat(), cv::Point() };

  const double sx = static_cast<double>(slot.width) / photo.cols;
  const double sy = static_cast<double>(slot.height) / photo.rows;

  if (policy == PlacementPolicy::FitInside) {
    const double scale = std::min(sx, sy);
    cv::Size scaled(std::clamp(static_cast<int>(std::lround(photo.cols * scale)), 1, slot.width),
                    std::clamp(static_cast<int>(std::lround(photo.rows * scale)), 1, slot.height));
    cv::Mat resized;
    cv::resize(photo, resized, scaled, 0, 0, cv::INTER_LANCZOS4);
    return { resized, cv::Point((slot.width - scaled.width) / 2, (slot.height - scaled.height) / 2) };
  }

  // fill-crop: never smaller than the slot, so no background can show through
  const double scale = std::max(sx, sy);
  cv::Size scaled(std::max(slot.width, static_cast<int>(std::lround(photo.cols * scale))),
                  std::max(slot.height, static_cast<int>(std::lround(photo.rows * scale))));
  cv::Mat resized;
  cv::resize(photo, resized, scaled, 0, 0, cv::INTER_LANCZOS4);
  cv::Rect crop((scaled.width - slot.width) / 2, (scaled.height - slot.height) / 2, slot.width,
                slot.height);
  return { resized(crop).clone(), cv::Point(0, 0) };
}

cv::Mat Compositor::background(const core::Template& tpl) const {
  const cv::Size canvasSize(settings_.canvasWidth, settings_.canvasHeight);

  if (tpl.background) {
    cv::Mat art = cv::imread(tpl.background->string(), cv::IMREAD_COLOR);
    if (!art.empty()) {
      if (art.size() != canvasSize)
        cv::resize(art, art, canvasSize, 0, 0, cv::INTER_LANCZOS4);
      return art;
    }
    logger_->warn(kTag, "background unreadable, using solid fill: " + tpl.background->string());
  }

  const auto& c = settings_.backgroundColor;
  return cv::Mat(canvasSize, CV_8UC3, cv::Scalar(c.b, c.g, c.r));
}

cv::Mat Compositor::render(const std::vector<core::PhotoRef>& photos, FilterKind filter,
                           const core::Template& tpl, std::vector<std::size_t>* skipped) const {
  cv::Mat canvas = background(tpl);
  const cv::Rect bounds(0, 0, canvas.cols, canvas.rows);

  const std::size_t n = std::min(photos.size(), tpl.rects.size());
  for (std::size_t i = 0; i < n; ++i) {
    cv::Mat photo = cv::imread(photos[i].path.string(), cv::IMREAD_COLOR);
    if (photo.empty()) {
      logger_->warn(kTag, "slot " + std::to_string(i) + " skipped, cannot decode " +
                              photos[i].path.string());
      if (skipped)
        skipped->push_back(i);
      continue;
    }

    const cv::Rect slot = toPixelRect(tpl.rects[i], canvas.size());
    auto [scaled, offset] = fitToSlot(photo, slot.size(), settings_.placement);
    if (scaled.empty()) {
      if (skipped)
        skipped->push_back(i);
      continue;
    }

    const std::uint64_t seed = settings_.noiseSeed + i;
    scaled = applyFilter(scaled, filter, settings_.noise, seed);
    if (tpl.vintageEffect && filter != FilterKind::Newspaper)
      scaled = newspaper(scaled, settings_.noise, seed);

    // clip to the page; a rect may overhang by a rounding pixel
    const cv::Rect placed(slot.x + offset.x, slot.y + offset.y, scaled.cols, scaled.rows);
    const cv::Rect visible = placed & bounds;
    if (visible.empty()) {
      logger_->warn(kTag, "slot " + std::to_string(i) + " skipped, rect lies off the page");
      if (skipped)
        skipped->push_back(i);
      continue;
    }
    const cv::Rect src(visible.x - placed.x, visible.y - placed.y, visible.width, visible.height);
    scaled(src).copyTo(canvas(visible));
  }
  return canvas;
}

ComposedArtifact Compositor::compose(const std::vector<core::PhotoRef>& photos, FilterKind filter,
                                     const core::Template& tpl) {
  ComposedArtifact artifact;
  artifact.filter = filter;

  cv::Mat page = render(photos, filter, tpl, &artifact.skippedSlots);
  artifact.placed = std::min(photos.size(), tpl.rects.size()) - artifact.skippedSlots.size();

  artifact.photo.takenAt = std::chrono::system_clock::now();
  artifact.photo.path = store_.artifactPath(artifact.photo.takenAt);

  bool written = false;
  try {
    written = cv::imwrite(artifact.photo.path.string(), page,
                          { cv::IMWRITE_JPEG_QUALITY, settings_.jpegQuality });
  } catch (const cv::Exception& e) {
    throw std::runtime_error("[Compositor] write " + artifact.photo.path.string() + ": " + e.what());
  }
  if (!written)
    throw std::runtime_error("[Compositor] write failed: " + artifact.photo.path.string());

  logger_->info(kTag, "composed " + artifact.photo.path.string() + " (" + tpl.id + ", " +
                          toString(filter) + ", " + std::to_string(artifact.placed) + " placed)");
  return artifact;
}

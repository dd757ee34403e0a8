/* @file HudPresenter.cpp
 *
 * © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

// STL headers
#include <sstream>

// Booth headers
#include "core/CaptureSession.hpp"
#include "core/Logger.hpp"
#include "core/PrintDispatcher.hpp"
#include "ui/HudPresenter.hpp"

using namespace booth::ui;
using namespace booth;

namespace {
  constexpr const char* kSource = "HUD";
}

HudPresenter::HudPresenter(std::shared_ptr<core::Logger> logger) : logger_(std::move(logger)) {}

void HudPresenter::show(const std::string& line) {
  lastLine_ = line;
  if (logger_)
    logger_->info(kSource, line);
}

void HudPresenter::onStateChanged(core::ScreenState, const core::CaptureSession& session) {
  switch (session.state) {
  case core::ScreenState::Attract:
    show("Press the button to start");
    break;
  case core::ScreenState::Template:
    if (session.tpl)
      show("Template: " + session.tpl->name + " (next/prev to change, shutter to start)");
    break;
  case core::ScreenState::Capturing:
    show("Smile!");
    break;
  case core::ScreenState::Selection:
    show("Pick " + std::to_string(session.selection.capacity()) + " photo(s): " +
         selectionStrip(session));
    break;
  case core::ScreenState::Review:
    show("Filter: " + std::string(imaging::toString(session.filter())) +
         " (next/prev to change, enter to print)");
    break;
  case core::ScreenState::Printing:
    show("Sending to printer...");
    break;
  default:
    break; // countdown / quick review have their own callbacks
  }
}

void HudPresenter::onTemplateChanged(const core::Template& tpl, int toTake) {
  show("Template: " + tpl.name + ", " + std::to_string(tpl.slots) + " slot(s), " +
       std::to_string(toTake) + " photos");
}

void HudPresenter::onCountdown(int remaining) {
  show(remaining > 0 ? std::to_string(remaining) : "Smile!");
}

void HudPresenter::onQuickReview(const core::PhotoRef& photo) {
  show(photo.placeholder ? "Camera problem, photo replaced" : "Got it: " + photo.path.filename().string());
}

void HudPresenter::onSelectionChanged(const core::CaptureSession& session) {
  show("Selected " + std::to_string(session.selection.selected().size()) + "/" +
       std::to_string(session.selection.capacity()) + " " + selectionStrip(session));
}

void HudPresenter::onFilterChanged(imaging::FilterKind filter) {
  show(std::string("Filter: ") + imaging::toString(filter));
}

void HudPresenter::onComposed(const imaging::ComposedArtifact& artifact) {
  std::string line = "Preview ready: " + artifact.photo.path.filename().string();
  if (!artifact.skippedSlots.empty())
    line += " (" + std::to_string(artifact.skippedSlots.size()) + " empty slot(s))";
  show(line);
}

void HudPresenter::onPrintFinished(const core::JobResult& result) {
  show(result.ok ? "Print sent" : "Print failed: " + result.message);
}

void HudPresenter::onNotice(const std::string& message) { show(message); }

void HudPresenter::onError(const std::string& message) {
  lastLine_ = message;
  if (logger_)
    logger_->warn(kSource, message);
}

void HudPresenter::onPreviewFrame(const io::Frame&) { ++previewFrames_; }

std::string HudPresenter::selectionStrip(const core::CaptureSession& session) {
  const auto& sel = session.selection;
  std::ostringstream os;
  for (std::size_t i = 0; i < sel.captureCount(); ++i) {
    if (i)
      os << ' ';
    const bool cursor = i == sel.cursor();
    const bool chosen = sel.isSelected(i);
    if (cursor)
      os << "[";
    if (chosen)
      os << "*";
    os << (i + 1);
    if (chosen)
      os << "*";
    if (cursor)
      os << "]";
  }
  return os.str();
}

#pragma once
/** @file  HudPresenter.hpp
 *  @brief Text HUD: turns controller notifications into status lines on the logger.
 *
 *  © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

#include <cstdint>
#include <memory>
#include <string>

#include "ui/SessionObserver.hpp"

namespace booth {
  namespace core {
    class Logger;
  } // namespace core

  namespace ui {

    class HudPresenter : public SessionObserver {
    public:
      explicit HudPresenter(std::shared_ptr<core::Logger> logger);

      void onStateChanged(core::ScreenState from, const core::CaptureSession& session) override;
      void onTemplateChanged(const core::Template& tpl, int toTake) override;
      void onCountdown(int remaining) override;
      void onQuickReview(const core::PhotoRef& photo) override;
      void onSelectionChanged(const core::CaptureSession& session) override;
      void onFilterChanged(imaging::FilterKind filter) override;
      void onComposed(const imaging::ComposedArtifact& artifact) override;
      void onPrintFinished(const core::JobResult& result) override;
      void onNotice(const std::string& message) override;
      void onError(const std::string& message) override;
      void onPreviewFrame(const io::Frame& frame) override;

      const std::string& lastLine() const { return lastLine_; }
      std::uint64_t previewFrames() const { return previewFrames_; }

      /// "[1] 2 *3*": brackets mark the cursor, stars the selection.
      static std::string selectionStrip(const core::CaptureSession& session);

    private:
      void show(const std::string& line);

      std::shared_ptr<core::Logger> logger_;
      std::string lastLine_;
      std::uint64_t previewFrames_{ 0 };
    };

  } // namespace ui
} // namespace booth

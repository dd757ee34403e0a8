#pragma once
/** @file  SessionObserver.hpp
 *  @brief Notification seam between SessionController and whatever draws the screen.
 *
 *  © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

#include <string>

#include "core/SessionState.hpp"
#include "io/CameraBackend.hpp"

namespace booth {
  namespace core { // forward decls so we don’t pull controller headers in
    struct CaptureSession;
    struct JobResult;
    struct PhotoRef;
    struct Template;
  } // namespace core

  namespace imaging {
    struct ComposedArtifact;
    enum class FilterKind : std::uint8_t;
  } // namespace imaging

  namespace ui {

    /**
 * @class SessionObserver
 * @brief All callbacks run on the control thread; default bodies are empty so a
 *        front-end only overrides what it renders.
 */
    class SessionObserver {
    public:
      virtual ~SessionObserver() = default;

      virtual void onStateChanged(core::ScreenState /*from*/, const core::CaptureSession& /*session*/) {}
      virtual void onTemplateChanged(const core::Template& /*tpl*/, int /*toTake*/) {}
      virtual void onCountdown(int /*remaining*/) {}
      virtual void onQuickReview(const core::PhotoRef& /*photo*/) {}
      virtual void onSelectionChanged(const core::CaptureSession& /*session*/) {}
      virtual void onFilterChanged(imaging::FilterKind /*filter*/) {}
      virtual void onComposed(const imaging::ComposedArtifact& /*artifact*/) {}
      virtual void onPrintFinished(const core::JobResult& /*result*/) {}
      virtual void onNotice(const std::string& /*message*/) {}
      virtual void onError(const std::string& /*message*/) {}
      virtual void onPreviewFrame(const io::Frame& /*frame*/) {}
    };

  } // namespace ui
} // namespace booth

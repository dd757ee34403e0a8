#pragma once

/** @file  KioskRuntime.hpp
 *  @brief Builds every subsystem from KioskConfig and runs the control loop.
 *
 *  © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <memory>

#include "core/CameraFactory.hpp"
#include "core/KioskConfig.hpp"

namespace booth {
  namespace imaging {
    class Compositor;
  } // namespace imaging

  namespace io {
    class PhotoStore;
    class ProcessRunner;
  } // namespace io

  namespace ui {
    class HudPresenter;
    class InputController;
  } // namespace ui

  namespace core {

    class CaptureCoordinator;
    class ErrorMonitor;
    class Logger;
    class PrintDispatcher;
    class PrinterSettings;
    class SessionController;
    class TemplateCatalog;

    /**
 * @class KioskRuntime
 * @brief Owner of the object graph; `run()` is the control thread.
 *
 *  * Loop: poll inputs, preview tick (attract / template / countdown only),
 *    `SessionController::poll()`, short sleep.
 *  * `stop()` may be called from a signal handler.
 */
    class KioskRuntime {

    public:
      KioskRuntime(KioskConfig config, std::shared_ptr<Logger> logger);
      ~KioskRuntime();

      //---public API---
      void initialize(); ///< throws if the photo directory or a named camera backend is unusable
      int run();         ///< blocks until stop(); returns the process exit code
      void stop() { running_.store(false); }

      /// "rpicam" and "opencv", configured from \p config.
      static CameraFactory cameraFactory(const KioskConfig& config,
                                         std::shared_ptr<io::ProcessRunner> runner);

      KioskRuntime(const KioskRuntime&) = delete;
      KioskRuntime& operator=(const KioskRuntime&) = delete;

    private:
      void buildInputs();
      void tick(std::chrono::milliseconds now);

      KioskConfig config_;
      std::shared_ptr<Logger> logger_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::shared_ptr<io::ProcessRunner> runner_;

      std::unique_ptr<io::PhotoStore> store_;
      std::unique_ptr<PrinterSettings> printerSettings_;
      std::unique_ptr<TemplateCatalog> catalog_;
      std::unique_ptr<CaptureCoordinator> capture_;
      std::unique_ptr<imaging::Compositor> compositor_;
      std::unique_ptr<PrintDispatcher> printer_;
      std::unique_ptr<ui::HudPresenter> hud_;
      std::unique_ptr<ui::InputController> inputs_;
      std::unique_ptr<SessionController> controller_; ///< declared last, destroyed first

      std::chrono::milliseconds nextPreview_{ 0 };
      std::atomic<bool> running_{ false };
    };

  } // namespace core
} // namespace booth

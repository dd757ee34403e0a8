#pragma once

/** @file  SessionController.hpp
 *  @brief Screen state machine for one booth: template → countdown → capture →
 *         selection → review → print, plus timeouts.
 *
 *  © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include "core/CaptureSession.hpp"
#include "core/PrintDispatcher.hpp"
#include "core/RingBuffer.hpp"
#include "core/SessionState.hpp"

namespace booth {
  namespace imaging {
    class Compositor;
  } // namespace imaging

  namespace ui {
    class SessionObserver;
  } // namespace ui

  namespace core {

    class CaptureCoordinator;
    class Logger;
    class TemplateCatalog;

    struct SessionTimings {
      int countdownStart{ 10 };
      std::chrono::milliseconds countdownTick{ 1000 };
      std::chrono::milliseconds quickReview{ 1200 };
      std::chrono::milliseconds inactivityTimeout{ 90000 };
      std::chrono::milliseconds watchdogInterval{ 1000 };
      std::chrono::milliseconds postPrintReturn{ 10000 }; ///< confirmation screen after a good print
    };

    struct InputEvent {
      InputAction action{ InputAction::Enter };
    };

    struct PrintCompleted {
      std::uint64_t generation{ 0 };
      JobResult result;
    };

    using ControlEvent = std::variant<InputEvent, PrintCompleted>;

    /**
 * @class SessionController
 * @brief Single owner of CaptureSession. Every mutation happens inside `poll()`,
 *        on whichever thread calls it (the control thread).
 *
 *  * `post()` is the only entry point safe to call from other threads.
 *  * Printing runs on a worker; its result comes back through the same queue
 *    as input and is dropped if the session it belonged to has since ended.
 *  * Time never comes from a clock in here: `poll(now)` drives every timer.
 */
    class SessionController {
    public:
      struct Dependencies {
        const TemplateCatalog& catalog;
        CaptureCoordinator& camera;
        imaging::Compositor& compositor;
        PrintDispatcher& printer;
        std::shared_ptr<Logger> logger;
      };

      explicit SessionController(Dependencies deps, SessionTimings timings = {},
                                 PrintOptions printOptions = {}, std::size_t queueCapacity = 64);
      ~SessionController(); ///< waits for an in-flight print job

      //---public API---
      void setObserver(ui::SessionObserver* observer) { observer_ = observer; }
      void setPrinterName(std::optional<std::string> name) { printerName_ = std::move(name); }

      /// Thread-safe. False if the queue is full and the action was dropped.
      bool post(InputAction action);

      /// Drain queued events, then fire due timers.
      void poll(std::chrono::milliseconds now);

      ScreenState state() const { return session_.state; }
      const CaptureSession& session() const { return session_; }
      std::size_t templateIndex() const { return templateIndex_; }
      const Template& currentTemplate() const;

      bool printPending() const;
      /// Block until the print worker (if any) has finished. Does not consume its result.
      void waitForPrintJob();

      SessionController(const SessionController&) = delete;
      SessionController& operator=(const SessionController&) = delete;

    private:
      void handleInput(InputAction action, std::chrono::milliseconds now);
      void handlePrintCompleted(const PrintCompleted& done, std::chrono::milliseconds now);
      void runTimers(std::chrono::milliseconds now);

      void startSession();
      void cycleTemplate(int delta);
      void beginCountdown(std::chrono::milliseconds now);
      void captureNow(std::chrono::milliseconds now);
      void finishQuickReview(std::chrono::milliseconds now);
      void moveCursor(int delta);
      void toggleSelection();
      void composeSelection();
      void changeFilter(int delta);
      void startPrint();
      void resetToAttract(const std::string& reason);

      bool composeInto(CaptureSession& session);
      void transitionTo(ScreenState next);
      void cancelTimers();

      const TemplateCatalog& catalog_;
      CaptureCoordinator& camera_;
      imaging::Compositor& compositor_;
      PrintDispatcher& printer_;
      std::shared_ptr<Logger> logger_;
      SessionTimings timings_;
      PrintOptions printOptions_;
      ui::SessionObserver* observer_{ nullptr };
      std::optional<std::string> printerName_;

      RingBuffer<ControlEvent> events_;
      CaptureSession session_;
      ScreenState lastReported_{ ScreenState::Attract };
      std::size_t templateIndex_{ 0 }; ///< survives session resets

      bool clockStarted_{ false };
      std::chrono::milliseconds lastInput_{ 0 };
      std::chrono::milliseconds nextWatchdog_{ 0 };
      std::optional<std::chrono::milliseconds> countdownDue_;
      std::optional<std::chrono::milliseconds> quickReviewDue_;
      std::optional<std::chrono::milliseconds> returnDue_;

      std::uint64_t generation_{ 0 };
      bool printSettled_{ false }; ///< true once a successful result arrived
      std::future<void> printJob_;
      std::atomic<bool> stopping_{ false };
    };

  } // namespace core
} // namespace booth

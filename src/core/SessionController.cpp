/* @file SessionController.cpp
 * @brief Booth FSM. Single control thread; print worker talks back via the event queue.
 *
 * © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

// STL headers
#include <exception>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

// Booth headers
#include "core/CaptureCoordinator.hpp"
#include "core/Logger.hpp"
#include "core/SessionController.hpp"
#include "core/TemplateCatalog.hpp"
#include "imaging/Compositor.hpp"
#include "ui/SessionObserver.hpp"

using namespace booth::core;
using namespace std::chrono_literals;

namespace {
  constexpr const char* kSource = "SessionController";
}

SessionController::SessionController(Dependencies deps, SessionTimings timings,
                                     PrintOptions printOptions, std::size_t queueCapacity)
    : catalog_(deps.catalog), camera_(deps.camera), compositor_(deps.compositor),
      printer_(deps.printer), logger_(std::move(deps.logger)), timings_(timings),
      printOptions_(std::move(printOptions)), events_(queueCapacity) {
  if (!logger_)
    throw std::invalid_argument("[SessionController] logger is required");
  if (catalog_.size() == 0)
    throw std::invalid_argument("[SessionController] template catalog is empty");
  if (timings_.countdownStart < 1)
    timings_.countdownStart = 1;
}

SessionController::~SessionController() {
  stopping_.store(true);
  waitForPrintJob();
}

bool SessionController::post(InputAction action) {
  if (events_.push(InputEvent{ action }))
    return true;
  logger_->warn(kSource, std::string("event queue full, dropped ") + toString(action));
  return false;
}

const Template& SessionController::currentTemplate() const {
  return session_.tpl ? *session_.tpl : catalog_.at(templateIndex_);
}

bool SessionController::printPending() const {
  return printJob_.valid() && printJob_.wait_for(0ms) != std::future_status::ready;
}

void SessionController::waitForPrintJob() {
  if (printJob_.valid())
    printJob_.wait();
}

//---control thread---

void SessionController::poll(std::chrono::milliseconds now) {
  if (!clockStarted_) {
    clockStarted_ = true;
    lastInput_ = now;
    nextWatchdog_ = now + timings_.watchdogInterval;
  }

  // only drain what was queued before this poll; a flood can't starve the timers
  for (std::size_t remaining = events_.capacity(); remaining > 0; --remaining) {
    auto ev = events_.tryPop();
    if (!ev)
      break;
    std::visit(
        [&](const auto& e) {
          using E = std::decay_t<decltype(e)>;
          if constexpr (std::is_same_v<E, InputEvent>)
            handleInput(e.action, now);
          else
            handlePrintCompleted(e, now);
        },
        *ev);
  }

  runTimers(now);
}

void SessionController::handleInput(InputAction action, std::chrono::milliseconds now) {
  lastInput_ = now;
  logger_->debug(kSource, std::string(toString(action)) + " in " + toString(session_.state));

  if (action == InputAction::Cancel) {
    if (session_.state == ScreenState::Attract)
      return;
    if (session_.state == ScreenState::Printing && !printSettled_) {
      logger_->info(kSource, "cancel ignored while print job is pending");
      return;
    }
    resetToAttract("cancel");
    return;
  }

  switch (session_.state) {
  case ScreenState::Attract:
    if (action == InputAction::Shutter || action == InputAction::Enter)
      startSession();
    break;

  case ScreenState::Template:
    if (action == InputAction::Next)
      cycleTemplate(+1);
    else if (action == InputAction::Prev)
      cycleTemplate(-1);
    else
      beginCountdown(now);
    break;

  case ScreenState::Countdown:
    if (action == InputAction::Shutter || action == InputAction::Enter) {
      countdownDue_.reset();
      captureNow(now);
    }
    break;

  case ScreenState::Selection:
    if (action == InputAction::Next)
      moveCursor(+1);
    else if (action == InputAction::Prev)
      moveCursor(-1);
    else if (action == InputAction::Shutter)
      toggleSelection();
    else
      composeSelection();
    break;

  case ScreenState::Review:
    if (action == InputAction::Next)
      changeFilter(+1);
    else if (action == InputAction::Prev)
      changeFilter(-1);
    else
      startPrint();
    break;

  case ScreenState::Capturing:
  case ScreenState::QuickReview:
  case ScreenState::Printing:
  default:
    break;
  }
}

void SessionController::handlePrintCompleted(const PrintCompleted& done,
                                             std::chrono::milliseconds now) {
  if (done.generation != generation_ || session_.state != ScreenState::Printing) {
    logger_->info(kSource, "discarding print result from an ended session");
    return;
  }
  if (printJob_.valid())
    printJob_.get();

  if (observer_)
    observer_->onPrintFinished(done.result);

  if (done.result.ok) {
    logger_->info(kSource, "print job accepted");
    if (observer_)
      observer_->onNotice("Printing... collect your photo at the printer");
    printSettled_ = true;
    returnDue_ = now + timings_.postPrintReturn;
    return;
  }

  logger_->error(kSource, "print failed: " + done.result.message);
  if (observer_)
    observer_->onError("Print failed: " + done.result.message);
  transitionTo(ScreenState::Review);
}

void SessionController::runTimers(std::chrono::milliseconds now) {
  if (now >= nextWatchdog_) {
    nextWatchdog_ = now + timings_.watchdogInterval;
    if (session_.state != ScreenState::Attract && now - lastInput_ > timings_.inactivityTimeout) {
      resetToAttract("inactivity");
      return;
    }
  }

  while (countdownDue_ && now >= *countdownDue_) {
    --session_.countdownValue;
    if (observer_)
      observer_->onCountdown(session_.countdownValue);
    if (session_.countdownValue <= 0) {
      countdownDue_.reset();
      captureNow(now);
      break;
    }
    *countdownDue_ += timings_.countdownTick;
  }

  if (quickReviewDue_ && now >= *quickReviewDue_) {
    quickReviewDue_.reset();
    finishQuickReview(now);
  }

  if (returnDue_ && now >= *returnDue_) {
    returnDue_.reset();
    resetToAttract("print complete");
  }
}

//---transitions---

void SessionController::startSession() {
  session_.reset();
  session_.tpl = &catalog_.at(templateIndex_);
  session_.toTake = session_.tpl->toTake();
  logger_->info(kSource, "session started with template " + session_.tpl->id);
  transitionTo(ScreenState::Template);
  if (observer_)
    observer_->onTemplateChanged(*session_.tpl, session_.toTake);
}

void SessionController::cycleTemplate(int delta) {
  templateIndex_ = TemplateCatalog::cycle(templateIndex_, delta, catalog_.size());
  session_.tpl = &catalog_.at(templateIndex_);
  session_.takenCount = 0;
  session_.toTake = session_.tpl->toTake();
  if (observer_)
    observer_->onTemplateChanged(*session_.tpl, session_.toTake);
}

void SessionController::beginCountdown(std::chrono::milliseconds now) {
  session_.countdownValue = timings_.countdownStart;
  transitionTo(ScreenState::Countdown);
  if (observer_)
    observer_->onCountdown(session_.countdownValue);
  countdownDue_ = now + timings_.countdownTick;
}

void SessionController::captureNow(std::chrono::milliseconds now) {
  transitionTo(ScreenState::Capturing);
  const auto number = session_.captures.size() + 1;

  PhotoRef photo;
  try {
    photo = camera_.captureStill(number);
  } catch (const std::exception& e) {
    // CaptureCoordinator contains backend faults; reaching here means its own IO broke
    logger_->error(kSource, std::string("capture aborted: ") + e.what());
    if (observer_)
      observer_->onError("Camera problem, trying again");
    beginCountdown(now);
    return;
  }

  session_.captures.push_back(photo);
  ++session_.takenCount;
  logger_->info(kSource, "captured " + std::to_string(session_.takenCount) + "/" +
                             std::to_string(session_.toTake) + " -> " + photo.path.string());

  transitionTo(ScreenState::QuickReview);
  if (observer_)
    observer_->onQuickReview(photo);
  quickReviewDue_ = now + timings_.quickReview;
}

void SessionController::finishQuickReview(std::chrono::milliseconds now) {
  if (session_.state != ScreenState::QuickReview)
    return;
  if (session_.takenCount < session_.toTake) {
    beginCountdown(now);
    return;
  }
  session_.selection.reset(session_.captures.size(), static_cast<std::size_t>(session_.tpl->slots));
  transitionTo(ScreenState::Selection);
  if (observer_)
    observer_->onSelectionChanged(session_);
}

void SessionController::moveCursor(int delta) {
  session_.selection.moveCursor(delta);
  if (observer_)
    observer_->onSelectionChanged(session_);
}

void SessionController::toggleSelection() {
  if (session_.selection.toggleAtCursor() && observer_)
    observer_->onSelectionChanged(session_);
}

void SessionController::composeSelection() {
  if (!session_.selection.isFull()) {
    logger_->debug(kSource, "enter ignored, selection incomplete");
    return;
  }
  if (composeInto(session_))
    transitionTo(ScreenState::Review);
}

void SessionController::changeFilter(int delta) {
  session_.filterIndex = imaging::cycleFilter(session_.filterIndex, delta);
  if (observer_)
    observer_->onFilterChanged(session_.filter());
  // a failed recompose keeps the previous artifact on screen
  composeInto(session_);
}

bool SessionController::composeInto(CaptureSession& session) {
  std::vector<PhotoRef> photos;
  photos.reserve(session.selection.selected().size());
  for (auto index : session.selection.selected())
    photos.push_back(session.captures.at(index));

  try {
    auto artifact = compositor_.compose(photos, session.filter(), *session.tpl);
    session.lastComposed = artifact;
    if (observer_)
      observer_->onComposed(*session.lastComposed);
    return true;
  } catch (const std::exception& e) {
    logger_->error(kSource, std::string("compose failed: ") + e.what());
    if (observer_)
      observer_->onError("Could not build the print page");
    return false;
  }
}

void SessionController::startPrint() {
  if (!session_.lastComposed)
    return;
  if (printPending()) {
    logger_->warn(kSource, "previous print job still running");
    if (observer_)
      observer_->onError("Printer is still busy, please try again");
    return;
  }
  if (printJob_.valid())
    printJob_.get(); // reap a job whose result was discarded

  printSettled_ = false;
  transitionTo(ScreenState::Printing);
  logger_->info(kSource, "printing " + session_.lastComposed->photo.path.string());

  printJob_ = std::async(std::launch::async, [this, generation = generation_,
                                              artifact = session_.lastComposed->photo,
                                              printerName = printerName_,
                                              options = printOptions_] {
    JobResult result;
    try {
      result = printer_.submit(artifact, printerName, options);
    } catch (const std::exception& e) {
      result = JobResult::failure(e.what());
    }
    ControlEvent done{ PrintCompleted{ generation, std::move(result) } };
    while (!events_.push(done)) {
      if (stopping_.load())
        return;
      std::this_thread::sleep_for(5ms);
    }
  });
}

void SessionController::resetToAttract(const std::string& reason) {
  // timers first so nothing can fire against the cleared session
  cancelTimers();
  ++generation_;
  printSettled_ = false;
  logger_->info(kSource, "reset to attract (" + reason + "), " +
                             std::to_string(session_.captures.size()) + " capture(s) kept on disk");
  session_.reset();
  transitionTo(ScreenState::Attract);
}

void SessionController::transitionTo(ScreenState next) {
  const auto from = lastReported_;
  session_.state = next;
  if (from == next)
    return;
  lastReported_ = next;
  logger_->debug(kSource, std::string(toString(from)) + " -> " + toString(next));
  if (observer_)
    observer_->onStateChanged(from, session_);
}

void SessionController::cancelTimers() {
  countdownDue_.reset();
  quickReviewDue_.reset();
  returnDue_.reset();
}

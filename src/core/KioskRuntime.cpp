/* @file KioskRuntime.cpp
 * @brief object graph assembly + control loop
 *
 * © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

// STL headers
#include <filesystem>
#include <stdexcept>
#include <thread>

// Booth headers
#include "core/CaptureCoordinator.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/KioskRuntime.hpp"
#include "core/Logger.hpp"
#include "core/PrinterSettings.hpp"
#include "core/SessionController.hpp"
#include "core/TemplateCatalog.hpp"
#include "imaging/Compositor.hpp"
#include "io/ButtonGPIO.hpp"
#include "io/KeyboardInput.hpp"
#include "io/LpPrintDispatcher.hpp"
#include "io/PhotoStore.hpp"
#include "io/ProcessRunner.hpp"
#include "io/StillProcessCamera.hpp"
#include "io/VideoCaptureCamera.hpp"
#include "ui/HudPresenter.hpp"
#include "ui/InputController.hpp"

using namespace booth::core;
using namespace std::chrono_literals;

namespace {
  constexpr const char* kSource = "KioskRuntime";
  constexpr auto kLoopSleep = 10ms;
} // namespace

KioskRuntime::KioskRuntime(KioskConfig config, std::shared_ptr<Logger> logger)
    : config_(std::move(config)), logger_(std::move(logger)),
      errorMonitor_(std::make_shared<ErrorMonitor>()),
      runner_(std::make_shared<io::ProcessRunner>()) {
  if (!logger_)
    throw std::invalid_argument("[KioskRuntime] logger is required");
  errorMonitor_->registerEscalation(
      [log = logger_](const std::string& msg) { log->error("ErrorMonitor", msg); });
}

KioskRuntime::~KioskRuntime() {
  controller_.reset(); // joins a pending print job before its collaborators go
  if (capture_)
    capture_->stop();
}

CameraFactory KioskRuntime::cameraFactory(const KioskConfig& config,
                                          std::shared_ptr<io::ProcessRunner> runner) {
  CameraFactory factory;
  const auto& cam = config.camera;

  factory.registerBackend("rpicam", [cam, runner] {
    io::StillProcessOptions opts;
    opts.videoCommand = cam.videoCommand;
    opts.stillCommand = cam.stillCommand;
    opts.preview = cam.preview;
    opts.framerate = cam.framerate;
    opts.stillQuality = cam.capture.jpegQuality;
    opts.mirror = cam.mirror;
    return std::make_unique<io::StillProcessCamera>(opts, runner);
  });
  factory.registerBackend("opencv", [cam] {
    return std::make_unique<io::VideoCaptureCamera>(cam.deviceIndex, cam.preview, cam.mirror,
                                                    cam.capture.jpegQuality);
  });
  return factory;
}

void KioskRuntime::initialize() {
  std::error_code ec;
  std::filesystem::create_directories(config_.paths.photosDir, ec);
  if (ec)
    throw std::runtime_error("[KioskRuntime] cannot create " + config_.paths.photosDir + ": " +
                             ec.message());

  store_ = std::make_unique<io::PhotoStore>(config_.paths.photosDir);

  printerSettings_ = std::make_unique<PrinterSettings>(store_->printerPreferencePath().string());
  printerSettings_->load();

  catalog_ = std::make_unique<TemplateCatalog>(TemplateCatalog::load(config_.paths.templatesPath, *logger_));
  logger_->info(kSource, std::to_string(catalog_->size()) + " template(s) from " +
                             config_.paths.templatesPath +
                             (catalog_->usingFallback() ? " (built-in fallback)" : ""));

  auto factory = cameraFactory(config_, runner_);
  auto primary = factory.create(config_.camera.primary); // unknown name -> out_of_range
  std::unique_ptr<io::CameraBackend> secondary;
  if (!config_.camera.secondary.empty() && config_.camera.secondary != config_.camera.primary) {
    if (factory.contains(config_.camera.secondary))
      secondary = factory.create(config_.camera.secondary);
    else
      logger_->warn(kSource, "unknown secondary camera \"" + config_.camera.secondary + "\"");
  }
  capture_ = std::make_unique<CaptureCoordinator>(std::move(primary), std::move(secondary), *store_,
                                                  errorMonitor_, logger_, config_.camera.capture);
  if (!capture_->start())
    logger_->error(kSource, "no camera available, captures will be placeholders");

  compositor_ = std::make_unique<imaging::Compositor>(config_.compositor, *store_, logger_);
  printer_ = std::make_unique<io::LpPrintDispatcher>(
      runner_, config_.print.command,
      std::chrono::duration_cast<std::chrono::milliseconds>(config_.print.timeout));

  hud_ = std::make_unique<ui::HudPresenter>(logger_);

  SessionController::Dependencies deps{ *catalog_, *capture_, *compositor_, *printer_, logger_ };
  controller_ = std::make_unique<SessionController>(deps, config_.timings, config_.print.options);
  controller_->setObserver(hud_.get());
  controller_->setPrinterName(printerSettings_->printer());

  buildInputs();
}

void KioskRuntime::buildInputs() {
  inputs_ = std::make_unique<ui::InputController>();
  inputs_->registerCallback([this](InputAction a) { controller_->post(a); });

  if (config_.gpio.enabled) {
    for (const auto& b : config_.gpio.buttons) {
      auto button = std::make_unique<io::ButtonGPIO>(b.name, config_.gpio.longPress,
                                                     config_.gpio.debounce);
      if (!button->open(config_.gpio.chip, b.line, config_.gpio.activeLow)) {
        errorMonitor_->notifyFailure("[GPIO] button " + b.name + " unavailable");
        continue;
      }
      inputs_->addButton(std::move(button), b.press, b.longPress);
    }
  }

  if (config_.keyboard.enabled) {
    auto keyboard = std::make_unique<io::KeyboardInput>();
    if (keyboard->open(config_.keyboard.device))
      inputs_->attachKeyboard(std::move(keyboard));
    else
      logger_->warn(kSource, "keyboard " + config_.keyboard.device + " unavailable");
  }

  if (inputs_->buttonCount() == 0 && !inputs_->hasKeyboard())
    logger_->error(kSource, "no input source available");
}

int KioskRuntime::run() {
  if (!controller_)
    throw std::logic_error("[KioskRuntime] run() before initialize()");

  running_.store(true);
  logger_->info(kSource, "kiosk running");
  const auto start = std::chrono::steady_clock::now();

  while (running_.load()) {
    const auto now =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    tick(now);
    std::this_thread::sleep_for(kLoopSleep);
  }

  logger_->info(kSource, "kiosk stopping");
  return 0;
}

void KioskRuntime::tick(std::chrono::milliseconds now) {
  inputs_->poll(now);

  if (now >= nextPreview_) {
    nextPreview_ = now + config_.camera.previewInterval;
    const auto state = controller_->state();
    if (state == ScreenState::Attract || state == ScreenState::Template ||
        state == ScreenState::Countdown) {
      if (auto frame = capture_->capturePreviewFrame())
        hud_->onPreviewFrame(*frame);
    }
  }

  controller_->poll(now);
}

#pragma once
/** @file  KioskConfig.hpp
 *  @brief Typed view of the kiosk JSON config, with a default for every key.
 *
 *  © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "core/CaptureCoordinator.hpp"
#include "core/Logger.hpp"
#include "core/PrintDispatcher.hpp"
#include "core/SessionController.hpp"
#include "core/SessionState.hpp"
#include "imaging/Compositor.hpp"
#include "io/CameraBackend.hpp"

namespace booth::core {

  struct PathSettings {
    std::string photosDir;     ///< captures, artifacts, printer.json
    std::string templatesPath; ///< template catalog JSON
    std::string logDir;        ///< run_*.csv; defaults to <photosDir>/logs
  };

  struct CameraSettings {
    std::string primary{ "rpicam" };
    std::string secondary{ "opencv" }; ///< "" disables the fallback backend
    int deviceIndex{ 0 };              ///< V4L2 index for the opencv backend
    io::Resolution preview{ 1280, 720 };
    int framerate{ 15 };
    bool mirror{ true };
    std::string videoCommand{ "rpicam-vid" };
    std::string stillCommand{ "rpicam-still" };
    std::chrono::milliseconds previewInterval{ 50 };
    CaptureSettings capture;
  };

  struct ButtonBinding {
    std::string name;
    unsigned int line{ 0 };
    InputAction press{ InputAction::Enter };
    std::optional<InputAction> longPress;
  };

  struct GpioSettings {
    bool enabled{ true };
    std::string chip{ "/dev/gpiochip0" };
    bool activeLow{ true };
    std::chrono::milliseconds debounce{ 30 };
    std::chrono::milliseconds longPress{ 3000 };
    std::vector<ButtonBinding> buttons{
      { "next", 17, InputAction::Next, std::nullopt },
      { "enter", 27, InputAction::Enter, InputAction::Cancel },
      { "prev", 22, InputAction::Prev, std::nullopt },
      { "shutter", 23, InputAction::Shutter, std::nullopt },
    };
  };

  struct KeyboardSettings {
    bool enabled{ true };
    std::string device{ "/dev/tty" };
  };

  struct PrintSettings {
    std::string command{ "lp" };
    PrintOptions options;
    std::chrono::seconds timeout{ 60 };
  };

  /**
 * @struct KioskConfig
 * @brief Whole-process settings.
 *
 *  * `load()` on a missing file returns defaults; a file that exists but does
 *    not parse or has a wrongly typed key throws `std::runtime_error`.
 *  * `PHOTOBOOTH_PHOTOS_DIR` / `PHOTOBOOTH_TEMPLATES_PATH` beat the file.
 */
  struct KioskConfig {
    PathSettings paths;
    imaging::CompositorSettings compositor;
    SessionTimings timings;
    CameraSettings camera;
    GpioSettings gpio;
    KeyboardSettings keyboard;
    PrintSettings print;
    LogLevel consoleLevel{ LogLevel::Info };
    bool loadedFromFile{ false };

    static KioskConfig defaults();
    static KioskConfig fromJson(const nlohmann::json& doc);
    static KioskConfig load(const std::string& path);

    /// Apply environment overrides and derive dependent defaults (log dir).
    void finalize();
  };

  std::optional<LogLevel> logLevelFromString(const std::string& name);

} // namespace booth::core

/* @file KioskConfig.cpp
 * @brief JSON -> KioskConfig mapping and validation.
 *
 * © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

// STL headers
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>

// 3rd-party headers
#include <nlohmann/json.hpp>

// Booth headers
#include "core/ConfigLoader.hpp"
#include "core/KioskConfig.hpp"

using namespace booth::core;
using nlohmann::json;

namespace {

  std::string homeDirectory() {
    const char* home = std::getenv("HOME");
    return home && *home ? home : ".";
  }

  [[noreturn]] void fail(const std::string& what) {
    throw std::runtime_error("[KioskConfig] " + what);
  }

  const json& section(const json& doc, const char* name) {
    static const json empty = json::object();
    auto it = doc.find(name);
    if (it == doc.end())
      return empty;
    if (!it->is_object())
      fail(std::string("\"") + name + "\" must be an object");
    return *it;
  }

  booth::io::Resolution resolution(const json& obj, const char* key, booth::io::Resolution fallback) {
    auto it = obj.find(key);
    if (it == obj.end())
      return fallback;
    if (!it->is_array() || it->size() != 2)
      fail(std::string("\"") + key + "\" must be [width, height]");
    booth::io::Resolution r{ it->at(0).get<int>(), it->at(1).get<int>() };
    if (r.width <= 0 || r.height <= 0)
      fail(std::string("\"") + key + "\" must be positive");
    return r;
  }

  InputAction action(const std::string& name) {
    auto a = actionFromString(name);
    if (!a)
      fail("unknown input action \"" + name + "\"");
    return *a;
  }

  void parsePaths(const json& s, PathSettings& p) {
    p.photosDir = s.value("photos", p.photosDir);
    p.templatesPath = s.value("templates", p.templatesPath);
    p.logDir = s.value("logs", p.logDir);
  }

  void parseCanvas(const json& s, booth::imaging::CompositorSettings& c) {
    c.canvasWidth = s.value("width", c.canvasWidth);
    c.canvasHeight = s.value("height", c.canvasHeight);
    if (c.canvasWidth <= 0 || c.canvasHeight <= 0)
      fail("canvas size must be positive");
    if (auto it = s.find("background"); it != s.end()) {
      if (!it->is_array() || it->size() != 3)
        fail("canvas.background must be [r, g, b]");
      std::uint8_t rgb[3];
      for (std::size_t k = 0; k < 3; ++k) {
        const int v = it->at(k).get<int>();
        if (v < 0 || v > 255)
          fail("canvas.background components must be 0..255");
        rgb[k] = static_cast<std::uint8_t>(v);
      }
      c.backgroundColor = { rgb[0], rgb[1], rgb[2] };
    }
  }

  void parseCompose(const json& s, booth::imaging::CompositorSettings& c) {
    if (auto it = s.find("placement"); it != s.end()) {
      auto p = booth::imaging::placementFromString(it->get<std::string>());
      if (!p)
        fail("unknown placement \"" + it->get<std::string>() + "\"");
      c.placement = *p;
    }
    if (auto it = s.find("noise"); it != s.end()) {
      auto n = booth::imaging::noiseFromString(it->get<std::string>());
      if (!n)
        fail("unknown noise intensity \"" + it->get<std::string>() + "\"");
      c.noise = *n;
    }
    c.noiseSeed = s.value("noise_seed", c.noiseSeed);
    c.jpegQuality = s.value("jpeg_quality", c.jpegQuality);
    if (c.jpegQuality < 1 || c.jpegQuality > 100)
      fail("compose.jpeg_quality must be 1..100");
  }

  void parseTiming(const json& s, SessionTimings& t) {
    using namespace std::chrono;
    t.countdownStart = s.value("countdown_seconds", t.countdownStart);
    t.quickReview = milliseconds(s.value("quick_review_ms", t.quickReview.count()));
    t.inactivityTimeout =
        seconds(s.value("inactivity_seconds", duration_cast<seconds>(t.inactivityTimeout).count()));
    t.postPrintReturn = seconds(
        s.value("post_print_return_seconds", duration_cast<seconds>(t.postPrintReturn).count()));
    if (t.countdownStart < 1)
      fail("timing.countdown_seconds must be >= 1");
    if (t.quickReview.count() < 0 || t.inactivityTimeout.count() <= 0 || t.postPrintReturn.count() < 0)
      fail("timing values must not be negative");
  }

  void parseCamera(const json& s, CameraSettings& c) {
    c.primary = s.value("primary", c.primary);
    c.secondary = s.value("secondary", c.secondary);
    c.deviceIndex = s.value("device_index", c.deviceIndex);
    c.preview = resolution(s, "preview", c.preview);
    c.capture.still = resolution(s, "still", c.capture.still);
    c.framerate = s.value("framerate", c.framerate);
    c.mirror = s.value("mirror", c.mirror);
    c.videoCommand = s.value("video_command", c.videoCommand);
    c.stillCommand = s.value("still_command", c.stillCommand);
    c.previewInterval = std::chrono::milliseconds(s.value("preview_interval_ms", c.previewInterval.count()));
    c.capture.previewFailureThreshold = s.value("failure_threshold", c.capture.previewFailureThreshold);
    c.capture.jpegQuality = s.value("still_quality", c.capture.jpegQuality);
    if (c.primary.empty())
      fail("camera.primary must name a backend");
    if (c.previewInterval.count() <= 0)
      fail("camera.preview_interval_ms must be positive");
  }

  void parseGpio(const json& s, GpioSettings& g) {
    g.enabled = s.value("enabled", g.enabled);
    g.chip = s.value("chip", g.chip);
    g.activeLow = s.value("active_low", g.activeLow);
    g.debounce = std::chrono::milliseconds(s.value("debounce_ms", g.debounce.count()));
    g.longPress = std::chrono::milliseconds(s.value("long_press_ms", g.longPress.count()));

    auto it = s.find("buttons");
    if (it == s.end())
      return;
    if (!it->is_array())
      fail("gpio.buttons must be an array");
    g.buttons.clear();
    for (const auto& b : *it) {
      ButtonBinding binding;
      binding.name = b.value("name", std::string{});
      binding.line = b.at("line").get<unsigned int>();
      binding.press = action(b.at("action").get<std::string>());
      if (auto l = b.find("long_action"); l != b.end())
        binding.longPress = action(l->get<std::string>());
      if (binding.name.empty())
        binding.name = toString(binding.press);
      g.buttons.push_back(std::move(binding));
    }
  }

  void parseKeyboard(const json& s, KeyboardSettings& k) {
    k.enabled = s.value("enabled", k.enabled);
    k.device = s.value("device", k.device);
  }

  void parsePrint(const json& s, PrintSettings& p) {
    p.command = s.value("command", p.command);
    if (auto it = s.find("options"); it != s.end())
      p.options.flags = it->get<std::vector<std::string>>();
    p.timeout = std::chrono::seconds(s.value("timeout_seconds", p.timeout.count()));
    if (p.command.empty())
      fail("print.command must not be empty");
  }

} // namespace

std::optional<LogLevel> booth::core::logLevelFromString(const std::string& name) {
  for (auto l : { LogLevel::Debug, LogLevel::Info, LogLevel::Warn, LogLevel::Error }) {
    std::string s = toString(l);
    for (auto& ch : s)
      ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    if (s == name)
      return l;
  }
  return std::nullopt;
}

KioskConfig KioskConfig::defaults() {
  KioskConfig cfg;
  cfg.paths.photosDir = homeDirectory() + "/photobooth/data/photos";
  cfg.paths.templatesPath = "templates/index.json";
  return cfg;
}

KioskConfig KioskConfig::fromJson(const json& doc) {
  if (!doc.is_object())
    fail("top level must be an object");

  KioskConfig cfg = defaults();
  try {
    parsePaths(section(doc, "paths"), cfg.paths);
    parseCanvas(section(doc, "canvas"), cfg.compositor);
    parseCompose(section(doc, "compose"), cfg.compositor);
    parseTiming(section(doc, "timing"), cfg.timings);
    parseCamera(section(doc, "camera"), cfg.camera);
    parseGpio(section(doc, "gpio"), cfg.gpio);
    parseKeyboard(section(doc, "keyboard"), cfg.keyboard);
    parsePrint(section(doc, "print"), cfg.print);

    const auto& log = section(doc, "log");
    if (auto it = log.find("console_level"); it != log.end()) {
      auto level = logLevelFromString(it->get<std::string>());
      if (!level)
        fail("unknown log level \"" + it->get<std::string>() + "\"");
      cfg.consoleLevel = *level;
    }
  } catch (const json::exception& e) {
    fail(e.what());
  }
  cfg.loadedFromFile = true;
  return cfg;
}

KioskConfig KioskConfig::load(const std::string& path) {
  ConfigLoader loader(path);
  KioskConfig cfg;
  if (!loader.exists()) {
    std::cerr << "[KioskConfig] " << path << " not found, using defaults\n";
    cfg = defaults();
  } else {
    cfg = fromJson(loader.load());
  }
  cfg.finalize();
  return cfg;
}

void KioskConfig::finalize() {
  if (const char* dir = std::getenv("PHOTOBOOTH_PHOTOS_DIR"); dir && *dir)
    paths.photosDir = dir;
  if (const char* tpl = std::getenv("PHOTOBOOTH_TEMPLATES_PATH"); tpl && *tpl)
    paths.templatesPath = tpl;
  if (paths.logDir.empty())
    paths.logDir = (std::filesystem::path(paths.photosDir) / "logs").string();
}

// Booth-Prod headers
#include "core/ConfigLoader.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/KioskConfig.hpp"
#include "core/Logger.hpp"
#include "core/PrinterSettings.hpp"
#include "core/RingBuffer.hpp"
#include "io/FileLogger.hpp"
#include "io/PhotoStore.hpp"

// Booth-Fake headers
#include "MockCollaborators.hpp"
#include "TempDir.hpp"

// 3rd-party headers
#include <nlohmann/json.hpp>

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <thread>

using namespace booth::core;
using booth::test::MockErrorMonitor;
using booth::test::TempDir;

namespace {
  std::string slurp(const std::filesystem::path& p) {
    std::ifstream in(p);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }

  void spit(const std::filesystem::path& p, const std::string& text) {
    std::ofstream out(p);
    out << text;
  }
} // namespace

// ---------------------------------------------------------------------------
// RingBuffer
// ---------------------------------------------------------------------------

TEST(ring_buffer, keeps_fifo_order_and_rejects_when_full) {
  RingBuffer<int> rb(3);
  EXPECT_TRUE(rb.push(1));
  EXPECT_TRUE(rb.push(2));
  EXPECT_TRUE(rb.push(3));
  EXPECT_FALSE(rb.push(4));
  EXPECT_EQ(rb.size(), 3u);

  EXPECT_EQ(rb.tryPop().value_or(-1), 1);
  EXPECT_TRUE(rb.push(5)); // wraps around
  EXPECT_EQ(rb.tryPop().value_or(-1), 2);
  EXPECT_EQ(rb.tryPop().value_or(-1), 3);
  EXPECT_EQ(rb.tryPop().value_or(-1), 5);
  EXPECT_FALSE(rb.tryPop().has_value());
}

TEST(ring_buffer, popFor_times_out_on_empty_and_wakes_on_push) {
  RingBuffer<int> rb(4);
  EXPECT_FALSE(rb.popFor(std::chrono::milliseconds{ 10 }).has_value());

  std::thread producer([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds{ 20 });
    rb.push(42);
  });
  auto v = rb.popFor(std::chrono::seconds{ 2 });
  producer.join();
  ASSERT_TRUE(v.has_value());
  EXPECT_EQ(*v, 42);
}

// ---------------------------------------------------------------------------
// ErrorMonitor
// ---------------------------------------------------------------------------

TEST(error_monitor, escalates_each_message_once_until_reset) {
  ErrorMonitor monitor;
  std::vector<std::string> escalated;
  monitor.registerEscalation([&](const std::string& m) { escalated.push_back(m); });

  monitor.notifyFailure("camera gone");
  monitor.notifyFailure("camera gone");
  monitor.notifyFailure("printer offline");
  EXPECT_EQ(escalated.size(), 2u);
  EXPECT_EQ(monitor.uniqueFailures(), 2u);

  monitor.reset();
  monitor.notifyFailure("camera gone");
  EXPECT_EQ(escalated.size(), 3u);
}

TEST(error_monitor, can_be_mocked_by_subsystems) {
  testing::StrictMock<MockErrorMonitor> monitor;
  EXPECT_CALL(monitor, notifyFailure("boom")).Times(1);
  ErrorMonitor& base = monitor;
  base.notifyFailure("boom");
}

// ---------------------------------------------------------------------------
// ConfigLoader
// ---------------------------------------------------------------------------

TEST(config_loader, parses_existing_file) {
  TempDir dir;
  spit(dir / "cfg.json", R"({"a": 1})");
  ConfigLoader loader((dir / "cfg.json").string());
  EXPECT_TRUE(loader.exists());
  EXPECT_EQ(loader.load().at("a").get<int>(), 1);
}

TEST(config_loader, throws_on_missing_and_corrupt_files) {
  TempDir dir;
  ConfigLoader missing((dir / "nope.json").string());
  EXPECT_FALSE(missing.exists());
  EXPECT_THROW(missing.load(), std::runtime_error);

  spit(dir / "bad.json", "{ not json");
  ConfigLoader corrupt((dir / "bad.json").string());
  EXPECT_THROW(corrupt.load(), std::runtime_error);
}

// ---------------------------------------------------------------------------
// Logger / FileLogger
// ---------------------------------------------------------------------------

TEST(logger, formats_csv_with_escaping) {
  LogEvent ev{ std::chrono::system_clock::time_point{ std::chrono::milliseconds{ 1500 } },
               LogLevel::Warn, "Camera", "frame, dropped \"late\"" };
  EXPECT_EQ(Logger::formatCsv(ev), "1500,WARN,Camera,\"frame, dropped \"\"late\"\"\"\n");
}

TEST(logger, writes_run_file_and_flushes_on_finish) {
  TempDir dir;
  Logger logger;
  logger.setConsoleLevel(LogLevel::Error);
  ASSERT_TRUE(logger.startNewRun(dir.path().string()));
  logger.info("SessionController", "session started");
  logger.warn("CaptureCoordinator", "preview stalled");
  logger.finishRun();

  const auto text = slurp(logger.runPath());
  EXPECT_NE(text.find("INFO,SessionController,session started"), std::string::npos);
  EXPECT_NE(text.find("WARN,CaptureCoordinator,preview stalled"), std::string::npos);
  EXPECT_EQ(std::filesystem::path(logger.runPath()).parent_path(), dir.path());
}

TEST(file_logger, appends_and_reports_open_state) {
  TempDir dir;
  booth::io::FileLogger file;
  EXPECT_FALSE(file.isOpen());
  ASSERT_TRUE(file.open((dir / "x.log").string()));
  file.write("one\n");
  file.write("two\n");
  file.close();
  EXPECT_EQ(slurp(dir / "x.log"), "one\ntwo\n");
}

// ---------------------------------------------------------------------------
// KioskConfig
// ---------------------------------------------------------------------------

TEST(kiosk_config, defaults_match_the_booth_hardware) {
  auto cfg = KioskConfig::defaults();
  EXPECT_EQ(cfg.compositor.canvasWidth, 2480);
  EXPECT_EQ(cfg.compositor.canvasHeight, 3508);
  EXPECT_EQ(cfg.timings.countdownStart, 10);
  EXPECT_EQ(cfg.timings.inactivityTimeout, std::chrono::seconds{ 90 });
  ASSERT_EQ(cfg.gpio.buttons.size(), 4u);
  EXPECT_EQ(cfg.gpio.buttons[1].line, 27u);
  ASSERT_TRUE(cfg.gpio.buttons[1].longPress.has_value());
  EXPECT_EQ(*cfg.gpio.buttons[1].longPress, InputAction::Cancel);
  EXPECT_EQ(cfg.print.options.flags,
            (std::vector<std::string>{ "media=A4.Borderless", "fit-to-page=false" }));
}

TEST(kiosk_config, reads_sections_and_keeps_defaults_for_the_rest) {
  auto doc = nlohmann::json::parse(R"({
    "paths":   { "photos": "/srv/photos", "templates": "/srv/templates.json" },
    "canvas":  { "width": 1200, "height": 1800, "background": [10, 20, 30] },
    "compose": { "placement": "fit_inside", "noise": "heavy" },
    "timing":  { "countdown_seconds": 5, "quick_review_ms": 3000 },
    "camera":  { "primary": "opencv", "secondary": "", "still": [640, 480] },
    "gpio":    { "buttons": [ { "line": 5, "action": "shutter" } ] },
    "print":   { "options": ["media=4x6"] },
    "log":     { "console_level": "debug" }
  })");
  auto cfg = KioskConfig::fromJson(doc);

  EXPECT_EQ(cfg.paths.photosDir, "/srv/photos");
  EXPECT_EQ(cfg.compositor.canvasWidth, 1200);
  EXPECT_EQ(cfg.compositor.backgroundColor.b, 30);
  EXPECT_EQ(cfg.compositor.placement, booth::imaging::PlacementPolicy::FitInside);
  EXPECT_EQ(cfg.compositor.noise, booth::imaging::NoiseIntensity::Heavy);
  EXPECT_EQ(cfg.timings.countdownStart, 5);
  EXPECT_EQ(cfg.timings.quickReview, std::chrono::milliseconds{ 3000 });
  EXPECT_EQ(cfg.timings.postPrintReturn, std::chrono::seconds{ 10 });
  EXPECT_EQ(cfg.camera.primary, "opencv");
  EXPECT_TRUE(cfg.camera.secondary.empty());
  EXPECT_EQ(cfg.camera.capture.still.width, 640);
  ASSERT_EQ(cfg.gpio.buttons.size(), 1u);
  EXPECT_EQ(cfg.gpio.buttons[0].name, "shutter");
  EXPECT_EQ(cfg.gpio.buttons[0].press, InputAction::Shutter);
  EXPECT_EQ(cfg.print.options.flags, std::vector<std::string>{ "media=4x6" });
  EXPECT_EQ(cfg.consoleLevel, LogLevel::Debug);
  EXPECT_TRUE(cfg.loadedFromFile);
}

TEST(kiosk_config, rejects_unknown_names_and_wrong_types) {
  using nlohmann::json;
  EXPECT_THROW(KioskConfig::fromJson(json::parse(R"({"compose":{"placement":"stretch"}})")),
               std::runtime_error);
  EXPECT_THROW(KioskConfig::fromJson(json::parse(R"({"timing":{"countdown_seconds":"ten"}})")),
               std::runtime_error);
  EXPECT_THROW(KioskConfig::fromJson(json::parse(R"({"gpio":{"buttons":[{"line":1,"action":"jump"}]}})")),
               std::runtime_error);
  EXPECT_THROW(KioskConfig::fromJson(json::parse(R"({"canvas":{"width":0}})")), std::runtime_error);
  EXPECT_THROW(KioskConfig::fromJson(json::parse(R"({"canvas":{"background":[300,0,0]}})")),
               std::runtime_error);
  EXPECT_THROW(KioskConfig::fromJson(json::parse(R"({"canvas":{"background":[0,-1,0]}})")),
               std::runtime_error);
  EXPECT_THROW(KioskConfig::fromJson(json::parse("[]")), std::runtime_error);
}

TEST(kiosk_config, missing_file_gives_defaults_and_environment_wins) {
  TempDir dir;
  ::setenv("PHOTOBOOTH_PHOTOS_DIR", dir.path().c_str(), 1);
  ::setenv("PHOTOBOOTH_TEMPLATES_PATH", "/etc/booth/templates.json", 1);
  auto cfg = KioskConfig::load((dir / "absent.json").string());
  ::unsetenv("PHOTOBOOTH_PHOTOS_DIR");
  ::unsetenv("PHOTOBOOTH_TEMPLATES_PATH");

  EXPECT_FALSE(cfg.loadedFromFile);
  EXPECT_EQ(cfg.paths.photosDir, dir.path().string());
  EXPECT_EQ(cfg.paths.templatesPath, "/etc/booth/templates.json");
  EXPECT_EQ(cfg.paths.logDir, (dir.path() / "logs").string());
}

TEST(kiosk_config, corrupt_file_is_fatal) {
  TempDir dir;
  spit(dir / "cfg.json", "{ \"paths\": ");
  EXPECT_THROW(KioskConfig::load((dir / "cfg.json").string()), std::runtime_error);
}

// ---------------------------------------------------------------------------
// PrinterSettings / PhotoStore
// ---------------------------------------------------------------------------

TEST(printer_settings, persists_preference_as_json) {
  TempDir dir;
  PrinterSettings settings((dir / "printer.json").string());
  settings.load();
  EXPECT_FALSE(settings.printer().has_value());

  ASSERT_TRUE(settings.save("Canon_SELPHY"));
  EXPECT_EQ(nlohmann::json::parse(slurp(dir / "printer.json")).at("printer"), "Canon_SELPHY");

  PrinterSettings reloaded((dir / "printer.json").string());
  reloaded.load();
  EXPECT_EQ(reloaded.printer().value_or(""), "Canon_SELPHY");

  ASSERT_TRUE(reloaded.save(""));
  EXPECT_FALSE(reloaded.printer().has_value());
}

TEST(printer_settings, corrupt_file_means_default_printer) {
  TempDir dir;
  spit(dir / "printer.json", "printer=foo");
  PrinterSettings settings((dir / "printer.json").string());
  settings.load();
  EXPECT_FALSE(settings.printer().has_value());
}

TEST(photo_store, dates_captures_and_never_overwrites) {
  TempDir dir;
  booth::io::PhotoStore store(dir.path());
  const auto when = std::chrono::system_clock::now();

  auto first = store.capturePath(1, when);
  EXPECT_EQ(first.extension(), ".jpg");
  EXPECT_EQ(first.filename().string().substr(6), "_1.jpg");
  EXPECT_TRUE(std::filesystem::is_directory(first.parent_path()));
  EXPECT_EQ(first.parent_path().parent_path().parent_path().parent_path(), dir.path());

  spit(first, "x");
  auto second = store.capturePath(1, when);
  EXPECT_NE(first, second);
  EXPECT_EQ(second.stem().string(), first.stem().string() + "-1");

  auto artifact = store.artifactPath(when);
  EXPECT_EQ(artifact.filename().string().rfind("A4_", 0), 0u);
  EXPECT_EQ(store.printerPreferencePath(), dir.path() / "printer.json");
}

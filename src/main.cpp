/* @file main.cpp
 * @brief photobooth [config.json] [--printer NAME]
 *
 * © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

// Booth headers
#include "core/KioskConfig.hpp"
#include "core/KioskRuntime.hpp"
#include "core/Logger.hpp"
#include "core/PrinterSettings.hpp"
#include "io/PhotoStore.hpp"

using namespace booth;

namespace {

  std::atomic<core::KioskRuntime*> gRuntime{ nullptr };

  void onSignal(int) {
    if (auto* rt = gRuntime.load())
      rt->stop();
  }

  void usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [config.json] [--printer NAME]\n"
              << "  --printer NAME  save NAME as the default printer (\"\" = system default) and exit\n";
  }

  int savePrinter(const core::KioskConfig& cfg, const std::string& name) {
    std::error_code ec;
    std::filesystem::create_directories(cfg.paths.photosDir, ec);
    if (ec) {
      std::cerr << "[main] cannot create " << cfg.paths.photosDir << ": " << ec.message() << "\n";
      return 1;
    }
    io::PhotoStore store(cfg.paths.photosDir);
    core::PrinterSettings settings(store.printerPreferencePath().string());
    if (!settings.save(name))
      return 1;
    std::cout << "printer preference: " << (name.empty() ? "<system default>" : name) << "\n";
    return 0;
  }

} // namespace

int main(int argc, char** argv) {
  std::string configPath = "photobooth.json";
  std::optional<std::string> printer;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--printer") {
      if (i + 1 >= argc) {
        usage(argv[0]);
        return 2;
      }
      printer = argv[++i];
    } else if (arg == "-h" || arg == "--help") {
      usage(argv[0]);
      return 0;
    } else if (!arg.empty() && arg[0] == '-') {
      usage(argv[0]);
      return 2;
    } else {
      configPath = arg;
    }
  }

  core::KioskConfig cfg;
  try {
    cfg = core::KioskConfig::load(configPath);
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  if (printer)
    return savePrinter(cfg, *printer);

  auto logger = std::make_shared<core::Logger>();
  logger->setConsoleLevel(cfg.consoleLevel);
  if (!logger->startNewRun(cfg.paths.logDir))
    std::cerr << "[main] run log disabled, console only\n";

  int rc = 0;
  try {
    core::KioskRuntime runtime(cfg, logger);
    runtime.initialize();

    gRuntime.store(&runtime);
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    rc = runtime.run();

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    gRuntime.store(nullptr);
  } catch (const std::exception& e) {
    gRuntime.store(nullptr);
    logger->error("main", e.what());
    rc = 1;
  }

  logger->finishRun();
  return rc;
}

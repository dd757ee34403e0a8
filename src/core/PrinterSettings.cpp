/* @file PrinterSettings.cpp
 *
 * © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

// STL headers
#include <fstream>
#include <iostream>

// 3rd-party headers
#include <nlohmann/json.hpp>

// Booth headers
#include "core/ConfigLoader.hpp"
#include "core/PrinterSettings.hpp"

using namespace booth::core;

PrinterSettings::PrinterSettings(std::string path) : path_(std::move(path)) {}

void PrinterSettings::load() {
  name_.clear();
  ConfigLoader loader(path_);
  if (!loader.exists())
    return;
  try {
    auto doc = loader.load();
    if (doc.is_object())
      name_ = doc.value("printer", std::string{});
  } catch (const std::exception& e) {
    std::cerr << "[PrinterSettings] ignoring " << path_ << ": " << e.what() << "\n";
  }
}

bool PrinterSettings::save(const std::string& name) {
  std::ofstream out(path_, std::ios::trunc);
  if (!out) {
    std::cerr << "[PrinterSettings] cannot write " << path_ << "\n";
    return false;
  }
  out << nlohmann::json{ { "printer", name } }.dump();
  if (!out)
    return false;
  name_ = name;
  return true;
}

std::optional<std::string> PrinterSettings::printer() const {
  if (name_.empty())
    return std::nullopt;
  return name_;
}

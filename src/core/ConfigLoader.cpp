/* @file ConfigLoader.cpp
 * @brief JSON file -> nlohmann::json, throwing on IO or parse errors
 *
 * © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

// STL headers
#include <filesystem>
#include <fstream>
#include <stdexcept>

// 3rd-party headers
#include <nlohmann/json.hpp>

// Booth headers
#include "core/ConfigLoader.hpp"

using namespace booth::core;

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

bool ConfigLoader::exists() const {
  std::error_code ec;
  return std::filesystem::is_regular_file(path_, ec);
}

nlohmann::json ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw std::runtime_error("[ConfigLoader] cannot open " + path_);

  try {
    return nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("[ConfigLoader] " + path_ + ": " + e.what());
  }
}

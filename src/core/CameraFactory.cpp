/* @file CameraFactory.cpp
 *
 * © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <stdexcept>

// Booth headers
#include "core/CameraFactory.hpp"
#include "io/CameraBackend.hpp"

using namespace booth::core;

bool CameraFactory::registerBackend(const std::string& name, Creator maker) {
  if (!maker)
    return false;
  return creators_.emplace(name, std::move(maker)).second;
}

std::unique_ptr<booth::io::CameraBackend> CameraFactory::create(const std::string& name) const {
  auto it = creators_.find(name);
  if (it == creators_.end())
    throw std::out_of_range("[CameraFactory] unknown camera backend: " + name);
  return it->second();
}

std::vector<std::string> CameraFactory::names() const {
  std::vector<std::string> out;
  for (const auto& [name, _] : creators_)
    out.push_back(name);
  std::sort(out.begin(), out.end());
  return out;
}

/* @file SelectionModel.cpp
 *
 * © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

// STL headers
#include <algorithm>

// Booth headers
#include "core/SelectionModel.hpp"

using namespace booth::core;

void SelectionModel::reset(std::size_t captureCount, std::size_t capacity) {
  captureCount_ = captureCount;
  capacity_ = capacity;
  cursor_ = 0;
  selected_.clear();
}

void SelectionModel::moveCursor(int delta) {
  if (captureCount_ == 0) {
    cursor_ = 0;
    return;
  }
  const long long last = static_cast<long long>(captureCount_) - 1;
  long long next = static_cast<long long>(cursor_) + delta;
  cursor_ = static_cast<std::size_t>(std::clamp(next, 0LL, last));
}

bool SelectionModel::toggleAtCursor() {
  if (captureCount_ == 0)
    return false;

  auto it = std::find(selected_.begin(), selected_.end(), cursor_);
  if (it != selected_.end()) {
    selected_.erase(it);
    return true;
  }
  if (selected_.size() >= capacity_)
    return false;
  selected_.push_back(cursor_);
  return true;
}

bool SelectionModel::isSelected(std::size_t index) const {
  return std::find(selected_.begin(), selected_.end(), index) != selected_.end();
}

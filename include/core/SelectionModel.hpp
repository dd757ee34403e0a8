#pragma once
/** @file  SelectionModel.hpp
 *  @brief Cursor + bounded pick set over the session's captures.
 *
 *  © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

#include <cstddef>
#include <vector>

namespace booth::core {

  /**
 * @class SelectionModel
 * @brief Pure in-memory; lives inside CaptureSession.
 *
 *  * Cursor is clamped to `[0, captureCount-1]`, never wraps.
 *  * `selected()` keeps selection order, which is the slot order at compose time.
 *  * Toggling beyond capacity is a silent no-op.
 */
  class SelectionModel {
  public:
    SelectionModel() = default;

    /// Start over for \p captureCount photos and \p capacity slots.
    void reset(std::size_t captureCount, std::size_t capacity);
    void clear() { reset(0, 0); }

    void moveCursor(int delta);

    /** @returns true if the selection changed. */
    bool toggleAtCursor();

    bool isSelected(std::size_t index) const;
    bool isFull() const { return capacity_ > 0 && selected_.size() == capacity_; }

    std::size_t cursor() const { return cursor_; }
    std::size_t capacity() const { return capacity_; }
    std::size_t captureCount() const { return captureCount_; }
    const std::vector<std::size_t>& selected() const { return selected_; }

  private:
    std::size_t captureCount_{ 0 };
    std::size_t capacity_{ 0 };
    std::size_t cursor_{ 0 };
    std::vector<std::size_t> selected_;
  };

} // namespace booth::core

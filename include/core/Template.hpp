#pragma once
/** @file  Template.hpp
 *  @brief Print-page layout definitions (slots + placement rects).
 *
 *  © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace booth {
  namespace core {

    inline constexpr int kMinSlots = 1;
    inline constexpr int kMaxSlots = 4;
    inline constexpr int kMarginShots = 2; ///< extra takes beyond the slot count

    /** Canvas-relative placement rectangle, percentages, origin top-left, y-down. */
    struct Rect {
      float leftPct{ 0.f };
      float topPct{ 0.f };
      float widthPct{ 100.f };
      float heightPct{ 100.f };
    };

    /**
 * @struct Template
 * @brief Immutable once loaded; `rects.size() == slots` is guaranteed by TemplateCatalog.
 */
    struct Template {
      std::string id;
      std::string name;
      int slots{ 1 };
      std::vector<Rect> rects;
      std::optional<std::filesystem::path> background;
      bool vintageEffect{ false };

      /// Photos to take for this layout.
      int toTake() const { return slots + kMarginShots; }
    };

  } // namespace core
} // namespace booth

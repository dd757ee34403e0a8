#pragma once
/** @file  Compositor.hpp
 *  @brief Lays selected photos onto a fixed-size print page following a Template.
 *
 *  © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <opencv2/core.hpp>

#include "core/PhotoRef.hpp"
#include "core/Template.hpp"
#include "imaging/Filters.hpp"

namespace booth {
  namespace core {
    class Logger;
  } // namespace core

  namespace io {
    class PhotoStore;
  } // namespace io

  namespace imaging {

    enum class PlacementPolicy : std::uint8_t {
      FillCrop,  ///< scale to cover, centre-crop overflow (canonical)
      FitInside, ///< scale to fit, centre, background shows around the photo
    };

    std::optional<PlacementPolicy> placementFromString(const std::string& name);

    struct CompositorSettings {
      int canvasWidth{ 2480 }; ///< A4 portrait at 300 dpi
      int canvasHeight{ 3508 };
      Rgb backgroundColor{ 34, 34, 34 };
      PlacementPolicy placement{ PlacementPolicy::FillCrop };
      NoiseIntensity noise{ NoiseIntensity::Medium };
      std::uint64_t noiseSeed{ 0x5eed };
      int jpegQuality{ 95 };
    };

    struct ComposedArtifact {
      core::PhotoRef photo;
      FilterKind filter{ FilterKind::None };
      std::size_t placed{ 0 };
      std::vector<std::size_t> skippedSlots; ///< slots left empty (unreadable photo)
    };

    /**
 * @class Compositor
 * @brief Deterministic page renderer + artifact writer.
 *
 *  * Photos zip with `template.rects` positionally; extras on either side are ignored.
 *  * Filters touch photos only, never the background art.
 *  * An unreadable photo leaves its slot empty and composition continues.
 *  * Every `compose()` writes a fresh file; previous artifacts stay on disk.
 */
    class Compositor {
    public:
      Compositor(CompositorSettings settings, io::PhotoStore& store,
                 std::shared_ptr<core::Logger> logger);
      virtual ~Compositor() = default;

      /// Render and persist; throws `std::runtime_error` if the page cannot be written.
      virtual ComposedArtifact compose(const std::vector<core::PhotoRef>& photos, FilterKind filter,
                                       const core::Template& tpl);

      /// Pure render, no IO besides reading inputs. \p skipped receives empty slot indices.
      cv::Mat render(const std::vector<core::PhotoRef>& photos, FilterKind filter,
                     const core::Template& tpl, std::vector<std::size_t>* skipped = nullptr) const;

      cv::Mat background(const core::Template& tpl) const;

      const CompositorSettings& settings() const { return settings_; }

      /// Percent rect -> pixel rect on a canvas of \p canvas (truncating, like the layout tool).
      static cv::Rect toPixelRect(const core::Rect& r, cv::Size canvas);

      /**
       * @brief Scale \p photo for \p slot under \p policy.
       * @returns the scaled (and for fill-crop, cropped) image plus its offset inside the slot.
       */
      static std::pair<cv::Mat, cv::Point> fitToSlot(const cv::Mat& photo, cv::Size slot,
                                                     PlacementPolicy policy);

    private:
      CompositorSettings settings_;
      io::PhotoStore& store_;
      std::shared_ptr<core::Logger> logger_;
    };

  } // namespace imaging
} // namespace booth

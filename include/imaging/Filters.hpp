#pragma once
/** @file  Filters.hpp
 *  @brief Per-photo looks: black & white, sepia duotone, vintage newspaper.
 *
 *  © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

#include <array>
#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>

#include <opencv2/core.hpp>

namespace booth {
  namespace imaging {

    enum class FilterKind : std::uint8_t { None, BlackWhite, Sepia, Newspaper, Count };
    static_assert(static_cast<std::uint8_t>(FilterKind::Count) == 4,
                  "Filter count changed please update the cycle order below");

    /// Customer-facing cycle order.
    inline constexpr std::array<FilterKind, 4> kFilterCycle{ FilterKind::None, FilterKind::BlackWhite,
                                                             FilterKind::Sepia,
                                                             FilterKind::Newspaper };

    inline const char* toString(FilterKind f) {
      switch (f) {
      case FilterKind::None:
        return "none";
      case FilterKind::BlackWhite:
        return "black_white";
      case FilterKind::Sepia:
        return "sepia";
      case FilterKind::Newspaper:
        return "newspaper";
      default:
        return "unknown";
      }
    }

    std::optional<FilterKind> filterFromString(const std::string& name);

    /// `kFilterCycle[(index + delta) mod 4]` index arithmetic.
    std::size_t cycleFilter(std::size_t index, int delta);

    enum class NoiseIntensity : std::uint8_t { Light, Medium, Heavy };

    /// Gaussian σ of the newspaper grain: 15 / 25 / 35.
    double noiseSigma(NoiseIntensity intensity);

    std::optional<NoiseIntensity> noiseFromString(const std::string& name);

    /** RGB triple as written in design docs (#rrggbb), converted to BGR internally. */
    struct Rgb {
      std::uint8_t r, g, b;
    };

    /// Luminance, re-expanded to three channels.
    cv::Mat blackWhite(const cv::Mat& bgr);

    /// Desaturate, then map black -> \p dark and white -> \p light linearly.
    cv::Mat duotone(const cv::Mat& bgr, Rgb dark, Rgb light);

    cv::Mat sepia(const cv::Mat& bgr);

    /**
     * @brief Aged-print look.
     *
     * Duotone #1a1410 / #e8dcc8, contrast 75 %, zero-mean luminance grain,
     * Gaussian blur σ 0.3, brightness 92 %. \p seed makes the grain repeatable.
     */
    cv::Mat newspaper(const cv::Mat& bgr, NoiseIntensity intensity, std::uint64_t seed);

    /// Dispatch on \p kind; `None` returns \p bgr untouched (shared data).
    cv::Mat applyFilter(const cv::Mat& bgr, FilterKind kind, NoiseIntensity intensity,
                        std::uint64_t seed);

  } // namespace imaging
} // namespace booth

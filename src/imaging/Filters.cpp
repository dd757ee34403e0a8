/* @file Filters.cpp
 * @brief per-photo colour filters on 8-bit BGR images
 *
 * © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

// STL headers
#include <vector>

// 3rd-party headers
#include <opencv2/imgproc.hpp>

// Booth headers
#include "imaging/Filters.hpp"

namespace booth {
  namespace imaging {

    namespace {

      constexpr Rgb kSepiaDark{ 0x2e, 0x1f, 0x0f };
      constexpr Rgb kSepiaLight{ 0xf4, 0xe1, 0xc1 };
      constexpr Rgb kNewsDark{ 0x1a, 0x14, 0x10 };
      constexpr Rgb kNewsLight{ 0xe8, 0xdc, 0xc8 };

      constexpr double kNewsContrast = 0.75;
      constexpr double kNewsBlurSigma = 0.3;
      constexpr double kNewsBrightness = 0.92;

      cv::Mat toGray(const cv::Mat& bgr) {
        cv::Mat gray;
        if (bgr.channels() == 1)
          gray = bgr;
        else
          cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);
        return gray;
      }

      // Blend towards the mean luminance, like an enhance-contrast slider.
      void reduceContrast(cv::Mat& bgr, double factor) {
        const double mean = cv::mean(toGray(bgr))[0];
        bgr.convertTo(bgr, -1, factor, mean * (1.0 - factor));
      }

      void addLumaNoise(cv::Mat& bgr, double sigma, std::uint64_t seed) {
        cv::RNG rng(seed);
        cv::Mat noise(bgr.size(), CV_32F);
        rng.fill(noise, cv::RNG::NORMAL, 0.0, sigma);

        cv::Mat noise3;
        cv::merge(std::vector<cv::Mat>{ noise, noise, noise }, noise3);

        cv::Mat work;
        bgr.convertTo(work, CV_32FC3);
        work += noise3;
        work.convertTo(bgr, CV_8UC3); // saturates to [0,255]
      }

    } // namespace

    std::optional<FilterKind> filterFromString(const std::string& name) {
      for (auto f : kFilterCycle)
        if (name == toString(f))
          return f;
      return std::nullopt;
    }

    std::size_t cycleFilter(std::size_t index, int delta) {
      const long long n = static_cast<long long>(kFilterCycle.size());
      long long next = (static_cast<long long>(index) + delta) % n;
      if (next < 0)
        next += n;
      return static_cast<std::size_t>(next);
    }

    double noiseSigma(NoiseIntensity intensity) {
      switch (intensity) {
      case NoiseIntensity::Light:
        return 15.0;
      case NoiseIntensity::Heavy:
        return 35.0;
      case NoiseIntensity::Medium:
      default:
        return 25.0;
      }
    }

    std::optional<NoiseIntensity> noiseFromString(const std::string& name) {
      if (name == "light")
        return NoiseIntensity::Light;
      if (name == "medium")
        return NoiseIntensity::Medium;
      if (name == "heavy")
        return NoiseIntensity::Heavy;
      return std::nullopt;
    }

    cv::Mat blackWhite(const cv::Mat& bgr) {
      cv::Mat out;
      cv::cvtColor(toGray(bgr), out, cv::COLOR_GRAY2BGR);
      return out;
    }

    cv::Mat duotone(const cv::Mat& bgr, Rgb dark, Rgb light) {
      cv::Mat lut(1, 256, CV_8UC3);
      for (int i = 0; i < 256; ++i) {
        auto lerp = [i](std::uint8_t a, std::uint8_t b) {
          return cv::saturate_cast<uchar>(a + (b - a) * i / 255.0);
        };
        lut.at<cv::Vec3b>(0, i) = cv::Vec3b(lerp(dark.b, light.b), lerp(dark.g, light.g),
                                            lerp(dark.r, light.r));
      }

      cv::Mat gray3, out;
      cv::cvtColor(toGray(bgr), gray3, cv::COLOR_GRAY2BGR);
      cv::LUT(gray3, lut, out);
      return out;
    }

    cv::Mat sepia(const cv::Mat& bgr) { return duotone(bgr, kSepiaDark, kSepiaLight); }

    cv::Mat newspaper(const cv::Mat& bgr, NoiseIntensity intensity, std::uint64_t seed) {
      cv::Mat out = duotone(bgr, kNewsDark, kNewsLight);
      reduceContrast(out, kNewsContrast);
      addLumaNoise(out, noiseSigma(intensity), seed);
      cv::GaussianBlur(out, out, cv::Size(3, 3), kNewsBlurSigma);
      out.convertTo(out, -1, kNewsBrightness, 0.0);
      return out;
    }

    cv::Mat applyFilter(const cv::Mat& bgr, FilterKind kind, NoiseIntensity intensity,
                        std::uint64_t seed) {
      switch (kind) {
      case FilterKind::BlackWhite:
        return blackWhite(bgr);
      case FilterKind::Sepia:
        return sepia(bgr);
      case FilterKind::Newspaper:
        return newspaper(bgr, intensity, seed);
      case FilterKind::None:
      default:
        return bgr;
      }
    }

  } // namespace imaging
} // namespace booth

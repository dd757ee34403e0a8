#pragma once
/** @file  TemplateCatalog.hpp
 *  @brief Ordered, validated set of page templates loaded once at startup.
 *
 *  © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "core/Template.hpp"

namespace booth::core {

  class Logger;

  /**
 * @class TemplateCatalog
 * @brief Owns every Template for the process lifetime; hands out const references.
 *
 *  * Fails soft: a missing / corrupt file or an empty result yields the built-in
 *    single-slot full-canvas template.
 *  * Invalid elements are skipped one by one (logged), valid siblings survive.
 *  * Elements without `rects` get a stock layout for 1, 2 or 4 slots.
 */
  class TemplateCatalog {
  public:
    /// Read and validate \p path. Never throws.
    static TemplateCatalog load(const std::string& path, Logger& log);

    /// Validate an already-parsed document; relative backgrounds resolve against \p baseDir.
    static TemplateCatalog fromJson(const nlohmann::json& doc, const std::filesystem::path& baseDir,
                                    Logger& log);

    /// Parse one element or throw `std::invalid_argument` naming the problem.
    static Template parseTemplate(const nlohmann::json& element,
                                  const std::filesystem::path& baseDir);

    static Template fallbackTemplate();

    /// Stock rects for \p slots (1, 2 or 4); throws `std::invalid_argument` otherwise.
    static std::vector<Rect> stockRects(int slots);

    /// Circular step: `(index + delta) mod count`, never negative.
    static std::size_t cycle(std::size_t index, int delta, std::size_t count);

    const std::vector<Template>& templates() const { return templates_; }
    std::size_t size() const { return templates_.size(); }
    const Template& at(std::size_t index) const { return templates_.at(index); }
    const Template* find(const std::string& id) const;
    bool usingFallback() const { return fallback_; }

  private:
    TemplateCatalog(std::vector<Template> templates, bool fallback);

    std::vector<Template> templates_;
    bool fallback_{ false };
  };

} // namespace booth::core

/* @file TemplateCatalog.cpp
 * @brief template JSON validation, stock layouts and the built-in fallback
 *
 * © 2026 Photobooth Kiosk contributors — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <unordered_set>

// 3rd-party headers
#include <nlohmann/json.hpp>

// Booth headers
#include "core/ConfigLoader.hpp"
#include "core/Logger.hpp"
#include "core/TemplateCatalog.hpp"

using namespace booth::core;

namespace {

  constexpr const char* kTag = "TemplateCatalog";
  constexpr float kBoundsEpsilon = 0.01f; // tolerate rounding in hand-measured layouts

  Rect parseRect(const nlohmann::json& r) {
    if (!r.is_object())
      throw std::invalid_argument("rect is not an object");

    Rect rect;
    rect.leftPct = r.at("leftPct").get<float>();
    rect.topPct = r.at("topPct").get<float>();
    rect.widthPct = r.at("widthPct").get<float>();
    rect.heightPct = r.at("heightPct").get<float>();

    if (rect.widthPct <= 0.f || rect.heightPct <= 0.f)
      throw std::invalid_argument("rect width/height must be > 0");
    if (rect.leftPct < -kBoundsEpsilon || rect.topPct < -kBoundsEpsilon ||
        rect.leftPct + rect.widthPct > 100.f + kBoundsEpsilon ||
        rect.topPct + rect.heightPct > 100.f + kBoundsEpsilon)
      throw std::invalid_argument("rect leaves the [0,100] canvas");
    return rect;
  }

} // namespace

TemplateCatalog::TemplateCatalog(std::vector<Template> templates, bool fallback)
    : templates_(std::move(templates)), fallback_(fallback) {}

TemplateCatalog TemplateCatalog::load(const std::string& path, Logger& log) {
  ConfigLoader loader(path);
  try {
    auto doc = loader.load();
    return fromJson(doc, std::filesystem::path(path).parent_path(), log);
  } catch (const std::exception& e) {
    log.warn(kTag, std::string("using built-in template: ") + e.what());
    return TemplateCatalog({ fallbackTemplate() }, true);
  }
}

TemplateCatalog TemplateCatalog::fromJson(const nlohmann::json& doc,
                                          const std::filesystem::path& baseDir, Logger& log) {
  if (!doc.is_array()) {
    log.warn(kTag, "template document is not an array, using built-in template");
    return TemplateCatalog({ fallbackTemplate() }, true);
  }

  std::vector<Template> out;
  std::unordered_set<std::string> ids;
  std::size_t index = 0;
  for (const auto& element : doc) {
    try {
      Template t = parseTemplate(element, baseDir);
      if (!ids.insert(t.id).second)
        throw std::invalid_argument("duplicate id '" + t.id + "'");
      out.push_back(std::move(t));
    } catch (const std::exception& e) {
      log.warn(kTag, "skipping template #" + std::to_string(index) + ": " + e.what());
    }
    ++index;
  }

  if (out.empty()) {
    log.warn(kTag, "no valid templates, using built-in template");
    return TemplateCatalog({ fallbackTemplate() }, true);
  }

  log.info(kTag, "loaded " + std::to_string(out.size()) + " template(s)");
  return TemplateCatalog(std::move(out), false);
}

Template TemplateCatalog::parseTemplate(const nlohmann::json& element,
                                        const std::filesystem::path& baseDir) {
  if (!element.is_object())
    throw std::invalid_argument("element is not an object");

  try {
    Template t;
    t.id = element.at("id").get<std::string>();
    if (t.id.empty())
      throw std::invalid_argument("empty id");
    t.name = element.value("name", t.id);

    const auto& slots = element.at("slots");
    if (!slots.is_number_integer())
      throw std::invalid_argument("slots must be an integer");
    t.slots = slots.get<int>();
    if (t.slots < kMinSlots || t.slots > kMaxSlots)
      throw std::invalid_argument("slots out of range: " + std::to_string(t.slots));

    auto rects = element.find("rects");
    if (rects == element.end() || (rects->is_array() && rects->empty())) {
      t.rects = stockRects(t.slots);
    } else {
      if (!rects->is_array())
        throw std::invalid_argument("rects must be an array");
      for (const auto& r : *rects)
        t.rects.push_back(parseRect(r));
    }
    if (static_cast<int>(t.rects.size()) != t.slots)
      throw std::invalid_argument("rects count " + std::to_string(t.rects.size()) +
                                  " != slots " + std::to_string(t.slots));

    auto bg = element.find("background");
    if (bg != element.end() && bg->is_string() && !bg->get<std::string>().empty()) {
      std::filesystem::path p = bg->get<std::string>();
      t.background = p.is_relative() ? baseDir / p : p;
    }
    t.vintageEffect = element.value("vintage_effect", false);
    return t;
  } catch (const nlohmann::json::exception& e) {
    throw std::invalid_argument(e.what());
  }
}

Template TemplateCatalog::fallbackTemplate() {
  Template t;
  t.id = "single_full";
  t.name = "Single Full";
  t.slots = 1;
  t.rects = { Rect{ 0.f, 0.f, 100.f, 100.f } };
  return t;
}

std::vector<Rect> TemplateCatalog::stockRects(int slots) {
  switch (slots) {
  case 1:
    return { Rect{ 1.6f, 25.35f, 97.f, 38.5f } };
  case 2: {
    // vertical pair, 2 % gap
    const float left = 6.f, top = 10.f, w = 88.f, h = 40.f, gap = 2.f;
    return { Rect{ left, top, w, h }, Rect{ left, top + h + gap, w, h } };
  }
  case 4: {
    // 2x2 grid
    const float left = 6.f, top = 12.f, w = 41.f, h = 32.f, hGap = 6.f, vGap = 10.f;
    const float left2 = left + w + hGap;
    const float top2 = top + h + vGap;
    return { Rect{ left, top, w, h }, Rect{ left2, top, w, h }, Rect{ left, top2, w, h },
             Rect{ left2, top2, w, h } };
  }
  default:
    throw std::invalid_argument("no stock layout for " + std::to_string(slots) + " slots");
  }
}

std::size_t TemplateCatalog::cycle(std::size_t index, int delta, std::size_t count) {
  if (count == 0)
    return 0;
  const long long n = static_cast<long long>(count);
  long long next = (static_cast<long long>(index) + delta) % n;
  if (next < 0)
    next += n;
  return static_cast<std::size_t>(next);
}

const Template* TemplateCatalog::find(const std::string& id) const {
  for (const auto& t : templates_)
    if (t.id == id)
      return &t;
  return nullptr;
}

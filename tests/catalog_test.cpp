// Booth-Prod headers
#include "core/Logger.hpp"
#include "core/TemplateCatalog.hpp"

// Booth-Fake headers
#include "TempDir.hpp"

// 3rd-party headers
#include <nlohmann/json.hpp>

// GTest headers
#include <gtest/gtest.h>

#include <fstream>

namespace booth::test {

  using booth::core::Logger;
  using booth::core::LogLevel;
  using booth::core::TemplateCatalog;
  using nlohmann::json;

  class TemplateCatalogTest : public ::testing::Test {
  protected:
    void SetUp() override { logger.setConsoleLevel(LogLevel::Error); }

    void write(const std::string& name, const std::string& text) {
      std::ofstream out(dir / name);
      out << text;
    }

    TemplateCatalog parse(const std::string& text) {
      return TemplateCatalog::fromJson(json::parse(text), dir.path(), logger);
    }

    TempDir dir;
    Logger logger;
  };

  TEST_F(TemplateCatalogTest, load_ReadsOrderedTemplatesAndResolvesBackgrounds) {
    write("index.json", R"([
      { "id": "classic", "name": "Classic", "slots": 1,
        "rects": [ { "leftPct": 5, "topPct": 5, "widthPct": 90, "heightPct": 60 } ],
        "background": "art/classic.png" },
      { "id": "strip", "name": "Strip", "slots": 2, "vintage_effect": true,
        "background": "/opt/art/strip.png" }
    ])");

    auto catalog = TemplateCatalog::load((dir / "index.json").string(), logger);

    EXPECT_FALSE(catalog.usingFallback());
    ASSERT_EQ(catalog.size(), 2u);
    EXPECT_EQ(catalog.at(0).id, "classic");
    EXPECT_EQ(catalog.at(1).id, "strip");
    ASSERT_TRUE(catalog.at(0).background.has_value());
    EXPECT_EQ(*catalog.at(0).background, dir.path() / "art/classic.png");
    EXPECT_EQ(*catalog.at(1).background, std::filesystem::path("/opt/art/strip.png"));
    EXPECT_FALSE(catalog.at(0).vintageEffect);
    EXPECT_TRUE(catalog.at(1).vintageEffect);
    EXPECT_FLOAT_EQ(catalog.at(0).rects[0].widthPct, 90.f);
  }

  TEST_F(TemplateCatalogTest, load_MissingOrCorruptFileFallsBackToSingleFullTemplate) {
    auto missing = TemplateCatalog::load((dir / "absent.json").string(), logger);
    ASSERT_EQ(missing.size(), 1u);
    EXPECT_TRUE(missing.usingFallback());
    EXPECT_EQ(missing.at(0).slots, 1);
    ASSERT_EQ(missing.at(0).rects.size(), 1u);
    EXPECT_FLOAT_EQ(missing.at(0).rects[0].widthPct, 100.f);
    EXPECT_FLOAT_EQ(missing.at(0).rects[0].heightPct, 100.f);

    write("bad.json", "[ { \"id\": ");
    auto corrupt = TemplateCatalog::load((dir / "bad.json").string(), logger);
    EXPECT_TRUE(corrupt.usingFallback());
    EXPECT_EQ(corrupt.at(0).id, TemplateCatalog::fallbackTemplate().id);

    auto notArray = parse(R"({ "id": "x", "slots": 1 })");
    EXPECT_TRUE(notArray.usingFallback());

    auto empty = parse("[]");
    EXPECT_TRUE(empty.usingFallback());
  }

  TEST_F(TemplateCatalogTest, fromJson_SkipsInvalidElementsButKeepsSiblings) {
    auto catalog = parse(R"([
      { "id": "mismatch", "slots": 2,
        "rects": [ { "leftPct": 0, "topPct": 0, "widthPct": 50, "heightPct": 50 } ] },
      { "id": "too_many", "slots": 5 },
      { "id": "three_no_rects", "slots": 3 },
      { "id": "off_canvas", "slots": 1,
        "rects": [ { "leftPct": 60, "topPct": 0, "widthPct": 50, "heightPct": 50 } ] },
      { "id": "zero_width", "slots": 1,
        "rects": [ { "leftPct": 0, "topPct": 0, "widthPct": 0, "heightPct": 50 } ] },
      { "name": "no id", "slots": 1 },
      { "id": "good", "slots": 4 },
      { "id": "good", "slots": 1 }
    ])");

    EXPECT_FALSE(catalog.usingFallback());
    ASSERT_EQ(catalog.size(), 1u);
    EXPECT_EQ(catalog.at(0).id, "good");
    EXPECT_EQ(catalog.at(0).slots, 4); // first "good" wins, duplicate skipped
  }

  TEST_F(TemplateCatalogTest, parseTemplate_ToleratesRoundingAtTheCanvasEdge) {
    auto t = TemplateCatalog::parseTemplate(
        json::parse(R"({ "id": "edge", "slots": 1,
                        "rects": [ { "leftPct": 50.005, "topPct": 0, "widthPct": 50, "heightPct": 100 } ] })"),
        dir.path());
    EXPECT_EQ(t.rects.size(), 1u);
    EXPECT_EQ(t.name, "edge"); // name defaults to id

    EXPECT_THROW(TemplateCatalog::parseTemplate(json::parse(R"({ "id": "x", "slots": "1" })"), dir.path()),
                 std::invalid_argument);
  }

  TEST_F(TemplateCatalogTest, stockRects_ProvideLayoutsForOneTwoAndFourSlots) {
    auto one = TemplateCatalog::stockRects(1);
    ASSERT_EQ(one.size(), 1u);
    EXPECT_FLOAT_EQ(one[0].leftPct, 1.6f);
    EXPECT_FLOAT_EQ(one[0].topPct, 25.35f);

    auto two = TemplateCatalog::stockRects(2);
    ASSERT_EQ(two.size(), 2u);
    EXPECT_FLOAT_EQ(two[1].topPct, two[0].topPct + two[0].heightPct + 2.f);

    auto four = TemplateCatalog::stockRects(4);
    ASSERT_EQ(four.size(), 4u);
    for (const auto& r : four) {
      EXPECT_LE(r.leftPct + r.widthPct, 100.f);
      EXPECT_LE(r.topPct + r.heightPct, 100.f);
    }

    EXPECT_THROW(TemplateCatalog::stockRects(3), std::invalid_argument);
  }

  TEST_F(TemplateCatalogTest, everyTemplate_TakesTwoMarginShots) {
    auto catalog = parse(R"([
      { "id": "a", "slots": 1 }, { "id": "b", "slots": 2 }, { "id": "d", "slots": 4 }
    ])");
    for (const auto& t : catalog.templates()) {
      EXPECT_GE(t.slots, 1);
      EXPECT_LE(t.slots, 4);
      EXPECT_EQ(t.toTake(), t.slots + 2);
      EXPECT_EQ(static_cast<int>(t.rects.size()), t.slots);
    }
    ASSERT_NE(catalog.find("b"), nullptr);
    EXPECT_EQ(catalog.find("b")->slots, 2);
    EXPECT_EQ(catalog.find("zzz"), nullptr);
  }

  TEST(template_cycle, wraps_in_both_directions) {
    EXPECT_EQ(TemplateCatalog::cycle(0, -1, 3), 2u);
    EXPECT_EQ(TemplateCatalog::cycle(2, +1, 3), 0u);
    EXPECT_EQ(TemplateCatalog::cycle(1, +7, 3), 2u);
    EXPECT_EQ(TemplateCatalog::cycle(0, -4, 3), 2u);
    EXPECT_EQ(TemplateCatalog::cycle(0, +1, 1), 0u);
  }

} // namespace booth::test

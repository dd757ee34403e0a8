// Booth-Prod headers
#include "core/Logger.hpp"
#include "imaging/Compositor.hpp"
#include "imaging/Filters.hpp"
#include "io/PhotoStore.hpp"

// Booth-Fake headers
#include "TempDir.hpp"

// 3rd-party headers
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

// GTest headers
#include <gtest/gtest.h>

#include <cstdlib>
#include <fstream>

namespace booth::test {

  using booth::core::Logger;
  using booth::core::LogLevel;
  using booth::core::PhotoRef;
  using booth::core::Rect;
  using booth::core::Template;
  using namespace booth::imaging;

  namespace {

    // resampling may move a solid colour by a level or two
    constexpr double kTol = 3.0;

    int countColor(const cv::Mat& img, const cv::Scalar& bgr, double tol = 0.0) {
      cv::Mat mask;
      cv::inRange(img, bgr - cv::Scalar::all(tol), bgr + cv::Scalar::all(tol), mask);
      return cv::countNonZero(mask);
    }

    bool near(const cv::Vec3b& a, const cv::Vec3b& b) {
      for (int c = 0; c < 3; ++c)
        if (std::abs(a[c] - b[c]) > kTol)
          return false;
      return true;
    }

    Template makeTemplate(std::string id, std::vector<Rect> rects) {
      Template t;
      t.id = std::move(id);
      t.name = t.id;
      t.slots = static_cast<int>(rects.size());
      t.rects = std::move(rects);
      return t;
    }

  } // namespace

  class CompositorTest : public ::testing::Test {
  protected:
    CompositorTest() : store(dir.path() / "photos"), logger(std::make_shared<Logger>()) {
      logger->setConsoleLevel(LogLevel::Error);
      settings.canvasWidth = 200;
      settings.canvasHeight = 300;
    }

    PhotoRef writePhoto(const std::string& name, const cv::Mat& img) {
      PhotoRef ref;
      ref.path = dir / name;
      cv::imwrite(ref.path.string(), img);
      return ref;
    }

    PhotoRef solid(const std::string& name, cv::Size size, cv::Scalar bgr) {
      return writePhoto(name, cv::Mat(size, CV_8UC3, bgr));
    }

    PhotoRef gradient(const std::string& name) {
      cv::Mat img(90, 120, CV_8UC3);
      for (int y = 0; y < img.rows; ++y)
        for (int x = 0; x < img.cols; ++x)
          img.at<cv::Vec3b>(y, x) = cv::Vec3b(static_cast<uchar>(x * 2), static_cast<uchar>(y * 2),
                                              static_cast<uchar>(255 - x));
      return writePhoto(name, img);
    }

    TempDir dir;
    booth::io::PhotoStore store;
    std::shared_ptr<Logger> logger;
    CompositorSettings settings;
  };

  TEST_F(CompositorTest, FillCropCoversTheWholeSlot) {
    Compositor comp(settings, store, logger);
    // wide photo into a tall page: must be cropped, not letterboxed
    auto photo = solid("wide.png", { 160, 60 }, cv::Scalar(0, 0, 255));

    cv::Mat page = comp.render({ photo }, FilterKind::None, makeTemplate("full", { Rect{} }));

    ASSERT_EQ(page.size(), cv::Size(200, 300));
    EXPECT_EQ(countColor(page, cv::Scalar(34, 34, 34)), 0);
    EXPECT_EQ(countColor(page, cv::Scalar(0, 0, 255), kTol), 200 * 300);
  }

  TEST_F(CompositorTest, FitInsideLeavesBackgroundAroundThePhoto) {
    settings.placement = PlacementPolicy::FitInside;
    Compositor comp(settings, store, logger);
    auto photo = solid("square.png", { 100, 100 }, cv::Scalar(0, 255, 0));

    cv::Mat page = comp.render({ photo }, FilterKind::None, makeTemplate("full", { Rect{} }));

    EXPECT_EQ(page.at<cv::Vec3b>(0, 0), cv::Vec3b(34, 34, 34));
    EXPECT_TRUE(near(page.at<cv::Vec3b>(150, 100), cv::Vec3b(0, 255, 0)));
    EXPECT_EQ(countColor(page, cv::Scalar(0, 255, 0), kTol), 200 * 200);
  }

  TEST_F(CompositorTest, RenderIsDeterministicIncludingGrain) {
    Compositor comp(settings, store, logger);
    auto photo = gradient("g.png");
    auto tpl = makeTemplate("duo", { Rect{ 0, 0, 100, 50 }, Rect{ 0, 50, 100, 50 } });

    for (auto f : kFilterCycle) {
      cv::Mat a = comp.render({ photo, photo }, f, tpl);
      cv::Mat b = comp.render({ photo, photo }, f, tpl);
      EXPECT_EQ(cv::norm(a, b, cv::NORM_INF), 0.0) << toString(f);
    }
  }

  TEST_F(CompositorTest, FiltersNeverTouchTheBackgroundArt) {
    cv::imwrite((dir / "art.png").string(), cv::Mat(30, 20, CV_8UC3, cv::Scalar(255, 0, 0)));
    Compositor comp(settings, store, logger);
    auto tpl = makeTemplate("top", { Rect{ 0, 0, 100, 50 } });
    tpl.background = dir / "art.png";

    cv::Mat page = comp.render({ gradient("g.png") }, FilterKind::Sepia, tpl);

    // art is resized to the canvas; lower half stays pure blue
    EXPECT_TRUE(near(page.at<cv::Vec3b>(299, 199), cv::Vec3b(255, 0, 0)));
    EXPECT_TRUE(near(page.at<cv::Vec3b>(200, 0), cv::Vec3b(255, 0, 0)));
    EXPECT_FALSE(near(page.at<cv::Vec3b>(10, 10), cv::Vec3b(255, 0, 0)));
  }

  TEST_F(CompositorTest, UnreadableBackgroundFallsBackToSolidFill) {
    Compositor comp(settings, store, logger);
    auto tpl = makeTemplate("missing_art", { Rect{ 0, 0, 50, 50 } });
    tpl.background = dir / "nope.png";

    cv::Mat bg = comp.background(tpl);
    EXPECT_EQ(countColor(bg, cv::Scalar(34, 34, 34)), 200 * 300);
  }

  TEST_F(CompositorTest, BlackWhiteOutputHasNoColour) {
    Compositor comp(settings, store, logger);
    cv::Mat page = comp.render({ gradient("g.png") }, FilterKind::BlackWhite,
                               makeTemplate("full", { Rect{} }));

    std::vector<cv::Mat> ch;
    cv::split(page, ch);
    EXPECT_EQ(cv::norm(ch[0], ch[1], cv::NORM_INF), 0.0);
    EXPECT_EQ(cv::norm(ch[1], ch[2], cv::NORM_INF), 0.0);
  }

  TEST_F(CompositorTest, VintageTemplateAgesPhotosEvenWithoutAFilter) {
    Compositor comp(settings, store, logger);
    auto photo = gradient("g.png");
    auto plain = makeTemplate("plain", { Rect{} });
    auto aged = plain;
    aged.id = "aged";
    aged.vintageEffect = true;

    cv::Mat a = comp.render({ photo }, FilterKind::None, plain);
    cv::Mat b = comp.render({ photo }, FilterKind::None, aged);
    cv::Mat c = comp.render({ photo }, FilterKind::Newspaper, plain);

    EXPECT_GT(cv::norm(a, b, cv::NORM_INF), 0.0);
    EXPECT_EQ(cv::norm(b, c, cv::NORM_INF), 0.0); // newspaper is not applied twice
  }

  TEST_F(CompositorTest, UnreadablePhotoLeavesItsSlotEmpty) {
    Compositor comp(settings, store, logger);
    PhotoRef broken{ dir / "broken.jpg" };
    {
      std::ofstream out(broken.path);
      out << "not a jpeg";
    }
    auto good = solid("ok.png", { 40, 40 }, cv::Scalar(0, 0, 255));
    auto tpl = makeTemplate("duo", { Rect{ 0, 0, 100, 50 }, Rect{ 0, 50, 100, 50 } });

    auto artifact = comp.compose({ broken, good }, FilterKind::None, tpl);

    EXPECT_EQ(artifact.skippedSlots, (std::vector<std::size_t>{ 0 }));
    EXPECT_EQ(artifact.placed, 1u);
    ASSERT_TRUE(std::filesystem::exists(artifact.photo.path));
    EXPECT_EQ(artifact.photo.path.filename().string().rfind("A4_", 0), 0u);
    EXPECT_EQ(artifact.photo.path.extension(), ".jpg");

    cv::Mat page = comp.render({ broken, good }, FilterKind::None, tpl);
    EXPECT_EQ(page.at<cv::Vec3b>(10, 10), cv::Vec3b(34, 34, 34));
    EXPECT_TRUE(near(page.at<cv::Vec3b>(290, 10), cv::Vec3b(0, 0, 255)));
  }

  TEST_F(CompositorTest, SlotOffThePageCountsAsSkipped) {
    Compositor comp(settings, store, logger);
    auto red = solid("r.png", { 40, 40 }, cv::Scalar(0, 0, 255));
    auto green = solid("g.png", { 40, 40 }, cv::Scalar(0, 255, 0));
    // hand-built template; the catalog would have rejected this rect
    auto tpl = makeTemplate("overhang", { Rect{ 0, 0, 100, 50 }, Rect{ 120, 0, 50, 50 } });

    auto artifact = comp.compose({ red, green }, FilterKind::None, tpl);

    EXPECT_EQ(artifact.skippedSlots, (std::vector<std::size_t>{ 1 }));
    EXPECT_EQ(artifact.placed, 1u);
    cv::Mat page = comp.render({ red, green }, FilterKind::None, tpl);
    EXPECT_EQ(countColor(page, cv::Scalar(0, 255, 0), kTol), 0);
  }

  TEST_F(CompositorTest, ExtraPhotosAreIgnoredAndEachComposeIsANewFile) {
    Compositor comp(settings, store, logger);
    auto red = solid("r.png", { 40, 40 }, cv::Scalar(0, 0, 255));
    auto green = solid("g.png", { 40, 40 }, cv::Scalar(0, 255, 0));
    auto tpl = makeTemplate("one", { Rect{} });

    cv::Mat page = comp.render({ red, green }, FilterKind::None, tpl);
    EXPECT_EQ(countColor(page, cv::Scalar(0, 255, 0), kTol), 0);

    auto first = comp.compose({ red, green }, FilterKind::None, tpl);
    auto second = comp.compose({ red }, FilterKind::Sepia, tpl);
    EXPECT_EQ(first.placed, 1u);
    EXPECT_EQ(second.filter, FilterKind::Sepia);
    EXPECT_NE(first.photo.path, second.photo.path);
    EXPECT_TRUE(std::filesystem::exists(first.photo.path));
    EXPECT_TRUE(std::filesystem::exists(second.photo.path));
  }

  TEST_F(CompositorTest, RejectsEmptyCanvas) {
    settings.canvasWidth = 0;
    EXPECT_THROW(Compositor(settings, store, logger), std::invalid_argument);
  }

  TEST(compositor_geometry, percent_rect_to_pixels_truncates) {
    auto r = Compositor::toPixelRect(Rect{ 10.f, 20.f, 50.f, 25.f }, cv::Size(200, 400));
    EXPECT_EQ(r, cv::Rect(20, 80, 100, 100));

    auto odd = Compositor::toPixelRect(Rect{ 1.6f, 25.35f, 97.f, 38.5f }, cv::Size(2480, 3508));
    EXPECT_EQ(odd.x, 39);
    EXPECT_EQ(odd.width, 2405);
  }

  TEST(compositor_geometry, fit_to_slot_fills_or_fits) {
    cv::Mat photo(100, 200, CV_8UC3, cv::Scalar::all(128));

    auto [filled, fo] = Compositor::fitToSlot(photo, { 80, 80 }, PlacementPolicy::FillCrop);
    EXPECT_EQ(filled.size(), cv::Size(80, 80));
    EXPECT_EQ(fo, cv::Point(0, 0));

    auto [fitted, po] = Compositor::fitToSlot(photo, { 80, 80 }, PlacementPolicy::FitInside);
    EXPECT_EQ(fitted.size(), cv::Size(80, 40));
    EXPECT_EQ(po, cv::Point(0, 20));

    auto [none, no] = Compositor::fitToSlot(cv::Mat(), { 80, 80 }, PlacementPolicy::FillCrop);
    EXPECT_TRUE(none.empty());
  }

  TEST(filters, cycle_wraps_both_ways) {
    EXPECT_EQ(cycleFilter(0, -1), 3u);
    EXPECT_EQ(cycleFilter(3, +1), 0u);
    EXPECT_EQ(kFilterCycle[cycleFilter(1, +1)], FilterKind::Sepia);
    EXPECT_EQ(filterFromString("newspaper"), FilterKind::Newspaper);
    EXPECT_FALSE(filterFromString("glow").has_value());
    EXPECT_EQ(noiseFromString("heavy"), NoiseIntensity::Heavy);
    EXPECT_DOUBLE_EQ(noiseSigma(NoiseIntensity::Light), 15.0);
    EXPECT_EQ(placementFromString("fit_inside"), PlacementPolicy::FitInside);
  }

  TEST(filters, sepia_maps_black_and_white_to_the_duotone_ends) {
    cv::Mat img(1, 2, CV_8UC3);
    img.at<cv::Vec3b>(0, 0) = cv::Vec3b(0, 0, 0);
    img.at<cv::Vec3b>(0, 1) = cv::Vec3b(255, 255, 255);

    cv::Mat out = sepia(img);
    EXPECT_EQ(out.at<cv::Vec3b>(0, 0), cv::Vec3b(0x0f, 0x1f, 0x2e));
    EXPECT_EQ(out.at<cv::Vec3b>(0, 1), cv::Vec3b(0xc1, 0xe1, 0xf4));
  }

  TEST(filters, newspaper_grain_depends_on_seed) {
    cv::Mat img(32, 32, CV_8UC3, cv::Scalar::all(128));
    cv::Mat a = newspaper(img, NoiseIntensity::Medium, 1);
    cv::Mat b = newspaper(img, NoiseIntensity::Medium, 1);
    cv::Mat c = newspaper(img, NoiseIntensity::Medium, 2);
    EXPECT_EQ(cv::norm(a, b, cv::NORM_INF), 0.0);
    EXPECT_GT(cv::norm(a, c, cv::NORM_INF), 0.0);
  }

} // namespace booth::test

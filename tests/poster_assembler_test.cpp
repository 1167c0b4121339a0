#include <gtest/gtest.h>
#include "poster_assembler.hpp"
#include "test_support.hpp"

#include <opencv2/imgcodecs.hpp>

using namespace eventposter;

namespace {

bool sameRegion(const cv::Mat& a, const cv::Mat& b, const cv::Rect& rect) {
    return cv::norm(a(rect), b(rect), cv::NORM_INF) == 0;
}

bool hasWarning(const RenderResult& result, const std::string& needle) {
    for (const auto& w : result.warnings) {
        if (w.find(needle) != std::string::npos) return true;
    }
    return false;
}

} // namespace

class PosterAssemblerTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::string font_path = test::findTestFont();
        if (font_path.empty()) GTEST_SKIP() << "no TrueType font found, set EVENTPOSTER_TEST_FONT";

        std::vector<uint8_t> font_bytes;
        std::string error;
        ASSERT_TRUE(readFile(font_path, font_bytes, error)) << error;

        assets_.put("font", font_bytes);
        assets_.put("logo", test::encodePng(test::solidImage(240, 120, cv::Scalar(153, 51, 0))));
        assets_.put("icon:clock", test::encodePng(test::iconImage(100)));
        assets_.put("icon:calendar", test::encodePng(test::iconImage(100)));
    }

    EventRecord record(const std::string& title) const {
        return EventRecord::fromInput("19:00", "2025-10-26", title, "Bonn", "Marktplatz 1, 53111 Bonn", "", 1);
    }

    LayoutConfig layout_;
    test::MemoryAssetCache assets_;
    BackgroundResolver resolver_{nullptr, 15};
};

TEST_F(PosterAssemblerTest, ReunionScenarioWithoutQueryUsesFallback) {
    PosterAssembler assembler(layout_, assets_, resolver_);
    RenderResult result = assembler.render(record("Reunión\nEXATEC\nBonn"));

    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_TRUE(result.used_fallback_background);
    EXPECT_TRUE(result.footer_drawn);
    EXPECT_EQ(result.image.size(), cv::Size(1080, 1080));
    EXPECT_EQ(result.image.type(), CV_8UC3);
    EXPECT_FALSE(result.png.empty());

    std::vector<std::string> expected = {"REUNIÓN", "EXATEC", "BONN"};
    EXPECT_EQ(result.fit.lines, expected);
    EXPECT_FALSE(result.fit.used_wrap_fallback);
    EXPECT_LE(result.fit.chosen_font_size, layout_.title.size);
    EXPECT_GE(result.fit.chosen_font_size, layout_.title_min_size);
    EXPECT_TRUE(result.warnings.empty());

    // Outside the panel the fallback stays white
    EXPECT_EQ(result.image.at<cv::Vec3b>(20, 20), cv::Vec3b(255, 255, 255));
}

TEST_F(PosterAssemblerTest, PngIsOpaque1080Square) {
    PosterAssembler assembler(layout_, assets_, resolver_);
    RenderResult result = assembler.render(record("Sommerfest"));
    ASSERT_TRUE(result.ok) << result.error;

    cv::Mat decoded = cv::imdecode(result.png, cv::IMREAD_UNCHANGED);
    ASSERT_FALSE(decoded.empty());
    EXPECT_EQ(decoded.cols, 1080);
    EXPECT_EQ(decoded.rows, 1080);
    EXPECT_EQ(decoded.channels(), 3);
}

TEST_F(PosterAssemblerTest, ComposeIsIdempotent) {
    PosterAssembler assembler(layout_, assets_, resolver_);
    ResolvedBackground background;
    background.image = test::solidImage(300, 200, cv::Scalar(40, 120, 200));

    RenderResult a = assembler.compose(record("Reunión\nEXATEC"), background);
    RenderResult b = assembler.compose(record("Reunión\nEXATEC"), background);
    ASSERT_TRUE(a.ok) << a.error;
    ASSERT_TRUE(b.ok) << b.error;
    EXPECT_FALSE(a.used_fallback_background);
    EXPECT_EQ(a.png, b.png);
}

TEST_F(PosterAssemblerTest, FooterDoesNotDependOnTitle) {
    PosterAssembler assembler(layout_, assets_, resolver_);
    RenderResult short_title = assembler.render(record("Gala"));
    RenderResult long_title = assembler.render(
        record("Treffen der\nEhemaligen aus\nMonterrey und\nganz Deutschland"));
    ASSERT_TRUE(short_title.ok) << short_title.error;
    ASSERT_TRUE(long_title.ok) << long_title.error;

    EXPECT_TRUE(sameRegion(short_title.image, long_title.image, layout_.footerRect()));
    EXPECT_FALSE(sameRegion(short_title.image, long_title.image, layout_.titleBox()));
}

TEST_F(PosterAssemblerTest, FitStaysInsideTitleBox) {
    PosterAssembler assembler(layout_, assets_, resolver_);
    RenderResult result = assembler.render(
        record("Treffen der\nEhemaligen aus\nMonterrey und\nganz Deutschland"));
    ASSERT_TRUE(result.ok) << result.error;

    cv::Rect box = layout_.titleBox();
    const double size = result.fit.chosen_font_size;
    const double block = result.fit.lines.size() * (size + result.fit.line_spacing) - result.fit.line_spacing;
    EXPECT_LE(block, box.height);
    EXPECT_LT(size, layout_.title.size);
}

TEST_F(PosterAssemblerTest, OverlongWordIsWrappedAndReported) {
    PosterAssembler assembler(layout_, assets_, resolver_);
    RenderResult result = assembler.render(record(std::string(40, 'W')));

    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_TRUE(result.fit.used_wrap_fallback);
    EXPECT_TRUE(result.fit.overflowing_word);
    EXPECT_EQ(result.fit.chosen_font_size, layout_.title_min_size);
    ASSERT_EQ(result.fit.lines.size(), 1u);
    EXPECT_TRUE(hasWarning(result, "wider than the panel"));
}

TEST_F(PosterAssemblerTest, MissingLogoStillProducesPoster) {
    test::MemoryAssetCache assets;
    AssetBytes font;
    std::string error;
    ASSERT_TRUE(assets_.getOrFetch("font", font, error));
    assets.put("font", *font);

    PosterAssembler assembler(layout_, assets, resolver_);
    RenderResult result = assembler.render(record("Gala"));
    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_FALSE(result.footer_drawn);
    EXPECT_TRUE(hasWarning(result, "footer skipped"));
    EXPECT_TRUE(hasWarning(result, "without icons"));
}

TEST_F(PosterAssemblerTest, MissingFontFailsRender) {
    test::MemoryAssetCache assets;
    PosterAssembler assembler(layout_, assets, resolver_);
    RenderResult result = assembler.render(record("Gala"));
    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.error.find("font"), std::string::npos);
    EXPECT_TRUE(result.png.empty());
}

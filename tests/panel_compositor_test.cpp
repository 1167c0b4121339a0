#include <gtest/gtest.h>
#include "panel_compositor.hpp"
#include "raster.hpp"
#include "test_support.hpp"

using namespace eventposter;

namespace {

void expectNear(const cv::Vec4b& actual, const cv::Vec4b& expected, int tolerance) {
    for (int c = 0; c < 4; ++c) {
        EXPECT_NEAR(actual[c], expected[c], tolerance) << "channel " << c;
    }
}

} // namespace

TEST(PanelCompositorTest, FallbackIsWhiteWithPanel) {
    LayoutConfig layout;
    PanelCompositor compositor(layout);
    cv::Mat canvas;
    std::string error;

    ASSERT_TRUE(compositor.apply(canvas, cv::Mat(), error)) << error;
    ASSERT_EQ(canvas.size(), cv::Size(1080, 1080));
    ASSERT_EQ(canvas.type(), CV_8UC4);

    EXPECT_EQ(canvas.at<cv::Vec4b>(5, 5), cv::Vec4b(255, 255, 255, 255));
    EXPECT_EQ(canvas.at<cv::Vec4b>(1075, 540), cv::Vec4b(255, 255, 255, 255));

    cv::Rect panel = layout.panelRect();
    EXPECT_EQ(canvas.at<cv::Vec4b>(panel.y + panel.height / 2, panel.x + panel.width / 2),
              cv::Vec4b(204, 82, 0, 255));
}

TEST(PanelCompositorTest, AccentStripeAndBorder) {
    LayoutConfig layout;
    PanelCompositor compositor(layout);
    cv::Mat canvas;
    std::string error;
    ASSERT_TRUE(compositor.apply(canvas, cv::Mat(), error));

    cv::Rect panel = layout.panelRect();
    int cx = panel.x + panel.width / 2;
    EXPECT_EQ(canvas.at<cv::Vec4b>(panel.y + 4, cx), cv::Vec4b(224, 163, 0, 255));
    EXPECT_EQ(canvas.at<cv::Vec4b>(panel.y + layout.accent_thickness + 4, cx), cv::Vec4b(204, 82, 0, 255));

    // Translucent white over the panel's left edge
    cv::Vec4b edge = canvas.at<cv::Vec4b>(panel.y + panel.height / 2, panel.x);
    EXPECT_GT(edge[2], 80);
    EXPECT_LT(edge[2], 255);
}

TEST(PanelCompositorTest, BackgroundIsResizedAndTinted) {
    LayoutConfig layout;
    PanelCompositor compositor(layout);
    cv::Mat canvas;
    std::string error;

    cv::Mat red = test::solidImage(100, 60, cv::Scalar(0, 0, 255));
    ASSERT_TRUE(compositor.apply(canvas, red, error)) << error;
    ASSERT_EQ(canvas.size(), cv::Size(1080, 1080));

    // rgb(0,51,153) at alpha 150 over pure red
    expectNear(canvas.at<cv::Vec4b>(20, 20), cv::Vec4b(90, 30, 105, 255), 1);
}

TEST(PanelCompositorTest, BackgroundAlphaIsFlattenedOnWhite) {
    LayoutConfig layout;
    layout.blur_radius = 0;
    PanelCompositor compositor(layout);
    cv::Mat canvas;
    std::string error;

    cv::Mat transparent(50, 50, CV_8UC4, cv::Scalar(0, 0, 0, 0));
    ASSERT_TRUE(compositor.apply(canvas, transparent, error)) << error;
    expectNear(canvas.at<cv::Vec4b>(20, 20), cv::Vec4b(195, 135, 105, 255), 1);
}

TEST(PanelCompositorTest, GrayscaleBackgroundIsAccepted) {
    LayoutConfig layout;
    PanelCompositor compositor(layout);
    cv::Mat canvas;
    std::string error;

    cv::Mat gray(40, 40, CV_8UC1, cv::Scalar(0));
    ASSERT_TRUE(compositor.apply(canvas, gray, error)) << error;
    expectNear(canvas.at<cv::Vec4b>(20, 20), cv::Vec4b(90, 30, 0, 255), 1);
}

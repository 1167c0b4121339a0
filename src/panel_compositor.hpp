// panel_compositor.hpp
#pragma once

#include "config.hpp"

#include <opencv2/core.hpp>
#include <string>

namespace eventposter {

// Builds the canvas: background (or fallback), tint and blur, then the
// panel with its border and accent stripe.
class PanelCompositor {
public:
    explicit PanelCompositor(const LayoutConfig& layout) : layout_(layout) {}

    // canvas is (re)allocated as a canvas_width x canvas_height BGRA image.
    // An empty background selects the fallback.
    bool apply(cv::Mat& canvas, const cv::Mat& background, std::string& error) const;

private:
    const LayoutConfig& layout_;

    void drawBackground(cv::Mat& canvas, const cv::Mat& background) const;
    void drawPanel(cv::Mat& canvas) const;
};

} // namespace eventposter

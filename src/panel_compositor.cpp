// panel_compositor.cpp
#include "panel_compositor.hpp"
#include "raster.hpp"

#include <opencv2/imgproc.hpp>

namespace eventposter {

bool PanelCompositor::apply(cv::Mat& canvas, const cv::Mat& background, std::string& error) const {
    try {
        canvas = raster::makeCanvas(layout_.canvas_width, layout_.canvas_height, layout_.fallback_color);
        if (!background.empty()) {
            drawBackground(canvas, background);
        }
        drawPanel(canvas);
    } catch (const cv::Exception& e) {
        error = std::string("panel compositing failed: ") + e.what();
        return false;
    }
    return true;
}

void PanelCompositor::drawBackground(cv::Mat& canvas, const cv::Mat& background) const {
    cv::Mat resized;
    cv::resize(background, resized, canvas.size(), 0, 0, cv::INTER_AREA);

    cv::Mat bgra = raster::toOpaqueBgra(resized);
    if (bgra.empty()) return;  // unsupported channel count, keep the fallback
    bgra.copyTo(canvas);

    raster::blendFill(canvas, cv::Rect(0, 0, canvas.cols, canvas.rows), layout_.tint_color);

    if (layout_.blur_radius > 0) {
        int k = 2 * layout_.blur_radius + 1;
        cv::GaussianBlur(canvas, canvas, cv::Size(k, k), 0);
    }
}

void PanelCompositor::drawPanel(cv::Mat& canvas) const {
    cv::Rect panel = layout_.panelRect();

    raster::blendFill(canvas, panel, layout_.panel_color);

    if (layout_.border_thickness > 0) {
        raster::strokeRect(canvas, panel, layout_.border_color, layout_.border_thickness);
    }

    // Accent stripe along the top edge
    if (layout_.accent_thickness > 0) {
        raster::blendFill(canvas, cv::Rect(panel.x, panel.y, panel.width, layout_.accent_thickness),
                          layout_.accent_color);
    }
}

} // namespace eventposter

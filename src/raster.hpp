// raster.hpp
#pragma once

#include <opencv2/core.hpp>

namespace eventposter { namespace raster {

// Canvases are CV_8UC4 in OpenCV's BGRA order; colors are written RGBA.
inline cv::Scalar rgba(int r, int g, int b, int a = 255) {
    return cv::Scalar(b, g, r, a);
}

cv::Mat makeCanvas(int width, int height, const cv::Scalar& color);

// Any 1, 3 or 4 channel 8-bit image to opaque BGRA. Transparent pixels are
// flattened against white.
cv::Mat toOpaqueBgra(const cv::Mat& image);

// Alpha-flattens a BGRA canvas against white into opaque BGR.
cv::Mat flattenToBgr(const cv::Mat& bgra);

// Source-over fill; the rectangle is clipped to the canvas.
void blendFill(cv::Mat& canvas, const cv::Rect& rect, const cv::Scalar& color);

// Blends `color` through an 8-bit coverage mask placed at top_left.
void blendMask(cv::Mat& canvas, const cv::Mat& mask, cv::Point top_left, const cv::Scalar& color);

// Source-over composite of a BGR or BGRA image placed at top_left.
void blendImage(cv::Mat& canvas, const cv::Mat& image, cv::Point top_left);

// Rectangle outline with constant alpha.
void strokeRect(cv::Mat& canvas, const cv::Rect& rect, const cv::Scalar& color, int thickness);

void strokeRoundedRect(cv::Mat& canvas, const cv::Rect& rect, int radius,
                       const cv::Scalar& color, int thickness);

}} // namespace eventposter::raster

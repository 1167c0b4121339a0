// raster.cpp
#include "raster.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>

namespace eventposter { namespace raster {

namespace {

inline uchar mix(int dst, int src, int a) {
    return static_cast<uchar>((dst * (255 - a) + src * a + 127) / 255);
}

inline void blendPixel(cv::Vec4b& dst, const cv::Scalar& color, int a) {
    if (a <= 0) return;
    dst[0] = mix(dst[0], static_cast<int>(color[0]), a);
    dst[1] = mix(dst[1], static_cast<int>(color[1]), a);
    dst[2] = mix(dst[2], static_cast<int>(color[2]), a);
    dst[3] = static_cast<uchar>(a + (dst[3] * (255 - a) + 127) / 255);
}

// Draws through an overlay copy of the affected region so partial alpha
// applies once per pixel even where strokes overlap.
template <typename DrawFn>
void drawWithAlpha(cv::Mat& canvas, const cv::Rect& area, const cv::Scalar& color, DrawFn draw) {
    cv::Rect roi = area & cv::Rect(0, 0, canvas.cols, canvas.rows);
    if (roi.empty()) return;

    const int a = static_cast<int>(color[3]);
    cv::Scalar opaque(color[0], color[1], color[2], 255);
    if (a >= 255) {
        draw(canvas, cv::Point(0, 0), opaque);
        return;
    }
    if (a <= 0) return;

    cv::Mat mask = cv::Mat::zeros(roi.size(), CV_8UC1);
    draw(mask, -roi.tl(), cv::Scalar(255));
    cv::Mat coverage;
    mask.convertTo(coverage, CV_8UC1, a / 255.0);
    blendMask(canvas, coverage, roi.tl(), opaque);
}

} // namespace

cv::Mat makeCanvas(int width, int height, const cv::Scalar& color) {
    return cv::Mat(height, width, CV_8UC4, color);
}

cv::Mat toOpaqueBgra(const cv::Mat& image) {
    cv::Mat bgra;
    switch (image.channels()) {
        case 1:
            cv::cvtColor(image, bgra, cv::COLOR_GRAY2BGRA);
            return bgra;
        case 3:
            cv::cvtColor(image, bgra, cv::COLOR_BGR2BGRA);
            return bgra;
        case 4: {
            bgra = makeCanvas(image.cols, image.rows, cv::Scalar(255, 255, 255, 255));
            blendImage(bgra, image, cv::Point(0, 0));
            return bgra;
        }
        default:
            return cv::Mat();
    }
}

cv::Mat flattenToBgr(const cv::Mat& bgra) {
    cv::Mat white = makeCanvas(bgra.cols, bgra.rows, cv::Scalar(255, 255, 255, 255));
    blendImage(white, bgra, cv::Point(0, 0));
    cv::Mat bgr;
    cv::cvtColor(white, bgr, cv::COLOR_BGRA2BGR);
    return bgr;
}

void blendFill(cv::Mat& canvas, const cv::Rect& rect, const cv::Scalar& color) {
    cv::Rect roi = rect & cv::Rect(0, 0, canvas.cols, canvas.rows);
    if (roi.empty()) return;

    const int a = static_cast<int>(color[3]);
    if (a >= 255) {
        canvas(roi).setTo(color);
        return;
    }
    if (a <= 0) return;

    cv::Mat region = canvas(roi);
    for (int y = 0; y < region.rows; ++y) {
        cv::Vec4b* row = region.ptr<cv::Vec4b>(y);
        for (int x = 0; x < region.cols; ++x) {
            blendPixel(row[x], color, a);
        }
    }
}

void blendMask(cv::Mat& canvas, const cv::Mat& mask, cv::Point top_left, const cv::Scalar& color) {
    CV_Assert(canvas.type() == CV_8UC4 && mask.type() == CV_8UC1);

    cv::Rect target(top_left, mask.size());
    cv::Rect roi = target & cv::Rect(0, 0, canvas.cols, canvas.rows);
    if (roi.empty()) return;

    const int color_a = static_cast<int>(color[3]);
    for (int y = roi.y; y < roi.y + roi.height; ++y) {
        const uchar* m = mask.ptr<uchar>(y - top_left.y);
        cv::Vec4b* row = canvas.ptr<cv::Vec4b>(y);
        for (int x = roi.x; x < roi.x + roi.width; ++x) {
            int a = m[x - top_left.x] * color_a / 255;
            blendPixel(row[x], color, a);
        }
    }
}

void blendImage(cv::Mat& canvas, const cv::Mat& image, cv::Point top_left) {
    CV_Assert(canvas.type() == CV_8UC4);

    cv::Rect target(top_left, image.size());
    cv::Rect roi = target & cv::Rect(0, 0, canvas.cols, canvas.rows);
    if (roi.empty()) return;

    if (image.channels() != 4) {
        cv::Mat bgra = toOpaqueBgra(image);
        bgra(roi - top_left).copyTo(canvas(roi));
        return;
    }

    for (int y = roi.y; y < roi.y + roi.height; ++y) {
        const cv::Vec4b* src = image.ptr<cv::Vec4b>(y - top_left.y);
        cv::Vec4b* row = canvas.ptr<cv::Vec4b>(y);
        for (int x = roi.x; x < roi.x + roi.width; ++x) {
            const cv::Vec4b& s = src[x - top_left.x];
            blendPixel(row[x], cv::Scalar(s[0], s[1], s[2]), s[3]);
        }
    }
}

void strokeRect(cv::Mat& canvas, const cv::Rect& rect, const cv::Scalar& color, int thickness) {
    cv::Rect area(rect.x - thickness, rect.y - thickness,
                  rect.width + 2 * thickness, rect.height + 2 * thickness);
    drawWithAlpha(canvas, area, color, [&](cv::Mat& target, cv::Point shift, const cv::Scalar& c) {
        cv::Rect r(rect.tl() + shift, rect.size());
        cv::rectangle(target, r, c, thickness, cv::LINE_8);
    });
}

void strokeRoundedRect(cv::Mat& canvas, const cv::Rect& rect, int radius,
                       const cv::Scalar& color, int thickness) {
    radius = std::max(0, std::min(radius, std::min(rect.width, rect.height) / 2));
    cv::Rect area(rect.x - thickness, rect.y - thickness,
                  rect.width + 2 * thickness, rect.height + 2 * thickness);

    drawWithAlpha(canvas, area, color, [&](cv::Mat& target, cv::Point shift, const cv::Scalar& c) {
        const int l = rect.x + shift.x;
        const int t = rect.y + shift.y;
        const int r = rect.x + rect.width - 1 + shift.x;
        const int b = rect.y + rect.height - 1 + shift.y;
        const cv::Size corner(radius, radius);

        cv::line(target, cv::Point(l + radius, t), cv::Point(r - radius, t), c, thickness, cv::LINE_AA);
        cv::line(target, cv::Point(l + radius, b), cv::Point(r - radius, b), c, thickness, cv::LINE_AA);
        cv::line(target, cv::Point(l, t + radius), cv::Point(l, b - radius), c, thickness, cv::LINE_AA);
        cv::line(target, cv::Point(r, t + radius), cv::Point(r, b - radius), c, thickness, cv::LINE_AA);

        cv::ellipse(target, cv::Point(l + radius, t + radius), corner, 180.0, 0, 90, c, thickness, cv::LINE_AA);
        cv::ellipse(target, cv::Point(r - radius, t + radius), corner, 270.0, 0, 90, c, thickness, cv::LINE_AA);
        cv::ellipse(target, cv::Point(r - radius, b - radius), corner, 0.0, 0, 90, c, thickness, cv::LINE_AA);
        cv::ellipse(target, cv::Point(l + radius, b - radius), corner, 90.0, 0, 90, c, thickness, cv::LINE_AA);
    });
}

}} // namespace eventposter::raster

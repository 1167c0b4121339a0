// text_layout.cpp
#include "text_layout.hpp"
#include "raster.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>

namespace eventposter {

int TextLayoutEngine::shadowOffset(int size_px) {
    return std::max(2, static_cast<int>(std::ceil(size_px / 30.0)));
}

const text::Font* TextLayoutEngine::font(const TextStyle& style, std::string& error) const {
    const text::Font* f = fonts_.load(style.weight, style.size);
    if (!f) error = fonts_.lastError();
    return f;
}

bool TextLayoutEngine::fitTitle(const std::vector<std::string>& lines, text::FitResult& result,
                                std::string& error) const {
    cv::Rect box = layout_.titleBox();

    text::FitRequest request;
    request.lines = lines;
    request.bounding_width = box.width;
    request.bounding_height = box.height;
    request.start_size = layout_.title.size;
    request.min_size = layout_.title_min_size;
    request.size_step = layout_.title_size_step;

    text::FontMeasurer measurer(fonts_, layout_.title.weight);
    text::TypographyFitter fitter(measurer, layout_.title_line_spacing);
    return fitter.fit(request, result, error);
}

bool TextLayoutEngine::draw(cv::Mat& canvas, const TextBlocks& blocks, const IconSet& icons,
                            std::string& error) const {
    if (!drawDatetime(canvas, blocks.datetime, icons, error)) return false;
    if (!drawTitle(canvas, blocks.title, error)) return false;

    if (!blocks.venue.empty()) {
        const text::Font* venue = font(layout_.venue, error);
        if (!venue) return false;
        if (!drawCentered(canvas, *venue, blocks.venue, layout_.venueCenterY(), true, error)) return false;
    }

    if (!blocks.address.empty()) {
        const text::Font* address = font(layout_.address, error);
        if (!address) return false;
        if (!drawCentered(canvas, *address, blocks.address, layout_.addressCenterY(), false, error)) {
            return false;
        }
    }
    return true;
}

bool TextLayoutEngine::drawDatetime(cv::Mat& canvas, const std::vector<DatetimeSegment>& segments,
                                    const IconSet& icons, std::string& error) const {
    if (segments.empty()) return true;

    const text::Font* f = font(layout_.datetime, error);
    if (!f) return false;

    // Measure the whole unit first so it can be centered as one piece
    std::vector<int> widths;
    std::vector<const cv::Mat*> segment_icons;
    int total = 0;
    for (size_t i = 0; i < segments.size(); ++i) {
        int w = 0;
        if (!f->measure(segments[i].text, w, error)) return false;
        widths.push_back(w);

        const cv::Mat* icon = nullptr;
        if (!segments[i].icon.empty()) {
            auto it = icons.find(segments[i].icon);
            if (it != icons.end() && !it->second.empty()) icon = &it->second;
        }
        segment_icons.push_back(icon);

        if (i > 0) total += layout_.segment_gap;
        if (icon) total += layout_.icon_size + layout_.icon_gap;
        total += w;
    }

    const cv::Rect panel = layout_.panelRect();
    const int center_y = layout_.datetimeCenterY();
    const int baseline = f->baselineForCenter(center_y);
    int x = panel.x + (panel.width - total) / 2;

    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) x += layout_.segment_gap;
        if (segment_icons[i]) {
            drawIcon(canvas, *segment_icons[i], cv::Point(x, center_y - layout_.icon_size / 2));
            x += layout_.icon_size + layout_.icon_gap;
        }
        if (!drawLine(canvas, *f, segments[i].text, cv::Point(x, baseline), false, error)) return false;
        x += widths[i];
    }
    return true;
}

bool TextLayoutEngine::drawTitle(cv::Mat& canvas, const text::FitResult& title, std::string& error) const {
    if (title.lines.empty()) return true;

    TextStyle style{title.chosen_font_size, layout_.title.weight};
    const text::Font* f = font(style, error);
    if (!f) return false;

    const cv::Rect box = layout_.titleBox();
    const double size = title.chosen_font_size;
    const double block = title.lines.size() * (size + title.line_spacing) - title.line_spacing;
    const double top = box.y + (box.height - block) / 2.0;

    for (size_t i = 0; i < title.lines.size(); ++i) {
        int center_y = static_cast<int>(std::lround(top + i * (size + title.line_spacing) + size / 2.0));
        if (!drawCentered(canvas, *f, title.lines[i], center_y, true, error)) return false;
    }
    return true;
}

bool TextLayoutEngine::drawCentered(cv::Mat& canvas, const text::Font& font, const std::string& line,
                                    int center_y, bool shadow, std::string& error) const {
    int width = 0;
    if (!font.measure(line, width, error)) return false;

    const cv::Rect panel = layout_.panelRect();
    cv::Point origin(panel.x + (panel.width - width) / 2, font.baselineForCenter(center_y));
    return drawLine(canvas, font, line, origin, shadow, error);
}

bool TextLayoutEngine::drawLine(cv::Mat& canvas, const text::Font& font, const std::string& line,
                                cv::Point origin, bool shadow, std::string& error) const {
    if (shadow) {
        int off = shadowOffset(font.size());
        if (!font.draw(canvas, line, origin + cv::Point(off, off), layout_.shadow_color, error)) return false;
    }
    return font.draw(canvas, line, origin, layout_.text_color, error);
}

void TextLayoutEngine::drawIcon(cv::Mat& canvas, const cv::Mat& icon, cv::Point top_left) const {
    cv::Mat mask;
    if (icon.channels() == 4) {
        cv::extractChannel(icon, mask, 3);
    } else if (icon.channels() == 3) {
        cv::cvtColor(icon, mask, cv::COLOR_BGR2GRAY);
    } else {
        mask = icon;
    }

    cv::Mat sized;
    cv::resize(mask, sized, cv::Size(layout_.icon_size, layout_.icon_size), 0, 0, cv::INTER_AREA);
    raster::blendMask(canvas, sized, top_left, layout_.text_color);
}

} // namespace eventposter

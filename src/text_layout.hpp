// text_layout.hpp
#pragma once

#include "config.hpp"
#include "event_record.hpp"
#include "text/font.hpp"
#include "text/text_fitter.hpp"

#include <opencv2/core.hpp>
#include <map>
#include <string>
#include <vector>

namespace eventposter {

struct TextBlocks {
    std::vector<DatetimeSegment> datetime;
    text::FitResult title;
    std::string venue;
    std::string address;
};

// Decoded icons by name, 8-bit with an alpha channel where the source had one
using IconSet = std::map<std::string, cv::Mat>;

/**
 * Places the panel text: datetime line near the panel top, the fitted title
 * block centered between it and the venue line, venue and address near the
 * panel bottom. All lines are horizontally centered on the panel.
 */
class TextLayoutEngine {
public:
    TextLayoutEngine(const LayoutConfig& layout, text::FontLibrary& fonts)
        : layout_(layout), fonts_(fonts) {}

    // Fits title lines into layout.titleBox().
    bool fitTitle(const std::vector<std::string>& lines, text::FitResult& result,
                  std::string& error) const;

    bool draw(cv::Mat& canvas, const TextBlocks& blocks, const IconSet& icons,
              std::string& error) const;

    static int shadowOffset(int size_px);

private:
    const LayoutConfig& layout_;
    text::FontLibrary& fonts_;

    const text::Font* font(const TextStyle& style, std::string& error) const;

    bool drawDatetime(cv::Mat& canvas, const std::vector<DatetimeSegment>& segments,
                      const IconSet& icons, std::string& error) const;
    bool drawTitle(cv::Mat& canvas, const text::FitResult& title, std::string& error) const;

    // Centered on the panel, vertically centered on center_y
    bool drawCentered(cv::Mat& canvas, const text::Font& font, const std::string& line,
                      int center_y, bool shadow, std::string& error) const;
    bool drawLine(cv::Mat& canvas, const text::Font& font, const std::string& line,
                  cv::Point origin, bool shadow, std::string& error) const;
    void drawIcon(cv::Mat& canvas, const cv::Mat& icon, cv::Point top_left) const;
};

} // namespace eventposter

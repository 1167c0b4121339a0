// footer_composer.hpp
#pragma once

#include "asset_cache.hpp"
#include "config.hpp"
#include "text/font.hpp"

#include <opencv2/core.hpp>
#include <string>

namespace eventposter {

enum class FooterStatus {
    Drawn,
    SkippedMissingLogo,
    Failed
};

const char* toString(FooterStatus status);

struct FooterResult {
    FooterStatus status = FooterStatus::Failed;
    std::string message;  // reason for skip/failure, or a non-fatal warning
};

/**
 * White band pinned to the bottom of the canvas:
 *
 *   | logo | separator | CTA / link text          QR |
 *
 * The logo is decoded before anything is drawn, so a missing logo leaves the
 * canvas untouched.
 */
class FooterComposer {
public:
    FooterComposer(const LayoutConfig& layout, text::FontLibrary& fonts)
        : layout_(layout), fonts_(fonts) {}

    FooterResult compose(cv::Mat& canvas, const AssetBytes& logo) const;

    // QR modules (with quiet zone) at error-correction level H, CV_8UC1.
    static bool encodeQr(const std::string& url, cv::Mat& qr, std::string& error);

private:
    const LayoutConfig& layout_;
    text::FontLibrary& fonts_;

    cv::Mat scaleLogo(const cv::Mat& logo) const;
    bool drawQr(cv::Mat& canvas, std::string& error) const;
};

} // namespace eventposter

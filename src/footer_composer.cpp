// footer_composer.cpp
#include "footer_composer.hpp"
#include "background_resolver.hpp"
#include "raster.hpp"
#include "utils.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/objdetect.hpp>

#include <algorithm>
#include <cmath>

namespace eventposter {

const char* toString(FooterStatus status) {
    switch (status) {
        case FooterStatus::Drawn: return "drawn";
        case FooterStatus::SkippedMissingLogo: return "skipped (missing logo)";
        case FooterStatus::Failed: return "failed";
    }
    return "unknown";
}

bool FooterComposer::encodeQr(const std::string& url, cv::Mat& qr, std::string& error) {
    if (url.empty()) {
        error = "empty QR content";
        return false;
    }
    try {
        cv::QRCodeEncoder::Params params;
        params.correction_level = cv::QRCodeEncoder::CORRECT_LEVEL_H;
        cv::Ptr<cv::QRCodeEncoder> encoder = cv::QRCodeEncoder::create(params);
        encoder->encode(url, qr);
    } catch (const cv::Exception& e) {
        error = std::string("QR encoding failed: ") + e.what();
        return false;
    }
    if (qr.empty()) {
        error = "QR encoding produced no image";
        return false;
    }
    if (qr.type() != CV_8UC1) {
        cv::Mat gray;
        cv::cvtColor(qr, gray, cv::COLOR_BGR2GRAY);
        qr = gray;
    }
    return true;
}

cv::Mat FooterComposer::scaleLogo(const cv::Mat& logo) const {
    int height = layout_.logo_height;
    int width = std::max(1, static_cast<int>(std::lround(
        static_cast<double>(logo.cols) * height / logo.rows)));
    cv::Mat scaled;
    cv::resize(logo, scaled, cv::Size(width, height), 0, 0, cv::INTER_AREA);
    return scaled;
}

FooterResult FooterComposer::compose(cv::Mat& canvas, const AssetBytes& logo_bytes) const {
    FooterResult result;

    cv::Mat logo;
    if (logo_bytes) {
        logo = decodeImage(*logo_bytes, cv::IMREAD_UNCHANGED);
    }
    if (logo.empty() || logo.channels() == 2) {
        result.status = FooterStatus::SkippedMissingLogo;
        result.message = logo_bytes ? "logo could not be decoded" : "logo not available";
        return result;
    }

    std::string error;
    const text::Font* cta = fonts_.load(layout_.cta.weight, layout_.cta.size);
    const text::Font* link = cta ? fonts_.load(layout_.link.weight, layout_.link.size) : nullptr;
    if (!cta || !link) {
        result.status = FooterStatus::Failed;
        result.message = fonts_.lastError();
        return result;
    }

    try {
        const cv::Rect band = layout_.footerRect();
        raster::blendFill(canvas, band, layout_.footer_color);

        // Logo, vertically centered at the left margin
        cv::Mat scaled = scaleLogo(logo);
        cv::Point logo_pos(layout_.logo_margin, band.y + (band.height - scaled.rows) / 2);
        raster::blendImage(canvas, scaled, logo_pos);

        // Vertical separator
        int sep_x = logo_pos.x + scaled.cols + layout_.separator_gap;
        int sep_top = band.y + layout_.separator_inset;
        int sep_bottom = band.y + band.height - layout_.separator_inset;
        raster::blendFill(canvas, cv::Rect(sep_x, sep_top, layout_.separator_thickness, sep_bottom - sep_top),
                          layout_.separator_color);

        // CTA above link, the pair centered in the band
        int text_x = sep_x + layout_.separator_thickness + layout_.separator_gap;
        int block = layout_.cta.size + layout_.cta_line_gap + layout_.link.size;
        int top = band.y + (band.height - block) / 2;
        int cta_baseline = cta->baselineForCenter(top + layout_.cta.size / 2);
        int link_baseline = link->baselineForCenter(top + layout_.cta.size + layout_.cta_line_gap +
                                                    layout_.link.size / 2);

        if (!cta->draw(canvas, layout_.cta_text, cv::Point(text_x, cta_baseline), layout_.brand_color, error) ||
            !link->draw(canvas, layout_.link_text, cv::Point(text_x, link_baseline), layout_.link_color, error)) {
            result.status = FooterStatus::Failed;
            result.message = error;
            return result;
        }

        result.status = FooterStatus::Drawn;
        if (!drawQr(canvas, error)) {
            result.message = error;
            Logger::log(Logger::WARNING, "QR code omitted: " + error);
        }
    } catch (const cv::Exception& e) {
        result.status = FooterStatus::Failed;
        result.message = std::string("footer drawing failed: ") + e.what();
    }
    return result;
}

bool FooterComposer::drawQr(cv::Mat& canvas, std::string& error) const {
    cv::Mat modules;
    if (!encodeQr(layout_.qr_url, modules, error)) return false;

    cv::Mat qr;
    cv::resize(modules, qr, cv::Size(layout_.qr_size, layout_.qr_size), 0, 0, cv::INTER_NEAREST);

    const cv::Rect band = layout_.footerRect();
    cv::Point pos(layout_.canvas_width - layout_.qr_padding - layout_.qr_size,
                  band.y + (band.height - layout_.qr_size) / 2);
    raster::blendImage(canvas, qr, pos);

    if (layout_.qr_border_thickness > 0) {
        const int m = layout_.qr_border_margin;
        cv::Rect frame(pos.x - m, pos.y - m, layout_.qr_size + 2 * m, layout_.qr_size + 2 * m);
        raster::strokeRoundedRect(canvas, frame, layout_.qr_border_radius, layout_.brand_color,
                                  layout_.qr_border_thickness);
    }
    return true;
}

} // namespace eventposter

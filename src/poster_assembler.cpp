// poster_assembler.cpp
#include "poster_assembler.hpp"
#include "footer_composer.hpp"
#include "panel_compositor.hpp"
#include "raster.hpp"
#include "text/font.hpp"
#include "utils.hpp"

#include <opencv2/imgcodecs.hpp>

namespace eventposter {

namespace {

const char* const kIconNames[] = {"clock", "calendar"};

} // namespace

RenderResult PosterAssembler::render(const EventRecord& record, const CancellationToken* cancel) const {
    ResolvedBackground background = resolver_.resolve(record.background_query, record.page, cancel);

    if (cancel && cancel->isCancelled()) {
        RenderResult result;
        result.error = "cancelled";
        return result;
    }

    RenderResult result = compose(record, background);
    if (background.isFallback() && !record.background_query.empty()) {
        result.warnings.push_back("background '" + record.background_query + "' unavailable (" +
                                  background.source + "), used fallback");
    }
    return result;
}

bool PosterAssembler::loadIcons(IconSet& icons, std::vector<std::string>& warnings) const {
    bool all = true;
    for (const char* name : kIconNames) {
        AssetBytes bytes;
        std::string error;
        cv::Mat icon;
        if (assets_.getOrFetch(std::string("icon:") + name, bytes, error)) {
            icon = decodeImage(*bytes, cv::IMREAD_UNCHANGED);
            if (icon.empty()) error = std::string("icon:") + name + ": not an image";
        }
        if (icon.empty()) {
            warnings.push_back(error + ", datetime drawn without icons");
            all = false;
            continue;
        }
        icons[name] = icon;
    }
    return all;
}

RenderResult PosterAssembler::compose(const EventRecord& record, const ResolvedBackground& background) const {
    RenderResult result;
    result.used_fallback_background = background.isFallback();
    Timer timer;

    AssetBytes font_bytes;
    std::string error;
    if (!assets_.getOrFetch("font", font_bytes, error)) {
        result.error = "font unavailable: " + error;
        Logger::log(Logger::ERROR, result.error);
        return result;
    }
    text::FontLibrary fonts(font_bytes, "font");
    if (!fonts.initialize()) {
        result.error = fonts.lastError();
        Logger::log(Logger::ERROR, result.error);
        return result;
    }

    cv::Mat canvas;
    PanelCompositor compositor(layout_);
    if (!compositor.apply(canvas, background.image, error)) {
        result.error = error;
        Logger::log(Logger::ERROR, result.error);
        return result;
    }

    IconSet icons;
    bool with_icons = loadIcons(icons, result.warnings);

    TextLayoutEngine engine(layout_, fonts);
    TextBlocks blocks;
    blocks.datetime = datetimeSegments(record, with_icons, layout_.datetime_separator);
    blocks.venue = record.venue;
    blocks.address = record.address;

    if (!engine.fitTitle(record.title, blocks.title, error)) {
        result.error = "title fitting failed: " + error;
        Logger::log(Logger::ERROR, result.error);
        return result;
    }
    if (blocks.title.overflowing_word) {
        result.warnings.push_back("title word wider than the panel at " +
                                  std::to_string(blocks.title.chosen_font_size) + "px");
    }

    try {
        if (!engine.draw(canvas, blocks, icons, error)) {
            result.error = "text layout failed: " + error;
            Logger::log(Logger::ERROR, result.error);
            return result;
        }
    } catch (const cv::Exception& e) {
        result.error = std::string("text layout failed: ") + e.what();
        Logger::log(Logger::ERROR, result.error);
        return result;
    }

    AssetBytes logo;
    std::string logo_error;
    if (!assets_.getOrFetch("logo", logo, logo_error)) {
        logo.reset();
    }

    FooterComposer footer(layout_, fonts);
    FooterResult footer_result = footer.compose(canvas, logo);
    switch (footer_result.status) {
        case FooterStatus::Drawn:
            result.footer_drawn = true;
            if (!footer_result.message.empty()) result.warnings.push_back(footer_result.message);
            break;
        case FooterStatus::SkippedMissingLogo:
            result.warnings.push_back("footer skipped: " +
                                      (logo_error.empty() ? footer_result.message : logo_error));
            break;
        case FooterStatus::Failed:
            result.error = "footer failed: " + footer_result.message;
            Logger::log(Logger::ERROR, result.error);
            return result;
    }

    try {
        result.image = raster::flattenToBgr(canvas);
        if (!cv::imencode(".png", result.image, result.png)) {
            result.error = "PNG encoding failed";
            Logger::log(Logger::ERROR, result.error);
            return result;
        }
    } catch (const cv::Exception& e) {
        result.error = std::string("PNG encoding failed: ") + e.what();
        Logger::log(Logger::ERROR, result.error);
        return result;
    }

    for (const auto& warning : result.warnings) {
        Logger::log(Logger::WARNING, warning);
    }

    result.fit = blocks.title;
    result.ok = true;
    Logger::log(Logger::DEBUG, "Poster composed in " + std::to_string(static_cast<int>(timer.elapsed_ms())) +
                " ms, title at " + std::to_string(result.fit.chosen_font_size) + "px" +
                (result.fit.used_wrap_fallback ? " (wrapped)" : ""));
    return result;
}

} // namespace eventposter

// poster_assembler.hpp
#pragma once

#include "asset_cache.hpp"
#include "background_resolver.hpp"
#include "config.hpp"
#include "event_record.hpp"
#include "text_layout.hpp"
#include "text/text_fitter.hpp"

#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace eventposter {

class CancellationToken;

struct RenderResult {
    bool ok = false;
    std::string error;
    std::vector<std::string> warnings;
    std::string label;

    cv::Mat image;               // opaque BGR, canvas size
    std::vector<uchar> png;
    text::FitResult fit;
    bool used_fallback_background = false;
    bool footer_drawn = false;
};

// Renders one poster for a record. Implementations must be safe to call from
// several threads at once.
class PosterRenderer {
public:
    virtual ~PosterRenderer() = default;
    virtual RenderResult render(const EventRecord& record, const CancellationToken* cancel = nullptr) const = 0;
};

/**
 * Runs the whole pipeline for one poster:
 *
 *   background -> panel -> title fit -> text -> footer -> flatten + PNG
 *
 * Every call builds its own canvas and FontLibrary; the only shared state is
 * the asset cache, so concurrent renders do not interfere.
 */
class PosterAssembler : public PosterRenderer {
public:
    PosterAssembler(const LayoutConfig& layout, AssetCache& assets, const BackgroundResolver& resolver)
        : layout_(layout), assets_(assets), resolver_(resolver) {}

    RenderResult render(const EventRecord& record, const CancellationToken* cancel = nullptr) const override;

    // Pipeline without the background lookup; deterministic for equal inputs.
    RenderResult compose(const EventRecord& record, const ResolvedBackground& background) const;

private:
    const LayoutConfig& layout_;
    AssetCache& assets_;
    const BackgroundResolver& resolver_;

    bool loadIcons(IconSet& icons, std::vector<std::string>& warnings) const;
};

} // namespace eventposter

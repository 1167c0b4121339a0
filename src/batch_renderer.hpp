// batch_renderer.hpp
#pragma once

#include "event_record.hpp"
#include "poster_assembler.hpp"

#include <string>
#include <vector>

namespace eventposter {

class CancellationToken;

/**
 * Renders several variants of one event on a small pool of threads.
 *
 * min(requests, max_workers) workers take request indices from a shared
 * counter and write into the matching result slot, so results come back in
 * request order regardless of which finishes first. Cancelling the token
 * aborts in-flight downloads and stops workers from picking up new work; a
 * cancelled batch returns no results.
 */
class BatchRenderer {
public:
    BatchRenderer(const PosterRenderer& renderer, int max_workers);

    std::vector<RenderResult> renderBatch(const EventRecord& record,
                                          const std::vector<VariantRequest>& requests,
                                          const CancellationToken* cancel = nullptr) const;

    int maxWorkers() const { return max_workers_; }

private:
    const PosterRenderer& renderer_;
    int max_workers_;
};

struct WrittenPoster {
    std::string path;
    const RenderResult* result = nullptr;
};

// Writes each successful result to output_dir as event_<date>_v<N>.png.
// N counts written posters from 1, so failed variants leave no gaps.
std::vector<WrittenPoster> writePosters(const std::vector<RenderResult>& results, const EventRecord& record,
                                        const std::string& output_dir);

} // namespace eventposter

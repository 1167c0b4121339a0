// batch_renderer.cpp
#include "batch_renderer.hpp"
#include "asset_cache.hpp"
#include "utils.hpp"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <thread>

namespace eventposter {

BatchRenderer::BatchRenderer(const PosterRenderer& renderer, int max_workers)
    : renderer_(renderer), max_workers_(std::max(1, max_workers)) {}

std::vector<RenderResult> BatchRenderer::renderBatch(const EventRecord& record,
                                                     const std::vector<VariantRequest>& requests,
                                                     const CancellationToken* cancel) const {
    if (requests.empty()) return {};

    std::vector<RenderResult> slots(requests.size());
    std::atomic<size_t> next{0};
    Timer timer;

    auto worker = [&]() {
        while (!(cancel && cancel->isCancelled())) {
            size_t index = next.fetch_add(1);
            if (index >= requests.size()) break;

            const VariantRequest& request = requests[index];
            EventRecord variant = record;
            variant.background_query = request.query;
            variant.page = request.page;

            Logger::log(Logger::DEBUG, request.label + ": query '" + request.query +
                        "' page " + std::to_string(request.page));
            slots[index] = renderer_.render(variant, cancel);
            slots[index].label = request.label;
        }
    };

    const size_t worker_count = std::min(requests.size(), static_cast<size_t>(max_workers_));
    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& t : workers) {
        t.join();
    }

    if (cancel && cancel->isCancelled()) {
        Logger::log(Logger::WARNING, "Batch cancelled, discarding results");
        return {};
    }

    size_t ok = std::count_if(slots.begin(), slots.end(), [](const RenderResult& r) { return r.ok; });
    Logger::log(Logger::INFO, "Rendered " + std::to_string(ok) + "/" + std::to_string(slots.size()) +
                " variants on " + std::to_string(worker_count) + " workers in " +
                std::to_string(static_cast<int>(timer.elapsed_ms())) + " ms");
    if (ok < slots.size()) {
        Logger::log(Logger::WARNING, "Only " + std::to_string(ok) + " of " + std::to_string(slots.size()) +
                    " variants could be generated");
    }
    return slots;
}

std::vector<WrittenPoster> writePosters(const std::vector<RenderResult>& results, const EventRecord& record,
                                        const std::string& output_dir) {
    std::vector<WrittenPoster> written;
    for (const RenderResult& result : results) {
        if (!result.ok) {
            Logger::log(Logger::ERROR, result.label + " failed: " + result.error);
            continue;
        }

        const int number = static_cast<int>(written.size()) + 1;
        std::string path = (std::filesystem::path(output_dir) / outputFileName(record, number)).string();
        std::string error;
        if (!writeFile(path, result.png, error)) {
            Logger::log(Logger::ERROR, error);
            continue;
        }
        written.push_back({path, &result});
    }
    return written;
}

} // namespace eventposter

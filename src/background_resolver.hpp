// background_resolver.hpp
#pragma once

#include "net/image_search_client.hpp"

#include <opencv2/core.hpp>
#include <string>

namespace eventposter {

class CancellationToken;

struct ResolvedBackground {
    cv::Mat image;       // 8-bit, 1/3/4 channels; empty means fallback
    std::string source;  // query and page, or why the fallback was used

    bool isFallback() const { return image.empty(); }
};

/**
 * Turns an optional search query into a background image. Every failure
 * (no query, network, empty results, undecodable bytes, cancellation)
 * degrades to the fallback and is logged; resolve() never throws.
 */
class BackgroundResolver {
public:
    // client may be null, in which case every query falls back
    BackgroundResolver(const net::ImageSearchClient* client, int per_page)
        : client_(client), per_page_(per_page) {}

    ResolvedBackground resolve(const std::string& query, int page,
                               const CancellationToken* cancel = nullptr) const;

private:
    const net::ImageSearchClient* client_;
    int per_page_;
};

// Decodes any OpenCV-readable image to 8 bits per channel. Returns an empty
// Mat when the bytes are not an image.
cv::Mat decodeImage(const std::vector<uint8_t>& bytes, int flags);

} // namespace eventposter

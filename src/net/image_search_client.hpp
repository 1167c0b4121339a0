// image_search_client.hpp
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace eventposter {

class CancellationToken;

namespace net {

struct SearchRequest {
    std::string query;
    int page = 1;
    int per_page = 15;
};

// Finds one photo for a query and downloads it. The result at index
// (page - 1) % per_page is used.
class ImageSearchClient {
public:
    virtual ~ImageSearchClient() = default;

    virtual bool search(const SearchRequest& request, std::vector<uint8_t>& image_bytes,
                        std::string& error, const CancellationToken* cancel = nullptr) const = 0;
};

}} // namespace eventposter::net

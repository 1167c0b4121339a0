// pexels_client.hpp
#pragma once

#include "config.hpp"
#include "net/http_client.hpp"
#include "net/image_search_client.hpp"

#include <string>

namespace eventposter { namespace net {

// Pexels photo search (https://www.pexels.com/api/).
class PexelsSearchClient : public ImageSearchClient {
public:
    PexelsSearchClient(SearchConfig config, const HttpClient& http);

    bool search(const SearchRequest& request, std::vector<uint8_t>& image_bytes,
                std::string& error, const CancellationToken* cancel = nullptr) const override;

    std::string searchUrl(const SearchRequest& request) const;

private:
    SearchConfig config_;
    const HttpClient& http_;
};

// Picks photos[(page - 1) % per_page].src.original from a search response.
bool parseSearchResponse(const std::string& json, int page, int per_page,
                         std::string& image_url, std::string& error);

}} // namespace eventposter::net

// pexels_client.cpp
#include "net/pexels_client.hpp"
#include "utils.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>

namespace eventposter { namespace net {

PexelsSearchClient::PexelsSearchClient(SearchConfig config, const HttpClient& http)
    : config_(std::move(config)), http_(http) {
    if (config_.api_key.empty()) {
        Logger::log(Logger::WARNING, "No Pexels API key configured, backgrounds will use the fallback");
    }
}

std::string PexelsSearchClient::searchUrl(const SearchRequest& request) const {
    std::string url = config_.endpoint;
    url += "?query=" + HttpClient::urlEncode(request.query);
    url += "&per_page=" + std::to_string(request.per_page);
    url += "&page=" + std::to_string(std::max(1, request.page));
    if (!config_.orientation.empty()) url += "&orientation=" + HttpClient::urlEncode(config_.orientation);
    if (!config_.sort.empty()) url += "&sort=" + HttpClient::urlEncode(config_.sort);
    return url;
}

bool PexelsSearchClient::search(const SearchRequest& request, std::vector<uint8_t>& image_bytes,
                                std::string& error, const CancellationToken* cancel) const {
    if (config_.api_key.empty()) {
        error = "no API key";
        return false;
    }

    HttpRequest query;
    query.url = searchUrl(request);
    query.headers.push_back("Authorization: " + config_.api_key);
    query.headers.push_back("Accept: application/json");

    HttpResponse response;
    if (!http_.perform(query, response, error, cancel)) {
        return false;
    }
    if (!isSuccess(response.status)) {
        error = "search returned HTTP " + std::to_string(response.status);
        return false;
    }

    std::string image_url;
    if (!parseSearchResponse(response.body, request.page, request.per_page, image_url, error)) {
        return false;
    }

    Logger::log(Logger::DEBUG, "Downloading background " + image_url);

    HttpRequest download;
    download.url = image_url;
    HttpResponse image;
    if (!http_.perform(download, image, error, cancel)) {
        return false;
    }
    if (!isSuccess(image.status)) {
        error = "image download returned HTTP " + std::to_string(image.status);
        return false;
    }
    if (image.body.empty()) {
        error = "image download returned no data";
        return false;
    }

    image_bytes.assign(image.body.begin(), image.body.end());
    return true;
}

bool parseSearchResponse(const std::string& json, int page, int per_page,
                         std::string& image_url, std::string& error) {
    if (per_page < 1) {
        error = "per_page must be positive";
        return false;
    }

    // JSON is a subset of YAML's flow style
    try {
        YAML::Node root = YAML::Load(json);
        if (!root.IsMap()) {
            error = "unexpected search response";
            return false;
        }

        YAML::Node photos = root["photos"];
        if (!photos || !photos.IsSequence() || photos.size() == 0) {
            error = "no results";
            return false;
        }

        const size_t index = static_cast<size_t>((std::max(1, page) - 1) % per_page);
        if (index >= photos.size()) {
            error = "result " + std::to_string(index) + " out of range (" +
                    std::to_string(photos.size()) + " results)";
            return false;
        }

        YAML::Node photo = photos[index];
        YAML::Node src = photo.IsMap() ? photo["src"] : YAML::Node();
        YAML::Node original = (src && src.IsMap()) ? src["original"] : YAML::Node();
        if (!original || !original.IsScalar() || original.Scalar().empty()) {
            error = "result has no image URL";
            return false;
        }
        image_url = original.Scalar();
        return true;
    } catch (const YAML::Exception& e) {
        error = std::string("malformed search response: ") + e.what();
        return false;
    }
}

}} // namespace eventposter::net

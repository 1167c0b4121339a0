// asset_cache.cpp
#include "asset_cache.hpp"
#include "utils.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>

namespace eventposter {

namespace {

const std::string kIconPrefix = "icon:";

} // namespace

bool readFile(const std::string& path, std::vector<uint8_t>& bytes, std::string& error) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error = "cannot open " + path;
        return false;
    }
    bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
        error = "read error on " + path;
        return false;
    }
    if (bytes.empty()) {
        error = path + " is empty";
        return false;
    }
    return true;
}

bool writeFile(const std::string& path, const std::vector<uint8_t>& bytes, std::string& error) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        error = "cannot open " + path + " for writing";
        return false;
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        error = "write error on " + path;
        return false;
    }
    return true;
}

FileAssetCache::FileAssetCache(AssetConfig config, const net::HttpClient& http)
    : config_(std::move(config)), http_(&http) {
    loader_ = [this](const std::string& key, std::vector<uint8_t>& bytes, std::string& error) {
        return loadFromDisk(key, bytes, error);
    };
}

FileAssetCache::FileAssetCache(Loader loader) : loader_(std::move(loader)) {}

bool FileAssetCache::getOrFetch(const std::string& key, AssetBytes& bytes, std::string& error) {
    std::promise<Outcome> promise;
    std::shared_future<Outcome> future;
    bool owner = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            future = it->second;
        } else {
            future = promise.get_future().share();
            entries_.emplace(key, future);
            owner = true;
        }
    }

    if (owner) {
        load_count_++;
        Outcome outcome;
        try {
            std::vector<uint8_t> data;
            outcome.ok = loader_(key, data, outcome.error);
            if (outcome.ok) {
                outcome.bytes = std::make_shared<const std::vector<uint8_t>>(std::move(data));
            }
        } catch (const std::exception& e) {
            outcome.ok = false;
            outcome.error = std::string("loader threw: ") + e.what();
        } catch (...) {
            outcome.ok = false;
            outcome.error = "loader threw an unknown exception";
        }
        // Waiters block on the promise, so it is satisfied on every path
        if (!outcome.ok) {
            outcome.bytes.reset();
            std::lock_guard<std::mutex> lock(mutex_);
            entries_.erase(key);
        }
        promise.set_value(std::move(outcome));
    }

    const Outcome& outcome = future.get();
    if (!outcome.ok) {
        error = key + ": " + outcome.error;
        return false;
    }
    bytes = outcome.bytes;
    return true;
}

bool FileAssetCache::loadFromDisk(const std::string& key, std::vector<uint8_t>& bytes,
                                  std::string& error) const {
    if (key == "font") return readFile(config_.font_path, bytes, error);
    if (key == "logo") return readFile(config_.logo_path, bytes, error);

    if (key.compare(0, kIconPrefix.size(), kIconPrefix) != 0) {
        error = "unknown asset";
        return false;
    }

    const std::string name = key.substr(kIconPrefix.size());
    const std::string path = (std::filesystem::path(config_.icon_dir) / (name + ".png")).string();

    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        return readFile(path, bytes, error);
    }
    return downloadIcon(name, path, bytes, error);
}

bool FileAssetCache::downloadIcon(const std::string& name, const std::string& path,
                                  std::vector<uint8_t>& bytes, std::string& error) const {
    auto it = config_.icon_urls.find(name);
    if (it == config_.icon_urls.end() || it->second.empty()) {
        error = "not on disk and no download URL configured";
        return false;
    }
    if (!http_) {
        error = "no HTTP client for download";
        return false;
    }

    Logger::log(Logger::INFO, "Downloading icon '" + name + "' from " + it->second);

    net::HttpRequest request;
    request.url = it->second;
    net::HttpResponse response;
    if (!http_->perform(request, response, error)) {
        return false;
    }
    if (!net::isSuccess(response.status)) {
        error = "download failed with HTTP " + std::to_string(response.status);
        return false;
    }
    if (response.body.empty()) {
        error = "download returned no data";
        return false;
    }
    bytes.assign(response.body.begin(), response.body.end());

    // The icon is usable even if it cannot be cached on disk
    std::error_code ec;
    std::filesystem::create_directories(config_.icon_dir, ec);
    std::string write_error;
    if (ec || !writeFile(path, bytes, write_error)) {
        Logger::log(Logger::WARNING, "Could not cache icon '" + name + "': " +
                    (ec ? ec.message() : write_error));
    }
    return true;
}

} // namespace eventposter

// asset_cache.hpp
#pragma once

#include "config.hpp"
#include "net/http_client.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace eventposter {

using AssetBytes = std::shared_ptr<const std::vector<uint8_t>>;

// Read-only asset bytes by logical name: "font", "logo", "icon:<name>".
class AssetCache {
public:
    virtual ~AssetCache() = default;

    // Blocks until the asset is available or has failed.
    virtual bool getOrFetch(const std::string& key, AssetBytes& bytes, std::string& error) = 0;
};

/**
 * Asset store backed by the configured files. Icons missing on disk are
 * downloaded from their configured URL and written to the icon directory.
 *
 * Each key is loaded once no matter how many threads ask for it at the same
 * time: the first caller runs the loader and everyone else waits on the same
 * shared future. Successful loads stay cached for the lifetime of the object;
 * a failure is reported to every waiter of that attempt and then dropped, so
 * a later call tries again.
 */
class FileAssetCache : public AssetCache {
public:
    using Loader = std::function<bool(const std::string& key, std::vector<uint8_t>& bytes,
                                      std::string& error)>;

    FileAssetCache(AssetConfig config, const net::HttpClient& http);
    explicit FileAssetCache(Loader loader);

    bool getOrFetch(const std::string& key, AssetBytes& bytes, std::string& error) override;

    // Number of loader runs so far
    size_t loadCount() const { return load_count_.load(); }

private:
    struct Outcome {
        bool ok = false;
        AssetBytes bytes;
        std::string error;
    };

    bool loadFromDisk(const std::string& key, std::vector<uint8_t>& bytes, std::string& error) const;
    bool downloadIcon(const std::string& name, const std::string& path,
                      std::vector<uint8_t>& bytes, std::string& error) const;

    AssetConfig config_;
    const net::HttpClient* http_ = nullptr;
    Loader loader_;

    std::mutex mutex_;
    std::map<std::string, std::shared_future<Outcome>> entries_;
    std::atomic<size_t> load_count_{0};
};

bool readFile(const std::string& path, std::vector<uint8_t>& bytes, std::string& error);
bool writeFile(const std::string& path, const std::vector<uint8_t>& bytes, std::string& error);

} // namespace eventposter

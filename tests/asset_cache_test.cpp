#include <gtest/gtest.h>
#include "asset_cache.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <thread>

#include <unistd.h>

using namespace eventposter;

namespace {

std::vector<uint8_t> bytesOf(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

class TempDir {
public:
    TempDir() {
        path_ = std::filesystem::temp_directory_path() /
                ("eventposter_assets_" + std::to_string(::getpid()) + "_" + std::to_string(counter_++));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    std::string file(const std::string& name) const { return (path_ / name).string(); }
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    static int counter_;
};

int TempDir::counter_ = 0;

} // namespace

TEST(AssetCacheTest, ConcurrentRequestsShareOneFetch) {
    std::atomic<int> loads{0};
    FileAssetCache cache([&](const std::string& key, std::vector<uint8_t>& bytes, std::string&) {
        loads++;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        bytes = bytesOf("data:" + key);
        return true;
    });

    const int kThreads = 16;
    std::vector<AssetBytes> results(kThreads);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] {
            std::string error;
            EXPECT_TRUE(cache.getOrFetch("icon:clock", results[i], error)) << error;
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(loads.load(), 1);
    EXPECT_EQ(cache.loadCount(), 1u);
    for (const auto& r : results) {
        ASSERT_TRUE(r);
        EXPECT_EQ(r.get(), results[0].get());
    }
    EXPECT_EQ(*results[0], bytesOf("data:icon:clock"));
}

TEST(AssetCacheTest, SuccessIsMemoized) {
    FileAssetCache cache([](const std::string&, std::vector<uint8_t>& bytes, std::string&) {
        bytes = bytesOf("x");
        return true;
    });
    AssetBytes a, b;
    std::string error;
    ASSERT_TRUE(cache.getOrFetch("logo", a, error));
    ASSERT_TRUE(cache.getOrFetch("logo", b, error));
    ASSERT_TRUE(cache.getOrFetch("font", b, error));
    EXPECT_EQ(cache.loadCount(), 2u);
}

TEST(AssetCacheTest, FailureIsNotCachedSoLaterCallsRetry) {
    std::atomic<int> attempts{0};
    FileAssetCache cache([&](const std::string&, std::vector<uint8_t>& bytes, std::string& error) {
        if (attempts++ == 0) {
            error = "temporarily unavailable";
            return false;
        }
        bytes = bytesOf("ok");
        return true;
    });

    AssetBytes bytes;
    std::string error;
    EXPECT_FALSE(cache.getOrFetch("icon:calendar", bytes, error));
    EXPECT_NE(error.find("temporarily unavailable"), std::string::npos);
    EXPECT_FALSE(bytes);

    EXPECT_TRUE(cache.getOrFetch("icon:calendar", bytes, error));
    ASSERT_TRUE(bytes);
    EXPECT_EQ(cache.loadCount(), 2u);
}

TEST(AssetCacheTest, ThrowingLoaderIsReportedAndRetried) {
    std::atomic<int> attempts{0};
    FileAssetCache cache([&](const std::string&, std::vector<uint8_t>& bytes, std::string&) -> bool {
        if (attempts++ == 0) {
            throw std::runtime_error("disk on fire");
        }
        bytes = bytesOf("ok");
        return true;
    });

    AssetBytes bytes;
    std::string error;
    EXPECT_FALSE(cache.getOrFetch("logo", bytes, error));
    EXPECT_NE(error.find("disk on fire"), std::string::npos);
    EXPECT_FALSE(bytes);

    // The failed attempt must not leave a broken entry behind
    error.clear();
    EXPECT_TRUE(cache.getOrFetch("logo", bytes, error)) << error;
    ASSERT_TRUE(bytes);
    EXPECT_EQ(*bytes, bytesOf("ok"));
    EXPECT_EQ(cache.loadCount(), 2u);
}

TEST(AssetCacheTest, ConcurrentWaitersAllSeeTheFailure) {
    FileAssetCache cache([](const std::string&, std::vector<uint8_t>&, std::string& error) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        error = "down";
        return false;
    });

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            AssetBytes bytes;
            std::string error;
            if (!cache.getOrFetch("logo", bytes, error)) failures++;
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(failures.load(), 8);
}

TEST(AssetCacheTest, ReadsConfiguredFiles) {
    TempDir dir;
    std::string error;
    ASSERT_TRUE(writeFile(dir.file("font.ttf"), bytesOf("FONT"), error)) << error;
    ASSERT_TRUE(writeFile(dir.file("logo.png"), bytesOf("LOGO"), error)) << error;
    std::filesystem::create_directories(dir.path() / "icons");
    ASSERT_TRUE(writeFile(dir.file("icons/clock.png"), bytesOf("CLOCK"), error)) << error;

    AssetConfig config;
    config.font_path = dir.file("font.ttf");
    config.logo_path = dir.file("logo.png");
    config.icon_dir = dir.file("icons");
    config.icon_urls.clear();

    net::HttpClient http;
    FileAssetCache cache(config, http);

    AssetBytes bytes;
    ASSERT_TRUE(cache.getOrFetch("font", bytes, error)) << error;
    EXPECT_EQ(*bytes, bytesOf("FONT"));
    ASSERT_TRUE(cache.getOrFetch("logo", bytes, error)) << error;
    EXPECT_EQ(*bytes, bytesOf("LOGO"));
    ASSERT_TRUE(cache.getOrFetch("icon:clock", bytes, error)) << error;
    EXPECT_EQ(*bytes, bytesOf("CLOCK"));
}

TEST(AssetCacheTest, MissingFilesAndUnknownKeysFail) {
    TempDir dir;
    AssetConfig config;
    config.font_path = dir.file("missing.ttf");
    config.logo_path = dir.file("missing.png");
    config.icon_dir = dir.file("icons");
    config.icon_urls.clear();

    net::HttpClient http;
    FileAssetCache cache(config, http);

    AssetBytes bytes;
    std::string error;
    EXPECT_FALSE(cache.getOrFetch("font", bytes, error));
    EXPECT_FALSE(cache.getOrFetch("logo", bytes, error));
    EXPECT_FALSE(cache.getOrFetch("icon:calendar", bytes, error));
    EXPECT_NE(error.find("no download URL"), std::string::npos);
    EXPECT_FALSE(cache.getOrFetch("soundtrack", bytes, error));
}

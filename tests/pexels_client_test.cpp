#include <gtest/gtest.h>
#include "fake_http_client.hpp"
#include "net/pexels_client.hpp"

#include <algorithm>

using namespace eventposter;

namespace {

const char* kTwoPhotos = R"({
  "page": 1,
  "per_page": 15,
  "photos": [
    {"id": 1, "width": 4000, "src": {"original": "https://images.pexels.com/photos/1/a.jpeg", "large": "x"}},
    {"id": 2, "width": 3000, "src": {"original": "https://images.pexels.com/photos/2/b.jpeg"}}
  ],
  "total_results": 2
})";

SearchConfig searchConfig(const std::string& key) {
    SearchConfig config;
    config.api_key = key;
    return config;
}

} // namespace

TEST(PexelsClientTest, ParsesResultAtPageIndex) {
    std::string url, error;
    ASSERT_TRUE(net::parseSearchResponse(kTwoPhotos, 1, 15, url, error)) << error;
    EXPECT_EQ(url, "https://images.pexels.com/photos/1/a.jpeg");

    ASSERT_TRUE(net::parseSearchResponse(kTwoPhotos, 2, 15, url, error)) << error;
    EXPECT_EQ(url, "https://images.pexels.com/photos/2/b.jpeg");

    // (17 - 1) % 15 == 1
    ASSERT_TRUE(net::parseSearchResponse(kTwoPhotos, 17, 15, url, error)) << error;
    EXPECT_EQ(url, "https://images.pexels.com/photos/2/b.jpeg");
}

TEST(PexelsClientTest, IndexBeyondResultsIsAnError) {
    std::string url, error;
    EXPECT_FALSE(net::parseSearchResponse(kTwoPhotos, 3, 15, url, error));
    EXPECT_NE(error.find("out of range"), std::string::npos);
}

TEST(PexelsClientTest, EmptyOrMalformedResponses) {
    std::string url, error;
    EXPECT_FALSE(net::parseSearchResponse(R"({"photos": [], "total_results": 0})", 3, 15, url, error));
    EXPECT_EQ(error, "no results");

    EXPECT_FALSE(net::parseSearchResponse(R"({"error": "Unauthorized"})", 1, 15, url, error));
    EXPECT_FALSE(net::parseSearchResponse(R"({"photos": [{"id": 1}]})", 1, 15, url, error));
    EXPECT_FALSE(net::parseSearchResponse("{\"photos\": [", 1, 15, url, error));
    EXPECT_FALSE(net::parseSearchResponse("", 1, 15, url, error));
}

TEST(PexelsClientTest, BuildsSearchUrl) {
    test::FakeHttpClient http;
    net::PexelsSearchClient client(searchConfig("KEY"), http);

    net::SearchRequest request;
    request.query = "office party & friends";
    request.page = 2;
    request.per_page = 15;
    std::string url = client.searchUrl(request);

    EXPECT_EQ(url.rfind("https://api.pexels.com/v1/search?", 0), 0u);
    EXPECT_NE(url.find("query=office%20party%20%26%20friends"), std::string::npos);
    EXPECT_NE(url.find("per_page=15"), std::string::npos);
    EXPECT_NE(url.find("page=2"), std::string::npos);
    EXPECT_NE(url.find("orientation=square"), std::string::npos);
    EXPECT_NE(url.find("sort=popular"), std::string::npos);
}

TEST(PexelsClientTest, SearchDownloadsSelectedPhoto) {
    test::FakeHttpClient http;
    http.queue(200, kTwoPhotos);
    http.queue(200, "IMAGEBYTES");
    net::PexelsSearchClient client(searchConfig("KEY"), http);

    net::SearchRequest request;
    request.query = "party";
    request.page = 2;
    std::vector<uint8_t> bytes;
    std::string error;
    ASSERT_TRUE(client.search(request, bytes, error)) << error;
    EXPECT_EQ(std::string(bytes.begin(), bytes.end()), "IMAGEBYTES");

    auto requests = http.requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_NE(std::find(requests[0].headers.begin(), requests[0].headers.end(), "Authorization: KEY"),
              requests[0].headers.end());
    EXPECT_EQ(requests[1].url, "https://images.pexels.com/photos/2/b.jpeg");
}

TEST(PexelsClientTest, NonSuccessStatusIsAnError) {
    test::FakeHttpClient http;
    http.queue(401, R"({"error": "Unauthorized"})");
    net::PexelsSearchClient client(searchConfig("BAD"), http);

    net::SearchRequest request;
    request.query = "party";
    std::vector<uint8_t> bytes;
    std::string error;
    EXPECT_FALSE(client.search(request, bytes, error));
    EXPECT_NE(error.find("401"), std::string::npos);
}

TEST(PexelsClientTest, MissingKeyFailsWithoutNetwork) {
    test::FakeHttpClient http;
    net::PexelsSearchClient client(searchConfig(""), http);

    net::SearchRequest request;
    request.query = "party";
    std::vector<uint8_t> bytes;
    std::string error;
    EXPECT_FALSE(client.search(request, bytes, error));
    EXPECT_TRUE(http.requests().empty());
}

#include <gtest/gtest.h>
#include "fake_http_client.hpp"
#include "net/webhook_publisher.hpp"

using namespace eventposter;

namespace {

std::vector<unsigned char> bytesOf(const std::string& s) {
    return std::vector<unsigned char>(s.begin(), s.end());
}

EventRecord sampleRecord() {
    return EventRecord::fromInput("19:00", "2025-10-26", "Reunión\nEXATEC", "Bonn", "Markt 1, \"Altstadt\"", "", 1);
}

} // namespace

TEST(WebhookPublisherTest, Base64Encoding) {
    EXPECT_EQ(net::base64Encode(bytesOf("")), "");
    EXPECT_EQ(net::base64Encode(bytesOf("M")), "TQ==");
    EXPECT_EQ(net::base64Encode(bytesOf("Ma")), "TWE=");
    EXPECT_EQ(net::base64Encode(bytesOf("Man")), "TWFu");
    EXPECT_EQ(net::base64Encode({0xFF, 0xFE, 0xFD, 0x00}), "//79AA==");
}

TEST(WebhookPublisherTest, EscapesJsonStrings) {
    EXPECT_EQ(net::escapeJson("a\"b\\c\nd"), "a\\\"b\\\\c\\nd");
    EXPECT_EQ(net::escapeJson(std::string("\x01", 1)), "\\u0001");
    EXPECT_EQ(net::escapeJson("Reunión"), "Reunión");
}

TEST(WebhookPublisherTest, PayloadCarriesImageAndEventFields) {
    std::string payload = net::WebhookPublisher::buildPayload(bytesOf("Man"), sampleRecord(), "Reunión\nEXATEC");

    EXPECT_EQ(payload.rfind("{\"image\":\"data:image/png;base64,TWFu\"", 0), 0u);
    EXPECT_NE(payload.find("\"event_name\":\"Reunión\\nEXATEC\""), std::string::npos);
    EXPECT_NE(payload.find("\"date\":\"26.10.2025\""), std::string::npos);
    EXPECT_NE(payload.find("\"time\":\"19:00\""), std::string::npos);
    EXPECT_NE(payload.find("\"place\":\"Bonn\""), std::string::npos);
    EXPECT_NE(payload.find("\"address\":\"Markt 1, \\\"Altstadt\\\"\""), std::string::npos);
    EXPECT_EQ(payload.back(), '}');
}

TEST(WebhookPublisherTest, Status200IsSuccess) {
    test::FakeHttpClient http;
    http.queue(200, "ok");
    net::WebhookPublisher publisher("https://hooks.example/poster", http);

    net::PublishResult result = publisher.publish(bytesOf("PNG"), sampleRecord(), "Reunión");
    EXPECT_TRUE(result.ok) << result.message;

    auto requests = http.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].method, "POST");
    EXPECT_EQ(requests[0].url, "https://hooks.example/poster");
    EXPECT_EQ(requests[0].headers.front(), "Content-Type: application/json");
}

TEST(WebhookPublisherTest, OtherStatusesFail) {
    test::FakeHttpClient http;
    http.queue(202, "");
    http.queue(500, "boom");
    net::WebhookPublisher publisher("https://hooks.example/poster", http);

    net::PublishResult accepted = publisher.publish(bytesOf("PNG"), sampleRecord(), "X");
    EXPECT_FALSE(accepted.ok);
    EXPECT_NE(accepted.message.find("202"), std::string::npos);

    net::PublishResult failed = publisher.publish(bytesOf("PNG"), sampleRecord(), "X");
    EXPECT_FALSE(failed.ok);
    EXPECT_NE(failed.message.find("500"), std::string::npos);
}

TEST(WebhookPublisherTest, TransportErrorFails) {
    test::FakeHttpClient http;
    http.queueFailure("Connection refused");
    net::WebhookPublisher publisher("https://hooks.example/poster", http);

    net::PublishResult result = publisher.publish(bytesOf("PNG"), sampleRecord(), "X");
    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.message.find("Connection refused"), std::string::npos);
}

TEST(WebhookPublisherTest, MissingUrlOrImageFailsWithoutRequest) {
    test::FakeHttpClient http;
    net::WebhookPublisher no_url("", http);
    EXPECT_FALSE(no_url.publish(bytesOf("PNG"), sampleRecord(), "X").ok);

    net::WebhookPublisher publisher("https://hooks.example/poster", http);
    EXPECT_FALSE(publisher.publish({}, sampleRecord(), "X").ok);
    EXPECT_TRUE(http.requests().empty());
}

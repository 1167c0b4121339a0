// webhook_publisher.hpp
#pragma once

#include "event_record.hpp"
#include "net/http_client.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace eventposter { namespace net {

struct PublishResult {
    bool ok = false;
    std::string message;
};

// Posts a finished poster as a base64 data URI together with the event
// fields. Only HTTP 200 counts as delivered.
class WebhookPublisher {
public:
    WebhookPublisher(std::string url, const HttpClient& http)
        : url_(std::move(url)), http_(http) {}

    PublishResult publish(const std::vector<unsigned char>& png, const EventRecord& record,
                          const std::string& title_text) const;

    static std::string buildPayload(const std::vector<unsigned char>& png, const EventRecord& record,
                                    const std::string& title_text);

private:
    std::string url_;
    const HttpClient& http_;
};

std::string base64Encode(const std::vector<unsigned char>& data);
std::string escapeJson(const std::string& s);

}} // namespace eventposter::net

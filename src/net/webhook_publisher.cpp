// webhook_publisher.cpp
#include "net/webhook_publisher.hpp"
#include "utils.hpp"

#include <cstdio>
#include <sstream>

namespace eventposter { namespace net {

std::string base64Encode(const std::vector<unsigned char>& data) {
    static const char* table = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    out.reserve((data.size() + 2) / 3 * 4);

    size_t i = 0;
    for (; i + 2 < data.size(); i += 3) {
        uint32_t n = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
        out += table[(n >> 18) & 63];
        out += table[(n >> 12) & 63];
        out += table[(n >> 6) & 63];
        out += table[n & 63];
    }
    if (i + 1 == data.size()) {
        uint32_t n = data[i] << 16;
        out += table[(n >> 18) & 63];
        out += table[(n >> 12) & 63];
        out += "==";
    } else if (i + 2 == data.size()) {
        uint32_t n = (data[i] << 16) | (data[i + 1] << 8);
        out += table[(n >> 18) & 63];
        out += table[(n >> 12) & 63];
        out += table[(n >> 6) & 63];
        out += '=';
    }
    return out;
}

std::string escapeJson(const std::string& s) {
    std::ostringstream o;
    for (char c : s) {
        switch (c) {
            case '\"': o << "\\\""; break;
            case '\\': o << "\\\\"; break;
            case '\n': o << "\\n"; break;
            case '\r': o << "\\r"; break;
            case '\t': o << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    o << buf;
                } else {
                    o << c;
                }
                break;
        }
    }
    return o.str();
}

std::string WebhookPublisher::buildPayload(const std::vector<unsigned char>& png, const EventRecord& record,
                                           const std::string& title_text) {
    std::ostringstream os;
    os << "{"
       << "\"image\":\"data:image/png;base64," << base64Encode(png) << "\","
       << "\"event_name\":\"" << escapeJson(title_text) << "\","
       << "\"date\":\"" << escapeJson(record.date) << "\","
       << "\"time\":\"" << escapeJson(record.time) << "\","
       << "\"place\":\"" << escapeJson(record.venue) << "\","
       << "\"address\":\"" << escapeJson(record.address) << "\""
       << "}";
    return os.str();
}

PublishResult WebhookPublisher::publish(const std::vector<unsigned char>& png, const EventRecord& record,
                                        const std::string& title_text) const {
    PublishResult result;
    if (url_.empty()) {
        result.message = "no webhook URL configured";
        return result;
    }
    if (png.empty()) {
        result.message = "nothing to publish";
        return result;
    }

    HttpRequest request;
    request.method = "POST";
    request.url = url_;
    request.headers.push_back("Content-Type: application/json");
    request.body = buildPayload(png, record, title_text);

    HttpResponse response;
    std::string error;
    if (!http_.perform(request, response, error)) {
        result.message = "publish failed: " + error;
        return result;
    }
    if (response.status != 200) {
        result.message = "webhook returned HTTP " + std::to_string(response.status);
        if (!response.body.empty()) result.message += ": " + response.body.substr(0, 200);
        return result;
    }

    result.ok = true;
    result.message = "published to " + url_;
    Logger::log(Logger::INFO, result.message);
    return result;
}

}} // namespace eventposter::net

// fake_http_client.hpp
#pragma once

#include "net/http_client.hpp"

#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace eventposter { namespace test {

// Replays queued responses in order and records every request.
class FakeHttpClient : public net::HttpClient {
public:
    struct Reply {
        bool transport_ok = true;
        long status = 200;
        std::string body;
        std::string error;
    };

    void queue(long status, const std::string& body) {
        Reply r;
        r.status = status;
        r.body = body;
        replies_.push_back(r);
    }

    void queueFailure(const std::string& error) {
        Reply r;
        r.transport_ok = false;
        r.error = error;
        replies_.push_back(r);
    }

    bool perform(const net::HttpRequest& request, net::HttpResponse& response,
                 std::string& error, const CancellationToken* = nullptr) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(request);
        if (replies_.empty()) {
            error = "no reply queued";
            return false;
        }
        Reply reply = replies_.front();
        replies_.pop_front();
        if (!reply.transport_ok) {
            error = reply.error;
            return false;
        }
        response = net::HttpResponse();
        response.status = reply.status;
        response.body = reply.body;
        return true;
    }

    std::vector<net::HttpRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    mutable std::mutex mutex_;
    mutable std::deque<Reply> replies_;
    mutable std::vector<net::HttpRequest> requests_;
};

}} // namespace eventposter::test

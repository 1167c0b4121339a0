// http_client.hpp
#pragma once

#include <string>
#include <vector>

namespace eventposter {

class CancellationToken;

namespace net {

struct HttpOptions {
    long connect_timeout_ms = 5000;
    long timeout_ms = 20000;
    int max_retries = 1;        // extra attempts on transient failures
    long retry_backoff_ms = 500;
    std::string user_agent = "eventposter/1.0";
};

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<std::string> headers;
    std::string body;
};

struct HttpResponse {
    long status = 0;
    std::string body;
    std::string content_type;
};

/**
 * Blocking HTTP(S) client over libcurl.
 *
 * perform() returns true when a response was received (any status) and false
 * on transport failure or cancellation, with `error` describing it.
 * Connection errors, timeouts, HTTP 429 and 5xx are retried up to
 * max_retries times. Safe to call from several threads at once; every call
 * uses its own easy handle.
 */
class HttpClient {
public:
    explicit HttpClient(HttpOptions options = HttpOptions());
    virtual ~HttpClient() = default;

    virtual bool perform(const HttpRequest& request, HttpResponse& response,
                         std::string& error, const CancellationToken* cancel = nullptr) const;

    const HttpOptions& options() const { return options_; }

    static std::string urlEncode(const std::string& value);

protected:
    // One transfer without retries. transient is set when a retry may
    // succeed.
    virtual bool performOnce(const HttpRequest& request, HttpResponse& response, std::string& error,
                             bool& transient, const CancellationToken* cancel) const;

private:
    HttpOptions options_;
};

inline bool isSuccess(long status) { return status >= 200 && status < 300; }

}} // namespace eventposter::net

// http_client.cpp
#include "net/http_client.hpp"
#include "utils.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <mutex>
#include <sstream>
#include <thread>

namespace eventposter { namespace net {

namespace {

std::once_flag g_curl_init;

size_t writeBody(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(data, size * nmemb);
    return size * nmemb;
}

int checkCancel(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* cancel = static_cast<const CancellationToken*>(userdata);
    return (cancel && cancel->isCancelled()) ? 1 : 0;
}

bool isTransient(CURLcode code) {
    switch (code) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            return true;
        default:
            return false;
    }
}

struct EasyDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

} // namespace

HttpClient::HttpClient(HttpOptions options) : options_(std::move(options)) {
    std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string HttpClient::urlEncode(const std::string& value) {
    std::ostringstream out;
    const char* hex = "0123456789ABCDEF";
    for (unsigned char c : value) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            out << c;
        } else {
            out << '%' << hex[c >> 4] << hex[c & 0x0F];
        }
    }
    return out.str();
}

bool HttpClient::perform(const HttpRequest& request, HttpResponse& response,
                         std::string& error, const CancellationToken* cancel) const {
    const int attempts = 1 + std::max(0, options_.max_retries);

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        bool transient = false;
        bool ok = performOnce(request, response, error, transient, cancel);
        if (ok && !(response.status == 429 || response.status >= 500)) {
            return true;
        }
        if (ok) {
            transient = true;
            error = "HTTP " + std::to_string(response.status);
        }

        if (!transient || attempt == attempts || (cancel && cancel->isCancelled())) {
            return ok;
        }

        Logger::log(Logger::DEBUG, request.method + " " + request.url + " failed (" + error +
                    "), retrying");
        std::this_thread::sleep_for(std::chrono::milliseconds(options_.retry_backoff_ms));
    }
    return false;
}

bool HttpClient::performOnce(const HttpRequest& request, HttpResponse& response, std::string& error,
                             bool& transient, const CancellationToken* cancel) const {
    response = HttpResponse();
    transient = false;

    std::unique_ptr<CURL, EasyDeleter> curl(curl_easy_init());
    if (!curl) {
        error = "curl_easy_init failed";
        return false;
    }

    curl_slist* raw_headers = nullptr;
    for (const auto& header : request.headers) {
        raw_headers = curl_slist_append(raw_headers, header.c_str());
    }
    std::unique_ptr<curl_slist, SlistDeleter> headers(raw_headers);

    char error_buffer[CURL_ERROR_SIZE] = {0};
    CURL* h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, options_.connect_timeout_ms);
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, options_.timeout_ms);
    curl_easy_setopt(h, CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeBody);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, checkCancel);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, const_cast<CancellationToken*>(cancel));
    if (headers) {
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
    }

    if (request.method == "POST") {
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    } else if (request.method != "GET") {
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    CURLcode code = curl_easy_perform(h);
    if (code != CURLE_OK) {
        if (code == CURLE_ABORTED_BY_CALLBACK) {
            error = "cancelled";
        } else {
            error = error_buffer[0] ? error_buffer : curl_easy_strerror(code);
            transient = isTransient(code);
        }
        return false;
    }

    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status);
    char* content_type = nullptr;
    if (curl_easy_getinfo(h, CURLINFO_CONTENT_TYPE, &content_type) == CURLE_OK && content_type) {
        response.content_type = content_type;
    }
    return true;
}

}} // namespace eventposter::net

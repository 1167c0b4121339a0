// background_resolver.cpp
#include "background_resolver.hpp"
#include "utils.hpp"

#include <opencv2/imgcodecs.hpp>

namespace eventposter {

cv::Mat decodeImage(const std::vector<uint8_t>& bytes, int flags) {
    if (bytes.empty()) return cv::Mat();

    cv::Mat image;
    try {
        image = cv::imdecode(cv::Mat(1, static_cast<int>(bytes.size()), CV_8UC1,
                                     const_cast<uint8_t*>(bytes.data())), flags);
    } catch (const cv::Exception& e) {
        Logger::log(Logger::DEBUG, std::string("imdecode: ") + e.what());
        return cv::Mat();
    }
    if (image.empty()) return image;

    if (image.depth() == CV_16U) {
        cv::Mat converted;
        image.convertTo(converted, CV_8U, 1.0 / 257.0);
        return converted;
    }
    if (image.depth() != CV_8U) {
        cv::Mat converted;
        double min_v = 0, max_v = 0;
        cv::minMaxLoc(image.reshape(1), &min_v, &max_v);
        double scale = max_v > 1.0 ? 255.0 / max_v : 255.0;
        image.convertTo(converted, CV_8U, scale);
        return converted;
    }
    return image;
}

ResolvedBackground BackgroundResolver::resolve(const std::string& query, int page,
                                               const CancellationToken* cancel) const {
    ResolvedBackground result;

    if (query.empty()) {
        result.source = "no query";
        return result;
    }

    const std::string label = "'" + query + "' page " + std::to_string(page);
    if (!client_) {
        result.source = "no image search client";
        Logger::log(Logger::WARNING, "Background " + label + ": " + result.source + ", using fallback");
        return result;
    }

    if (cancel && cancel->isCancelled()) {
        result.source = "cancelled";
        return result;
    }

    net::SearchRequest request;
    request.query = query;
    request.page = page;
    request.per_page = per_page_;

    Timer timer;
    std::vector<uint8_t> bytes;
    std::string error;
    if (!client_->search(request, bytes, error, cancel)) {
        result.source = error;
        Logger::log(Logger::WARNING, "Background " + label + " failed: " + error + ", using fallback");
        return result;
    }

    cv::Mat image = decodeImage(bytes, cv::IMREAD_UNCHANGED);
    if (image.empty() || image.channels() == 2 || image.channels() > 4) {
        result.source = "undecodable image";
        Logger::log(Logger::WARNING, "Background " + label + ": image could not be decoded, using fallback");
        return result;
    }

    Logger::log(Logger::DEBUG, "Background " + label + " resolved in " +
                std::to_string(static_cast<int>(timer.elapsed_ms())) + " ms (" +
                std::to_string(image.cols) + "x" + std::to_string(image.rows) + ")");
    result.image = image;
    result.source = label;
    return result;
}

} // namespace eventposter

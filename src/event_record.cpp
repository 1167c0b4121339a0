// event_record.cpp
#include "event_record.hpp"
#include "text/utf8.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace eventposter {

namespace {

bool allDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

std::vector<std::string> splitOn(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream in(s);
    while (std::getline(in, part, sep)) parts.push_back(part);
    return parts;
}

std::string twoDigits(const std::string& s) {
    return s.size() == 1 ? "0" + s : s;
}

} // namespace

EventRecord EventRecord::fromInput(const std::string& time, const std::string& date,
                                   const std::string& title_text, const std::string& venue,
                                   const std::string& address, const std::string& background_query,
                                   int page) {
    EventRecord record;
    record.time = formatTime(time);
    record.date = formatDate(date);
    record.title = parseTitle(title_text);
    record.venue = text::trim(venue);
    record.address = text::trim(address);
    record.background_query = text::trim(background_query);
    record.page = std::max(1, page);
    return record;
}

std::vector<std::string> parseTitle(const std::string& text) {
    std::vector<std::string> lines;
    for (const auto& raw : splitOn(text, '\n')) {
        std::string line = text::trim(raw);  // also strips '\r'
        if (!line.empty()) lines.push_back(text::toUpperUtf8(line));
    }
    return lines;
}

std::string formatDate(const std::string& date) {
    std::string d = text::trim(date);
    auto parts = splitOn(d, '-');
    if (parts.size() == 3 && parts[0].size() == 4 && allDigits(parts[0]) &&
        parts[1].size() <= 2 && allDigits(parts[1]) &&
        parts[2].size() <= 2 && allDigits(parts[2])) {
        return twoDigits(parts[2]) + "." + twoDigits(parts[1]) + "." + parts[0];
    }
    return d;
}

std::string formatTime(const std::string& time) {
    std::string t = text::trim(time);
    auto parts = splitOn(t, ':');
    if ((parts.size() == 2 || parts.size() == 3) &&
        parts[0].size() <= 2 && allDigits(parts[0]) &&
        parts[1].size() == 2 && allDigits(parts[1]) &&
        (parts.size() == 2 || (parts[2].size() == 2 && allDigits(parts[2])))) {
        return twoDigits(parts[0]) + ":" + parts[1];
    }
    return t;
}

std::vector<DatetimeSegment> datetimeSegments(const EventRecord& record, bool with_icons,
                                              const std::string& separator) {
    std::vector<DatetimeSegment> segments;
    if (with_icons) {
        if (!record.time.empty()) segments.push_back({"clock", record.time});
        if (!record.date.empty()) segments.push_back({"calendar", record.date});
        return segments;
    }

    std::string joined = record.time;
    if (!record.time.empty() && !record.date.empty()) joined += separator;
    joined += record.date;
    if (!joined.empty()) segments.push_back({"", joined});
    return segments;
}

std::vector<VariantRequest> planVariants(const EventRecord& record, int count, bool derive_queries) {
    std::vector<VariantRequest> variants;
    count = std::max(1, count);

    auto label = [](size_t n) { return "Version " + std::to_string(n); };

    if (!record.background_query.empty()) {
        // Same keywords, one result page per variant
        for (int i = 0; i < count; ++i) {
            variants.push_back({record.background_query, record.page + i, label(variants.size() + 1)});
        }
        return variants;
    }

    if (derive_queries && !record.title.empty()) {
        const std::string& base = record.title.front();
        std::vector<std::string> queries = {
            base,
            "celebration " + base,
            text::trim("event venue " + record.venue),
            "event decoration",
            text::trim("party " + record.venue),
        };
        for (const auto& q : queries) {
            if (static_cast<int>(variants.size()) >= count) break;
            variants.push_back({q, 1, label(variants.size() + 1)});
        }
        return variants;
    }

    variants.push_back({"", record.page, label(1)});
    return variants;
}

std::string outputFileName(const EventRecord& record, int index) {
    std::string stamp;
    auto parts = splitOn(record.date, '.');
    if (parts.size() == 3 && allDigits(parts[0]) && allDigits(parts[1]) && allDigits(parts[2])) {
        stamp = parts[2] + parts[1] + parts[0];
    } else {
        for (char c : record.date) {
            if (std::isdigit(static_cast<unsigned char>(c))) stamp.push_back(c);
        }
    }
    if (stamp.empty()) stamp = "undated";
    return "event_" + stamp + "_v" + std::to_string(index) + ".png";
}

} // namespace eventposter

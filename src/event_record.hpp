// event_record.hpp
#pragma once

#include <string>
#include <vector>

namespace eventposter {

struct EventRecord {
    std::string time;                 // displayed as is, e.g. "19:00"
    std::string date;                 // displayed as is, e.g. "26.10.2025"
    std::vector<std::string> title;   // upper-cased, non-empty lines
    std::string venue;
    std::string address;
    std::string background_query;     // empty when no search should happen
    int page = 1;

    // Builds a record from raw form input: formats date and time, splits and
    // upper-cases the title, trims everything else.
    static EventRecord fromInput(const std::string& time, const std::string& date,
                                 const std::string& title_text, const std::string& venue,
                                 const std::string& address, const std::string& background_query,
                                 int page);
};

// Splits on newlines, trims, drops empty lines, upper-cases.
std::vector<std::string> parseTitle(const std::string& text);

// "2025-10-26" -> "26.10.2025"; anything else is returned trimmed.
std::string formatDate(const std::string& date);

// "7:05" / "19:00:00" -> "07:05" / "19:00"; anything else is returned trimmed.
std::string formatTime(const std::string& time);

struct DatetimeSegment {
    std::string icon;  // asset name without the "icon:" prefix, empty for none
    std::string text;
};

// Icon layout: [clock] time  [calendar] date. Text layout: "time | date".
std::vector<DatetimeSegment> datetimeSegments(const EventRecord& record, bool with_icons,
                                              const std::string& separator);

struct VariantRequest {
    std::string query;
    int page = 1;
    std::string label;
};

std::vector<VariantRequest> planVariants(const EventRecord& record, int count, bool derive_queries);

// event_<YYYYMMDD>_v<N>.png
std::string outputFileName(const EventRecord& record, int index);

} // namespace eventposter

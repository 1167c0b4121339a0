// text_fitter.cpp
#include "text/text_fitter.hpp"
#include "text/utf8.hpp"

#include <algorithm>

namespace eventposter { namespace text {

bool FontMeasurer::measure(const std::string& text, int size_px, int& width, std::string& error) const {
    const Font* font = library_.load(weight_, size_px);
    if (!font) {
        error = library_.lastError();
        return false;
    }
    return font->measure(text, width, error);
}

double TypographyFitter::blockHeight(size_t line_count, int size) const {
    if (line_count == 0) return 0.0;
    const double spacing = lineSpacing(size);
    return static_cast<double>(line_count) * (size + spacing) - spacing;
}

bool TypographyFitter::fitsAt(const std::vector<std::string>& lines, int size,
                              const FitRequest& request, bool& fits, std::string& error) const {
    fits = false;
    if (blockHeight(lines.size(), size) > request.bounding_height) return true;

    for (const auto& line : lines) {
        int width = 0;
        if (!measurer_.measure(line, size, width, error)) return false;
        if (width > request.bounding_width) return true;
    }
    fits = true;
    return true;
}

bool TypographyFitter::fit(const FitRequest& request, FitResult& result, std::string& error) const {
    result = FitResult();
    const int step = std::max(1, request.size_step);

    for (int size = request.start_size; size >= request.min_size; size -= step) {
        bool fits = false;
        if (!fitsAt(request.lines, size, request, fits, error)) return false;
        if (fits) {
            result.chosen_font_size = size;
            result.line_spacing = lineSpacing(size);
            result.lines = request.lines;
            return true;
        }
    }

    return wrapWords(request.lines, request, result, error);
}

bool TypographyFitter::wrapWords(const std::vector<std::string>& lines, const FitRequest& request,
                                 FitResult& result, std::string& error) const {
    const int size = request.min_size;

    std::vector<std::string> words;
    for (const auto& line : lines) {
        for (auto& word : splitWords(line)) words.push_back(std::move(word));
    }

    std::vector<std::string> wrapped;
    std::string current;
    for (const auto& word : words) {
        if (current.empty()) {
            current = word;
        } else {
            std::string candidate = current + " " + word;
            int width = 0;
            if (!measurer_.measure(candidate, size, width, error)) return false;
            if (width > request.bounding_width) {
                wrapped.push_back(current);
                current = word;
            } else {
                current = candidate;
            }
        }
    }
    if (!current.empty()) wrapped.push_back(current);

    for (const auto& line : wrapped) {
        int width = 0;
        if (!measurer_.measure(line, size, width, error)) return false;
        if (width > request.bounding_width) {
            result.overflowing_word = true;
            break;
        }
    }

    result.chosen_font_size = size;
    result.line_spacing = lineSpacing(size);
    result.lines = std::move(wrapped);
    result.used_wrap_fallback = true;
    return true;
}

}} // namespace eventposter::text

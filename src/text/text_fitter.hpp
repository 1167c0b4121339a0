// text_fitter.hpp
#pragma once

#include "text/font.hpp"

#include <string>
#include <vector>

namespace eventposter { namespace text {

// Width of a single line of text at a pixel size.
class TextMeasurer {
public:
    virtual ~TextMeasurer() = default;
    virtual bool measure(const std::string& text, int size_px, int& width, std::string& error) const = 0;
};

// Measures with a FontLibrary at a fixed weight, loading one Font per size.
class FontMeasurer : public TextMeasurer {
public:
    FontMeasurer(FontLibrary& library, FontWeight weight)
        : library_(library), weight_(weight) {}

    bool measure(const std::string& text, int size_px, int& width, std::string& error) const override;

private:
    FontLibrary& library_;
    FontWeight weight_;
};

struct FitResult {
    int chosen_font_size = 0;
    double line_spacing = 0.0;
    std::vector<std::string> lines;
    bool used_wrap_fallback = false;
    bool overflowing_word = false;  // a single word wider than the box
};

struct FitRequest {
    std::vector<std::string> lines;
    int bounding_width = 0;
    int bounding_height = 0;
    int start_size = 0;
    int min_size = 0;
    int size_step = 1;
};

/**
 * Picks the largest font size, stepping down from start_size, at which every
 * line fits bounding_width and the block height
 *
 *     n * (size + spacing) - spacing,   spacing = size * line_spacing_ratio
 *
 * fits bounding_height. When no size in the sequence fits, the words are
 * greedily re-wrapped at min_size. A word wider than the box on its own is
 * kept whole on its own line and will overflow.
 */
class TypographyFitter {
public:
    TypographyFitter(const TextMeasurer& measurer, double line_spacing_ratio)
        : measurer_(measurer), line_spacing_ratio_(line_spacing_ratio) {}

    // Returns false only when measuring fails; error says why.
    bool fit(const FitRequest& request, FitResult& result, std::string& error) const;

    double lineSpacing(int size) const { return size * line_spacing_ratio_; }
    double blockHeight(size_t line_count, int size) const;

private:
    const TextMeasurer& measurer_;
    double line_spacing_ratio_;

    bool fitsAt(const std::vector<std::string>& lines, int size, const FitRequest& request,
                bool& fits, std::string& error) const;
    bool wrapWords(const std::vector<std::string>& lines, const FitRequest& request,
                   FitResult& result, std::string& error) const;
};

}} // namespace eventposter::text

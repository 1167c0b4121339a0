// font.hpp
#pragma once

#include <opencv2/core.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

typedef struct FT_LibraryRec_* FT_Library;
typedef struct FT_FaceRec_* FT_Face;
typedef struct hb_font_t hb_font_t;

namespace eventposter { namespace text {

enum class FontWeight {
    Regular = 0,
    SemiBold = 1,
    Bold = 2
};

const char* toString(FontWeight weight);
bool parseFontWeight(const std::string& name, FontWeight& weight);

struct FontSpec {
    std::string family;  // asset path of the font file
    FontWeight weight = FontWeight::Regular;
    int size_px = 0;
};

using FontData = std::shared_ptr<const std::vector<uint8_t>>;

/**
 * A face at one weight and pixel size. Created by FontLibrary and never
 * reconfigured afterwards; valid as long as its library.
 *
 * Not thread-safe: FreeType faces share a glyph slot, so a Font belongs to
 * the render that loaded it.
 */
class Font {
public:
    ~Font();
    Font(const Font&) = delete;
    Font& operator=(const Font&) = delete;

    const FontSpec& spec() const { return spec_; }
    int size() const { return spec_.size_px; }

    // Pixel metrics; descender is negative.
    int ascender() const { return ascender_; }
    int descender() const { return descender_; }

    // Advance width of a UTF-8 string in pixels, as shaped by HarfBuzz
    // (GPOS kerning included).
    bool measure(const std::string& text, int& width, std::string& error) const;

    // Draws with the baseline starting at `origin`. Color is BGRA.
    bool draw(cv::Mat& canvas, const std::string& text, cv::Point origin,
              const cv::Scalar& color, std::string& error) const;

    // Baseline y that centers the line box (ascender..descender) on center_y.
    int baselineForCenter(int center_y) const;

private:
    friend class FontLibrary;
    Font(FT_Face face, FontSpec spec, bool synthetic_bold);

    // One positioned glyph of a shaped run, all values in 26.6.
    struct ShapedGlyph {
        uint32_t index = 0;
        long x = 0;
        long x_offset = 0;
        long y_offset = 0;
    };

    // Shapes one line. pen_x receives the total advance.
    bool shape(const std::string& text, std::vector<ShapedGlyph>& glyphs, long& pen_x,
               std::string& error) const;

    // Loads glyph `index` into the face's slot, emboldened if synthetic.
    bool loadGlyph(uint32_t index, std::string& error) const;

    FT_Face face_;
    hb_font_t* hb_font_ = nullptr;
    FontSpec spec_;
    bool synthetic_bold_;
    long embolden_strength_ = 0;
    int ascender_ = 0;
    int descender_ = 0;
};

/**
 * Owns one FreeType library instance and the fonts loaded from a single
 * font file. One library is created per render; the font bytes are shared
 * read-only between renders.
 */
class FontLibrary {
public:
    FontLibrary(FontData data, std::string family);
    ~FontLibrary();
    FontLibrary(const FontLibrary&) = delete;
    FontLibrary& operator=(const FontLibrary&) = delete;

    bool initialize();

    // Returns nullptr on failure, see lastError(). The same weight and size
    // always yield the same instance within this library.
    const Font* load(FontWeight weight, int size_px);

    const std::string& lastError() const { return last_error_; }

private:
    FontData data_;
    std::string family_;
    FT_Library library_ = nullptr;
    std::map<std::pair<int, int>, std::unique_ptr<Font>> fonts_;
    std::string last_error_;
};

}} // namespace eventposter::text

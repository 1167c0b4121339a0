// font.cpp
#include "text/font.hpp"
#include "text/utf8.hpp"
#include "raster.hpp"

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_MULTIPLE_MASTERS_H
#include FT_OUTLINE_H

#include <hb.h>
#include <hb-ft.h>

#include <algorithm>
#include <sstream>
#include <vector>

namespace eventposter { namespace text {

namespace {

constexpr FT_Int32 kLoadFlags = FT_LOAD_NO_HINTING | FT_LOAD_NO_BITMAP;

int weightValue(FontWeight weight) {
    switch (weight) {
        case FontWeight::SemiBold: return 600;
        case FontWeight::Bold:     return 700;
        default:                   return 400;
    }
}

std::string ftError(const char* what, FT_Error code) {
    std::ostringstream ss;
    ss << what << " failed (FreeType error " << code << ")";
    return ss.str();
}

// Sets the wght axis of a variable font. Returns false for static fonts.
bool applyWeightAxis(FT_Library library, FT_Face face, FontWeight weight) {
    if (!FT_HAS_MULTIPLE_MASTERS(face)) return false;

    FT_MM_Var* mm = nullptr;
    if (FT_Get_MM_Var(face, &mm) != 0 || !mm) return false;

    bool has_weight = false;
    std::vector<FT_Fixed> coords(mm->num_axis);
    for (FT_UInt i = 0; i < mm->num_axis; ++i) {
        const FT_Var_Axis& axis = mm->axis[i];
        coords[i] = axis.def;
        if (axis.tag == FT_MAKE_TAG('w', 'g', 'h', 't')) {
            FT_Fixed wanted = static_cast<FT_Fixed>(weightValue(weight)) << 16;
            coords[i] = std::max(axis.minimum, std::min(wanted, axis.maximum));
            has_weight = true;
        }
    }

    bool applied = false;
    if (has_weight) {
        applied = FT_Set_Var_Design_Coordinates(face, mm->num_axis, coords.data()) == 0;
    }
    FT_Done_MM_Var(library, mm);
    return applied;
}

} // namespace

const char* toString(FontWeight weight) {
    switch (weight) {
        case FontWeight::SemiBold: return "SemiBold";
        case FontWeight::Bold:     return "Bold";
        default:                   return "Regular";
    }
}

bool parseFontWeight(const std::string& name, FontWeight& weight) {
    std::string n = toUpperUtf8(trim(name));
    if (n == "REGULAR")  { weight = FontWeight::Regular; return true; }
    if (n == "SEMIBOLD") { weight = FontWeight::SemiBold; return true; }
    if (n == "BOLD")     { weight = FontWeight::Bold; return true; }
    return false;
}

// ============================== Font ==============================

Font::Font(FT_Face face, FontSpec spec, bool synthetic_bold)
    : face_(face), spec_(std::move(spec)), synthetic_bold_(synthetic_bold) {
    ascender_ = static_cast<int>((face_->size->metrics.ascender + 32) >> 6);
    descender_ = static_cast<int>((face_->size->metrics.descender - 32) / 64);

    // Picks up the pixel size and variation coordinates already set on the face
    hb_font_ = hb_ft_font_create_referenced(face_);
    hb_ft_font_set_load_flags(hb_font_, kLoadFlags);

    if (synthetic_bold_) {
        // Stroke strength in 26.6, proportional to the em size
        const long em = static_cast<long>(spec_.size_px) * 64;
        embolden_strength_ = spec_.weight == FontWeight::Bold ? em / 24 : em / 40;
    }
}

Font::~Font() {
    if (hb_font_) {
        hb_font_destroy(hb_font_);
        hb_font_ = nullptr;
    }
    if (face_) {
        FT_Done_Face(face_);
        face_ = nullptr;
    }
}

bool Font::loadGlyph(uint32_t index, std::string& error) const {
    FT_Error err = FT_Load_Glyph(face_, index, kLoadFlags);
    if (err) {
        error = ftError("FT_Load_Glyph", err);
        return false;
    }

    FT_GlyphSlot slot = face_->glyph;
    if (synthetic_bold_ && slot->format == FT_GLYPH_FORMAT_OUTLINE) {
        FT_Outline_EmboldenXY(&slot->outline, embolden_strength_, embolden_strength_);
    }
    return true;
}

bool Font::shape(const std::string& text, std::vector<ShapedGlyph>& glyphs, long& pen_x,
                 std::string& error) const {
    glyphs.clear();
    pen_x = 0;
    if (text.empty()) return true;

    hb_buffer_t* buffer = hb_buffer_create();
    if (!hb_buffer_allocation_successful(buffer)) {
        hb_buffer_destroy(buffer);
        error = "hb_buffer_create failed";
        return false;
    }

    hb_buffer_add_utf8(buffer, text.data(), static_cast<int>(text.size()), 0, -1);
    hb_buffer_guess_segment_properties(buffer);
    hb_shape(hb_font_, buffer, nullptr, 0);

    unsigned int count = 0;
    const hb_glyph_info_t* info = hb_buffer_get_glyph_infos(buffer, &count);
    const hb_glyph_position_t* pos = hb_buffer_get_glyph_positions(buffer, &count);

    glyphs.reserve(count);
    for (unsigned int i = 0; i < count; ++i) {
        ShapedGlyph glyph;
        glyph.index = info[i].codepoint;
        glyph.x = pen_x;
        glyph.x_offset = pos[i].x_offset;
        glyph.y_offset = pos[i].y_offset;
        glyphs.push_back(glyph);

        pen_x += pos[i].x_advance;
        if (synthetic_bold_) pen_x += embolden_strength_;
    }

    hb_buffer_destroy(buffer);
    return true;
}

bool Font::measure(const std::string& text, int& width, std::string& error) const {
    std::vector<ShapedGlyph> glyphs;
    long pen_x = 0;
    if (!shape(text, glyphs, pen_x, error)) return false;
    width = static_cast<int>((pen_x + 32) >> 6);
    return true;
}

bool Font::draw(cv::Mat& canvas, const std::string& text, cv::Point origin,
                const cv::Scalar& color, std::string& error) const {
    std::vector<ShapedGlyph> glyphs;
    long pen_x = 0;
    if (!shape(text, glyphs, pen_x, error)) return false;

    for (const ShapedGlyph& glyph : glyphs) {
        if (!loadGlyph(glyph.index, error)) return false;

        FT_GlyphSlot slot = face_->glyph;
        FT_Error err = FT_Render_Glyph(slot, FT_RENDER_MODE_NORMAL);
        if (err) {
            error = ftError("FT_Render_Glyph", err);
            return false;
        }

        const FT_Bitmap& bitmap = slot->bitmap;
        if (bitmap.width == 0 || bitmap.rows == 0 || bitmap.pitch <= 0) {
            continue;  // blank glyph (space)
        }

        cv::Mat coverage(static_cast<int>(bitmap.rows), static_cast<int>(bitmap.width),
                         CV_8UC1, bitmap.buffer, static_cast<size_t>(bitmap.pitch));
        cv::Point top_left(origin.x + static_cast<int>((glyph.x + glyph.x_offset + 32) >> 6) + slot->bitmap_left,
                           origin.y - static_cast<int>((glyph.y_offset + 32) >> 6) - slot->bitmap_top);
        raster::blendMask(canvas, coverage, top_left, color);
    }
    return true;
}

int Font::baselineForCenter(int center_y) const {
    // (ascender + descender) / 2 is the offset from baseline to box middle
    return center_y + (ascender_ + descender_) / 2;
}

// ============================== FontLibrary ==============================

FontLibrary::FontLibrary(FontData data, std::string family)
    : data_(std::move(data)), family_(std::move(family)) {}

FontLibrary::~FontLibrary() {
    fonts_.clear();  // faces first
    if (library_) {
        FT_Done_FreeType(library_);
        library_ = nullptr;
    }
}

bool FontLibrary::initialize() {
    if (library_) return true;

    if (!data_ || data_->empty()) {
        last_error_ = "font data for '" + family_ + "' is empty";
        return false;
    }

    FT_Error err = FT_Init_FreeType(&library_);
    if (err) {
        library_ = nullptr;
        last_error_ = ftError("FT_Init_FreeType", err);
        return false;
    }
    return true;
}

const Font* FontLibrary::load(FontWeight weight, int size_px) {
    if (!library_) {
        last_error_ = "font library not initialized";
        return nullptr;
    }
    if (size_px <= 0) {
        last_error_ = "invalid font size " + std::to_string(size_px);
        return nullptr;
    }

    auto key = std::make_pair(static_cast<int>(weight), size_px);
    auto it = fonts_.find(key);
    if (it != fonts_.end()) return it->second.get();

    FT_Face face = nullptr;
    FT_Error err = FT_New_Memory_Face(library_,
                                      data_->data(),
                                      static_cast<FT_Long>(data_->size()),
                                      0,
                                      &face);
    if (err || !face) {
        last_error_ = ftError(("loading font '" + family_ + "'").c_str(), err);
        return nullptr;
    }

    bool variable = applyWeightAxis(library_, face, weight);

    err = FT_Set_Pixel_Sizes(face, 0, static_cast<FT_UInt>(size_px));
    if (err) {
        FT_Done_Face(face);
        last_error_ = ftError("FT_Set_Pixel_Sizes", err);
        return nullptr;
    }

    FontSpec spec{family_, weight, size_px};
    bool synthetic_bold = !variable && weight != FontWeight::Regular;
    std::unique_ptr<Font> font(new Font(face, spec, synthetic_bold));
    const Font* result = font.get();
    fonts_[key] = std::move(font);
    return result;
}

}} // namespace eventposter::text

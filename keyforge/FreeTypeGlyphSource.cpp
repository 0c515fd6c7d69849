/**
 * @file FreeTypeGlyphSource.cpp
 * @brief Glyph outlines from TrueType / OpenType fonts via FreeType
 */

#include "GlyphSource.h"
#include "Errors.h"
#include "Diagnostics.h"

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_OUTLINE_H

#include <algorithm>
#include <cstdint>
#include <limits>
#include <memory>
#include <utility>
#include <vector>

namespace keyforge {

//=============================================================================
// FREETYPE HANDLES
//=============================================================================

struct FreeTypeGlyphSource::Impl {
    FT_Library library = nullptr;
    FT_Face face = nullptr;
    std::string path;
    int curve_steps = 8;

    ~Impl() {
        if (face) FT_Done_Face(face);
        if (library) FT_Done_FreeType(library);
    }
};

namespace {

//=============================================================================
// OUTLINE DECOMPOSITION
//=============================================================================

struct OutlineDecoder {
    Contours* out = nullptr;
    Contour current;
    double pen_x = 0.0;      // font units
    double scale = 1.0;      // font units -> working units
    int steps = 8;
    FT_Vector last = {0, 0};

    Point2 map(double x, double y) const {
        return {(pen_x + x) * scale, y * scale};
    }

    void flush() {
        if (current.size() >= 2 && current.front() == current.back()) {
            current.pop_back();
        }
        if (current.size() >= 3) {
            out->push_back(std::move(current));
        }
        current.clear();
    }
};

int moveTo(const FT_Vector* to, void* user) {
    auto* d = static_cast<OutlineDecoder*>(user);
    d->flush();
    d->current.push_back(d->map(to->x, to->y));
    d->last = *to;
    return 0;
}

int lineTo(const FT_Vector* to, void* user) {
    auto* d = static_cast<OutlineDecoder*>(user);
    d->current.push_back(d->map(to->x, to->y));
    d->last = *to;
    return 0;
}

int conicTo(const FT_Vector* control, const FT_Vector* to, void* user) {
    auto* d = static_cast<OutlineDecoder*>(user);
    const double x0 = d->last.x, y0 = d->last.y;
    for (int i = 1; i <= d->steps; ++i) {
        const double t = static_cast<double>(i) / d->steps;
        const double u = 1.0 - t;
        const double x = u * u * x0 + 2.0 * u * t * control->x + t * t * to->x;
        const double y = u * u * y0 + 2.0 * u * t * control->y + t * t * to->y;
        d->current.push_back(d->map(x, y));
    }
    d->last = *to;
    return 0;
}

int cubicTo(const FT_Vector* c1, const FT_Vector* c2, const FT_Vector* to, void* user) {
    auto* d = static_cast<OutlineDecoder*>(user);
    const double x0 = d->last.x, y0 = d->last.y;
    for (int i = 1; i <= d->steps; ++i) {
        const double t = static_cast<double>(i) / d->steps;
        const double u = 1.0 - t;
        const double b0 = u * u * u, b1 = 3.0 * u * u * t, b2 = 3.0 * u * t * t, b3 = t * t * t;
        const double x = b0 * x0 + b1 * c1->x + b2 * c2->x + b3 * to->x;
        const double y = b0 * y0 + b1 * c1->y + b2 * c2->y + b3 * to->y;
        d->current.push_back(d->map(x, y));
    }
    d->last = *to;
    return 0;
}

// Minimal UTF-8 decoder; malformed bytes map to U+FFFD.
std::vector<uint32_t> decodeUtf8(const std::string& text) {
    std::vector<uint32_t> codepoints;
    size_t i = 0;
    while (i < text.size()) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        int extra = 0;
        uint32_t cp = 0;
        if (c < 0x80)               { cp = c; extra = 0; }
        else if ((c & 0xE0) == 0xC0) { cp = c & 0x1F; extra = 1; }
        else if ((c & 0xF0) == 0xE0) { cp = c & 0x0F; extra = 2; }
        else if ((c & 0xF8) == 0xF0) { cp = c & 0x07; extra = 3; }
        else { codepoints.push_back(0xFFFD); ++i; continue; }

        if (i + static_cast<size_t>(extra) >= text.size()) {
            codepoints.push_back(0xFFFD);
            break;
        }
        bool ok = true;
        for (int k = 1; k <= extra; ++k) {
            const unsigned char cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) { ok = false; break; }
            cp = (cp << 6) | (cc & 0x3F);
        }
        codepoints.push_back(ok ? cp : 0xFFFD);
        i += ok ? extra + 1 : 1;
    }
    return codepoints;
}

} // anonymous namespace

//=============================================================================
// FreeTypeGlyphSource
//=============================================================================

FreeTypeGlyphSource::FreeTypeGlyphSource(const std::string& fontPath, int curveSteps)
    : impl_(std::make_unique<Impl>()) {
    if (curveSteps < 1) {
        throw InvalidParameterError("curve_steps", "must be at least 1");
    }
    impl_->path = fontPath;
    impl_->curve_steps = curveSteps;

    if (FT_Init_FreeType(&impl_->library) != 0) {
        impl_->library = nullptr;
        throw InvalidParameterError("font_path", "FreeType could not be initialised");
    }
    if (FT_New_Face(impl_->library, fontPath.c_str(), 0, &impl_->face) != 0) {
        impl_->face = nullptr;
        throw InvalidParameterError("font_path", "cannot load font face from '" + fontPath + "'");
    }
    if (!FT_IS_SCALABLE(impl_->face)) {
        throw InvalidParameterError("font_path", "'" + fontPath + "' is not an outline font");
    }

    KEYFORGE_LOG_DEBUG("Loaded font %s (%s)", fontPath.c_str(),
                       impl_->face->family_name ? impl_->face->family_name : "unnamed");
}

FreeTypeGlyphSource::~FreeTypeGlyphSource() = default;

std::string FreeTypeGlyphSource::name() const {
    const char* family = impl_->face->family_name;
    return std::string("freetype:") + (family ? family : impl_->path);
}

Contours FreeTypeGlyphSource::outlineLine(const std::string& text, double lineHeight) const {
    requirePositive("line_height", lineHeight);

    FT_Face face = impl_->face;
    Contours contours;

    OutlineDecoder decoder;
    decoder.out = &contours;
    decoder.scale = lineHeight / static_cast<double>(face->units_per_EM);
    decoder.steps = impl_->curve_steps;

    FT_Outline_Funcs funcs;
    funcs.move_to = moveTo;
    funcs.line_to = lineTo;
    funcs.conic_to = conicTo;
    funcs.cubic_to = cubicTo;
    funcs.shift = 0;
    funcs.delta = 0;

    const bool kerning = FT_HAS_KERNING(face);
    FT_UInt previous = 0;

    for (uint32_t cp : decodeUtf8(text)) {
        const FT_UInt index = FT_Get_Char_Index(face, cp);

        if (kerning && previous != 0 && index != 0) {
            FT_Vector delta;
            if (FT_Get_Kerning(face, previous, index, FT_KERNING_UNSCALED, &delta) == 0) {
                decoder.pen_x += static_cast<double>(delta.x);
            }
        }

        if (FT_Load_Glyph(face, index, FT_LOAD_NO_SCALE | FT_LOAD_NO_BITMAP) != 0) {
            KEYFORGE_LOG_WARN("FreeType could not load glyph for U+%04X, skipped", cp);
            previous = 0;
            continue;
        }

        if (face->glyph->format == FT_GLYPH_FORMAT_OUTLINE) {
            if (FT_Outline_Decompose(&face->glyph->outline, &funcs, &decoder) != 0) {
                KEYFORGE_LOG_WARN("FreeType could not decompose glyph for U+%04X", cp);
            }
            decoder.flush();
        }

        decoder.pen_x += static_cast<double>(face->glyph->metrics.horiAdvance);
        previous = index;
    }

    if (contours.empty()) {
        return contours;
    }

    // Centre on the ink width and on the font body (ascender .. descender)
    double ink_min = std::numeric_limits<double>::max();
    double ink_max = std::numeric_limits<double>::lowest();
    for (const auto& contour : contours) {
        for (const auto& p : contour) {
            ink_min = std::min(ink_min, p[0]);
            ink_max = std::max(ink_max, p[0]);
        }
    }
    const double shift_x = -0.5 * (ink_min + ink_max);
    const double shift_y = -0.5 * (face->ascender + face->descender) * decoder.scale;

    for (auto& contour : contours) {
        for (auto& p : contour) {
            p[0] += shift_x;
            p[1] += shift_y;
        }
    }
    return contours;
}

//=============================================================================
// SELECTION
//=============================================================================

std::unique_ptr<IGlyphSource> createGlyphSource(const std::string& fontPath) {
    if (fontPath.empty()) {
        return std::make_unique<BlockGlyphSource>();
    }
    return std::make_unique<FreeTypeGlyphSource>(fontPath);
}

} // namespace keyforge

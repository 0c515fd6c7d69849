/**
 * @file BlockGlyphSource.cpp
 * @brief Built-in 5x7 block font
 */

#include "GlyphSource.h"
#include "Errors.h"

#include <algorithm>
#include <cctype>
#include <limits>

namespace keyforge {

namespace {

// Row 0 is the top row. '#' is ink.
struct BlockGlyph {
    char ch;
    const char* rows[BlockGlyphSource::kRows];
};

const BlockGlyph kGlyphs[] = {
    {'A', {".###.", "#...#", "#...#", "#####", "#...#", "#...#", "#...#"}},
    {'B', {"####.", "#...#", "#...#", "####.", "#...#", "#...#", "####."}},
    {'C', {".###.", "#...#", "#....", "#....", "#....", "#...#", ".###."}},
    {'D', {"####.", "#...#", "#...#", "#...#", "#...#", "#...#", "####."}},
    {'E', {"#####", "#....", "#....", "####.", "#....", "#....", "#####"}},
    {'F', {"#####", "#....", "#....", "####.", "#....", "#....", "#...."}},
    {'G', {".###.", "#...#", "#....", "#.###", "#...#", "#...#", ".####"}},
    {'H', {"#...#", "#...#", "#...#", "#####", "#...#", "#...#", "#...#"}},
    {'I', {".###.", "..#..", "..#..", "..#..", "..#..", "..#..", ".###."}},
    {'J', {"..###", "...#.", "...#.", "...#.", "...#.", "#..#.", ".##.."}},
    {'K', {"#...#", "#..#.", "#.#..", "##...", "#.#..", "#..#.", "#...#"}},
    {'L', {"#....", "#....", "#....", "#....", "#....", "#....", "#####"}},
    {'M', {"#...#", "##.##", "#.#.#", "#.#.#", "#...#", "#...#", "#...#"}},
    {'N', {"#...#", "#...#", "##..#", "#.#.#", "#..##", "#...#", "#...#"}},
    {'O', {".###.", "#...#", "#...#", "#...#", "#...#", "#...#", ".###."}},
    {'P', {"####.", "#...#", "#...#", "####.", "#....", "#....", "#...."}},
    {'Q', {".###.", "#...#", "#...#", "#...#", "#.#.#", "#..#.", ".##.#"}},
    {'R', {"####.", "#...#", "#...#", "####.", "#.#..", "#..#.", "#...#"}},
    {'S', {".####", "#....", "#....", ".###.", "....#", "....#", "####."}},
    {'T', {"#####", "..#..", "..#..", "..#..", "..#..", "..#..", "..#.."}},
    {'U', {"#...#", "#...#", "#...#", "#...#", "#...#", "#...#", ".###."}},
    {'V', {"#...#", "#...#", "#...#", "#...#", "#...#", ".#.#.", "..#.."}},
    {'W', {"#...#", "#...#", "#...#", "#.#.#", "#.#.#", "#.#.#", ".#.#."}},
    {'X', {"#...#", "#...#", ".#.#.", "..#..", ".#.#.", "#...#", "#...#"}},
    {'Y', {"#...#", "#...#", ".#.#.", "..#..", "..#..", "..#..", "..#.."}},
    {'Z', {"#####", "....#", "...#.", "..#..", ".#...", "#....", "#####"}},
    {'0', {".###.", "#...#", "#..##", "#.#.#", "##..#", "#...#", ".###."}},
    {'1', {"..#..", ".##..", "..#..", "..#..", "..#..", "..#..", ".###."}},
    {'2', {".###.", "#...#", "....#", "...#.", "..#..", ".#...", "#####"}},
    {'3', {"#####", "...#.", "..#..", "...#.", "....#", "#...#", ".###."}},
    {'4', {"...#.", "..##.", ".#.#.", "#..#.", "#####", "...#.", "...#."}},
    {'5', {"#####", "#....", "####.", "....#", "....#", "#...#", ".###."}},
    {'6', {"..##.", ".#...", "#....", "####.", "#...#", "#...#", ".###."}},
    {'7', {"#####", "....#", "...#.", "..#..", ".#...", ".#...", ".#..."}},
    {'8', {".###.", "#...#", "#...#", ".###.", "#...#", "#...#", ".###."}},
    {'9', {".###.", "#...#", "#...#", ".####", "....#", "...#.", ".##.."}},
    {'.', {".....", ".....", ".....", ".....", ".....", ".##..", ".##.."}},
    {',', {".....", ".....", ".....", ".....", ".##..", "..#..", ".#..."}},
    {'!', {"..#..", "..#..", "..#..", "..#..", "..#..", ".....", "..#.."}},
    {'?', {".###.", "#...#", "....#", "...#.", "..#..", ".....", "..#.."}},
    {'-', {".....", ".....", ".....", "#####", ".....", ".....", "....."}},
    {'\'', {"..#..", "..#..", ".#...", ".....", ".....", ".....", "....."}},
    {':', {".....", ".##..", ".##..", ".....", ".##..", ".##..", "....."}},
    {' ', {".....", ".....", ".....", ".....", ".....", ".....", "....."}},
};

const BlockGlyph kUnknownGlyph =
    {'?', {"#####", "#####", "#####", "#####", "#####", "#####", "#####"}};

const BlockGlyph& lookupGlyph(char c) {
    const char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    for (const auto& g : kGlyphs) {
        if (g.ch == upper) return g;
    }
    return kUnknownGlyph;
}

Contour rectangle(double x0, double y0, double x1, double y1) {
    // Counter-clockwise
    return {{x0, y0}, {x1, y0}, {x1, y1}, {x0, y1}};
}

} // anonymous namespace

BlockGlyphSource::BlockGlyphSource(double cellOverlap)
    : cell_overlap_(cellOverlap) {
    if (cellOverlap < 0.0 || cellOverlap >= 0.5) {
        throw InvalidParameterError("cell_overlap", "must be in [0, 0.5)");
    }
}

Contours BlockGlyphSource::outlineLine(const std::string& text, double lineHeight) const {
    requirePositive("line_height", lineHeight);

    const double cell = lineHeight / kRows;
    const double grow = cell_overlap_ * cell;
    const double top = 0.5 * lineHeight;

    Contours contours;
    double ink_min = std::numeric_limits<double>::max();
    double ink_max = std::numeric_limits<double>::lowest();

    for (size_t i = 0; i < text.size(); ++i) {
        const BlockGlyph& glyph = lookupGlyph(text[i]);
        const double origin_x = static_cast<double>(i * kAdvance) * cell;

        for (int r = 0; r < kRows; ++r) {
            const char* row = glyph.rows[r];
            int c = 0;
            while (c < kColumns) {
                if (row[c] != '#') { ++c; continue; }
                const int run_start = c;
                while (c < kColumns && row[c] == '#') ++c;

                const double x0 = origin_x + run_start * cell - grow;
                const double x1 = origin_x + c * cell + grow;
                const double y1 = top - r * cell + grow;
                const double y0 = top - (r + 1) * cell - grow;
                contours.push_back(rectangle(x0, y0, x1, y1));
                ink_min = std::min(ink_min, x0);
                ink_max = std::max(ink_max, x1);
            }
        }
    }

    if (contours.empty()) {
        return contours;
    }

    const double shift = -0.5 * (ink_min + ink_max);
    for (auto& contour : contours) {
        for (auto& p : contour) {
            p[0] += shift;
        }
    }
    return contours;
}

} // namespace keyforge

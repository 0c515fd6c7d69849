/**
 * @file GlyphSource.h
 * @brief Font collaborators that turn a line of text into planar outlines
 *
 * A glyph source only produces 2D contours. Resolving overlaps, extruding
 * and placing the result on a face is the Text-Solid Builder's job.
 */

#pragma once

#include <array>
#include <memory>
#include <string>
#include <vector>

namespace keyforge {

using Point2 = std::array<double, 2>;
using Contour = std::vector<Point2>;      ///< Closed ring, last point != first
using Contours = std::vector<Contour>;    ///< Interpreted with the non-zero fill rule

/**
 * @brief Abstract font collaborator
 */
class IGlyphSource {
public:
    virtual ~IGlyphSource() = default;

    virtual std::string name() const = 0;

    /**
     * @brief Outline a whole line of text
     *
     * The result is centred on the origin horizontally (ink width) and
     * vertically (font body), with the glyphs reading along +X and +Y up.
     * A line with no visible glyphs returns an empty set.
     *
     * @param text Line of text (no newlines)
     * @param lineHeight Target glyph height in working units
     */
    virtual Contours outlineLine(const std::string& text, double lineHeight) const = 0;
};

//=============================================================================
// BUILT-IN BLOCK FONT
//=============================================================================

/**
 * @brief 5x7 block font, no external dependencies
 *
 * Covers A-Z, 0-9, space and . , ! ? - ' :. Lowercase maps to uppercase;
 * any other character renders as a filled box. Each lit run of cells is one
 * rectangle, grown by cellOverlap (fraction of a cell) so that neighbouring
 * runs overlap and fuse under the non-zero rule instead of merely touching.
 */
class BlockGlyphSource : public IGlyphSource {
public:
    explicit BlockGlyphSource(double cellOverlap = 0.02);

    std::string name() const override { return "block5x7"; }
    Contours outlineLine(const std::string& text, double lineHeight) const override;

    static constexpr int kColumns = 5;
    static constexpr int kRows = 7;
    static constexpr int kAdvance = 6;    ///< Columns per character including gap

private:
    double cell_overlap_;
};

//=============================================================================
// FREETYPE FONT
//=============================================================================

/**
 * @brief TrueType / OpenType outlines through FreeType
 *
 * Outlines are read in font units, curves are flattened, kerning is
 * applied, and the em square is scaled to lineHeight.
 *
 * @throws InvalidParameterError ("font_path") if the face cannot be loaded
 */
class FreeTypeGlyphSource : public IGlyphSource {
public:
    explicit FreeTypeGlyphSource(const std::string& fontPath, int curveSteps = 8);
    ~FreeTypeGlyphSource() override;

    FreeTypeGlyphSource(const FreeTypeGlyphSource&) = delete;
    FreeTypeGlyphSource& operator=(const FreeTypeGlyphSource&) = delete;

    std::string name() const override;
    Contours outlineLine(const std::string& text, double lineHeight) const override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Pick the glyph source for a run
 *
 * An empty font path selects the block font.
 */
std::unique_ptr<IGlyphSource> createGlyphSource(const std::string& fontPath);

} // namespace keyforge

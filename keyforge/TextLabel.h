/**
 * @file TextLabel.h
 * @brief Text-Solid Builder: multi-line label extruded onto a planar face
 */

#pragma once

#include "Solid.h"
#include "GlyphSource.h"

#include <string>
#include <vector>

namespace keyforge {

class IBooleanBackend;

/// Leading between consecutive baselines, as a multiple of the line height.
constexpr double kLineSpacingRatio = 1.6;

/**
 * @brief Build one label solid from lines of text
 *
 * Line i is offset by -i * lineHeight * kLineSpacingRatio along the face's
 * up axis and the stack is centred on faceCenter. Each line is extruded
 * extrudeDepth out of the face (along faceNormal) and overlapEps into it,
 * then all lines are unioned. Empty or whitespace-only lines keep their
 * slot but add no geometry; an empty line list gives an empty solid.
 *
 * @throws InvalidParameterError on non-positive height, depth or epsilon
 */
Solid buildLabel(const std::vector<std::string>& lines,
                 double lineHeight,
                 double extrudeDepth,
                 const Vec3& faceCenter,
                 const Vec3& faceNormal,
                 const IGlyphSource& glyphs,
                 IBooleanBackend& backend,
                 double overlapEps,
                 const std::string& name = "label");

} // namespace keyforge

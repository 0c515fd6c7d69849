/**
 * @file Extrude.h
 * @brief Planar contours to a prism solid
 */

#pragma once

#include "keyforge/Solid.h"
#include "keyforge/GlyphSource.h"

#include <string>

namespace keyforge {

/**
 * @brief Resolve contours with the non-zero fill rule and extrude them
 *
 * The prism spans z in [0, height] in the contours' own XY frame, wound
 * outward. Overlapping contours fuse; contours enclosing no area vanish.
 *
 * @return Closed solid, or an empty solid if nothing remains or the
 *         extrusion was rejected (logged)
 */
Solid extrudeContours(const Contours& contours, double height, const std::string& name);

} // namespace keyforge

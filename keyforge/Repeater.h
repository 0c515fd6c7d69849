/**
 * @file Repeater.h
 * @brief Repeater: evenly spaced congruent slabs merged into one solid
 */

#pragma once

#include "Solid.h"

#include <string>

namespace keyforge {

class IBooleanBackend;

/**
 * @brief N slabs spread over (spanStart, spanEnd) along one axis
 *
 * spacing = (spanEnd - spanStart) / (count + 1); slab i (1-indexed) is
 * centred at spanStart + i * spacing on `axis` and at `anchor` on the two
 * other axes. Slabs never touch, and are unioned into one solid.
 *
 * @return Union of the slabs; empty if count == 0
 * @throws InvalidParameterError if count < 0, an extent is not positive,
 *         spanEnd <= spanStart, or spacing <= slab extent along `axis`
 */
Solid buildRepeatedSlabs(int count,
                         const Vec3& slabExtents,
                         Axis axis,
                         double spanStart,
                         double spanEnd,
                         const Vec3& anchor,
                         IBooleanBackend& backend,
                         const std::string& name = "slabs");

} // namespace keyforge

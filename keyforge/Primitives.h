/**
 * @file Primitives.h
 * @brief Primitive Factory: parametric box, cylinder and annulus solids
 *
 * All primitives are built in world space with an identity transform,
 * closed, and wound counter-clockwise seen from outside.
 */

#pragma once

#include "Solid.h"

#include <string>

namespace keyforge {

class IBooleanBackend;

/// Maximum number of Difference attempts makeAnnulus makes.
constexpr int kAnnulusMaxAttempts = 3;

/**
 * @brief Axis-aligned rectangular prism
 *
 * @throws InvalidParameterError if any extent is not positive
 */
Solid makeBox(const Vec3& center, const Vec3& extents, const std::string& name = "box");

/**
 * @brief Closed cylinder with flat caps
 *
 * Ring vertex i sits at angle 2*pi*(i + 0.5)/segments around the axis, so
 * no tessellation vertex lies on an axis-aligned tangent plane.
 *
 * @param height Full length along the axis, centred on center
 * @throws InvalidParameterError on non-positive radius/height or segments < 3
 */
Solid makeCylinder(double radius, double height, int segments,
                   const Vec3& center, Axis axis = Axis::Z,
                   const std::string& name = "cylinder");

/**
 * @brief Ring with a through-hole: outer cylinder minus a longer inner one
 *
 * The inner cylinder is over-extended by overlapEps past both faces of
 * the ring. If the Difference fails it is retried with the over-extension
 * doubled, up to kAnnulusMaxAttempts attempts in total.
 *
 * @throws InvalidParameterError on invalid dimensions (inner >= outer, ...)
 * @throws BooleanOperationError if every attempt fails
 */
Solid makeAnnulus(double outerRadius, double innerRadius, double thickness,
                  const Vec3& center, int segments, Axis axis,
                  IBooleanBackend& backend, double overlapEps,
                  const std::string& name = "annulus");

} // namespace keyforge

/**
 * @file Finishing.h
 * @brief Finishing Stage: recentre on the volumetric centroid and rescale
 */

#pragma once

#include "keyforge/Solid.h"

namespace keyforge {

/**
 * @brief Move the origin to the centre of mass and convert units
 *
 * Any pending transform is baked first. Vertices are re-expressed relative
 * to the volumetric centroid c and scaled: v' = (v - c) * targetUnitScale.
 * The transform's translation then holds c * targetUnitScale, so the solid
 * keeps its placement while its mesh is origin-centred.
 *
 * Calling finish again with scale 1.0 leaves the solid unchanged up to
 * floating-point rounding.
 *
 * @throws InvalidParameterError if targetUnitScale is not positive
 * @throws NoGeometryError if the solid is empty or encloses zero volume
 */
Solid finish(Solid solid, double targetUnitScale);

} // namespace keyforge

/**
 * @file Finishing.cpp
 * @brief Finishing Stage implementation
 */

#include "Finishing.h"
#include "keyforge/Errors.h"
#include "keyforge/Diagnostics.h"

namespace keyforge {

Solid finish(Solid solid, double targetUnitScale) {
    KEYFORGE_SCOPED_TIMER("Finishing");

    requirePositive("target_unit_scale", targetUnitScale);

    solid.bakeTransform();

    if (solid.empty()) {
        throw NoGeometryError("Assembly produced no geometry: '" + solid.name + "' has no faces");
    }

    bool ok = false;
    const Vec3 centroid = volumetricCentroid(solid, &ok);
    if (!ok) {
        throw NoGeometryError("Assembly produced no geometry: '" + solid.name + "' encloses zero volume");
    }

    for (auto& v : solid.vertices) {
        v = mul(sub(v, centroid), targetUnitScale);
    }
    solid.transform = Transform::translation(mul(centroid, targetUnitScale));

    KEYFORGE_LOG_DEBUG("Finished '%s': centroid (%.4f, %.4f, %.4f), scale %g",
                       solid.name.c_str(), centroid[0], centroid[1], centroid[2], targetUnitScale);
    return solid;
}

} // namespace keyforge

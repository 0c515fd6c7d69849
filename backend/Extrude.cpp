// ═══════════════════════════════════════════════════════════════════════════════
// KEYFORGE Extrude.cpp: CrossSection + Manifold::Extrude
// ═══════════════════════════════════════════════════════════════════════════════

#include "Extrude.h"
#include "ManifoldMesh.h"
#include "keyforge/Diagnostics.h"
#include "keyforge/Errors.h"

#include <manifold/cross_section.h>
#include <manifold/manifold.h>

#include <exception>
#include <utility>

namespace keyforge {

Solid extrudeContours(const Contours& contours, double height, const std::string& name)
{
    requirePositive("extrude_height", height);

    if (contours.empty()) {
        return Solid(name);
    }

    manifold::Polygons polys;
    polys.reserve(contours.size());
    for (const auto& contour : contours) {
        manifold::SimplePolygon ring;
        ring.reserve(contour.size());
        for (const auto& p : contour) {
            ring.push_back(manifold::vec2(p[0], p[1]));
        }
        polys.push_back(std::move(ring));
    }

    try {
        const manifold::CrossSection section(polys, manifold::CrossSection::FillRule::NonZero);
        if (section.IsEmpty()) {
            return Solid(name);
        }

        const manifold::Manifold prism = manifold::Manifold::Extrude(section.ToPolygons(), height);
        if (prism.Status() != manifold::Manifold::Error::NoError) {
            KEYFORGE_LOG_ERROR("Extrusion of '%s' rejected by Manifold (status %d)",
                               name.c_str(), static_cast<int>(prism.Status()));
            return Solid(name);
        }
        return solidFromManifold(prism, name);

    } catch (const std::exception& e) {
        KEYFORGE_LOG_ERROR("Extrusion of '%s' failed: %s", name.c_str(), e.what());
        return Solid(name);
    }
}

} // namespace keyforge

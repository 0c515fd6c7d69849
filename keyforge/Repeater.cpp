/**
 * @file Repeater.cpp
 * @brief Repeater implementation
 */

#include "Repeater.h"
#include "Primitives.h"
#include "Errors.h"
#include "Diagnostics.h"
#include "backend/BooleanCombine.h"

#include <sstream>
#include <utility>

namespace keyforge {

Solid buildRepeatedSlabs(int count,
                         const Vec3& slabExtents,
                         Axis axis,
                         double spanStart,
                         double spanEnd,
                         const Vec3& anchor,
                         IBooleanBackend& backend,
                         const std::string& name) {
    if (count < 0) {
        throw InvalidParameterError("count", "cannot be negative, got " + std::to_string(count));
    }
    requirePositive("slab_extents.x", slabExtents[0]);
    requirePositive("slab_extents.y", slabExtents[1]);
    requirePositive("slab_extents.z", slabExtents[2]);
    if (!(spanEnd > spanStart)) {
        throw InvalidParameterError("span_end", "must be greater than span_start");
    }

    Solid composite(name);
    if (count == 0) {
        return composite;
    }

    const int k = axisIndex(axis);
    const double spacing = (spanEnd - spanStart) / (static_cast<double>(count) + 1.0);
    if (spacing <= slabExtents[k]) {
        std::ostringstream oss;
        oss << "spacing " << spacing << " along " << axisName(axis)
            << " does not exceed slab extent " << slabExtents[k];
        throw InvalidParameterError("count", oss.str());
    }

    for (int i = 1; i <= count; ++i) {
        Vec3 center = anchor;
        center[k] = spanStart + i * spacing;
        const Solid slab = makeBox(center, slabExtents, name + "_" + std::to_string(i));

        BooleanResult merged = combine(backend, composite, slab, BooleanOp::Union);
        if (!merged.success) {
            KEYFORGE_LOG_WARN("Slab %d of '%s' could not be merged: %s",
                              i, name.c_str(), merged.error_message.c_str());
            continue;
        }
        composite = std::move(merged.output);
        composite.name = name;
    }

    return composite;
}

} // namespace keyforge

/**
 * @file Primitives.cpp
 * @brief Primitive Factory implementation
 */

#include "Primitives.h"
#include "Errors.h"
#include "Diagnostics.h"
#include "backend/BooleanCombine.h"

#include <cmath>
#include <string>
#include <utility>

namespace keyforge {

namespace {

constexpr double kPi = 3.14159265358979323846;

// Cyclic permutation taking local +Z onto the requested axis (keeps handedness).
Vec3 orientAlong(Axis axis, const Vec3& local) {
    switch (axis) {
        case Axis::X: return {local[2], local[0], local[1]};
        case Axis::Y: return {local[1], local[2], local[0]};
        case Axis::Z: return local;
    }
    return local;
}

void addQuad(Solid& s, uint32_t a, uint32_t b, uint32_t c, uint32_t d) {
    s.addFace(a, b, c);
    s.addFace(a, c, d);
}

} // anonymous namespace

//=============================================================================
// BOX
//=============================================================================

Solid makeBox(const Vec3& center, const Vec3& extents, const std::string& name) {
    requirePositive("extents.x", extents[0]);
    requirePositive("extents.y", extents[1]);
    requirePositive("extents.z", extents[2]);

    Solid box(name);
    box.vertices.reserve(8);

    // Corner index bits: x | y << 1 | z << 2
    for (int i = 0; i < 8; ++i) {
        const double sx = (i & 1) ? 0.5 : -0.5;
        const double sy = (i & 2) ? 0.5 : -0.5;
        const double sz = (i & 4) ? 0.5 : -0.5;
        box.addVertex({center[0] + sx * extents[0],
                       center[1] + sy * extents[1],
                       center[2] + sz * extents[2]});
    }

    box.faces.reserve(12);
    addQuad(box, 0, 4, 6, 2);   // -X
    addQuad(box, 1, 3, 7, 5);   // +X
    addQuad(box, 0, 1, 5, 4);   // -Y
    addQuad(box, 2, 6, 7, 3);   // +Y
    addQuad(box, 0, 2, 3, 1);   // -Z
    addQuad(box, 4, 5, 7, 6);   // +Z

    return box;
}

//=============================================================================
// CYLINDER
//=============================================================================

Solid makeCylinder(double radius, double height, int segments,
                   const Vec3& center, Axis axis, const std::string& name) {
    requirePositive("radius", radius);
    requirePositive("height", height);
    if (segments < 3) {
        throw InvalidParameterError("segments",
                                    "must be at least 3, got " + std::to_string(segments));
    }

    const uint32_t n = static_cast<uint32_t>(segments);
    const double half = 0.5 * height;

    Solid cyl(name);
    cyl.vertices.reserve(2 * n + 2);

    // Bottom ring [0, n), top ring [n, 2n), then bottom and top centres
    for (int ring = 0; ring < 2; ++ring) {
        const double z = ring == 0 ? -half : half;
        for (uint32_t i = 0; i < n; ++i) {
            const double theta = 2.0 * kPi * (static_cast<double>(i) + 0.5) / n;
            const Vec3 local = {radius * std::cos(theta), radius * std::sin(theta), z};
            cyl.addVertex(add(center, orientAlong(axis, local)));
        }
    }
    const uint32_t bottom_center = cyl.addVertex(add(center, orientAlong(axis, {0.0, 0.0, -half})));
    const uint32_t top_center = cyl.addVertex(add(center, orientAlong(axis, {0.0, 0.0, half})));

    cyl.faces.reserve(4 * n);
    for (uint32_t i = 0; i < n; ++i) {
        const uint32_t j = (i + 1) % n;
        addQuad(cyl, i, j, n + j, n + i);        // side
        cyl.addFace(top_center, n + i, n + j);   // top cap
        cyl.addFace(bottom_center, j, i);        // bottom cap
    }

    return cyl;
}

//=============================================================================
// ANNULUS
//=============================================================================

Solid makeAnnulus(double outerRadius, double innerRadius, double thickness,
                  const Vec3& center, int segments, Axis axis,
                  IBooleanBackend& backend, double overlapEps,
                  const std::string& name) {
    requirePositive("outer_radius", outerRadius);
    requirePositive("inner_radius", innerRadius);
    requirePositive("thickness", thickness);
    requirePositive("overlap_epsilon", overlapEps);
    if (innerRadius >= outerRadius) {
        throw InvalidParameterError("inner_radius", "must be smaller than outer_radius");
    }

    const Solid outer = makeCylinder(outerRadius, thickness, segments, center, axis, name);
    const double outer_volume = signedVolume(outer);

    double extension = overlapEps;
    std::string last_error;

    for (int attempt = 1; attempt <= kAnnulusMaxAttempts; ++attempt) {
        const Solid inner = makeCylinder(innerRadius, thickness + 2.0 * extension,
                                         segments, center, axis, name + "_hole");

        BooleanResult cut = combine(backend, outer, inner, BooleanOp::Difference);
        if (cut.success && !cut.output.empty() &&
            signedVolume(cut.output) < outer_volume * (1.0 - kVolumeRelativeTolerance)) {
            cut.output.name = name;
            if (attempt > 1) {
                KEYFORGE_LOG_INFO("Annulus '%s' cut on attempt %d (over-extension %g)",
                                  name.c_str(), attempt, extension);
            }
            return std::move(cut.output);
        }

        last_error = cut.success ? "hole did not remove any material" : cut.error_message;
        KEYFORGE_LOG_WARN("Annulus '%s' attempt %d/%d failed: %s",
                          name.c_str(), attempt, kAnnulusMaxAttempts, last_error.c_str());
        extension *= 2.0;
    }

    throw BooleanOperationError("Annulus '" + name + "' could not be cut after " +
                                std::to_string(kAnnulusMaxAttempts) + " attempts: " + last_error);
}

} // namespace keyforge

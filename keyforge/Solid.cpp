/**
 * @file Solid.cpp
 * @brief Solid mesh container, transforms and volume integrals
 */

#include "Solid.h"

#include <algorithm>
#include <cmath>

namespace keyforge {

double length(const Vec3& a) {
    return std::sqrt(dot(a, a));
}

Vec3 normalized(const Vec3& a) {
    const double len = length(a);
    if (len < 1e-300) {
        return {0.0, 0.0, 0.0};
    }
    return mul(a, 1.0 / len);
}

const char* axisName(Axis axis) {
    switch (axis) {
        case Axis::X: return "X";
        case Axis::Y: return "Y";
        case Axis::Z: return "Z";
    }
    return "?";
}

const char* booleanOpName(BooleanOp op) {
    switch (op) {
        case BooleanOp::Union:      return "Union";
        case BooleanOp::Difference: return "Difference";
    }
    return "?";
}

bool Transform::isIdentity() const {
    for (int r = 0; r < 3; ++r) {
        for (int c = 0; c < 4; ++c) {
            const double expected = (r == c) ? 1.0 : 0.0;
            if (m[r][c] != expected) return false;
        }
    }
    return true;
}

//=============================================================================
// SOLID
//=============================================================================

void Solid::append(const Solid& other) {
    const uint32_t base = static_cast<uint32_t>(vertices.size());
    vertices.insert(vertices.end(), other.vertices.begin(), other.vertices.end());
    faces.reserve(faces.size() + other.faces.size());
    for (const auto& f : other.faces) {
        faces.push_back({f[0] + base, f[1] + base, f[2] + base});
    }
}

void Solid::translate(const Vec3& offset) {
    for (auto& v : vertices) {
        v = add(v, offset);
    }
}

void Solid::scale(double factor) {
    for (auto& v : vertices) {
        v = mul(v, factor);
    }
}

void Solid::clear() {
    std::vector<Vec3>().swap(vertices);
    std::vector<Face>().swap(faces);
    transform = Transform();
}

void Solid::computeBoundingBox(double out_min[3], double out_max[3]) const {
    if (vertices.empty()) {
        for (int i = 0; i < 3; ++i) {
            out_min[i] = 0.0;
            out_max[i] = 0.0;
        }
        return;
    }

    for (int i = 0; i < 3; ++i) {
        out_min[i] = vertices[0][i];
        out_max[i] = vertices[0][i];
    }

    for (const auto& v : vertices) {
        for (int i = 0; i < 3; ++i) {
            out_min[i] = std::min(out_min[i], v[i]);
            out_max[i] = std::max(out_max[i], v[i]);
        }
    }
}

void Solid::bakeTransform() {
    if (transform.isIdentity()) return;
    for (auto& v : vertices) {
        v = transform.apply(v);
    }
    transform = Transform();
}

//=============================================================================
// VOLUME PROPERTIES
//=============================================================================

namespace {

// Tetrahedra are formed against the bounding-box centre rather than the
// world origin to keep the products well conditioned far from zero.
Vec3 referencePoint(const Solid& solid) {
    double bmin[3], bmax[3];
    solid.computeBoundingBox(bmin, bmax);
    return {0.5 * (bmin[0] + bmax[0]), 0.5 * (bmin[1] + bmax[1]), 0.5 * (bmin[2] + bmax[2])};
}

} // anonymous namespace

double signedVolume(const Solid& solid) {
    if (solid.empty()) return 0.0;

    const Vec3 ref = referencePoint(solid);
    double six_vol = 0.0;
    for (const auto& f : solid.faces) {
        const Vec3 a = sub(solid.vertices[f[0]], ref);
        const Vec3 b = sub(solid.vertices[f[1]], ref);
        const Vec3 c = sub(solid.vertices[f[2]], ref);
        six_vol += dot(a, cross(b, c));
    }
    return six_vol / 6.0;
}

Vec3 volumetricCentroid(const Solid& solid, bool* ok) {
    if (ok) *ok = false;
    if (solid.empty()) return {0.0, 0.0, 0.0};

    const Vec3 ref = referencePoint(solid);
    double six_vol = 0.0;
    Vec3 moment = {0.0, 0.0, 0.0};

    for (const auto& f : solid.faces) {
        const Vec3 a = sub(solid.vertices[f[0]], ref);
        const Vec3 b = sub(solid.vertices[f[1]], ref);
        const Vec3 c = sub(solid.vertices[f[2]], ref);
        const double v6 = dot(a, cross(b, c));
        six_vol += v6;
        // Tetra (ref, a, b, c) has centroid (a + b + c) / 4 relative to ref
        moment = add(moment, mul(add(add(a, b), c), v6));
    }

    if (std::abs(six_vol) < 1e-15) {
        return ref;
    }

    if (ok) *ok = true;
    return add(ref, mul(moment, 1.0 / (4.0 * six_vol)));
}

bool boundingBoxesOverlap(const double a_min[3], const double a_max[3],
                          const double b_min[3], const double b_max[3]) {
    for (int i = 0; i < 3; ++i) {
        if (a_max[i] <= b_min[i] || b_max[i] <= a_min[i]) {
            return false;
        }
    }
    return true;
}

} // namespace keyforge

/**
 * @file Solid.h
 * @brief Core mesh data structures for the keyforge solid generator
 *
 * A Solid is a closed, oriented triangle mesh bounding a volume. Faces are
 * wound counter-clockwise when viewed from outside, so face normals point
 * out of the material. Every builder in keyforge returns a Solid by value;
 * there is no shared scene state.
 */

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace keyforge {

using Vec3 = std::array<double, 3>;
using Face = std::array<uint32_t, 3>;

//=============================================================================
// SMALL VECTOR HELPERS
//=============================================================================

inline Vec3 add(const Vec3& a, const Vec3& b) { return {a[0] + b[0], a[1] + b[1], a[2] + b[2]}; }
inline Vec3 sub(const Vec3& a, const Vec3& b) { return {a[0] - b[0], a[1] - b[1], a[2] - b[2]}; }
inline Vec3 mul(const Vec3& a, double s) { return {a[0] * s, a[1] * s, a[2] * s}; }
inline double dot(const Vec3& a, const Vec3& b) { return a[0] * b[0] + a[1] * b[1] + a[2] * b[2]; }
inline Vec3 cross(const Vec3& a, const Vec3& b) {
    return {a[1] * b[2] - a[2] * b[1],
            a[2] * b[0] - a[0] * b[2],
            a[0] * b[1] - a[1] * b[0]};
}
double length(const Vec3& a);
Vec3 normalized(const Vec3& a);

//=============================================================================
// AXIS
//=============================================================================

enum class Axis { X = 0, Y = 1, Z = 2 };

inline int axisIndex(Axis axis) { return static_cast<int>(axis); }
const char* axisName(Axis axis);

//=============================================================================
// TRANSFORM
//=============================================================================

/**
 * @brief Affine local-to-world transform stored as a row-major 3x4 matrix
 *
 * p_world = M[0..2][0..2] * p_local + M[.][3]
 */
struct Transform {
    std::array<std::array<double, 4>, 3> m;

    Transform() {
        m = {{{{1, 0, 0, 0}}, {{0, 1, 0, 0}}, {{0, 0, 1, 0}}}};
    }

    static Transform translation(const Vec3& t) {
        Transform tr;
        tr.m[0][3] = t[0];
        tr.m[1][3] = t[1];
        tr.m[2][3] = t[2];
        return tr;
    }

    Vec3 apply(const Vec3& p) const {
        return {m[0][0] * p[0] + m[0][1] * p[1] + m[0][2] * p[2] + m[0][3],
                m[1][0] * p[0] + m[1][1] * p[1] + m[1][2] * p[2] + m[1][3],
                m[2][0] * p[0] + m[2][1] * p[1] + m[2][2] * p[2] + m[2][3]};
    }

    Vec3 origin() const { return {m[0][3], m[1][3], m[2][3]}; }

    bool isIdentity() const;
};

//=============================================================================
// SOLID
//=============================================================================

/**
 * @brief Named triangle mesh with a local-to-world transform
 *
 * Vertices are stored in local space. Builders produce world-space vertices
 * with an identity transform; the finishing stage moves the origin.
 */
struct Solid {
    std::string name;
    std::vector<Vec3> vertices;
    std::vector<Face> faces;
    Transform transform;

    Solid() = default;
    explicit Solid(std::string n) : name(std::move(n)) {}

    bool empty() const { return faces.empty(); }
    size_t vertexCount() const { return vertices.size(); }
    size_t faceCount() const { return faces.size(); }

    uint32_t addVertex(const Vec3& p) {
        vertices.push_back(p);
        return static_cast<uint32_t>(vertices.size() - 1);
    }

    void addFace(uint32_t a, uint32_t b, uint32_t c) {
        faces.push_back({a, b, c});
    }

    // Append another mesh as a separate shell (no boolean merge).
    void append(const Solid& other);

    void translate(const Vec3& offset);
    void scale(double factor);

    // Release all geometry and its storage.
    void clear();

    // Compute bounding box from vertices. Returns all zeros if empty.
    void computeBoundingBox(double out_min[3], double out_max[3]) const;

    // Bake the transform into the vertices and reset it to identity.
    void bakeTransform();
};

//=============================================================================
// VOLUME PROPERTIES
//=============================================================================

/**
 * @brief Signed enclosed volume (divergence theorem over the faces)
 *
 * Positive for a closed mesh with outward winding.
 */
double signedVolume(const Solid& solid);

/**
 * @brief Centre of mass of the uniform-density volume bounded by the mesh
 *
 * @param[out] ok false when the enclosed volume is (numerically) zero
 */
Vec3 volumetricCentroid(const Solid& solid, bool* ok = nullptr);

/**
 * @brief Axis-aligned box intersection test with strict inequality
 *
 * Boxes that only touch on a face do not intersect.
 */
bool boundingBoxesOverlap(const double a_min[3], const double a_max[3],
                          const double b_min[3], const double b_max[3]);

//=============================================================================
// BOOLEAN OPERATION ENUM
//=============================================================================

enum class BooleanOp {
    Union,       // A ∪ B
    Difference   // A - B
};

const char* booleanOpName(BooleanOp op);

} // namespace keyforge

/**
 * @file Frame.h
 * @brief Orthonormal frame of a planar target face
 */

#pragma once

#include "Solid.h"

namespace keyforge {

/**
 * @brief Right-handed in-face basis: right x up == normal
 */
struct FaceFrame {
    Vec3 right;
    Vec3 up;
    Vec3 normal;

    // Map frame-local (x right, y up, z along normal) to world.
    Vec3 toWorld(const Vec3& origin, const Vec3& local) const {
        return add(origin, add(add(mul(right, local[0]), mul(up, local[1])), mul(normal, local[2])));
    }
};

/**
 * @brief Build the frame of a face from its outward normal
 *
 * "up" is world +Z projected onto the face; when the face is (nearly)
 * horizontal, world +Y is used instead. right = up x normal.
 *
 * A zero-length normal falls back to the XY plane facing +Z.
 */
FaceFrame computeFaceFrame(const Vec3& faceNormal);

} // namespace keyforge

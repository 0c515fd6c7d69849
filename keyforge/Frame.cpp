/**
 * @file Frame.cpp
 * @brief Face frame construction
 */

#include "Frame.h"

#include <cmath>

namespace keyforge {

FaceFrame computeFaceFrame(const Vec3& faceNormal) {
    FaceFrame frame;

    const double nlen = length(faceNormal);
    if (nlen < 1e-10) {
        // Degenerate - use default basis
        frame.normal = {0.0, 0.0, 1.0};
        frame.up = {0.0, 1.0, 0.0};
        frame.right = {1.0, 0.0, 0.0};
        return frame;
    }

    frame.normal = mul(faceNormal, 1.0 / nlen);

    // Reference "up": world Z unless the face is close to horizontal
    Vec3 reference = {0.0, 0.0, 1.0};
    if (std::abs(frame.normal[2]) > 0.999) {
        reference = {0.0, 1.0, 0.0};
    }

    // Gram-Schmidt: remove the normal component
    const Vec3 projected = sub(reference, mul(frame.normal, dot(reference, frame.normal)));
    frame.up = normalized(projected);
    frame.right = normalized(cross(frame.up, frame.normal));

    return frame;
}

} // namespace keyforge

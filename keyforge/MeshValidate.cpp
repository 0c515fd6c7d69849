/**
 * @file MeshValidate.cpp
 * @brief Topology gate implementation
 */

#include "MeshValidate.h"

#include <cmath>
#include <string>
#include <unordered_map>

namespace keyforge {

//=============================================================================
// DEGENERATE FACES
//=============================================================================

bool isFaceDegenerate(const Solid& solid, const Face& face) {
    if (face[0] == face[1] || face[1] == face[2] || face[2] == face[0]) {
        return true;
    }

    const Vec3& a = solid.vertices[face[0]];
    const Vec3& b = solid.vertices[face[1]];
    const Vec3& c = solid.vertices[face[2]];

    for (int i = 0; i < 3; ++i) {
        if (!std::isfinite(a[i]) || !std::isfinite(b[i]) || !std::isfinite(c[i])) {
            return true;
        }
    }

    const Vec3 n = cross(sub(b, a), sub(c, a));
    return n[0] == 0.0 && n[1] == 0.0 && n[2] == 0.0;
}

//=============================================================================
// TOPOLOGY INSPECTION
//=============================================================================

TopologyReport inspectTopology(const Solid& solid) {
    TopologyReport report;
    report.face_count = solid.faces.size();

    const uint32_t nverts = static_cast<uint32_t>(solid.vertices.size());

    // Undirected use count, and (for winding) how often each direction occurs
    std::unordered_map<Edge, int, EdgeHash> edge_counts;
    std::unordered_map<Edge, int, EdgeHash> forward_counts;
    edge_counts.reserve(solid.faces.size() * 2);
    forward_counts.reserve(solid.faces.size() * 2);

    for (const auto& f : solid.faces) {
        if (f[0] >= nverts || f[1] >= nverts || f[2] >= nverts) {
            ++report.invalid_indices;
            continue;
        }
        if (isFaceDegenerate(solid, f)) {
            ++report.degenerate_faces;
        }

        for (int k = 0; k < 3; ++k) {
            const uint32_t a = f[k];
            const uint32_t b = f[(k + 1) % 3];
            if (a == b) continue;
            Edge e(a, b);
            edge_counts[e]++;
            if (a < b) forward_counts[e]++;
        }
    }

    for (const auto& [edge, count] : edge_counts) {
        if (count == 1) {
            ++report.boundary_edges;
        } else if (count > 2) {
            ++report.non_manifold_edges;
        } else {
            // A correctly wound shared edge is used once in each direction
            auto it = forward_counts.find(edge);
            const int forward = (it == forward_counts.end()) ? 0 : it->second;
            if (forward != 1) {
                ++report.inconsistent_edges;
            }
        }
    }

    return report;
}

//=============================================================================
// OPERAND GATE
//=============================================================================

bool validateOperand(const Solid& solid, DiagnosticLog& log) {
    if (solid.empty()) {
        return true;
    }

    const TopologyReport report = inspectTopology(solid);
    if (report.isClosedManifold()) {
        return true;
    }

    const std::string who = "'" + solid.name + "'";

    if (report.invalid_indices > 0) {
        log.error(DiagCategory::Error,
                  who + " has face indices past its vertex array",
                  static_cast<int>(report.invalid_indices));
    }
    if (report.degenerate_faces > 0) {
        log.error(DiagCategory::Degenerate,
                  who + " has degenerate faces",
                  static_cast<int>(report.degenerate_faces));
    }
    if (report.boundary_edges > 0) {
        log.error(DiagCategory::NotWatertight,
                  who + " has boundary edges (not watertight)",
                  static_cast<int>(report.boundary_edges));
    }
    if (report.non_manifold_edges > 0) {
        log.error(DiagCategory::NonManifold,
                  who + " has edges shared by more than two faces",
                  static_cast<int>(report.non_manifold_edges));
    }
    if (report.inconsistent_edges > 0) {
        log.error(DiagCategory::InconsistentWinding,
                  who + " has inconsistently wound edges",
                  static_cast<int>(report.inconsistent_edges));
    }

    return false;
}

} // namespace keyforge

/**
 * @file MeshValidate.h
 * @brief Topology gate run on every solid before it reaches the boolean solver
 *
 * A solid handed to a boolean must be a closed 2-manifold with consistent
 * outward winding. The gate counts each defect class so callers can decide
 * and report, rather than letting the solver run on undefined input.
 */

#pragma once

#include "Solid.h"
#include "Diagnostics.h"

#include <cstddef>
#include <cstdint>

namespace keyforge {

/**
 * @brief Edge structure for edge-use counting (undirected, ordered for hashing)
 */
struct Edge {
    uint32_t v0, v1;

    Edge(uint32_t a, uint32_t b) {
        if (a < b) { v0 = a; v1 = b; }
        else { v0 = b; v1 = a; }
    }

    bool operator==(const Edge& other) const {
        return v0 == other.v0 && v1 == other.v1;
    }
};

struct EdgeHash {
    size_t operator()(const Edge& e) const noexcept {
        return (static_cast<size_t>(e.v0) << 32) ^ e.v1;
    }
};

/**
 * @brief Defect counts for one solid
 */
struct TopologyReport {
    size_t invalid_indices = 0;       ///< Face index past the vertex array
    size_t degenerate_faces = 0;      ///< Repeated index or zero area
    size_t boundary_edges = 0;        ///< Edge used by one face
    size_t non_manifold_edges = 0;    ///< Edge used by more than two faces
    size_t inconsistent_edges = 0;    ///< Same directed edge used twice
    size_t face_count = 0;

    bool isClosedManifold() const {
        return face_count > 0 && invalid_indices == 0 && degenerate_faces == 0 &&
               boundary_edges == 0 && non_manifold_edges == 0 && inconsistent_edges == 0;
    }
};

/**
 * @brief Check if a face is degenerate
 *
 * Degenerate means a repeated vertex index, a non-finite coordinate, or
 * an exactly zero cross product (collinear corners).
 */
bool isFaceDegenerate(const Solid& solid, const Face& face);

/**
 * @brief Count every defect class of a solid
 */
TopologyReport inspectTopology(const Solid& solid);

/**
 * @brief Gate a solid before a boolean
 *
 * Empty solids pass (the caller decides what an empty operand means).
 * A non-empty solid that is not a closed manifold logs one entry per
 * defect class, tagged with the solid's name.
 *
 * @return true if the solid may be handed to the solver
 */
bool validateOperand(const Solid& solid, DiagnosticLog& log);

} // namespace keyforge

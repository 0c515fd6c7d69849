#pragma once
// ═══════════════════════════════════════════════════════════════════════════════
// KEYFORGE ManifoldMesh.h: Solid <-> manifold::MeshGL64 conversion
// ═══════════════════════════════════════════════════════════════════════════════
//
// Internal to the backend directory. Both sides use counter-clockwise
// outward winding, so triangles are copied without reordering.

#include "keyforge/Solid.h"

#include <manifold/manifold.h>

#include <string>

namespace keyforge {

/// Copy an indexed solid into MeshGL64 (positions only), tagged with originalID.
manifold::MeshGL64 solidToMeshGL64(const Solid& solid, uint32_t originalID);

/// Rebuild an indexed solid from Manifold output, de-duplicating vertices
/// by exact coordinate bits.
Solid solidFromMeshGL64(const manifold::MeshGL64& gl, const std::string& name);

/// Convert and read back a Manifold in one step.
Solid solidFromManifold(const manifold::Manifold& m, const std::string& name);

} // namespace keyforge

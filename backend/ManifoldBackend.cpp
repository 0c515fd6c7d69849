// ═══════════════════════════════════════════════════════════════════════════════
// KEYFORGE ManifoldBackend.cpp: Boolean Operations via elalish/manifold v3.x
// ═══════════════════════════════════════════════════════════════════════════════
//
// v3 API: MeshGL64 (double precision, no GLM dependency).
//
// Both keyforge and Manifold wind triangles counter-clockwise seen from
// outside, so no winding reversal is needed on either side.
//
// ═══════════════════════════════════════════════════════════════════════════════

#include "ManifoldBackend.h"
#include "ManifoldMesh.h"

#include <manifold/manifold.h>

#include <chrono>
#include <cstdint>
#include <exception>
#include <string>

namespace keyforge {

// ─────────────────────────────────────────────────────────────────────────────
// Name / description
// ─────────────────────────────────────────────────────────────────────────────

std::string ManifoldBackend::name()        const { return "manifold"; }
std::string ManifoldBackend::description() const { return "Manifold (guaranteed watertight)"; }

namespace {

manifold::OpType toManifoldOp(BooleanOp op)
{
    switch (op) {
        case BooleanOp::Union:      return manifold::OpType::Add;
        case BooleanOp::Difference: return manifold::OpType::Subtract;
    }
    return manifold::OpType::Add;
}

std::string statusName(manifold::Manifold::Error status)
{
    switch (status) {
        case manifold::Manifold::Error::NoError:               return "no error";
        case manifold::Manifold::Error::NonFiniteVertex:       return "non-finite vertex";
        case manifold::Manifold::Error::NotManifold:           return "not manifold";
        case manifold::Manifold::Error::VertexOutOfBounds:     return "vertex index out of bounds";
        case manifold::Manifold::Error::PropertiesWrongLength: return "properties wrong length";
        default:                                               return "error code " +
                                                                   std::to_string(static_cast<int>(status));
    }
}

} // anonymous namespace

// ═══════════════════════════════════════════════════════════════════════════════
// ManifoldBackend::execute
// ═══════════════════════════════════════════════════════════════════════════════

BooleanResult ManifoldBackend::execute(const Solid& a, const Solid& b, BooleanOp op)
{
    BooleanResult result;
    auto t0 = std::chrono::steady_clock::now();

    if (a.empty() || b.empty()) {
        result.success       = false;
        result.error_message = "Empty input mesh (A or B has no triangles)";
        return result;
    }

    // ── Reserve unique IDs for face tracking ─────────────────────────────
    const uint32_t idA = manifold::Manifold::ReserveIDs(1);
    const uint32_t idB = manifold::Manifold::ReserveIDs(1);

    // ── Create Manifold objects ──────────────────────────────────────────
    manifold::Manifold mA, mB;
    try {
        mA = manifold::Manifold(solidToMeshGL64(a, idA));
        mB = manifold::Manifold(solidToMeshGL64(b, idB));
    } catch (const std::exception& e) {
        result.success       = false;
        result.error_message = std::string("Failed to create Manifold: ") + e.what();
        return result;
    }

    if (mA.Status() != manifold::Manifold::Error::NoError) {
        result.success       = false;
        result.error_message = "Mesh '" + a.name + "' is not a valid manifold (" +
                               statusName(mA.Status()) + ")";
        return result;
    }
    if (mB.Status() != manifold::Manifold::Error::NoError) {
        result.success       = false;
        result.error_message = "Mesh '" + b.name + "' is not a valid manifold (" +
                               statusName(mB.Status()) + ")";
        return result;
    }

    // ── Execute operation ────────────────────────────────────────────────
    try {
        manifold::Manifold out = mA.Boolean(mB, toManifoldOp(op));

        if (out.Status() != manifold::Manifold::Error::NoError) {
            result.success = false;
            result.error_message = "Boolean operation produced invalid result (" +
                                   statusName(out.Status()) + ")";
            return result;
        }

        result.output = solidFromManifold(out, a.name);

    } catch (const std::exception& e) {
        result.success       = false;
        result.error_message = std::string("Boolean operation failed: ") + e.what();
        return result;
    }

    result.success = true;

    auto t1 = std::chrono::steady_clock::now();
    result.execution_time_ms = std::chrono::duration<double, std::milli>(t1 - t0).count();

    return result;
}

} // namespace keyforge

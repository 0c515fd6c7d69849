// ═══════════════════════════════════════════════════════════════════════════════
// KEYFORGE ManifoldMesh.cpp: Solid <-> MeshGL64 (elalish/manifold v3.x)
// ═══════════════════════════════════════════════════════════════════════════════

#include "ManifoldMesh.h"

#include <array>
#include <cstring>
#include <unordered_map>
#include <vector>

namespace keyforge {

namespace {

// ─────────────────────────────────────────────────────────────────────────────
// Exact-bit vertex key (FNV-1a on the raw double bits)
// ─────────────────────────────────────────────────────────────────────────────

struct DoubleVtxHash {
    size_t operator()(const std::array<double,3>& p) const {
        size_t h = 14695981039346656037ULL;
        const unsigned char* raw = reinterpret_cast<const unsigned char*>(p.data());
        for (size_t i = 0; i < sizeof(double)*3; ++i) {
            h ^= raw[i];
            h *= 1099511628211ULL;
        }
        return h;
    }
};

struct DoubleVtxEq {
    bool operator()(const std::array<double,3>& a,
                    const std::array<double,3>& b) const {
        return std::memcmp(a.data(), b.data(), sizeof(double)*3) == 0;
    }
};

} // anonymous namespace

// ─────────────────────────────────────────────────────────────────────────────
// §1  Solid → MeshGL64
// ─────────────────────────────────────────────────────────────────────────────

manifold::MeshGL64 solidToMeshGL64(const Solid& solid, uint32_t originalID)
{
    manifold::MeshGL64 gl;
    gl.numProp = 3;  // x, y, z

    gl.vertProperties.reserve(solid.vertices.size() * 3);
    for (const auto& v : solid.vertices) {
        const Vec3 w = solid.transform.apply(v);
        gl.vertProperties.push_back(w[0]);
        gl.vertProperties.push_back(w[1]);
        gl.vertProperties.push_back(w[2]);
    }

    gl.triVerts.reserve(solid.faces.size() * 3);
    for (const auto& f : solid.faces) {
        gl.triVerts.push_back(f[0]);
        gl.triVerts.push_back(f[1]);
        gl.triVerts.push_back(f[2]);
    }

    // Face tracking: single run covering all triangles, tagged with originalID
    if (!solid.faces.empty()) {
        gl.runIndex.push_back(0);
        gl.runIndex.push_back(static_cast<uint64_t>(solid.faces.size() * 3));
        gl.runOriginalID.push_back(originalID);
    }

    return gl;
}

// ─────────────────────────────────────────────────────────────────────────────
// §2  MeshGL64 → Solid
// ─────────────────────────────────────────────────────────────────────────────

Solid solidFromMeshGL64(const manifold::MeshGL64& gl, const std::string& name)
{
    Solid solid(name);

    const size_t numProp = static_cast<size_t>(gl.numProp);
    const size_t numVert = numProp > 0 ? gl.vertProperties.size() / numProp : 0;
    const size_t numTris = gl.triVerts.size() / 3;

    std::unordered_map<std::array<double,3>, uint32_t,
                       DoubleVtxHash, DoubleVtxEq> vmap;
    vmap.reserve(numVert);

    std::vector<uint32_t> remap(numVert);
    for (size_t i = 0; i < numVert; ++i) {
        std::array<double,3> key = { gl.vertProperties[i * numProp + 0],
                                     gl.vertProperties[i * numProp + 1],
                                     gl.vertProperties[i * numProp + 2] };
        auto it = vmap.find(key);
        if (it == vmap.end()) {
            const uint32_t idx = solid.addVertex(key);
            vmap.emplace(key, idx);
            remap[i] = idx;
        } else {
            remap[i] = it->second;
        }
    }

    solid.faces.reserve(numTris);
    for (size_t f = 0; f < numTris; ++f) {
        solid.addFace(remap[gl.triVerts[f * 3 + 0]],
                      remap[gl.triVerts[f * 3 + 1]],
                      remap[gl.triVerts[f * 3 + 2]]);
    }

    return solid;
}

Solid solidFromManifold(const manifold::Manifold& m, const std::string& name)
{
    return solidFromMeshGL64(m.GetMeshGL64(), name);
}

} // namespace keyforge

#pragma once
// ═══════════════════════════════════════════════════════════════════════════════
// KEYFORGE ManifoldBackend: Boolean Operations via Manifold Library
// ═══════════════════════════════════════════════════════════════════════════════
//
// Conversion helpers (Solid <-> MeshGL64) live in ManifoldMesh.h, which is
// only included by translation units that link Manifold, so that
// <manifold/manifold.h> is not exposed through this header.

#include "IBooleanBackend.h"

namespace keyforge {

class ManifoldBackend : public IBooleanBackend {
public:
    std::string name() const override;
    std::string description() const override;
    BooleanResult execute(const Solid& a, const Solid& b, BooleanOp op) override;
};

} // namespace keyforge

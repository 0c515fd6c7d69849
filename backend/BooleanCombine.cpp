/**
 * @file BooleanCombine.cpp
 * @brief Checked pairwise boolean
 */

#include "BooleanCombine.h"
#include "keyforge/MeshValidate.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <sstream>
#include <string>
#include <utility>

namespace keyforge {

namespace {

BooleanResult failure(BooleanResult result, const std::string& message) {
    result.success = false;
    result.error_message = message;
    result.output.clear();
    result.diagnostics.error(DiagCategory::BooleanFailed, message);
    return result;
}

// Gate one input. Non-empty inputs must be closed and enclose positive volume.
bool checkInput(const Solid& solid, const char* role, BooleanResult& result, std::string& why) {
    if (!validateOperand(solid, result.diagnostics)) {
        why = std::string(role) + " '" + solid.name + "' is not a closed manifold";
        return false;
    }
    if (!solid.empty() && signedVolume(solid) <= 0.0) {
        result.diagnostics.error(DiagCategory::InconsistentWinding,
                                 "'" + solid.name + "' encloses no positive volume (inside-out?)");
        why = std::string(role) + " '" + solid.name + "' encloses no positive volume";
        return false;
    }
    return true;
}

} // anonymous namespace

BooleanResult combine(IBooleanBackend& backend,
                      const Solid& base,
                      const Solid& operand,
                      BooleanOp op) {
    BooleanResult result;
    auto t0 = std::chrono::steady_clock::now();

    std::string why;
    if (!checkInput(base, "base", result, why) ||
        !checkInput(operand, "operand", result, why)) {
        return failure(std::move(result), why);
    }

    // Identities for empty inputs; the solver is never asked about them
    if (operand.empty()) {
        result.output = base;
        result.success = true;
        return result;
    }
    if (base.empty()) {
        if (op == BooleanOp::Union) {
            result.output = operand;
            result.output.name = base.name.empty() ? operand.name : base.name;
        }
        result.success = true;
        return result;
    }

    BooleanResult solved;
    try {
        solved = backend.execute(base, operand, op);
    } catch (const std::exception& e) {
        return failure(std::move(result),
                       "backend '" + backend.name() + "' threw: " + e.what());
    }

    result.diagnostics.merge(solved.diagnostics);
    if (!solved.success) {
        return failure(std::move(result), solved.error_message);
    }

    Solid& out = solved.output;
    out.name = base.name;

    //=========================================================================
    // Result checks
    //=========================================================================
    if (!out.empty()) {
        const TopologyReport report = inspectTopology(out);
        if (!report.isClosedManifold()) {
            std::ostringstream oss;
            oss << booleanOpName(op) << " result is not a closed manifold ("
                << report.boundary_edges << " boundary, "
                << report.non_manifold_edges << " non-manifold, "
                << report.degenerate_faces << " degenerate)";
            return failure(std::move(result), oss.str());
        }
    }

    const double va = signedVolume(base);
    const double vb = signedVolume(operand);
    const double vr = signedVolume(out);

    if (op == BooleanOp::Union) {
        const double larger = std::max(va, vb);
        if (out.empty() || vr < larger * (1.0 - kVolumeRelativeTolerance)) {
            std::ostringstream oss;
            oss << "Union lost material: result volume " << vr
                << " below larger input volume " << larger;
            return failure(std::move(result), oss.str());
        }
        if (vr > (va + vb) * (1.0 + kVolumeRelativeTolerance)) {
            std::ostringstream oss;
            oss << "Union gained material: result volume " << vr
                << " above input sum " << (va + vb);
            return failure(std::move(result), oss.str());
        }
    } else {
        if (vr > va * (1.0 + kVolumeRelativeTolerance)) {
            std::ostringstream oss;
            oss << "Difference added material: result volume " << vr
                << " above base volume " << va;
            return failure(std::move(result), oss.str());
        }
    }

    result.output = std::move(out);
    result.success = true;

    auto t1 = std::chrono::steady_clock::now();
    result.execution_time_ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
    return result;
}

} // namespace keyforge

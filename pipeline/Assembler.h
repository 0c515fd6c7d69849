/**
 * @file Assembler.h
 * @brief CSG Assembler: folds an ordered plan of boolean steps into a base
 *
 * Steps are applied strictly in plan order, never regrouped by mode. A
 * step whose boolean fails is skipped and leaves the base exactly as it
 * was; the run continues with the next step. Operands are consumed.
 */

#pragma once

#include "keyforge/Solid.h"
#include "keyforge/Diagnostics.h"

#include <string>
#include <utility>
#include <vector>

namespace keyforge {

class IBooleanBackend;

//=============================================================================
// PLAN
//=============================================================================

/**
 * @brief One fold operation against the accumulating base
 */
struct BooleanStep {
    Solid operand;
    BooleanOp mode = BooleanOp::Union;

    BooleanStep() = default;
    BooleanStep(Solid s, BooleanOp m) : operand(std::move(s)), mode(m) {}
};

//=============================================================================
// STATUS
//=============================================================================

enum class StepOutcome {
    Succeeded,  ///< Boolean applied, base replaced by the result
    Skipped,    ///< Boolean failed, base rolled back (unchanged)
    NoOp        ///< Operand had no geometry, nothing attempted
};

const char* stepOutcomeName(StepOutcome outcome);

struct StepStatus {
    std::string name;                 ///< Operand name
    BooleanOp mode = BooleanOp::Union;
    StepOutcome outcome = StepOutcome::NoOp;
    std::string message;              ///< Failure reason, empty on success
    size_t faces_before = 0;          ///< Base face count before the step
    size_t faces_after = 0;           ///< Base face count after the step
    double elapsed_ms = 0.0;
};

/**
 * @brief Assembled solid plus one status per attempted step
 */
struct AssemblyResult {
    Solid solid;
    std::vector<StepStatus> steps;
    DiagnosticLog diagnostics;

    size_t countOf(StepOutcome outcome) const;

    /// One console line per step.
    void printSteps() const;
};

/**
 * @brief Fold the plan into the base
 *
 * If the plan is empty or holds no operand with geometry, the base is
 * returned unchanged with an empty status list. Otherwise every step gets
 * a status: empty operands are NoOp, failed booleans Skipped.
 *
 * Never throws on boolean failure.
 */
AssemblyResult assemble(Solid base, std::vector<BooleanStep> plan, IBooleanBackend& backend);

} // namespace keyforge

/**
 * @file Assembler.cpp
 * @brief CSG Assembler implementation
 */

#include "Assembler.h"
#include "backend/BooleanCombine.h"

#include <algorithm>
#include <chrono>
#include <utility>

namespace keyforge {

const char* stepOutcomeName(StepOutcome outcome) {
    switch (outcome) {
        case StepOutcome::Succeeded: return "Succeeded";
        case StepOutcome::Skipped:   return "Skipped";
        case StepOutcome::NoOp:      return "NoOp";
    }
    return "?";
}

size_t AssemblyResult::countOf(StepOutcome outcome) const {
    return static_cast<size_t>(std::count_if(steps.begin(), steps.end(),
        [outcome](const StepStatus& s) { return s.outcome == outcome; }));
}

void AssemblyResult::printSteps() const {
    for (size_t i = 0; i < steps.size(); ++i) {
        const StepStatus& s = steps[i];
        if (s.outcome == StepOutcome::Skipped) {
            KEYFORGE_LOG_WARN("  step %zu %-10s %-10s %-9s faces %zu -> %zu  (%s)",
                              i + 1, s.name.c_str(), booleanOpName(s.mode),
                              stepOutcomeName(s.outcome), s.faces_before, s.faces_after,
                              s.message.c_str());
        } else {
            KEYFORGE_LOG_INFO("  step %zu %-10s %-10s %-9s faces %zu -> %zu  %.2f ms",
                              i + 1, s.name.c_str(), booleanOpName(s.mode),
                              stepOutcomeName(s.outcome), s.faces_before, s.faces_after,
                              s.elapsed_ms);
        }
    }
}

AssemblyResult assemble(Solid base, std::vector<BooleanStep> plan, IBooleanBackend& backend) {
    AssemblyResult result;

    const bool any_geometry = std::any_of(plan.begin(), plan.end(),
        [](const BooleanStep& step) { return !step.operand.empty(); });

    if (!any_geometry) {
        result.solid = std::move(base);
        return result;
    }

    result.steps.reserve(plan.size());

    for (auto& step : plan) {
        // The operand is consumed by this step whatever the outcome
        Solid operand = std::move(step.operand);
        step.operand.clear();

        StepStatus status;
        status.name = operand.name;
        status.mode = step.mode;
        status.faces_before = base.faceCount();

        auto t0 = std::chrono::steady_clock::now();

        if (operand.empty()) {
            status.outcome = StepOutcome::NoOp;
            status.message = "empty operand";
            result.diagnostics.info("Step '" + status.name + "' has an empty operand, nothing to do");
        } else {
            BooleanResult combined = combine(backend, base, operand, step.mode);
            result.diagnostics.merge(combined.diagnostics);

            if (combined.success) {
                const std::string base_name = base.name;
                base = std::move(combined.output);
                base.name = base_name;
                status.outcome = StepOutcome::Succeeded;
            } else {
                // Base untouched: combine never mutates its inputs
                status.outcome = StepOutcome::Skipped;
                status.message = combined.error_message;
                result.diagnostics.warn(DiagCategory::BooleanFailed,
                                        "Step '" + status.name + "' (" + booleanOpName(step.mode) +
                                        ") skipped: " + combined.error_message);
            }
        }

        auto t1 = std::chrono::steady_clock::now();
        status.elapsed_ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
        status.faces_after = base.faceCount();
        result.steps.push_back(std::move(status));
    }

    result.solid = std::move(base);
    return result;
}

} // namespace keyforge

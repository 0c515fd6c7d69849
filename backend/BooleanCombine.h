/**
 * @file BooleanCombine.h
 * @brief The single checked boolean entry point used by every builder
 *
 * combine() never throws. It gates both inputs through the topology check,
 * runs the backend, converts solver exceptions into failures, and rejects
 * results that are not closed manifolds or whose volume contradicts the
 * operation (a union that lost material, a difference that gained some).
 */

#pragma once

#include "IBooleanBackend.h"

namespace keyforge {

/// Relative volume slack when checking a boolean result against its inputs.
constexpr double kVolumeRelativeTolerance = 1e-6;

/**
 * @brief base ∘ operand through the backend, with input and output checks
 *
 * Empty operands are identities: base ∪ ∅ = base, base − ∅ = base,
 * ∅ ∪ operand = operand, ∅ − operand = ∅.
 *
 * @return BooleanResult; on failure output is empty and error_message says why
 */
BooleanResult combine(IBooleanBackend& backend,
                      const Solid& base,
                      const Solid& operand,
                      BooleanOp op);

} // namespace keyforge

/**
 * @file IBooleanBackend.h
 * @brief Abstract interface for Boolean operation backends
 */

#pragma once

#include <memory>
#include <string>

#include "keyforge/Solid.h"
#include "keyforge/Diagnostics.h"

namespace keyforge {

/**
 * @brief Result of one pairwise boolean
 *
 * Failure is a value: success == false with a message. The output is
 * meaningful only on success.
 */
struct BooleanResult {
    Solid output;
    bool success = false;
    std::string error_message;
    DiagnosticLog diagnostics;

    double execution_time_ms = 0.0;

    BooleanResult() = default;
};

/**
 * @brief Abstract interface for Boolean operation backends
 *
 * Implementations:
 * - ManifoldBackend: manifold library wrapper (guaranteed watertight output)
 *
 * One instance is created per run and shared by every builder and the
 * assembler, so all booleans of a run use the same solver settings.
 */
class IBooleanBackend {
public:
    virtual ~IBooleanBackend() = default;

    /// Get backend name
    virtual std::string name() const = 0;

    /// Get backend description (optional, defaults to name)
    virtual std::string description() const { return name(); }

    /// Execute a ∘ b. Inputs are closed manifolds with outward winding.
    virtual BooleanResult execute(const Solid& a, const Solid& b, BooleanOp op) = 0;
};

/**
 * @brief Factory function to create backends by name
 *
 * Supported names: "manifold", "auto"
 */
std::unique_ptr<IBooleanBackend> createBackend(const std::string& name);

} // namespace keyforge

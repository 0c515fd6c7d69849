/**
 * @file KeyforgePipeline.h
 * @brief Main pipeline orchestrator for the keyforge solid generator
 *
 * This file defines the main pipeline entry point and configuration
 * structures. One run goes through these stages:
 *
 *   Validate:   dimension and configuration checks (fatal on failure)
 *   Primitives: book body, spine cylinder, carabiner annulus
 *   Label:      multi-line text solid on the front cover
 *   Pages:      repeated page-line slabs on the fore edge
 *   Assemble:   ordered boolean fold with per-step rollback
 *   Finish:     recentre on the centroid, convert to the output unit
 *
 * Builders and the assembler share one boolean backend per run.
 */

#pragma once

#include "keyforge/Solid.h"
#include "keyforge/Diagnostics.h"
#include "keyforge/Parameters.h"
#include "pipeline/Assembler.h"

#include <cstdio>
#include <string>
#include <utility>
#include <vector>

namespace keyforge {

class IBooleanBackend;
class IGlyphSource;

//=============================================================================
// PIPELINE CONFIGURATION
//=============================================================================

/**
 * @brief Run settings that are not dimensions
 */
struct PipelineConfig {
    // Backend selection ("auto", "manifold")
    std::string backend = "auto";

    // TrueType/OpenType font for the label; empty selects the block font
    std::string font_path;

    LabelMode label_mode = LabelMode::Emboss;

    // Working unit (mm) -> output unit. 1.0 keeps millimetres, 0.001 gives metres.
    double target_unit_scale = 1.0;

    std::string output_name = "BibleKeyring";

    MaterialDescriptor material;
};

//=============================================================================
// PIPELINE RESULT
//=============================================================================

/**
 * @brief Result structure from pipeline execution
 *
 * On success, output is the finished, origin-centred solid and material
 * the descriptor to export with it.
 */
struct PipelineResult {
    Solid output;                      ///< Finished solid
    MaterialDescriptor material;       ///< Material attached to output
    bool success = false;              ///< True if a solid was produced
    std::string error_message;         ///< Error description if failed
    DiagnosticLog diagnostics;         ///< Full diagnostic log
    std::vector<StepStatus> steps;     ///< One entry per assembly step
    double execution_time_ms = 0.0;    ///< Total execution time

    // Per-stage timing breakdown
    double validate_time_ms = 0.0;
    double primitives_time_ms = 0.0;
    double label_time_ms = 0.0;
    double pages_time_ms = 0.0;
    double assembly_time_ms = 0.0;
    double finish_time_ms = 0.0;

    bool hasOutput() const { return success && !output.empty(); }

    size_t outputTriangleCount() const { return output.faceCount(); }

    void printTiming() const {
        std::printf("[KEYFORGE Pipeline] Total: %.2f ms\n", execution_time_ms);
        std::printf("  Validate:    %.2f ms\n", validate_time_ms);
        std::printf("  Primitives:  %.2f ms\n", primitives_time_ms);
        std::printf("  Label:       %.2f ms\n", label_time_ms);
        std::printf("  Pages:       %.2f ms\n", pages_time_ms);
        std::printf("  Assemble:    %.2f ms\n", assembly_time_ms);
        std::printf("  Finish:      %.2f ms\n", finish_time_ms);
    }
};

//=============================================================================
// MAIN PIPELINE ENTRY POINT
//=============================================================================

/**
 * @brief Generate the keyring solid
 *
 * Invalid dimensions or configuration end the run before any geometry is
 * built. Boolean failures during assembly skip the affected step only.
 * An empty or zero-volume final solid fails the run.
 *
 * Example usage:
 * @code
 *   DimensionSpec spec;
 *   PipelineConfig config;
 *   config.label_mode = LabelMode::Engrave;
 *
 *   PipelineResult result = runPipeline(spec, config);
 *   if (result.success) {
 *       // Export result.output with result.material
 *   }
 * @endcode
 */
PipelineResult runPipeline(const DimensionSpec& spec, const PipelineConfig& config);

/**
 * @brief Generate the keyring solid with a caller-supplied backend and font
 *
 * config.backend and config.font_path are not used to create anything;
 * backend and glyphs serve every builder and the assembler.
 */
PipelineResult runPipeline(const DimensionSpec& spec,
                           const PipelineConfig& config,
                           IBooleanBackend& backend,
                           const IGlyphSource& glyphs);

//=============================================================================
// PLAN CONSTRUCTION (Advanced Usage)
//=============================================================================

/**
 * @brief The book body box every plan is folded into
 */
Solid buildBookBody(const DimensionSpec& spec);

/**
 * @brief Plan under construction plus steps that failed while building
 */
struct KeyringPlan {
    std::vector<BooleanStep> steps;
    /// Statuses for operands that could not be built, keyed by plan position.
    std::vector<std::pair<size_t, StepStatus>> build_failures;

    double primitives_time_ms = 0.0;
    double label_time_ms = 0.0;
    double pages_time_ms = 0.0;
};

/**
 * @brief Build every operand of the keyring in plan order
 *
 * spine (Union), loop (Union), label (Union, or Difference when engraved),
 * pages (Union). A loop whose hole cannot be cut is dropped and recorded
 * in build_failures as Skipped.
 *
 * @throws InvalidParameterError if a builder rejects its dimensions
 */
KeyringPlan buildKeyringPlan(const DimensionSpec& spec,
                             const PipelineConfig& config,
                             IBooleanBackend& backend,
                             const IGlyphSource& glyphs,
                             DiagnosticLog& log);

/**
 * @brief Put statuses of operands that never reached the plan back in order
 *
 * Each inserted status is a no-change step: its face counts are those of
 * the step before it, or baseFaces at the front.
 */
void mergeBuildFailures(std::vector<StepStatus>& steps, const KeyringPlan& plan, size_t baseFaces);

/**
 * @brief Get keyforge pipeline version string
 */
const char* getPipelineVersion();

/**
 * @brief Validate pipeline configuration
 * @return True if configuration is valid
 */
bool validateConfig(const PipelineConfig& config, DiagnosticLog& log);

} // namespace keyforge

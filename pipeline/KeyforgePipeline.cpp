/**
 * @file KeyforgePipeline.cpp
 * @brief Main pipeline orchestrator implementation
 *
 * Pipeline Flow:
 *   1. Validate dimensions and configuration (fatal)
 *   2. Build operands in plan order: spine, loop, label, pages
 *   3. Assemble into the book body with per-step rollback
 *   4. Finish (recentre, rescale) and attach the material
 */

#include "KeyforgePipeline.h"
#include "Assembler.h"
#include "Finishing.h"

#include "backend/BackendFactory.h"
#include "keyforge/Errors.h"
#include "keyforge/GlyphSource.h"
#include "keyforge/Primitives.h"
#include "keyforge/Repeater.h"
#include "keyforge/TextLabel.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>

namespace keyforge {

//=============================================================================
// VERSION AND VALIDATION
//=============================================================================

static constexpr const char* PIPELINE_VERSION = "1.0.0";

const char* getPipelineVersion() {
    return PIPELINE_VERSION;
}

bool validateConfig(const PipelineConfig& config, DiagnosticLog& log) {
    bool valid = true;

    if (!std::isfinite(config.target_unit_scale) || config.target_unit_scale <= 0.0) {
        log.error(DiagCategory::InvalidParameter,
                  "target_unit_scale must be positive (got " +
                  std::to_string(config.target_unit_scale) + ")");
        valid = false;
    }

    if (config.output_name.empty()) {
        log.error(DiagCategory::InvalidParameter, "output_name cannot be empty");
        valid = false;
    }

    const auto& known = getAvailableBackends();
    if (config.backend != "auto" &&
        std::find(known.begin(), known.end(), config.backend) == known.end()) {
        log.error(DiagCategory::InvalidParameter, "Unknown backend: " + config.backend);
        valid = false;
    }

    const auto& color = config.material.base_color;
    for (double c : color) {
        if (!(c >= 0.0 && c <= 1.0)) {
            log.error(DiagCategory::InvalidParameter, "material base_color components must be in [0, 1]");
            valid = false;
            break;
        }
    }

    return valid;
}

//=============================================================================
// PLAN CONSTRUCTION
//=============================================================================

Solid buildBookBody(const DimensionSpec& spec) {
    return makeBox({spec.book_width / 2.0, 0.0, 0.0},
                   {spec.book_width, spec.book_depth, spec.book_height},
                   "BookBody");
}

namespace {

double elapsedMs(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - since).count();
}

void appendPrimitiveSteps(KeyringPlan& plan, const DimensionSpec& spec,
                          IBooleanBackend& backend, DiagnosticLog& log) {
    const double eps = overlapEpsilon(spec);

    // Spine: over-extended past the body's top and bottom faces
    plan.steps.emplace_back(
        makeCylinder(spec.book_depth / 2.0, spec.book_height + 2.0 * eps,
                     spec.cylinder_segments, {0.0, 0.0, 0.0}, Axis::Z, "BookSpine"),
        BooleanOp::Union);

    // Loop: hole runs front to back, ring sunk loop_overlap into the body top
    const Vec3 loop_center = {0.0, 0.0,
                              spec.book_height / 2.0 + spec.loop_outer_radius - spec.loop_overlap};
    try {
        plan.steps.emplace_back(
            makeAnnulus(spec.loop_outer_radius, spec.loop_inner_radius, spec.loop_thickness,
                        loop_center, spec.cylinder_segments, Axis::Y, backend, eps,
                        "CarabinerLoop"),
            BooleanOp::Union);
    } catch (const BooleanOperationError& e) {
        StepStatus status;
        status.name = "CarabinerLoop";
        status.mode = BooleanOp::Union;
        status.outcome = StepOutcome::Skipped;
        status.message = e.what();
        plan.build_failures.emplace_back(plan.steps.size(), status);
        log.warn(DiagCategory::BooleanFailed, std::string("Carabiner loop dropped: ") + e.what());
    }
}

void appendLabelStep(KeyringPlan& plan, const DimensionSpec& spec, const PipelineConfig& config,
                     IBooleanBackend& backend, const IGlyphSource& glyphs) {
    const double eps = overlapEpsilon(spec);
    const Vec3 normal = {0.0, -1.0, 0.0};
    Vec3 face_center = {spec.book_width / 2.0, -spec.book_depth / 2.0, 0.0};
    BooleanOp mode = BooleanOp::Union;

    if (config.label_mode == LabelMode::Engrave) {
        // Push the label into the cover so it cuts text_extrude deep
        face_center = add(face_center, mul(normal, eps - spec.text_extrude));
        mode = BooleanOp::Difference;
    }

    plan.steps.emplace_back(
        buildLabel(spec.text_lines, spec.text_size, spec.text_extrude,
                   face_center, normal, glyphs, backend, eps, "Text"),
        mode);
}

void appendPageStep(KeyringPlan& plan, const DimensionSpec& spec, IBooleanBackend& backend) {
    const double half_span = spec.book_depth / 2.0 - spec.cover_thickness;
    plan.steps.emplace_back(
        buildRepeatedSlabs(spec.page_line_count,
                           {spec.page_line_depth, spec.page_line_thickness,
                            spec.book_height * spec.page_line_height_ratio},
                           Axis::Y, -half_span, half_span,
                           {spec.book_width + 0.01, 0.0, 0.0},
                           backend, "PageLines"),
        BooleanOp::Union);
}

} // anonymous namespace

void mergeBuildFailures(std::vector<StepStatus>& steps, const KeyringPlan& plan, size_t baseFaces) {
    size_t inserted = 0;
    for (const auto& [position, failure] : plan.build_failures) {
        const size_t at = std::min(position + inserted, steps.size());
        StepStatus status = failure;
        status.faces_before = at > 0 ? steps[at - 1].faces_after : baseFaces;
        status.faces_after = status.faces_before;
        steps.insert(steps.begin() + static_cast<std::ptrdiff_t>(at), status);
        ++inserted;
    }
}

KeyringPlan buildKeyringPlan(const DimensionSpec& spec,
                             const PipelineConfig& config,
                             IBooleanBackend& backend,
                             const IGlyphSource& glyphs,
                             DiagnosticLog& log) {
    KeyringPlan plan;

    auto stage_start = std::chrono::steady_clock::now();
    appendPrimitiveSteps(plan, spec, backend, log);
    plan.primitives_time_ms = elapsedMs(stage_start);

    stage_start = std::chrono::steady_clock::now();
    appendLabelStep(plan, spec, config, backend, glyphs);
    plan.label_time_ms = elapsedMs(stage_start);

    stage_start = std::chrono::steady_clock::now();
    appendPageStep(plan, spec, backend);
    plan.pages_time_ms = elapsedMs(stage_start);

    return plan;
}

//=============================================================================
// MAIN PIPELINE ENTRY POINT
//=============================================================================

PipelineResult runPipeline(const DimensionSpec& spec, const PipelineConfig& config) {
    std::unique_ptr<IBooleanBackend> backend;
    std::unique_ptr<IGlyphSource> glyphs;
    try {
        backend = createBackend(config.backend);
        glyphs = createGlyphSource(config.font_path);
    } catch (const std::invalid_argument& e) {
        PipelineResult result;
        result.diagnostics.fatal(DiagCategory::InvalidParameter, e.what());
        result.success = false;
        result.error_message = e.what();
        return result;
    }

    return runPipeline(spec, config, *backend, *glyphs);
}

PipelineResult runPipeline(const DimensionSpec& spec,
                           const PipelineConfig& config,
                           IBooleanBackend& backend,
                           const IGlyphSource& glyphs) {
    PipelineResult result;
    auto pipeline_start = std::chrono::steady_clock::now();

    KEYFORGE_LOG_INFO("Starting keyforge pipeline v%s", getPipelineVersion());

    //=========================================================================
    // VALIDATE
    //=========================================================================
    auto stage_start = std::chrono::steady_clock::now();

    const bool dims_ok = validateDimensions(spec, result.diagnostics);
    const bool config_ok = validateConfig(config, result.diagnostics);
    result.validate_time_ms = elapsedMs(stage_start);

    if (!dims_ok || !config_ok) {
        result.diagnostics.fatal(DiagCategory::InvalidParameter, "Invalid dimensions or configuration");
        result.success = false;
        result.error_message = "Invalid parameter: ";
        for (const auto& entry : result.diagnostics.entries) {
            if (entry.category == DiagCategory::InvalidParameter) {
                result.error_message += entry.message;
                break;
            }
        }
        result.execution_time_ms = elapsedMs(pipeline_start);
        return result;
    }

    KEYFORGE_LOG_INFO("Backend: %s, glyphs: %s, label mode: %s, epsilon %g",
                      backend.description().c_str(), glyphs.name().c_str(),
                      labelModeName(config.label_mode), overlapEpsilon(spec));

    //=========================================================================
    // BUILD OPERANDS
    //=========================================================================
    KeyringPlan plan;
    Solid body;
    try {
        body = buildBookBody(spec);
        plan = buildKeyringPlan(spec, config, backend, glyphs, result.diagnostics);
    } catch (const InvalidParameterError& e) {
        result.diagnostics.fatal(DiagCategory::InvalidParameter, e.what());
        result.success = false;
        result.error_message = e.what();
        result.execution_time_ms = elapsedMs(pipeline_start);
        return result;
    }
    result.primitives_time_ms = plan.primitives_time_ms;
    result.label_time_ms = plan.label_time_ms;
    result.pages_time_ms = plan.pages_time_ms;

    //=========================================================================
    // ASSEMBLE
    //=========================================================================
    KEYFORGE_LOG_INFO("Assembling %zu steps", plan.steps.size());
    stage_start = std::chrono::steady_clock::now();

    const size_t base_faces = body.faceCount();
    AssemblyResult assembly = assemble(std::move(body), std::move(plan.steps), backend);
    mergeBuildFailures(assembly.steps, plan, base_faces);
    result.diagnostics.merge(assembly.diagnostics);
    result.assembly_time_ms = elapsedMs(stage_start);

    assembly.printSteps();
    result.steps = assembly.steps;

    //=========================================================================
    // FINISH
    //=========================================================================
    stage_start = std::chrono::steady_clock::now();
    try {
        assembly.solid.name = config.output_name;
        result.output = finish(std::move(assembly.solid), config.target_unit_scale);
    } catch (const NoGeometryError& e) {
        result.diagnostics.fatal(DiagCategory::Error, e.what());
        result.success = false;
        result.error_message = e.what();
        result.finish_time_ms = elapsedMs(stage_start);
        result.execution_time_ms = elapsedMs(pipeline_start);
        return result;
    } catch (const InvalidParameterError& e) {
        result.diagnostics.fatal(DiagCategory::InvalidParameter, e.what());
        result.success = false;
        result.error_message = e.what();
        result.execution_time_ms = elapsedMs(pipeline_start);
        return result;
    }
    result.finish_time_ms = elapsedMs(stage_start);

    result.material = config.material;
    result.success = true;
    result.execution_time_ms = elapsedMs(pipeline_start);

    KEYFORGE_LOG_INFO("Finished '%s': %zu vertices, %zu faces, %zu/%zu steps succeeded",
                      result.output.name.c_str(), result.output.vertexCount(),
                      result.output.faceCount(), assembly.countOf(StepOutcome::Succeeded),
                      result.steps.size());
    return result;
}

} // namespace keyforge

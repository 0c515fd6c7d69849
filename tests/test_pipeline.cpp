/**
 * @file test_pipeline.cpp
 * @brief Whole keyring runs through the orchestrator
 */

#include "TestHarness.h"
#include "TestBackends.h"

#include "backend/BackendFactory.h"
#include "keyforge/GlyphSource.h"
#include "keyforge/MeshValidate.h"
#include "pipeline/Assembler.h"
#include "pipeline/KeyforgePipeline.h"

#include <limits>
#include <memory>
#include <utility>

using namespace keyforge;

static const StepStatus* findStep(const std::vector<StepStatus>& steps, const std::string& name) {
    for (const auto& s : steps) {
        if (s.name == name) return &s;
    }
    return nullptr;
}

//=============================================================================
// PLAN
//=============================================================================

static void test_plan_order() {
    TEST_BEGIN("Plan is spine, loop, label, pages");

    DimensionSpec spec;
    PipelineConfig config;
    DiagnosticLog log;
    auto backend = createBackend("manifold");
    BlockGlyphSource glyphs;

    KeyringPlan plan = buildKeyringPlan(spec, config, *backend, glyphs, log);
    TEST_ASSERT(plan.steps.size() == 4);
    TEST_ASSERT(plan.build_failures.empty());
    TEST_ASSERT(plan.steps[0].operand.name == "BookSpine");
    TEST_ASSERT(plan.steps[1].operand.name == "CarabinerLoop");
    TEST_ASSERT(plan.steps[2].operand.name == "Text");
    TEST_ASSERT(plan.steps[3].operand.name == "PageLines");
    for (const auto& step : plan.steps) {
        TEST_ASSERT(step.mode == BooleanOp::Union);
        TEST_ASSERT(!step.operand.empty());
    }

    TEST_PASS();
}

static void test_assembled_keyring_covers_body() {
    TEST_BEGIN("Assembled keyring bounds contain the book body");

    DimensionSpec spec;
    PipelineConfig config;
    DiagnosticLog log;
    auto backend = createBackend("manifold");
    BlockGlyphSource glyphs;

    Solid body = buildBookBody(spec);
    double body_min[3], body_max[3];
    body.computeBoundingBox(body_min, body_max);

    KeyringPlan plan = buildKeyringPlan(spec, config, *backend, glyphs, log);
    AssemblyResult result = assemble(std::move(body), std::move(plan.steps), *backend);

    TEST_ASSERT(result.countOf(StepOutcome::Succeeded) == 4);
    TEST_ASSERT(inspectTopology(result.solid).isClosedManifold());

    double out_min[3], out_max[3];
    result.solid.computeBoundingBox(out_min, out_max);
    for (int i = 0; i < 3; ++i) {
        TEST_ASSERT(out_min[i] <= body_min[i] + 1e-9);
        TEST_ASSERT(out_max[i] >= body_max[i] - 1e-9);
    }

    // Spine sticks out behind x = 0, loop above the top, label off the front
    TEST_ASSERT(out_min[0] < -4.9);
    TEST_ASSERT(out_max[2] > 19.0 + 2.0 * spec.loop_outer_radius - spec.loop_overlap - 0.1);
    TEST_ASSERT(out_min[1] < -5.0 - 0.7);

    TEST_PASS();
}

//=============================================================================
// RUN
//=============================================================================

static void test_default_run() {
    TEST_BEGIN("Default run succeeds with every step applied");

    PipelineResult result = runPipeline(DimensionSpec(), PipelineConfig());

    TEST_ASSERT_MSG(result.success, result.error_message);
    TEST_ASSERT(result.hasOutput());
    TEST_ASSERT(result.output.name == "BibleKeyring");
    TEST_ASSERT(result.material.name == "BibleNavy");
    TEST_ASSERT(result.steps.size() == 4);
    for (const auto& s : result.steps) {
        TEST_ASSERT(s.outcome == StepOutcome::Succeeded);
    }
    TEST_ASSERT(inspectTopology(result.output).isClosedManifold());

    bool ok = false;
    const Vec3 c = volumetricCentroid(result.output, &ok);
    TEST_ASSERT(ok);
    TEST_ASSERT_NEAR(length(c), 0.0, 1e-6);

    TEST_PASS();
}

static void test_engraved_run() {
    TEST_BEGIN("Engraved label removes material");

    PipelineConfig emboss;
    PipelineConfig engrave;
    engrave.label_mode = LabelMode::Engrave;

    PipelineResult a = runPipeline(DimensionSpec(), emboss);
    PipelineResult b = runPipeline(DimensionSpec(), engrave);

    TEST_ASSERT(a.success && b.success);
    const StepStatus* text = findStep(b.steps, "Text");
    TEST_ASSERT(text != nullptr);
    TEST_ASSERT(text->mode == BooleanOp::Difference);
    TEST_ASSERT(text->outcome == StepOutcome::Succeeded);
    TEST_ASSERT(signedVolume(b.output) < signedVolume(a.output));

    TEST_PASS();
}

static void test_metre_output() {
    TEST_BEGIN("Metre output is a thousand times smaller");

    PipelineConfig mm;
    PipelineConfig m;
    m.target_unit_scale = 0.001;

    PipelineResult a = runPipeline(DimensionSpec(), mm);
    PipelineResult b = runPipeline(DimensionSpec(), m);
    TEST_ASSERT(a.success && b.success);

    double amin[3], amax[3], bmin[3], bmax[3];
    a.output.computeBoundingBox(amin, amax);
    b.output.computeBoundingBox(bmin, bmax);
    TEST_ASSERT_NEAR((bmax[2] - bmin[2]) * 1000.0, amax[2] - amin[2], 1e-6);

    TEST_PASS();
}

static void test_no_pages_is_noop() {
    TEST_BEGIN("Zero page lines leaves a NoOp pages step");

    DimensionSpec spec;
    spec.page_line_count = 0;
    PipelineResult result = runPipeline(spec, PipelineConfig());

    TEST_ASSERT(result.success);
    const StepStatus* pages = findStep(result.steps, "PageLines");
    TEST_ASSERT(pages != nullptr);
    TEST_ASSERT(pages->outcome == StepOutcome::NoOp);

    TEST_PASS();
}

//=============================================================================
// FAILURES
//=============================================================================

static void test_invalid_dimensions_abort() {
    TEST_BEGIN("Invalid dimensions fail before any step");

    DimensionSpec spec;
    spec.loop_inner_radius = 5.0;
    PipelineResult result = runPipeline(spec, PipelineConfig());

    TEST_ASSERT(!result.success);
    TEST_ASSERT(result.steps.empty());
    TEST_ASSERT(result.output.empty());
    TEST_ASSERT(result.error_message.find("loop_inner_radius") != std::string::npos);
    TEST_ASSERT(result.diagnostics.has_fatal);

    TEST_PASS();
}

static void test_negative_width_abort() {
    TEST_BEGIN("Negative book width names the parameter");

    DimensionSpec spec;
    spec.book_width = -1.0;
    PipelineResult result = runPipeline(spec, PipelineConfig());

    TEST_ASSERT(!result.success);
    TEST_ASSERT(result.error_message.find("book_width") != std::string::npos);

    TEST_PASS();
}

static void test_unknown_backend_abort() {
    TEST_BEGIN("Unknown backend is a configuration error");

    PipelineConfig config;
    config.backend = "cgal";
    PipelineResult result = runPipeline(DimensionSpec(), config);

    TEST_ASSERT(!result.success);
    TEST_ASSERT(result.steps.empty());

    TEST_PASS();
}

static void test_validate_config() {
    TEST_BEGIN("validateConfig flags scale, name and colour");

    DiagnosticLog log;
    TEST_ASSERT(validateConfig(PipelineConfig(), log));

    PipelineConfig bad;
    bad.target_unit_scale = 0.0;
    bad.output_name.clear();
    bad.material.base_color = {1.5, 0.0, 0.0, 1.0};
    DiagnosticLog bad_log;
    TEST_ASSERT(!validateConfig(bad, bad_log));
    TEST_ASSERT(bad_log.countOf(DiagCategory::InvalidParameter) == 3);

    TEST_PASS();
}

static void test_uncuttable_loop_reported_in_place() {
    TEST_BEGIN("Loop that cannot be cut is Skipped at its plan position");

    // Refuses Difference, so every hole attempt fails; unions still apply
    testing::AppendBackend backend;
    BlockGlyphSource glyphs;
    PipelineResult result = runPipeline(DimensionSpec(), PipelineConfig(), backend, glyphs);

    TEST_ASSERT_MSG(result.success, result.error_message);
    TEST_ASSERT(result.steps.size() == 4);
    TEST_ASSERT(result.steps[0].name == "BookSpine");
    TEST_ASSERT(result.steps[1].name == "CarabinerLoop");
    TEST_ASSERT(result.steps[2].name == "Text");
    TEST_ASSERT(result.steps[3].name == "PageLines");

    const StepStatus& loop = result.steps[1];
    TEST_ASSERT(loop.outcome == StepOutcome::Skipped);
    TEST_ASSERT(loop.message.find("attempts") != std::string::npos);
    TEST_ASSERT(loop.faces_before == result.steps[0].faces_after);
    TEST_ASSERT(loop.faces_after == loop.faces_before);
    TEST_ASSERT(result.steps[2].faces_before == loop.faces_after);

    TEST_ASSERT(result.steps[0].outcome == StepOutcome::Succeeded);
    TEST_ASSERT(result.steps[2].outcome == StepOutcome::Succeeded);
    TEST_ASSERT(result.steps[3].outcome == StepOutcome::Succeeded);
    TEST_ASSERT(result.diagnostics.countOf(DiagCategory::BooleanFailed) > 0);

    TEST_PASS();
}

static void test_huge_page_count_rejected() {
    TEST_BEGIN("INT_MAX page lines is an invalid parameter");

    DimensionSpec spec;
    spec.page_line_count = std::numeric_limits<int>::max();

    DiagnosticLog log;
    TEST_ASSERT(!validateDimensions(spec, log));
    TEST_ASSERT(log.countOf(DiagCategory::InvalidParameter) == 1);

    PipelineResult result = runPipeline(spec, PipelineConfig());
    TEST_ASSERT(!result.success);
    TEST_ASSERT(result.steps.empty());
    TEST_ASSERT(result.error_message.find("page_line_count") != std::string::npos);

    spec.page_line_count = kMaxPageLineCount + 1;
    DiagnosticLog over_log;
    TEST_ASSERT(!validateDimensions(spec, over_log));

    TEST_PASS();
}

//=============================================================================
// MAIN
//=============================================================================

int main() {
    std::printf("\n");
    std::printf("========================================\n");
    std::printf("keyforge Pipeline Tests (v%s)\n", getPipelineVersion());
    std::printf("========================================\n");
    std::printf("\n");

    std::printf("--- Plan ---\n");
    test_plan_order();
    test_assembled_keyring_covers_body();

    std::printf("\n--- Run ---\n");
    test_default_run();
    test_engraved_run();
    test_metre_output();
    test_no_pages_is_noop();

    std::printf("\n--- Failures ---\n");
    test_invalid_dimensions_abort();
    test_negative_width_abort();
    test_unknown_backend_abort();
    test_validate_config();
    test_uncuttable_loop_reported_in_place();
    test_huge_page_count_rejected();

    TEST_SUMMARY();

    return g_testsFailed > 0 ? 1 : 0;
}

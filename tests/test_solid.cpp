/**
 * @file test_solid.cpp
 * @brief Solid metrics, topology gate and face frame
 */

#include "TestHarness.h"

#include "keyforge/Frame.h"
#include "keyforge/MeshValidate.h"
#include "keyforge/Primitives.h"
#include "keyforge/Solid.h"

#include <cmath>

using namespace keyforge;

static constexpr double kPi = 3.14159265358979323846;

//=============================================================================
// METRICS
//=============================================================================

static void test_box_volume_and_centroid() {
    TEST_BEGIN("Box volume and centroid");

    Solid box = makeBox({1.0, -2.0, 3.0}, {2.0, 4.0, 6.0});
    TEST_ASSERT_NEAR(signedVolume(box), 48.0, 1e-9);

    bool ok = false;
    Vec3 c = volumetricCentroid(box, &ok);
    TEST_ASSERT(ok);
    TEST_ASSERT_NEAR(c[0], 1.0, 1e-9);
    TEST_ASSERT_NEAR(c[1], -2.0, 1e-9);
    TEST_ASSERT_NEAR(c[2], 3.0, 1e-9);

    TEST_PASS();
}

static void test_cylinder_volume() {
    TEST_BEGIN("Cylinder volume matches inscribed polygon prism");

    const int n = 32;
    Solid cyl = makeCylinder(5.0, 10.0, n, {0.0, 0.0, 0.0});
    const double polygon_area = 0.5 * n * 25.0 * std::sin(2.0 * kPi / n);
    TEST_ASSERT_NEAR(signedVolume(cyl), polygon_area * 10.0, 1e-6);

    TEST_PASS();
}

static void test_inverted_solid_has_negative_volume() {
    TEST_BEGIN("Flipped winding gives negative volume");

    Solid box = makeBox({0.0, 0.0, 0.0}, {1.0, 1.0, 1.0});
    for (auto& f : box.faces) {
        std::swap(f[1], f[2]);
    }
    TEST_ASSERT(signedVolume(box) < 0.0);

    TEST_PASS();
}

static void test_empty_solid_metrics() {
    TEST_BEGIN("Empty solid has zero volume, no centroid");

    Solid empty("nothing");
    TEST_ASSERT(empty.empty());
    TEST_ASSERT(signedVolume(empty) == 0.0);

    bool ok = true;
    volumetricCentroid(empty, &ok);
    TEST_ASSERT(!ok);

    TEST_PASS();
}

static void test_bake_transform() {
    TEST_BEGIN("bakeTransform moves vertices and resets transform");

    Solid box = makeBox({0.0, 0.0, 0.0}, {2.0, 2.0, 2.0});
    box.transform = Transform::translation({10.0, 0.0, -5.0});
    box.bakeTransform();

    TEST_ASSERT(box.transform.isIdentity());
    double bmin[3], bmax[3];
    box.computeBoundingBox(bmin, bmax);
    TEST_ASSERT_NEAR(bmin[0], 9.0, 1e-12);
    TEST_ASSERT_NEAR(bmax[0], 11.0, 1e-12);
    TEST_ASSERT_NEAR(bmin[2], -6.0, 1e-12);

    TEST_PASS();
}

static void test_bounding_box_overlap_is_strict() {
    TEST_BEGIN("Touching bounding boxes do not overlap");

    const double a_min[3] = {0, 0, 0}, a_max[3] = {1, 1, 1};
    const double b_min[3] = {1, 0, 0}, b_max[3] = {2, 1, 1};
    const double c_min[3] = {0.5, 0.5, 0.5}, c_max[3] = {3, 3, 3};

    TEST_ASSERT(!boundingBoxesOverlap(a_min, a_max, b_min, b_max));
    TEST_ASSERT(boundingBoxesOverlap(a_min, a_max, c_min, c_max));

    TEST_PASS();
}

static void test_append_offsets_indices() {
    TEST_BEGIN("append re-indexes the appended faces");

    Solid a = makeBox({0.0, 0.0, 0.0}, {1.0, 1.0, 1.0});
    Solid b = makeBox({5.0, 0.0, 0.0}, {1.0, 1.0, 1.0});
    a.append(b);

    TEST_ASSERT(a.vertexCount() == 16);
    TEST_ASSERT(a.faceCount() == 24);
    TEST_ASSERT(a.faces[12][0] >= 8);
    TEST_ASSERT_NEAR(signedVolume(a), 2.0, 1e-12);

    TEST_PASS();
}

//=============================================================================
// TOPOLOGY
//=============================================================================

static void test_primitives_are_closed() {
    TEST_BEGIN("Box and cylinder are closed manifolds");

    TEST_ASSERT(inspectTopology(makeBox({0, 0, 0}, {1, 2, 3})).isClosedManifold());
    TEST_ASSERT(inspectTopology(makeCylinder(1.0, 2.0, 3, {0, 0, 0})).isClosedManifold());
    TEST_ASSERT(inspectTopology(makeCylinder(1.0, 2.0, 64, {0, 0, 0}, Axis::X)).isClosedManifold());

    TEST_PASS();
}

static void test_open_mesh_reports_boundary() {
    TEST_BEGIN("Missing face leaves boundary edges");

    Solid box = makeBox({0, 0, 0}, {1, 1, 1});
    box.faces.pop_back();

    TopologyReport report = inspectTopology(box);
    TEST_ASSERT(!report.isClosedManifold());
    TEST_ASSERT(report.boundary_edges == 3);

    DiagnosticLog log;
    TEST_ASSERT(!validateOperand(box, log));
    TEST_ASSERT(log.countOf(DiagCategory::NotWatertight) == 1);

    TEST_PASS();
}

static void test_degenerate_faces_detected() {
    TEST_BEGIN("Collapsed vertex gives degenerate faces");

    Solid box = makeBox({0, 0, 0}, {1, 1, 1});
    box.vertices[1] = box.vertices[0];

    TopologyReport report = inspectTopology(box);
    TEST_ASSERT(report.degenerate_faces > 0);

    Solid repeated("repeated");
    repeated.addVertex({0, 0, 0});
    repeated.addVertex({1, 0, 0});
    repeated.addVertex({0, 1, 0});
    repeated.addFace(0, 0, 1);
    TEST_ASSERT(isFaceDegenerate(repeated, repeated.faces[0]));

    TEST_PASS();
}

static void test_invalid_index_detected() {
    TEST_BEGIN("Out-of-range index is reported");

    Solid box = makeBox({0, 0, 0}, {1, 1, 1});
    box.faces[0][2] = 99;

    TopologyReport report = inspectTopology(box);
    TEST_ASSERT(report.invalid_indices == 1);
    TEST_ASSERT(!report.isClosedManifold());

    TEST_PASS();
}

static void test_empty_operand_passes_gate() {
    TEST_BEGIN("Empty solid passes validateOperand");

    DiagnosticLog log;
    TEST_ASSERT(validateOperand(Solid("empty"), log));
    TEST_ASSERT(!log.hasErrors());

    TEST_PASS();
}

//=============================================================================
// FACE FRAME
//=============================================================================

static void test_front_face_frame() {
    TEST_BEGIN("Front face (-Y) reads along +X with Z up");

    FaceFrame f = computeFaceFrame({0.0, -1.0, 0.0});
    TEST_ASSERT_NEAR(f.right[0], 1.0, 1e-12);
    TEST_ASSERT_NEAR(f.up[2], 1.0, 1e-12);
    TEST_ASSERT_NEAR(f.normal[1], -1.0, 1e-12);

    TEST_PASS();
}

static void test_frame_is_orthonormal() {
    TEST_BEGIN("Frames are right-handed orthonormal");

    const Vec3 normals[] = {{0, 0, 1}, {0, 0, -1}, {1, 0, 0}, {1, 1, 1}, {0.2, -0.7, 0.1}};
    for (const auto& n : normals) {
        FaceFrame f = computeFaceFrame(n);
        TEST_ASSERT_NEAR(length(f.right), 1.0, 1e-12);
        TEST_ASSERT_NEAR(length(f.up), 1.0, 1e-12);
        TEST_ASSERT_NEAR(dot(f.right, f.up), 0.0, 1e-12);
        TEST_ASSERT_NEAR(dot(f.right, f.normal), 0.0, 1e-12);
        const Vec3 r = cross(f.up, f.normal);
        TEST_ASSERT_NEAR(dot(r, f.right), 1.0, 1e-12);
    }

    TEST_PASS();
}

//=============================================================================
// MAIN
//=============================================================================

int main() {
    std::printf("\n");
    std::printf("========================================\n");
    std::printf("keyforge Solid Tests\n");
    std::printf("========================================\n");
    std::printf("\n");

    std::printf("--- Metrics ---\n");
    test_box_volume_and_centroid();
    test_cylinder_volume();
    test_inverted_solid_has_negative_volume();
    test_empty_solid_metrics();
    test_bake_transform();
    test_bounding_box_overlap_is_strict();
    test_append_offsets_indices();

    std::printf("\n--- Topology ---\n");
    test_primitives_are_closed();
    test_open_mesh_reports_boundary();
    test_degenerate_faces_detected();
    test_invalid_index_detected();
    test_empty_operand_passes_gate();

    std::printf("\n--- Face Frame ---\n");
    test_front_face_frame();
    test_frame_is_orthonormal();

    TEST_SUMMARY();

    return g_testsFailed > 0 ? 1 : 0;
}

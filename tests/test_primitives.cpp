/**
 * @file test_primitives.cpp
 * @brief Primitive Factory: box, cylinder, annulus
 */

#include "TestHarness.h"
#include "TestBackends.h"

#include "backend/BackendFactory.h"
#include "keyforge/Errors.h"
#include "keyforge/MeshValidate.h"
#include "keyforge/Primitives.h"

#include <cmath>
#include <memory>

using namespace keyforge;

static constexpr double kPi = 3.14159265358979323846;

// Möller-Trumbore; counts every triangle the ray (t > 0) passes through
static int countRayHits(const Solid& solid, const Vec3& origin, const Vec3& dir) {
    int hits = 0;
    for (const auto& f : solid.faces) {
        const Vec3& v0 = solid.vertices[f[0]];
        const Vec3 e1 = sub(solid.vertices[f[1]], v0);
        const Vec3 e2 = sub(solid.vertices[f[2]], v0);
        const Vec3 p = cross(dir, e2);
        const double det = dot(e1, p);
        if (std::fabs(det) < 1e-12) continue;
        const double inv = 1.0 / det;
        const Vec3 s = sub(origin, v0);
        const double u = dot(s, p) * inv;
        if (u < 0.0 || u > 1.0) continue;
        const Vec3 q = cross(s, e1);
        const double v = dot(dir, q) * inv;
        if (v < 0.0 || u + v > 1.0) continue;
        if (dot(e2, q) * inv > 0.0) ++hits;
    }
    return hits;
}

static double polygonArea(double radius, int segments) {
    return 0.5 * segments * radius * radius * std::sin(2.0 * kPi / segments);
}

//=============================================================================
// BOX
//=============================================================================

static void test_box_shape() {
    TEST_BEGIN("Box has 8 vertices, 12 faces, requested extents");

    Solid box = makeBox({15.0, 0.0, 0.0}, {30.0, 10.0, 38.0}, "BookBody");
    TEST_ASSERT(box.name == "BookBody");
    TEST_ASSERT(box.vertexCount() == 8);
    TEST_ASSERT(box.faceCount() == 12);

    double bmin[3], bmax[3];
    box.computeBoundingBox(bmin, bmax);
    TEST_ASSERT_NEAR(bmin[0], 0.0, 1e-12);
    TEST_ASSERT_NEAR(bmax[0], 30.0, 1e-12);
    TEST_ASSERT_NEAR(bmax[1] - bmin[1], 10.0, 1e-12);
    TEST_ASSERT_NEAR(bmax[2] - bmin[2], 38.0, 1e-12);
    TEST_ASSERT(signedVolume(box) > 0.0);

    TEST_PASS();
}

static void test_box_rejects_bad_extents() {
    TEST_BEGIN("Box rejects zero and negative extents");

    bool threw = false;
    try {
        makeBox({0, 0, 0}, {1.0, 0.0, 1.0});
    } catch (const InvalidParameterError& e) {
        threw = e.parameter() == "extents.y";
    }
    TEST_ASSERT(threw);

    threw = false;
    try {
        makeBox({0, 0, 0}, {-1.0, 1.0, 1.0});
    } catch (const InvalidParameterError&) {
        threw = true;
    }
    TEST_ASSERT(threw);

    TEST_PASS();
}

//=============================================================================
// CYLINDER
//=============================================================================

static void test_cylinder_counts() {
    TEST_BEGIN("Cylinder has 2N+2 vertices and 4N faces");

    Solid cyl = makeCylinder(5.0, 38.0, 32, {0, 0, 0});
    TEST_ASSERT(cyl.vertexCount() == 66);
    TEST_ASSERT(cyl.faceCount() == 128);
    TEST_ASSERT(inspectTopology(cyl).isClosedManifold());

    TEST_PASS();
}

static void test_cylinder_axis() {
    TEST_BEGIN("Cylinder height runs along the requested axis");

    const Axis axes[] = {Axis::X, Axis::Y, Axis::Z};
    for (Axis axis : axes) {
        Solid cyl = makeCylinder(1.0, 8.0, 16, {1.0, 2.0, 3.0}, axis);
        double bmin[3], bmax[3];
        cyl.computeBoundingBox(bmin, bmax);
        const int k = axisIndex(axis);
        TEST_ASSERT_NEAR(bmax[k] - bmin[k], 8.0, 1e-12);
        for (int i = 0; i < 3; ++i) {
            if (i != k) TEST_ASSERT(bmax[i] - bmin[i] <= 2.0 + 1e-12);
        }
        TEST_ASSERT(signedVolume(cyl) > 0.0);
    }

    TEST_PASS();
}

static void test_cylinder_rejects_bad_input() {
    TEST_BEGIN("Cylinder rejects <3 segments and bad sizes");

    int failures = 0;
    try { makeCylinder(1.0, 1.0, 2, {0, 0, 0}); } catch (const InvalidParameterError&) { ++failures; }
    try { makeCylinder(0.0, 1.0, 8, {0, 0, 0}); } catch (const InvalidParameterError&) { ++failures; }
    try { makeCylinder(1.0, -1.0, 8, {0, 0, 0}); } catch (const InvalidParameterError&) { ++failures; }
    TEST_ASSERT(failures == 3);

    TEST_PASS();
}

//=============================================================================
// ANNULUS
//=============================================================================

static void test_annulus_hole_perforates() {
    TEST_BEGIN("Annulus hole: axial ray through centre hits nothing");

    auto backend = createBackend("manifold");
    Solid ring = makeAnnulus(4.0, 2.5, 3.0, {0, 0, 0}, 32, Axis::Z, *backend, 0.0075);

    TEST_ASSERT(!ring.empty());
    TEST_ASSERT(inspectTopology(ring).isClosedManifold());

    TEST_ASSERT(countRayHits(ring, {0.0, 0.0, -10.0}, {0.0, 0.0, 1.0}) == 0);
    TEST_ASSERT(countRayHits(ring, {0.013, -0.021, -10.0}, {0.0, 0.0, 1.0}) == 0);

    // Through the wall: enters and leaves once
    TEST_ASSERT(countRayHits(ring, {3.2, 0.137, -10.0}, {0.0, 0.0, 1.0}) == 2);

    TEST_PASS();
}

static void test_annulus_volume() {
    TEST_BEGIN("Annulus volume is outer minus inner prism");

    auto backend = createBackend("manifold");
    Solid ring = makeAnnulus(4.0, 2.5, 3.0, {0, 0, 22.0}, 32, Axis::Y, *backend, 0.0075, "CarabinerLoop");

    const double expected = (polygonArea(4.0, 32) - polygonArea(2.5, 32)) * 3.0;
    TEST_ASSERT_NEAR(signedVolume(ring), expected, expected * 1e-6);
    TEST_ASSERT(ring.name == "CarabinerLoop");

    // Hole along Y: a ray along Y through the centre passes
    TEST_ASSERT(countRayHits(ring, {0.01, -10.0, 22.02}, {0.0, 1.0, 0.0}) == 0);

    TEST_PASS();
}

static void test_annulus_rejects_inverted_radii() {
    TEST_BEGIN("Annulus rejects inner >= outer");

    testing::AppendBackend backend;
    bool threw = false;
    try {
        makeAnnulus(2.5, 2.5, 3.0, {0, 0, 0}, 32, Axis::Z, backend, 0.0075);
    } catch (const InvalidParameterError& e) {
        threw = e.parameter() == "inner_radius";
    }
    TEST_ASSERT(threw);
    TEST_ASSERT(backend.calls == 0);

    TEST_PASS();
}

static void test_annulus_retries_then_throws() {
    TEST_BEGIN("Annulus retries, then raises BooleanOperationError");

    testing::FailingBackend backend;
    bool threw = false;
    try {
        makeAnnulus(4.0, 2.5, 3.0, {0, 0, 0}, 32, Axis::Z, backend, 0.0075);
    } catch (const BooleanOperationError&) {
        threw = true;
    }
    TEST_ASSERT(threw);
    TEST_ASSERT(backend.calls == kAnnulusMaxAttempts);

    TEST_PASS();
}

// Claims success but hands back the outer cylinder untouched
class UncutBackend : public IBooleanBackend {
public:
    std::string name() const override { return "uncut"; }
    BooleanResult execute(const Solid& a, const Solid&, BooleanOp) override {
        ++calls;
        BooleanResult result;
        result.output = a;
        result.success = true;
        return result;
    }
    int calls = 0;
};

static void test_annulus_rejects_uncut_result() {
    TEST_BEGIN("Annulus treats an uncut result as a failed attempt");

    UncutBackend backend;
    bool threw = false;
    try {
        makeAnnulus(4.0, 2.5, 3.0, {0, 0, 0}, 16, Axis::X, backend, 0.01);
    } catch (const BooleanOperationError&) {
        threw = true;
    }
    TEST_ASSERT(threw);
    TEST_ASSERT(backend.calls == kAnnulusMaxAttempts);

    TEST_PASS();
}

//=============================================================================
// MAIN
//=============================================================================

int main() {
    std::printf("\n");
    std::printf("========================================\n");
    std::printf("keyforge Primitive Factory Tests\n");
    std::printf("========================================\n");
    std::printf("\n");

    std::printf("--- Box ---\n");
    test_box_shape();
    test_box_rejects_bad_extents();

    std::printf("\n--- Cylinder ---\n");
    test_cylinder_counts();
    test_cylinder_axis();
    test_cylinder_rejects_bad_input();

    std::printf("\n--- Annulus ---\n");
    test_annulus_hole_perforates();
    test_annulus_volume();
    test_annulus_rejects_inverted_radii();
    test_annulus_retries_then_throws();
    test_annulus_rejects_uncut_result();

    TEST_SUMMARY();

    return g_testsFailed > 0 ? 1 : 0;
}

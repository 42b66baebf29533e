#include "test_harness.hpp"
#include "boundary/boundary_oracle.hpp"
#include "boundary/polygon_boundary.hpp"
#include "core/geometry.hpp"
#include "core/sim_errors.hpp"
#include <vector>

using namespace rxnet;

// 0..100 square
static std::vector<Point> square() {
    return { {0, 0}, {100, 0}, {100, 100}, {0, 100} };
}

// U-shaped lake: two arms (x 0..40 and 60..100) joined along y 0..20.
static std::vector<Point> u_shape() {
    return { {0, 0}, {100, 0}, {100, 100}, {60, 100}, {60, 20}, {40, 20}, {40, 100}, {0, 100} };
}

void testGeometryHelpers() {
    TEST("advance follows compass headings")
        Point p = advance(Point(0, 0), 0.0, 10.0);
        ASSERT_NEAR(p.x, 0.0, 1e-12);
        ASSERT_NEAR(p.y, 10.0, 1e-12);
        Point q = advance(Point(0, 0), 90.0, 10.0);
        ASSERT_NEAR(q.x, 10.0, 1e-12);
        ASSERT_NEAR(q.y, 0.0, 1e-9);
        ASSERT_NEAR(wrap_heading(-30.0), 330.0, 1e-12);
        ASSERT_NEAR(wrap_heading(725.0), 5.0, 1e-12);
    PASS()

    TEST("segments_cross ignores touching endpoints")
        ASSERT(segments_cross({0, 0}, {10, 10}, {0, 10}, {10, 0}));
        ASSERT(!segments_cross({0, 0}, {5, 5}, {5, 5}, {10, 0}));
        ASSERT(!segments_cross({0, 0}, {10, 0}, {0, 1}, {10, 1}));
    PASS()

    TEST("ring area and path length")
        ASSERT_NEAR(ring_area(square()), 10000.0, 1e-9);
        Path path{ {{0, 0}, 0}, {{3, 4}, 1}, {{3, 10}, 2} };
        ASSERT_NEAR(path_length(path), 11.0, 1e-12);
    PASS()
}

void testPolygonContainment() {
    TEST("square contains interior, rejects exterior")
        PolygonBoundary poly(square());
        ASSERT(poly.contains({50, 50}));
        ASSERT(poly.contains({1, 99}));
        ASSERT(!poly.contains({-1, 50}));
        ASSERT(!poly.contains({50, 101}));
        ASSERT_NEAR(poly.area(), 10000.0, 1e-9);
    PASS()

    TEST("island is land")
        std::vector<std::vector<Point>> holes{ { {40, 40}, {60, 40}, {60, 60}, {40, 60} } };
        PolygonBoundary poly(square(), holes);
        ASSERT(poly.hole_count() == 1);
        ASSERT(!poly.contains({50, 50}));
        ASSERT(poly.contains({20, 50}));
        ASSERT(!poly.segment_within({20, 50}, {80, 50}));
        ASSERT(poly.segment_within({20, 20}, {80, 20}));
        ASSERT_NEAR(poly.area(), 9600.0, 1e-9);
    PASS()

    TEST("non-convex: segment across the notch is rejected")
        PolygonBoundary poly(u_shape());
        ASSERT(poly.contains({20, 80}));
        ASSERT(poly.contains({80, 80}));
        ASSERT(!poly.contains({50, 80}));
        ASSERT(!poly.segment_within({20, 80}, {80, 80}));
        ASSERT(poly.segment_within({20, 10}, {80, 10}));
    PASS()

    TEST("closing vertex is dropped, short rings rejected")
        PolygonBoundary poly(std::vector<Point>{ {0, 0}, {10, 0}, {10, 10}, {0, 10}, {0, 0} });
        ASSERT(poly.outer().size() == 4);
        ASSERT_THROWS(ValidationError, PolygonBoundary(std::vector<Point>{ {0, 0}, {1, 1} }));
        ASSERT_THROWS(ValidationError, PolygonBoundary(std::vector<Point>{ {0, 0}, {1, 0}, {NAN, 1} }));
    PASS()

    TEST("zero-area polygon contains nothing")
        PolygonBoundary flat(std::vector<Point>{ {0, 0}, {10, 0}, {20, 0} });
        ASSERT(flat.area() == 0.0);
        ASSERT(!flat.contains({5, 0}));
        ASSERT(!flat.contains({5, 1}));
    PASS()
}

void testPathBetween() {
    TEST("direct path when the segment is in water")
        PolygonBoundary poly(square());
        auto path = poly.path_between({10, 10}, {90, 90});
        ASSERT(path.has_value());
        ASSERT(path->size() == 2);
        ASSERT(path->back().step == 1);
    PASS()

    TEST("least-cost path detours around the notch")
        PolygonBoundary poly(u_shape());
        Point a(20, 80), b(80, 80);
        auto path = poly.path_between(a, b);
        ASSERT(path.has_value());
        ASSERT(path->size() >= 4);
        ASSERT(path->front().pos == a);
        ASSERT(path->back().pos == b);
        // Goes down one arm, round the notch corners, up the other
        ASSERT(path_length(*path) > distance(a, b));
        ASSERT(path_length(*path) < 200.0);
        for (size_t i = 1; i < path->size(); i++) {
            Point mid = lerp((*path)[i - 1].pos, (*path)[i].pos, 0.5);
            ASSERT(poly.contains(mid) || mid.y == 20.0);
            ASSERT((*path)[i].step == static_cast<int>(i));
        }
    PASS()

    TEST("no path from land")
        PolygonBoundary poly(u_shape());
        ASSERT(!poly.path_between({50, 80}, {20, 80}).has_value());
    PASS()

    TEST("open water accepts everything finite")
        OpenWaterBoundary open;
        ASSERT(open.contains({1e9, -1e9}));
        ASSERT(!open.contains({NAN, 0}));
        ASSERT(open.path_between({0, 0}, {5, 5})->size() == 2);
    PASS()
}

int main() {
    std::cout << "=== Boundary Tests ===" << std::endl;
    testGeometryHelpers();
    testPolygonContainment();
    testPathBetween();
    return finish();
}

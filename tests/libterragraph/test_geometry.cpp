#include <catch2/catch.hpp>

#include "libterragraph/BoundingBox.hpp"
#include "libterragraph/Exception.hpp"
#include "libterragraph/Point.hpp"

#include "test_data.hpp"

#include <algorithm>

using namespace Terragraph;

TEST_CASE("Polygon area and orientation", "[Geometry]") {
    Polygon square = Test::square(Vec2d(0., 0.), 5.).contour;
    REQUIRE(square.area() == Approx(100.));
    REQUIRE(square.is_counter_clockwise());

    std::reverse(square.points.begin(), square.points.end());
    REQUIRE(square.area() == Approx(-100.));
    square.make_counter_clockwise();
    REQUIRE(square.area() == Approx(100.));
}

TEST_CASE("ExPolygon area subtracts the holes", "[Geometry]") {
    ExPolygon expoly = Test::square(Vec2d(0., 0.), 5.);
    Polygon hole = Test::square(Vec2d(0., 0.), 1.).contour;
    std::reverse(hole.points.begin(), hole.points.end());
    expoly.holes.emplace_back(hole);
    REQUIRE(expoly.area() == Approx(96.));
}

TEST_CASE("Canonical ring starts at the smallest vertex", "[Geometry]") {
    Polygon ring(Points{ Vec2d(2., 0.), Vec2d(2., 2.), Vec2d(0., 2.), Vec2d(0., 0.) });
    ring.canonicalize();
    REQUIRE(ring.points.front() == Vec2d(0., 0.));
    REQUIRE(ring.points[1] == Vec2d(2., 0.));
    REQUIRE(ring.area() == Approx(4.));
}

TEST_CASE("Segmentize splits long ring edges evenly", "[Geometry]") {
    const Polygon ring = Test::square(Vec2d(5., 5.), 5.).contour;

    GIVEN("a spacing dividing the edges") {
        const Points pts = segmentize(ring, 2.5);
        THEN("every edge is split into four pieces") {
            REQUIRE(pts.size() == 16);
            for (size_t i = 0; i < pts.size(); ++ i)
                REQUIRE((pts[(i + 1) % pts.size()] - pts[i]).norm() == Approx(2.5));
        }
    }
    GIVEN("a spacing not dividing the edges") {
        const Points pts = segmentize(ring, 3.);
        THEN("no piece is longer than the spacing") {
            REQUIRE(pts.size() == 16);
            for (size_t i = 0; i < pts.size(); ++ i)
                REQUIRE((pts[(i + 1) % pts.size()] - pts[i]).norm() <= 3.);
        }
    }
    GIVEN("a spacing longer than the edges") {
        REQUIRE(segmentize(ring, 20.).size() == 4);
    }
    GIVEN("an invalid spacing") {
        REQUIRE_THROWS_AS(segmentize(ring, 0.), InvalidArgument);
    }
}

TEST_CASE("Point hash agrees with exact equality", "[Geometry]") {
    REQUIRE(PointHash()(Vec2d(0., -0.)) == PointHash()(Vec2d(-0., 0.)));
    REQUIRE(PointEqual()(Vec2d(0., -0.), Vec2d(-0., 0.)));
    REQUIRE_FALSE(PointEqual()(Vec2d(1., 2.), Vec2d(1., 2. + 1e-12)));
}

TEST_CASE("Bounding box", "[Geometry]") {
    BoundingBox bb;
    REQUIRE_FALSE(bb.defined());
    REQUIRE(bb.degenerate());

    bb.merge(Vec2d(1., 2.));
    REQUIRE(bb.defined());
    REQUIRE(bb.degenerate());

    bb.merge(Points{ Vec2d(-3., 5.), Vec2d(4., -1.) });
    REQUIRE(bb == BoundingBox(-3., -1., 4., 5.));
    REQUIRE(bb.area() == Approx(42.));

    SECTION("closed containment") {
        REQUIRE(bb.contains(Vec2d(-3., 5.)));
        REQUIRE(bb.contains(Vec2d(0., 0.)));
        REQUIRE_FALSE(bb.contains(Vec2d(4.0001, 0.)));
    }
    SECTION("overlap includes touching boxes") {
        REQUIRE(bb.overlap(BoundingBox(4., 5., 10., 10.)));
        REQUIRE_FALSE(bb.overlap(BoundingBox(4.5, 0., 10., 10.)));
    }
    SECTION("expanded") {
        REQUIRE(bb.expanded(1.) == BoundingBox(-4., -2., 5., 6.));
    }
    SECTION("extents of polygons") {
        REQUIRE(get_extents(Test::square(Vec2d(10., 10.), 2.)) == BoundingBox(8., 8., 12., 12.));
        REQUIRE_FALSE(get_extents(ExPolygons()).defined());
    }
}

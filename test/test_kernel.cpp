#include "doctest/doctest.h"
#include "geokernel/kernel.hpp"

#include <vector>

namespace {
    datapod::Point pt(double x, double y) { return datapod::Point{x, y, 0.0}; }
} // namespace

TEST_CASE("Segment intersection") {
    SUBCASE("Proper crossing") {
        CHECK(geokernel::segments_intersect(pt(0, 0), pt(2, 2), pt(0, 2), pt(2, 0)));
    }

    SUBCASE("Touching endpoints count") {
        CHECK(geokernel::segments_intersect(pt(0, 0), pt(1, 0), pt(1, 0), pt(1, 1)));
    }

    SUBCASE("Collinear overlap counts") {
        CHECK(geokernel::segments_intersect(pt(0, 0), pt(2, 0), pt(1, 0), pt(3, 0)));
    }

    SUBCASE("Collinear but disjoint") {
        CHECK_FALSE(geokernel::segments_intersect(pt(0, 0), pt(1, 0), pt(2, 0), pt(3, 0)));
    }

    SUBCASE("Parallel segments") {
        CHECK_FALSE(geokernel::segments_intersect(pt(0, 0), pt(2, 0), pt(0, 1), pt(2, 1)));
    }
}

TEST_CASE("Point to segment distance") {
    // Perpendicular foot inside the segment
    CHECK(geokernel::point_segment_distance(pt(1, 3), pt(0, 0), pt(2, 0)) == doctest::Approx(3.0));

    // Foot beyond the end clamps to the endpoint
    CHECK(geokernel::point_segment_distance(pt(5, 4), pt(0, 0), pt(2, 0)) == doctest::Approx(5.0));

    // Zero-length segment behaves like a point
    CHECK(geokernel::point_segment_distance(pt(3, 4), pt(0, 0), pt(0, 0)) == doctest::Approx(5.0));
}

TEST_CASE("Segment to segment distance") {
    SUBCASE("Crossing segments are at distance zero") {
        CHECK(geokernel::segment_segment_distance(pt(0, 0), pt(2, 2), pt(0, 2), pt(2, 0)) == doctest::Approx(0.0));
    }

    SUBCASE("Interior near-miss with far-apart vertices") {
        // Vertices are at least 50 apart, but the interiors pass within 1
        double d = geokernel::segment_segment_distance(pt(-50, 0), pt(50, 0), pt(0, 1), pt(0, 100));
        CHECK(d == doctest::Approx(1.0));
    }

    SUBCASE("Parallel offset") {
        CHECK(geokernel::segment_segment_distance(pt(0, 0), pt(10, 0), pt(0, 2), pt(10, 2)) == doctest::Approx(2.0));
    }
}

TEST_CASE("Ring utilities") {
    std::vector<datapod::Point> square = {pt(0, 0), pt(4, 0), pt(4, 4), pt(0, 4), pt(0, 0)};

    SUBCASE("Signed area follows orientation") {
        CHECK(geokernel::signed_area(square) == doctest::Approx(16.0));

        std::vector<datapod::Point> clockwise(square.rbegin(), square.rend());
        CHECK(geokernel::signed_area(clockwise) == doctest::Approx(-16.0));
    }

    SUBCASE("Point in ring") {
        CHECK(geokernel::point_in_ring(pt(2, 2), square));
        CHECK_FALSE(geokernel::point_in_ring(pt(5, 2), square));
        CHECK_FALSE(geokernel::point_in_ring(pt(-1, -1), square));
    }

    SUBCASE("Consecutive duplicates are dropped") {
        std::vector<datapod::Point> in = {pt(0, 0), pt(0, 0), pt(1, 1), pt(1, 1), pt(1, 1), pt(2, 0)};
        std::vector<datapod::Point> out;
        std::size_t removed = geokernel::remove_consecutive_duplicates(in, out);

        CHECK(removed == 3);
        REQUIRE(out.size() == 3);
        CHECK(out[1].x == 1.0);
        CHECK(out[2].x == 2.0);
    }
}

TEST_CASE("Geodesy") {
    SUBCASE("Haversine over one degree of latitude") {
        double d = geokernel::haversine_distance(14.0, 50.0, 14.0, 51.0);
        CHECK(d == doctest::Approx(geokernel::meters_per_degree_lat()).epsilon(1e-6));
        CHECK(d == doctest::Approx(111195.0).epsilon(1e-3));
    }

    SUBCASE("Longitude degrees shrink with latitude") {
        CHECK(geokernel::meters_per_degree_lon(0.0) == doctest::Approx(geokernel::meters_per_degree_lat()));
        CHECK(geokernel::meters_per_degree_lon(60.0) == doctest::Approx(geokernel::meters_per_degree_lat() * 0.5));
    }

    SUBCASE("Local projection is centred on its origin") {
        geokernel::LocalProjection proj(14.42, 50.08);
        auto origin = proj.project(pt(14.42, 50.08));
        CHECK(origin.x == doctest::Approx(0.0));
        CHECK(origin.y == doctest::Approx(0.0));

        auto north = proj.project(pt(14.42, 50.09));
        CHECK(north.x == doctest::Approx(0.0));
        CHECK(north.y == doctest::Approx(0.01 * geokernel::meters_per_degree_lat()));
    }
}

#include "doctest/doctest.h"
#include "digsafe/validator.hpp"

#include <algorithm>
#include <limits>

using digsafe::GeometryKind;
using digsafe::GeometryValidator;
using digsafe::NormalizedGeometry;
using digsafe::RawGeometry;
using digsafe::ValidationError;

namespace {
    bool contains_message(const std::vector<std::string> &messages, const std::string &text) {
        return std::find(messages.begin(), messages.end(), text) != messages.end();
    }

    // Roughly 70 m x 110 m block in central Prague
    RawGeometry prague_block() {
        return RawGeometry::polygon(
            {{{14.420, 50.080}, {14.421, 50.080}, {14.421, 50.081}, {14.420, 50.081}, {14.420, 50.080}}});
    }
} // namespace

TEST_CASE("Point validation") {
    GeometryValidator validator;

    SUBCASE("Point inside the operating area") {
        NormalizedGeometry g = validator.validate(RawGeometry::point(14.4378, 50.0755));
        CHECK(g.kind() == GeometryKind::Point);
        CHECK(g.warnings.empty());

        const auto &p = std::get<datapod::Point>(g.geometry);
        CHECK(p.x == 14.4378);
        CHECK(p.y == 50.0755);
        CHECK(g.bounding_box.min_point.x == 14.4378);
        CHECK(g.bounding_box.max_point.y == 50.0755);
    }

    SUBCASE("Point outside the operating area only warns") {
        NormalizedGeometry g = validator.validate(RawGeometry::point(2.35, 48.85));
        REQUIRE(g.warnings.size() == 1);
        CHECK(g.warnings[0] == "point lies outside the operating area");
    }

    SUBCASE("Wrong arity") {
        RawGeometry raw{"Point", {{{14.4, 50.0, 200.0}}}};
        auto report = validator.check(raw);
        CHECK_FALSE(report.is_valid());
        CHECK(contains_message(report.errors, "point must have exactly 2 coordinates"));
    }

    SUBCASE("Missing position") {
        RawGeometry raw{"Point", {}};
        auto report = validator.check(raw);
        CHECK(contains_message(report.errors, "point must have exactly one position"));
    }

    SUBCASE("Non-finite coordinates") {
        auto report = validator.check(RawGeometry::point(std::numeric_limits<double>::quiet_NaN(), 50.0));
        CHECK(contains_message(report.errors, "point coordinates must be finite numbers"));
        CHECK_FALSE(report.geometry.has_value());
    }
}

TEST_CASE("Line string validation") {
    GeometryValidator validator;

    SUBCASE("Consecutive duplicates are removed with one warning") {
        NormalizedGeometry g = validator.validate(RawGeometry::line_string({{0, 0}, {0, 0}, {1, 1}}));
        const auto &line = std::get<datapod::Linestring>(g.geometry);
        REQUIRE(line.points.size() == 2);
        CHECK(line.points[0].x == 0.0);
        CHECK(line.points[1].x == 1.0);
        REQUIRE(g.warnings.size() == 1);
        CHECK(g.warnings[0] == "removed 1 duplicate position");
    }

    SUBCASE("Too few positions") {
        auto report = validator.check(RawGeometry::line_string({{14.42, 50.08}}));
        CHECK(contains_message(report.errors, "line must have at least 2 positions"));
    }

    SUBCASE("All positions identical") {
        auto report = validator.check(RawGeometry::line_string({{14.42, 50.08}, {14.42, 50.08}, {14.42, 50.08}}));
        CHECK(contains_message(report.errors, "line must have at least 2 distinct positions"));
    }

    SUBCASE("Position with the wrong arity is located") {
        auto report = validator.check(RawGeometry::line_string({{14.42, 50.08}, {14.43}}));
        CHECK(contains_message(report.errors, "invalid coordinate at position 2: expected [longitude, latitude]"));
    }

    SUBCASE("Infinite coordinate is located") {
        double inf = std::numeric_limits<double>::infinity();
        auto report = validator.check(RawGeometry::line_string({{14.42, 50.08}, {14.43, 50.08}, {inf, 50.09}}));
        CHECK(contains_message(report.errors, "coordinate at position 3 is not a finite number"));
    }

    SUBCASE("Very short line warns") {
        // About 3.6 m
        NormalizedGeometry g = validator.validate(RawGeometry::line_string({{14.42, 50.08}, {14.42005, 50.08}}));
        CHECK(contains_message(g.warnings, "line is very short (less than 10 m)"));
        CHECK(GeometryValidator::line_length_m(std::get<datapod::Linestring>(g.geometry)) ==
              doctest::Approx(3.57).epsilon(0.01));
    }
}

TEST_CASE("Polygon validation") {
    GeometryValidator validator;

    SUBCASE("Closed polygon keeps a bit-identical closing vertex") {
        NormalizedGeometry g = validator.validate(prague_block());
        const auto &poly = std::get<datapod::Polygon>(g.geometry);
        REQUIRE(poly.vertices.size() == 5);
        CHECK(poly.vertices.front().x == poly.vertices.back().x);
        CHECK(poly.vertices.front().y == poly.vertices.back().y);
        CHECK(g.warnings.empty());
        CHECK(GeometryValidator::polygon_area_m2(poly) == doctest::Approx(7934.0).epsilon(0.01));
    }

    SUBCASE("Unclosed ring is fatal") {
        RawGeometry raw = RawGeometry::polygon({{{0, 0}, {1, 0}, {1, 1}, {0, 1}}});
        CHECK_THROWS_AS(validator.validate(raw), ValidationError);

        try {
            validator.validate(raw);
        } catch (const ValidationError &e) {
            CHECK(contains_message(e.messages(),
                                   "polygon must be closed (first and last position must be identical)"));
        }
    }

    SUBCASE("Too few positions") {
        auto report = validator.check(RawGeometry::polygon({{{0, 0}, {1, 0}, {0, 0}}}));
        CHECK(contains_message(report.errors,
                               "polygon must have at least 4 positions (including the closing position)"));
    }

    SUBCASE("Degenerate ring after de-duplication") {
        auto report = validator.check(RawGeometry::polygon({{{0, 0}, {1, 0}, {1, 0}, {0, 0}}}));
        CHECK(contains_message(report.errors, "polygon must have at least 3 distinct vertices"));
    }

    SUBCASE("Ring alternating between two positions") {
        auto report = validator.check(RawGeometry::polygon(
            {{{14.42, 50.08}, {14.43, 50.08}, {14.42, 50.08}, {14.43, 50.08}, {14.42, 50.08}}}));
        CHECK_FALSE(report.is_valid());
        CHECK(report.errors.size() == 1);
        CHECK(contains_message(report.errors, "polygon must have at least 3 distinct vertices"));
    }

    SUBCASE("Duplicate vertices are dropped and re-closed") {
        NormalizedGeometry g = validator.validate(RawGeometry::polygon({{{14.420, 50.080},
                                                                          {14.420, 50.080},
                                                                          {14.421, 50.080},
                                                                          {14.421, 50.081},
                                                                          {14.420, 50.081},
                                                                          {14.420, 50.080}}}));
        const auto &poly = std::get<datapod::Polygon>(g.geometry);
        CHECK(poly.vertices.size() == 5);
        CHECK(poly.vertices.front().x == poly.vertices.back().x);
        CHECK(poly.vertices.front().y == poly.vertices.back().y);
        CHECK(contains_message(g.warnings, "removed 1 duplicate position"));
    }

    SUBCASE("Interior rings are ignored with a warning") {
        RawGeometry raw = prague_block();
        raw.coordinates.push_back(
            {{14.4203, 50.0803}, {14.4205, 50.0803}, {14.4205, 50.0805}, {14.4203, 50.0805}, {14.4203, 50.0803}});
        NormalizedGeometry g = validator.validate(raw);
        CHECK(contains_message(g.warnings, "only the outer ring is used; 1 interior ring(s) ignored"));
    }

    SUBCASE("Tiny polygon warns") {
        NormalizedGeometry g = validator.validate(RawGeometry::polygon(
            {{{14.42, 50.08}, {14.42005, 50.08}, {14.42005, 50.08005}, {14.42, 50.08005}, {14.42, 50.08}}}));
        CHECK(contains_message(g.warnings, "polygon area is very small (less than 100 m²)"));
    }

    SUBCASE("Self-intersecting ring is a warning, not an error") {
        RawGeometry bowtie = RawGeometry::polygon(
            {{{14.420, 50.080}, {14.422, 50.082}, {14.422, 50.080}, {14.420, 50.081}, {14.420, 50.080}}});
        auto report = validator.check(bowtie);
        CHECK(report.is_valid());
        CHECK(contains_message(report.warnings, "polygon may intersect itself"));
    }

    SUBCASE("Simple ring is not flagged") {
        NormalizedGeometry g = validator.validate(prague_block());
        CHECK_FALSE(GeometryValidator::has_self_intersection(std::get<datapod::Polygon>(g.geometry)));
    }
}

TEST_CASE("Unsupported input") {
    GeometryValidator validator;

    CHECK(contains_message(validator.check(RawGeometry{}).errors, "geometry is not defined"));
    CHECK(contains_message(validator.check(RawGeometry{"MultiPoint", {{{14.42, 50.08}}}}).errors,
                           "unsupported geometry type: MultiPoint"));
    CHECK_THROWS_AS(validator.validate(RawGeometry{"GeometryCollection", {}}), ValidationError);
}

TEST_CASE("Configured thresholds drive warnings") {
    digsafe::EngineConfig config;
    config.min_line_length_m = 50.0;
    GeometryValidator validator(config);

    // About 26 m: fine by default, short under the stricter setting
    RawGeometry raw = RawGeometry::line_string({{14.4378, 50.0755}, {14.4380, 50.0757}});
    CHECK(GeometryValidator().validate(raw).warnings.empty());
    CHECK(contains_message(validator.validate(raw).warnings, "line is very short (less than 50 m)"));
}

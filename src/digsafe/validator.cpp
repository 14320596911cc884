#include "digsafe/validator.hpp"

#include <cmath>
#include <set>
#include <sstream>
#include <utility>

#include <boost/geometry.hpp>
#include <boost/geometry/algorithms/is_valid.hpp>
#include <boost/geometry/geometries/point_xy.hpp>
#include <boost/geometry/geometries/polygon.hpp>

#include <geokernel/kernel.hpp>

namespace digsafe {

    namespace bg = boost::geometry;
    using BPoint = bg::model::d2::point_xy<double>;
    using BPolygon = bg::model::polygon<BPoint>;

    namespace {
        std::string join(const std::vector<std::string> &messages) {
            std::string out = "invalid geometry";
            for (std::size_t i = 0; i < messages.size(); ++i) {
                out += (i == 0) ? ": " : "; ";
                out += messages[i];
            }
            return out;
        }

        std::string format_number(double value) {
            std::ostringstream oss;
            oss << value;
            return oss.str();
        }

        // Reads one [lon, lat] position; reports and returns false on the first structural problem
        bool read_position(const Position &pos, std::size_t index, datapod::Point &out, ValidationReport &report) {
            if (pos.size() != 2) {
                report.errors.push_back("invalid coordinate at position " + std::to_string(index + 1) +
                                        ": expected [longitude, latitude]");
                return false;
            }
            if (!std::isfinite(pos[0]) || !std::isfinite(pos[1])) {
                report.errors.push_back("coordinate at position " + std::to_string(index + 1) +
                                        " is not a finite number");
                return false;
            }
            out = datapod::Point{pos[0], pos[1], 0.0};
            return true;
        }

        bool read_positions(const std::vector<Position> &positions, std::vector<datapod::Point> &out,
                            ValidationReport &report) {
            out.reserve(positions.size());
            for (std::size_t i = 0; i < positions.size(); ++i) {
                datapod::Point p;
                if (!read_position(positions[i], i, p, report)) {
                    return false;
                }
                out.push_back(p);
            }
            return true;
        }

        std::string removed_warning(std::size_t removed) {
            return "removed " + std::to_string(removed) + " duplicate position" + (removed == 1 ? "" : "s");
        }
    } // namespace

    ValidationError::ValidationError(std::vector<std::string> messages)
        : std::runtime_error(join(messages)), messages_(std::move(messages)) {}

    GeometryValidator::GeometryValidator(const EngineConfig &config) : config_(config) {}

    ValidationReport GeometryValidator::check(const RawGeometry &raw) const {
        ValidationReport report;

        if (raw.type.empty()) {
            report.errors.push_back("geometry is not defined");
        } else if (raw.type == "Point") {
            check_point(raw, report);
        } else if (raw.type == "LineString") {
            check_line_string(raw, report);
        } else if (raw.type == "Polygon") {
            check_polygon(raw, report);
        } else {
            report.errors.push_back("unsupported geometry type: " + raw.type);
        }

        if (!report.errors.empty()) {
            report.geometry.reset();
        } else if (report.geometry) {
            report.geometry->bounding_box = bounding_box_of(report.geometry->geometry);
            report.geometry->warnings = report.warnings;
        }
        return report;
    }

    NormalizedGeometry GeometryValidator::validate(const RawGeometry &raw) const {
        ValidationReport report = check(raw);
        if (!report.is_valid()) {
            throw ValidationError(report.errors);
        }
        return std::move(*report.geometry);
    }

    void GeometryValidator::check_point(const RawGeometry &raw, ValidationReport &report) const {
        if (raw.coordinates.size() != 1 || raw.coordinates.front().size() != 1) {
            report.errors.push_back("point must have exactly one position");
            return;
        }

        const Position &pos = raw.coordinates.front().front();
        if (pos.size() != 2) {
            report.errors.push_back("point must have exactly 2 coordinates");
            return;
        }
        if (!std::isfinite(pos[0]) || !std::isfinite(pos[1])) {
            report.errors.push_back("point coordinates must be finite numbers");
            return;
        }

        if (!config_.operating_bounds.contains(pos[0], pos[1])) {
            report.warnings.push_back("point lies outside the operating area");
        }

        report.geometry = NormalizedGeometry{datapod::Point{pos[0], pos[1], 0.0}, {}, {}};
    }

    void GeometryValidator::check_line_string(const RawGeometry &raw, ValidationReport &report) const {
        if (raw.coordinates.empty() || raw.coordinates.front().size() < 2) {
            report.errors.push_back("line must have at least 2 positions");
            return;
        }

        const auto &positions = raw.coordinates.front();
        std::vector<datapod::Point> points;
        if (!read_positions(positions, points, report)) {
            return;
        }

        std::vector<datapod::Point> unique;
        std::size_t removed = geokernel::remove_consecutive_duplicates(points, unique);
        if (unique.size() < 2) {
            report.errors.push_back("line must have at least 2 distinct positions");
            return;
        }
        if (removed > 0) {
            report.warnings.push_back(removed_warning(removed));
        }

        datapod::Linestring line;
        for (const auto &p : unique) {
            line.points.push_back(p);
        }

        if (line_length_m(line) < config_.min_line_length_m) {
            report.warnings.push_back("line is very short (less than " + format_number(config_.min_line_length_m) +
                                      " m)");
        }

        report.geometry = NormalizedGeometry{std::move(line), {}, {}};
    }

    void GeometryValidator::check_polygon(const RawGeometry &raw, ValidationReport &report) const {
        if (raw.coordinates.empty()) {
            report.errors.push_back("polygon must have at least one ring");
            return;
        }

        const auto &ring = raw.coordinates.front();
        if (ring.size() < 4) {
            report.errors.push_back("polygon must have at least 4 positions (including the closing position)");
            return;
        }

        std::vector<datapod::Point> points;
        if (!read_positions(ring, points, report)) {
            return;
        }

        bool closed = geokernel::same_position(points.front(), points.back());
        if (!closed) {
            report.errors.push_back("polygon must be closed (first and last position must be identical)");
        }

        // De-duplicate the open ring; an unclosed ring is still scanned so both problems surface together
        std::vector<datapod::Point> open(points.begin(), closed ? points.end() - 1 : points.end());
        std::vector<datapod::Point> unique;
        geokernel::remove_consecutive_duplicates(open, unique);
        while (unique.size() > 1 && geokernel::same_position(unique.back(), unique.front())) {
            unique.pop_back();
        }

        // A ring bouncing between two positions has no consecutive duplicates but still no area
        std::set<std::pair<double, double>> distinct;
        for (const auto &p : unique) {
            distinct.emplace(p.x, p.y);
        }
        if (distinct.size() < 3) {
            report.errors.push_back("polygon must have at least 3 distinct vertices");
        }
        if (!report.errors.empty()) {
            return;
        }

        if (raw.coordinates.size() > 1) {
            report.warnings.push_back("only the outer ring is used; " + std::to_string(raw.coordinates.size() - 1) +
                                      " interior ring(s) ignored");
        }

        datapod::Polygon polygon;
        polygon.vertices.reserve(unique.size() + 1);
        for (const auto &p : unique) {
            polygon.vertices.push_back(p);
        }
        polygon.vertices.push_back(unique.front());

        std::size_t removed = ring.size() - polygon.vertices.size();
        if (removed > 0) {
            report.warnings.push_back(removed_warning(removed));
        }

        if (polygon_area_m2(polygon) < config_.min_polygon_area_m2) {
            report.warnings.push_back("polygon area is very small (less than " +
                                      format_number(config_.min_polygon_area_m2) + " m²)");
        }

        if (has_self_intersection(polygon)) {
            report.warnings.push_back("polygon may intersect itself");
        }

        report.geometry = NormalizedGeometry{std::move(polygon), {}, {}};
    }

    double GeometryValidator::line_length_m(const datapod::Linestring &line) {
        double length = 0.0;
        for (std::size_t i = 1; i < line.points.size(); ++i) {
            length += geokernel::haversine_distance(line.points[i - 1], line.points[i]);
        }
        return length;
    }

    double GeometryValidator::polygon_area_m2(const datapod::Polygon &polygon) {
        const auto &verts = polygon.vertices;
        if (verts.size() < 4) {
            return 0.0;
        }

        double mean_lat = 0.0;
        for (std::size_t i = 0; i + 1 < verts.size(); ++i) {
            mean_lat += verts[i].y;
        }
        mean_lat /= static_cast<double>(verts.size() - 1);

        double area_deg2 = std::abs(geokernel::signed_area(verts));
        return area_deg2 * geokernel::meters_per_degree_lat() * geokernel::meters_per_degree_lon(mean_lat);
    }

    bool GeometryValidator::has_self_intersection(const datapod::Polygon &polygon) {
        BPolygon bpoly;
        for (const auto &v : polygon.vertices) {
            bg::append(bpoly.outer(), BPoint(v.x, v.y));
        }
        bg::correct(bpoly);

        bg::validity_failure_type failure = bg::no_failure;
        if (bg::is_valid(bpoly, failure)) {
            return false;
        }
        return failure == bg::failure_self_intersections || failure == bg::failure_spikes;
    }

} // namespace digsafe

#pragma once

#include <algorithm>
#include <string>
#include <variant>
#include <vector>

#include <datapod/datapod.hpp>

#include <geokernel/geodesy.hpp>

namespace digsafe {

    /// One GeoJSON position as received; arity is unchecked until validation
    using Position = std::vector<double>;

    /**
     * @brief Unvalidated geometry exactly as it arrived from the caller
     *
     * `coordinates` is GeoJSON shaped with one extra level for points:
     * - Point: a single list holding one position
     * - LineString: a single list holding the path
     * - Polygon: one list per ring, the outer ring first
     */
    struct RawGeometry {
        std::string type;
        std::vector<std::vector<Position>> coordinates;

        static RawGeometry point(double lon, double lat) { return RawGeometry{"Point", {{Position{lon, lat}}}}; }

        static RawGeometry line_string(std::vector<Position> path) {
            return RawGeometry{"LineString", {std::move(path)}};
        }

        static RawGeometry polygon(std::vector<std::vector<Position>> rings) {
            return RawGeometry{"Polygon", std::move(rings)};
        }
    };

    /**
     * @brief Validated geometry; every coordinate holds x = longitude, y = latitude
     */
    using Geometry = std::variant<datapod::Point, datapod::Linestring, datapod::Polygon>;

    enum class GeometryKind { Point, LineString, Polygon };

    inline GeometryKind kind_of(const Geometry &geometry) {
        if (std::holds_alternative<datapod::Point>(geometry))
            return GeometryKind::Point;
        if (std::holds_alternative<datapod::Linestring>(geometry))
            return GeometryKind::LineString;
        return GeometryKind::Polygon;
    }

    inline const char *to_string(GeometryKind kind) {
        switch (kind) {
        case GeometryKind::Point:
            return "Point";
        case GeometryKind::LineString:
            return "LineString";
        case GeometryKind::Polygon:
            return "Polygon";
        }
        return "Unknown";
    }

    /**
     * @brief All coordinates of a geometry in order (a polygon keeps its closing vertex)
     */
    inline std::vector<datapod::Point> vertices_of(const Geometry &geometry) {
        std::vector<datapod::Point> out;
        if (const auto *p = std::get_if<datapod::Point>(&geometry)) {
            out.push_back(*p);
        } else if (const auto *line = std::get_if<datapod::Linestring>(&geometry)) {
            out.assign(line->points.begin(), line->points.end());
        } else if (const auto *poly = std::get_if<datapod::Polygon>(&geometry)) {
            out.assign(poly->vertices.begin(), poly->vertices.end());
        }
        return out;
    }

    /**
     * @brief Lon/lat bounding box of a geometry
     */
    inline datapod::AABB bounding_box_of(const Geometry &geometry) {
        auto verts = vertices_of(geometry);
        if (verts.empty()) {
            return datapod::AABB{datapod::Point{0.0, 0.0, 0.0}, datapod::Point{0.0, 0.0, 0.0}};
        }

        datapod::Point lo = verts.front();
        datapod::Point hi = verts.front();
        for (const auto &v : verts) {
            lo.x = std::min(lo.x, v.x);
            lo.y = std::min(lo.y, v.y);
            hi.x = std::max(hi.x, v.x);
            hi.y = std::max(hi.y, v.y);
        }
        lo.z = 0.0;
        hi.z = 0.0;
        return datapod::AABB{lo, hi};
    }

    /**
     * @brief Grow a lon/lat box by a distance in metres on every side
     *
     * The longitude margin uses the latitude farthest from the equator, so the
     * grown box never under-covers.
     */
    inline datapod::AABB expand_bounding_box(const datapod::AABB &box, double meters) {
        double worst_lat = std::min(89.0, std::max(std::abs(box.min_point.y), std::abs(box.max_point.y)));
        double d_lat = meters / geokernel::meters_per_degree_lat();
        double d_lon = meters / geokernel::meters_per_degree_lon(worst_lat);
        return datapod::AABB{datapod::Point{box.min_point.x - d_lon, box.min_point.y - d_lat, 0.0},
                             datapod::Point{box.max_point.x + d_lon, box.max_point.y + d_lat, 0.0}};
    }

    inline bool boxes_overlap(const datapod::AABB &a, const datapod::AABB &b) {
        return a.min_point.x <= b.max_point.x && b.min_point.x <= a.max_point.x && a.min_point.y <= b.max_point.y &&
               b.min_point.y <= a.max_point.y;
    }

    /**
     * @brief Geometry that passed GeometryValidator
     *
     * Guarantees: finite coordinates, no consecutive duplicates, line strings
     * with >= 2 points, polygons closed with a bit-identical last vertex and
     * >= 3 distinct vertices. Warnings are advisory and never block use.
     */
    struct NormalizedGeometry {
        Geometry geometry;
        datapod::AABB bounding_box;
        std::vector<std::string> warnings;

        GeometryKind kind() const { return kind_of(geometry); }
    };

} // namespace digsafe

#include "digsafe/proximity.hpp"

#include <algorithm>
#include <limits>
#include <vector>

#include <geokernel/kernel.hpp>

namespace digsafe {

    namespace {
        struct PlanarShape {
            std::vector<datapod::Point> vertices;
            bool is_area = false;
        };

        datapod::Point mean_position(const std::vector<datapod::Point> &verts) {
            double sx = 0.0, sy = 0.0;
            for (const auto &v : verts) {
                sx += v.x;
                sy += v.y;
            }
            double n = static_cast<double>(verts.size());
            return datapod::Point{sx / n, sy / n, 0.0};
        }

        PlanarShape to_planar(const Geometry &geometry, const std::vector<datapod::Point> &verts,
                              const geokernel::LocalProjection &projection) {
            PlanarShape shape;
            shape.is_area = std::holds_alternative<datapod::Polygon>(geometry);
            shape.vertices.reserve(verts.size());
            for (const auto &v : verts) {
                shape.vertices.push_back(projection.project(v));
            }
            return shape;
        }

        // A single point is treated as a zero-length segment
        double shape_distance(const PlanarShape &a, const PlanarShape &b) {
            std::size_t a_segments = a.vertices.size() > 1 ? a.vertices.size() - 1 : 1;
            std::size_t b_segments = b.vertices.size() > 1 ? b.vertices.size() - 1 : 1;

            double best = std::numeric_limits<double>::max();
            for (std::size_t i = 0; i < a_segments; ++i) {
                const auto &p1 = a.vertices[i];
                const auto &p2 = a.vertices.size() > 1 ? a.vertices[i + 1] : a.vertices[i];
                for (std::size_t j = 0; j < b_segments; ++j) {
                    const auto &q1 = b.vertices[j];
                    const auto &q2 = b.vertices.size() > 1 ? b.vertices[j + 1] : b.vertices[j];
                    best = std::min(best, geokernel::segment_segment_distance(p1, p2, q1, q2));
                    if (best == 0.0) {
                        return 0.0;
                    }
                }
            }
            return best;
        }
    } // namespace

    bool ProximityEngine::is_proximal(const NormalizedGeometry &a, const NormalizedGeometry &b,
                                      double threshold_m) const {
        if (!boxes_overlap(expand_bounding_box(a.bounding_box, threshold_m), b.bounding_box)) {
            return false;
        }
        double d = distance(a.geometry, b.geometry);
        return d == 0.0 || d <= threshold_m;
    }

    bool ProximityEngine::intersects(const NormalizedGeometry &a, const NormalizedGeometry &b) const {
        return is_proximal(a, b, 0.0);
    }

    double ProximityEngine::distance(const Geometry &a, const Geometry &b) const {
        auto verts_a = vertices_of(a);
        auto verts_b = vertices_of(b);
        if (verts_a.empty() || verts_b.empty()) {
            return std::numeric_limits<double>::max();
        }

        if (verts_a.size() == 1 && verts_b.size() == 1) {
            return geokernel::haversine_distance(verts_a.front(), verts_b.front());
        }

        datapod::Point ca = mean_position(verts_a);
        datapod::Point cb = mean_position(verts_b);
        geokernel::LocalProjection projection((ca.x + cb.x) / 2.0, (ca.y + cb.y) / 2.0);

        PlanarShape pa = to_planar(a, verts_a, projection);
        PlanarShape pb = to_planar(b, verts_b, projection);

        // Containment without boundary contact: one vertex of the inner shape decides
        if (pa.is_area && geokernel::point_in_ring(pb.vertices.front(), pa.vertices)) {
            return 0.0;
        }
        if (pb.is_area && geokernel::point_in_ring(pa.vertices.front(), pb.vertices)) {
            return 0.0;
        }

        return shape_distance(pa, pb);
    }

} // namespace digsafe

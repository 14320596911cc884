#pragma once

#include <algorithm>
#include <cmath>

#include <datapod/datapod.hpp>

namespace geokernel {

    /**
     * @brief Orientation of the triple (a, b, c)
     *
     * @return Positive for a counter-clockwise turn, negative for clockwise, 0 when collinear
     */
    inline double orientation(const datapod::Point &a, const datapod::Point &b, const datapod::Point &c) {
        return (b.x - a.x) * (c.y - a.y) - (b.y - a.y) * (c.x - a.x);
    }

    inline int orientation_sign(const datapod::Point &a, const datapod::Point &b, const datapod::Point &c) {
        double o = orientation(a, b, c);
        if (o > 0.0)
            return 1;
        if (o < 0.0)
            return -1;
        return 0;
    }

    /**
     * @brief Check if point q lies within the bounding box of segment [p, r]
     *
     * Only meaningful when p, q and r are already known to be collinear.
     */
    inline bool on_segment(const datapod::Point &p, const datapod::Point &q, const datapod::Point &r) {
        return q.x <= std::max(p.x, r.x) && q.x >= std::min(p.x, r.x) && q.y <= std::max(p.y, r.y) &&
               q.y >= std::min(p.y, r.y);
    }

    /**
     * @brief Check if two closed segments share at least one point
     *
     * Touching endpoints and collinear overlap both count as intersection.
     *
     * @param p1 Start of first segment
     * @param p2 End of first segment
     * @param q1 Start of second segment
     * @param q2 End of second segment
     * @return true if the segments intersect
     */
    inline bool segments_intersect(const datapod::Point &p1, const datapod::Point &p2, const datapod::Point &q1,
                                   const datapod::Point &q2) {
        int o1 = orientation_sign(p1, p2, q1);
        int o2 = orientation_sign(p1, p2, q2);
        int o3 = orientation_sign(q1, q2, p1);
        int o4 = orientation_sign(q1, q2, p2);

        if (o1 != o2 && o3 != o4)
            return true;

        if (o1 == 0 && on_segment(p1, q1, p2))
            return true;
        if (o2 == 0 && on_segment(p1, q2, p2))
            return true;
        if (o3 == 0 && on_segment(q1, p1, q2))
            return true;
        if (o4 == 0 && on_segment(q1, p2, q2))
            return true;

        return false;
    }

    /**
     * @brief Distance from a point to a closed segment
     *
     * A zero-length segment degenerates to point distance.
     */
    inline double point_segment_distance(const datapod::Point &p, const datapod::Point &a, const datapod::Point &b) {
        double dx = b.x - a.x;
        double dy = b.y - a.y;
        double len_sq = dx * dx + dy * dy;

        double t = 0.0;
        if (len_sq > 0.0) {
            t = ((p.x - a.x) * dx + (p.y - a.y) * dy) / len_sq;
            t = std::clamp(t, 0.0, 1.0);
        }

        double cx = a.x + t * dx - p.x;
        double cy = a.y + t * dy - p.y;
        return std::sqrt(cx * cx + cy * cy);
    }

    /**
     * @brief Minimum distance between two closed segments
     *
     * Zero when the segments intersect; otherwise the minimum is attained at an
     * endpoint of one of them.
     */
    inline double segment_segment_distance(const datapod::Point &p1, const datapod::Point &p2,
                                           const datapod::Point &q1, const datapod::Point &q2) {
        if (segments_intersect(p1, p2, q1, q2))
            return 0.0;

        double d = point_segment_distance(p1, q1, q2);
        d = std::min(d, point_segment_distance(p2, q1, q2));
        d = std::min(d, point_segment_distance(q1, p1, p2));
        d = std::min(d, point_segment_distance(q2, p1, p2));
        return d;
    }

} // namespace geokernel

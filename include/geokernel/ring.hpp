#pragma once

#include <cmath>
#include <cstddef>

#include <datapod/datapod.hpp>

namespace geokernel {

    /**
     * @brief Exact coordinate equality
     *
     * Normalization compares coordinates bit-for-bit the way they were entered,
     * so no tolerance is applied here.
     */
    inline bool same_position(const datapod::Point &a, const datapod::Point &b) { return a.x == b.x && a.y == b.y; }

    /**
     * @brief Signed area of a ring using the shoelace formula
     *
     * Works on open and closed rings alike (a closing vertex contributes zero).
     * Positive area means counter-clockwise winding.
     *
     * @param ring Ring vertices
     * @return Signed area in squared input units
     */
    template <typename Points> inline double signed_area(const Points &ring) {
        std::size_t n = ring.size();
        if (n < 3) {
            return 0.0;
        }

        double area = 0.0;
        for (std::size_t i = 0; i < n; ++i) {
            std::size_t j = (i + 1) % n;
            area += ring[i].x * ring[j].y;
            area -= ring[j].x * ring[i].y;
        }

        return area * 0.5;
    }

    /**
     * @brief Check if a point lies inside a ring (even-odd rule)
     *
     * Points exactly on the boundary may report either side; callers that need
     * boundary contact treat it through segment distance instead.
     *
     * @param point The point to check
     * @param ring Ring vertices, closed or open
     * @return true if the point is inside the ring
     */
    template <typename Points> inline bool point_in_ring(const datapod::Point &point, const Points &ring) {
        std::size_t n = ring.size();
        if (n < 3) {
            return false;
        }

        bool inside = false;
        for (std::size_t i = 0, j = n - 1; i < n; j = i++) {
            const auto &a = ring[i];
            const auto &b = ring[j];
            if ((a.y > point.y) != (b.y > point.y)) {
                double x_cross = (b.x - a.x) * (point.y - a.y) / (b.y - a.y) + a.x;
                if (point.x < x_cross) {
                    inside = !inside;
                }
            }
        }

        return inside;
    }

    /**
     * @brief Copy points, dropping each point equal to its predecessor
     *
     * @param points Input sequence
     * @param out Output sequence (appended to)
     * @return Number of points dropped
     */
    template <typename In, typename Out> inline std::size_t remove_consecutive_duplicates(const In &points, Out &out) {
        std::size_t removed = 0;
        for (std::size_t i = 0; i < points.size(); ++i) {
            if (!out.empty() && same_position(out.back(), points[i])) {
                ++removed;
                continue;
            }
            out.push_back(points[i]);
        }
        return removed;
    }

} // namespace geokernel

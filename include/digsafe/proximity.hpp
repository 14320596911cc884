#pragma once

#include "digsafe/geometry.hpp"

namespace digsafe {

    /**
     * @brief Exact minimum-distance and intersection tests between normalized geometries
     *
     * Distances are computed in a local equirectangular projection centred on the
     * mean position of both geometries, which is accurate for the few-kilometre
     * scale of excavation sites. Point/Point pairs use haversine directly.
     */
    class ProximityEngine {
      public:
        /**
         * @brief Decide spatial conflict
         *
         * @param a First geometry
         * @param b Second geometry
         * @param threshold_m Maximum separation in metres still counted as a conflict
         * @return true if the geometries intersect or lie within @p threshold_m of each other
         */
        bool is_proximal(const NormalizedGeometry &a, const NormalizedGeometry &b, double threshold_m) const;

        /// Geometries share at least one point (boundary contact or containment included)
        bool intersects(const NormalizedGeometry &a, const NormalizedGeometry &b) const;

        /// Minimum separation in metres; 0 when the geometries intersect
        double distance(const Geometry &a, const Geometry &b) const;
    };

} // namespace digsafe

#pragma once

#include <cmath>

#include <datapod/datapod.hpp>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace geokernel {

    /// Mean Earth radius used by every metric conversion in the kernel
    inline constexpr double EARTH_RADIUS_M = 6371000.0;

    inline double deg_to_rad(double deg) { return deg * M_PI / 180.0; }

    /**
     * @brief Great-circle distance between two lon/lat positions
     *
     * @param lon1 Longitude of the first position (degrees)
     * @param lat1 Latitude of the first position (degrees)
     * @param lon2 Longitude of the second position (degrees)
     * @param lat2 Latitude of the second position (degrees)
     * @return Distance in metres on a spherical Earth
     */
    inline double haversine_distance(double lon1, double lat1, double lon2, double lat2) {
        double d_lat = deg_to_rad(lat2 - lat1);
        double d_lon = deg_to_rad(lon2 - lon1);
        double a = std::sin(d_lat / 2.0) * std::sin(d_lat / 2.0) +
                   std::cos(deg_to_rad(lat1)) * std::cos(deg_to_rad(lat2)) * std::sin(d_lon / 2.0) *
                       std::sin(d_lon / 2.0);
        double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
        return EARTH_RADIUS_M * c;
    }

    /**
     * @brief Haversine distance between two points holding x = longitude, y = latitude
     */
    inline double haversine_distance(const datapod::Point &a, const datapod::Point &b) {
        return haversine_distance(a.x, a.y, b.x, b.y);
    }

    inline double meters_per_degree_lat() { return EARTH_RADIUS_M * M_PI / 180.0; }

    inline double meters_per_degree_lon(double latitude) {
        return EARTH_RADIUS_M * M_PI / 180.0 * std::cos(deg_to_rad(latitude));
    }

    /**
     * @brief Local equirectangular projection
     *
     * Maps lon/lat degrees to metres east/north of a reference position. The
     * east scale is fixed at the reference latitude, which keeps the error
     * small for the few-kilometre extents the engine compares.
     */
    class LocalProjection {
        double origin_lon_;
        double origin_lat_;
        double east_scale_;
        double north_scale_;

      public:
        LocalProjection(double origin_lon, double origin_lat)
            : origin_lon_(origin_lon), origin_lat_(origin_lat), east_scale_(meters_per_degree_lon(origin_lat)),
              north_scale_(meters_per_degree_lat()) {}

        datapod::Point project(const datapod::Point &lon_lat) const {
            return datapod::Point{(lon_lat.x - origin_lon_) * east_scale_, (lon_lat.y - origin_lat_) * north_scale_,
                                  0.0};
        }

        double east_scale() const { return east_scale_; }
        double north_scale() const { return north_scale_; }
    };

} // namespace geokernel

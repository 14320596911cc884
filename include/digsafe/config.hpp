#pragma once

#include <chrono>

namespace digsafe {

    /**
     * @brief Lon/lat rectangle the engine is expected to operate in
     */
    struct OperatingBounds {
        double min_lon = 12.0;
        double max_lon = 18.9;
        double min_lat = 48.5;
        double max_lat = 51.1;

        bool contains(double lon, double lat) const {
            return lon >= min_lon && lon <= max_lon && lat >= min_lat && lat <= max_lat;
        }
    };

    /**
     * @brief Tunable thresholds of the conflict engine
     *
     * Defaults match the municipal coordination deployment: a 20 m buffer around
     * each project and Czech Republic operating bounds.
     */
    struct EngineConfig {
        double proximity_threshold_m = 20.0;
        double min_line_length_m = 10.0;
        double min_polygon_area_m2 = 100.0;
        OperatingBounds operating_bounds{};
        std::chrono::milliseconds candidate_fetch_timeout{800};
        int max_moratorium_years = 5;
    };

} // namespace digsafe

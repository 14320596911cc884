#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <datapod/datapod.hpp>

#include "digsafe/config.hpp"
#include "digsafe/geometry.hpp"

namespace digsafe {

    /**
     * @brief Fatal geometry problem; the submission must be corrected before any conflict check
     */
    class ValidationError : public std::runtime_error {
        std::vector<std::string> messages_;

      public:
        explicit ValidationError(std::vector<std::string> messages);

        /// User-displayable messages, in the order they were found
        const std::vector<std::string> &messages() const { return messages_; }
    };

    /**
     * @brief Outcome of GeometryValidator::check
     */
    struct ValidationReport {
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
        std::optional<NormalizedGeometry> geometry;

        bool is_valid() const { return errors.empty() && geometry.has_value(); }
    };

    /**
     * @brief Validates and normalizes raw Point, LineString and Polygon input
     *
     * The only consumer of raw user input. Structural failures (wrong arity,
     * non-finite values, too few positions) stop the checks for that geometry;
     * closure and distinct-vertex failures accumulate. Warnings never block.
     */
    class GeometryValidator {
        EngineConfig config_;

      public:
        explicit GeometryValidator(const EngineConfig &config = EngineConfig{});

        /// Non-throwing validation
        ValidationReport check(const RawGeometry &raw) const;

        /**
         * @brief Validate and normalize
         *
         * @return Normalized geometry carrying any warnings
         * @throws ValidationError with every error message when the input is unusable
         */
        NormalizedGeometry validate(const RawGeometry &raw) const;

        const EngineConfig &config() const { return config_; }

        /// Haversine length of a lon/lat line string in metres
        static double line_length_m(const datapod::Linestring &line);

        /// Enclosed area of a lon/lat ring in square metres (equirectangular scale at its mean latitude)
        static double polygon_area_m2(const datapod::Polygon &polygon);

        /// Boost.Geometry validity check restricted to crossings and spikes
        static bool has_self_intersection(const datapod::Polygon &polygon);

      private:
        void check_point(const RawGeometry &raw, ValidationReport &report) const;
        void check_line_string(const RawGeometry &raw, ValidationReport &report) const;
        void check_polygon(const RawGeometry &raw, ValidationReport &report) const;
    };

} // namespace digsafe

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "digsafe/aggregator.hpp"
#include "digsafe/config.hpp"
#include "digsafe/municipality.hpp"
#include "digsafe/registry.hpp"
#include "digsafe/validator.hpp"

namespace digsafe {

    /**
     * @brief The conflict check could not be completed (timeout or data-source error)
     *
     * Never means "no conflicts". The caller decides whether to block the
     * submission or to continue unverified through detect_or_unverified().
     */
    class EvaluationFailure : public std::runtime_error {
      public:
        explicit EvaluationFailure(const std::string &reason)
            : std::runtime_error("conflict check incomplete: " + reason) {}
    };

    /**
     * @brief Result of a check that may have been skipped in degraded mode
     */
    struct CheckOutcome {
        std::optional<ConflictDetectionResult> result;
        bool verified = false;
        std::string disclaimer; ///< User-visible notice when verified is false
    };

    /**
     * @brief Totals over a set of evaluated requests
     */
    struct ConflictStatistics {
        int evaluated = 0;
        int with_conflicts = 0;
        int spatial_conflicts = 0;
        int temporal_conflicts = 0;
        int moratorium_violations = 0;
    };

    /**
     * @brief Narrows which requests count towards ConflictStatistics
     *
     * Unset members do not filter. The date bounds keep requests whose window
     * reaches into [start_date, end_date].
     */
    struct StatisticsFilter {
        std::vector<std::string> municipality_codes; ///< Keep requests touching any of these
        std::optional<Date> start_date;
        std::optional<Date> end_date;
    };

    /**
     * @brief Build a request from raw submission data
     *
     * @throws ValidationError if the geometry is unusable
     * @throws std::invalid_argument if a date is malformed or start is after end
     */
    ConflictDetectionRequest make_request(const GeometryValidator &validator, const RawGeometry &geometry,
                                          const std::string &start_date, const std::string &end_date,
                                          std::optional<std::string> exclude_project_id = std::nullopt);

    /**
     * @brief Runs a full conflict check against the shared data sources
     *
     * Candidate projects, moratoria and exceptions are fetched on a worker
     * thread under the configured deadline; the classification itself is done
     * by ConflictAggregator. Sources are shared with the worker so an abandoned
     * fetch cannot outlive them.
     */
    class ConflictDetector {
        std::shared_ptr<const ProjectSource> projects_;
        std::shared_ptr<const MoratoriumRegistry> moratoriums_;
        EngineConfig config_;
        ConflictAggregator aggregator_;

      public:
        ConflictDetector(std::shared_ptr<const ProjectSource> projects,
                         std::shared_ptr<const MoratoriumRegistry> moratoriums,
                         const EngineConfig &config = EngineConfig{});

        /**
         * @brief Evaluate one request, failing closed
         *
         * @throws EvaluationFailure on fetch timeout or data-source error
         */
        ConflictDetectionResult detect(const ConflictDetectionRequest &request) const;

        /**
         * @brief Evaluate one request, falling back to an unverified outcome
         *
         * The fallback is logged and carries a disclaimer for the user.
         */
        CheckOutcome detect_or_unverified(const ConflictDetectionRequest &request) const;

        /**
         * @brief Evaluate several keyed requests; failed entries are logged and left out
         */
        std::map<std::string, ConflictDetectionResult>
        detect_batch(const std::map<std::string, ConflictDetectionRequest> &requests) const;

        static ConflictStatistics summarize(const std::map<std::string, ConflictDetectionResult> &results);

        /**
         * @brief Totals over the results whose request passes @p filter
         *
         * Results are matched to requests by key; a result without a request is
         * logged and left out. Municipalities are looked up only when the
         * filter names codes.
         */
        static ConflictStatistics summarize(const std::map<std::string, ConflictDetectionRequest> &requests,
                                            const std::map<std::string, ConflictDetectionResult> &results,
                                            const StatisticsFilter &filter,
                                            const MunicipalityResolver &municipalities);

        const EngineConfig &config() const { return config_; }
    };

} // namespace digsafe

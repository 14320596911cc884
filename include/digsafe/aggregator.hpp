#pragma once

#include <vector>

#include "digsafe/config.hpp"
#include "digsafe/proximity.hpp"
#include "digsafe/types.hpp"

namespace digsafe {

    /**
     * @brief Combines spatial, temporal and moratorium signals into a classified result
     *
     * Pure and deterministic: the output depends only on the arguments, and
     * sequence order follows input order. Safe to share between threads.
     */
    class ConflictAggregator {
        EngineConfig config_;
        ProximityEngine proximity_;

      public:
        explicit ConflictAggregator(const EngineConfig &config = EngineConfig{});

        /**
         * @brief Classify one request against a candidate snapshot
         *
         * @param request Validated request geometry and window
         * @param candidates Candidate projects (over-approximation allowed, duplicates ignored)
         * @param moratoriums Moratoria to test; each must intersect and overlap to count
         * @param exceptions Recorded exceptions; an effective one for the requesting
         *        project moves its moratorium to `acknowledged_moratoriums`
         */
        ConflictDetectionResult detect(const ConflictDetectionRequest &request, const std::vector<Project> &candidates,
                                       const std::vector<Moratorium> &moratoriums,
                                       const std::vector<MoratoriumException> &exceptions = {}) const;

        const EngineConfig &config() const { return config_; }
    };

} // namespace digsafe

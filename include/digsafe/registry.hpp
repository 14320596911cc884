#pragma once

#include <map>
#include <string>
#include <vector>

#include "digsafe/proximity.hpp"
#include "digsafe/spatial_index.hpp"
#include "digsafe/types.hpp"

namespace digsafe {

    /**
     * @brief Read-only project lookup consumed by the detector
     */
    class ProjectSource {
      public:
        virtual ~ProjectSource() = default;

        /**
         * @brief Projects that may lie within @p threshold_m of @p geometry
         *
         * May over-approximate; the exact test happens in ConflictAggregator.
         * Implementations backed by a database may block or throw.
         */
        virtual std::vector<Project> find_candidates_near(const NormalizedGeometry &geometry,
                                                          double threshold_m) const = 0;
    };

    /**
     * @brief Read-only snapshot of moratoria and their recorded exceptions
     */
    class MoratoriumRegistry {
      public:
        virtual ~MoratoriumRegistry() = default;

        /// Moratoria overlapping @p window in time and intersecting @p geometry
        virtual std::vector<Moratorium> find_active_in_area(const NormalizedGeometry &geometry,
                                                            const TimeWindow &window) const = 0;

        /// Exceptions recorded for the (moratorium, project) pair, effective or not
        virtual std::vector<MoratoriumException> find_exceptions(const std::string &moratorium_id,
                                                                 const std::string &project_id) const = 0;
    };

    /**
     * @brief ProjectSource over an immutable in-memory snapshot
     *
     * Only projects in candidate states (pending_approval, approved,
     * in_progress) are returned, ordered by id.
     */
    class InMemoryProjectSource : public ProjectSource {
        std::vector<Project> projects_;
        std::map<std::string, std::size_t> by_id_;
        RTreeSpatialIndex index_;

      public:
        /// @throws std::invalid_argument on duplicate project ids
        explicit InMemoryProjectSource(std::vector<Project> projects);

        std::vector<Project> find_candidates_near(const NormalizedGeometry &geometry,
                                                  double threshold_m) const override;

        std::size_t size() const { return projects_.size(); }
    };

    /**
     * @brief MoratoriumRegistry over an immutable in-memory snapshot
     */
    class InMemoryMoratoriumRegistry : public MoratoriumRegistry {
        std::vector<Moratorium> moratoriums_;
        std::vector<MoratoriumException> exceptions_;
        std::map<std::string, std::size_t> by_id_;
        RTreeSpatialIndex index_;
        ProximityEngine proximity_;

      public:
        /// @throws std::invalid_argument on duplicate moratorium ids
        InMemoryMoratoriumRegistry(std::vector<Moratorium> moratoriums,
                                   std::vector<MoratoriumException> exceptions = {});

        std::vector<Moratorium> find_active_in_area(const NormalizedGeometry &geometry,
                                                    const TimeWindow &window) const override;

        std::vector<MoratoriumException> find_exceptions(const std::string &moratorium_id,
                                                         const std::string &project_id) const override;

        std::size_t size() const { return moratoriums_.size(); }
    };

    /**
     * @brief Check a moratorium's validity period on creation or update
     *
     * @throws std::invalid_argument if the period is longer than @p max_years years
     */
    void validate_moratorium_window(const TimeWindow &window, int max_years = 5);

} // namespace digsafe

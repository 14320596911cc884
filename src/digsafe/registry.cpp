#include "digsafe/registry.hpp"

#include <stdexcept>

#include "digsafe/temporal.hpp"

namespace digsafe {

    InMemoryProjectSource::InMemoryProjectSource(std::vector<Project> projects) : projects_(std::move(projects)) {
        for (std::size_t i = 0; i < projects_.size(); ++i) {
            if (!by_id_.emplace(projects_[i].id, i).second) {
                throw std::invalid_argument("duplicate project id in snapshot: " + projects_[i].id);
            }
            index_.insert(projects_[i].id, projects_[i].geometry.bounding_box);
        }
    }

    std::vector<Project> InMemoryProjectSource::find_candidates_near(const NormalizedGeometry &geometry,
                                                                     double threshold_m) const {
        std::vector<Project> result;
        for (const auto &id : index_.query(expand_bounding_box(geometry.bounding_box, threshold_m))) {
            const Project &project = projects_[by_id_.at(id)];
            if (is_conflict_candidate(project.state)) {
                result.push_back(project);
            }
        }
        return result;
    }

    InMemoryMoratoriumRegistry::InMemoryMoratoriumRegistry(std::vector<Moratorium> moratoriums,
                                                           std::vector<MoratoriumException> exceptions)
        : moratoriums_(std::move(moratoriums)), exceptions_(std::move(exceptions)) {
        for (std::size_t i = 0; i < moratoriums_.size(); ++i) {
            if (!by_id_.emplace(moratoriums_[i].id, i).second) {
                throw std::invalid_argument("duplicate moratorium id in snapshot: " + moratoriums_[i].id);
            }
            index_.insert(moratoriums_[i].id, moratoriums_[i].geometry.bounding_box);
        }
    }

    std::vector<Moratorium> InMemoryMoratoriumRegistry::find_active_in_area(const NormalizedGeometry &geometry,
                                                                            const TimeWindow &window) const {
        std::vector<Moratorium> result;
        for (const auto &id : index_.query(geometry.bounding_box)) {
            const Moratorium &moratorium = moratoriums_[by_id_.at(id)];
            if (!TemporalOverlapEngine::overlaps(moratorium.window, window)) {
                continue;
            }
            if (proximity_.intersects(geometry, moratorium.geometry)) {
                result.push_back(moratorium);
            }
        }
        return result;
    }

    std::vector<MoratoriumException> InMemoryMoratoriumRegistry::find_exceptions(const std::string &moratorium_id,
                                                                                 const std::string &project_id) const {
        std::vector<MoratoriumException> result;
        for (const auto &exception : exceptions_) {
            if (exception.moratorium_id == moratorium_id && exception.project_id == project_id) {
                result.push_back(exception);
            }
        }
        return result;
    }

    void validate_moratorium_window(const TimeWindow &window, int max_years) {
        if (window.start().add_years(max_years) < window.end()) {
            throw std::invalid_argument("moratorium duration cannot exceed " + std::to_string(max_years) +
                                        " years");
        }
    }

} // namespace digsafe

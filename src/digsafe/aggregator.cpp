#include "digsafe/aggregator.hpp"

#include <set>
#include <string>

#include "digsafe/temporal.hpp"

namespace digsafe {

    namespace {
        bool is_exempt(const Moratorium &moratorium, const ConflictDetectionRequest &request,
                       const std::vector<MoratoriumException> &exceptions) {
            auto subject = request.subject_project_id();
            if (!subject) {
                return false;
            }
            for (const auto &exception : exceptions) {
                if (exception.moratorium_id == moratorium.id && exception.project_id == *subject &&
                    exception.is_effective_for(request.window)) {
                    return true;
                }
            }
            return false;
        }
    } // namespace

    ConflictAggregator::ConflictAggregator(const EngineConfig &config) : config_(config) {}

    ConflictDetectionResult ConflictAggregator::detect(const ConflictDetectionRequest &request,
                                                       const std::vector<Project> &candidates,
                                                       const std::vector<Moratorium> &moratoriums,
                                                       const std::vector<MoratoriumException> &exceptions) const {
        ConflictDetectionResult result;

        std::set<std::string> seen_projects;
        for (const auto &project : candidates) {
            if (request.exclude_project_id && project.id == *request.exclude_project_id) {
                continue;
            }
            if (!seen_projects.insert(project.id).second) {
                continue;
            }
            if (!proximity_.is_proximal(request.geometry, project.geometry, config_.proximity_threshold_m)) {
                continue;
            }

            result.spatial_conflicts.push_back(project);
            if (TemporalOverlapEngine::overlaps(request.window, project.window)) {
                result.temporal_conflicts.push_back(project);
            }
        }

        std::set<std::string> seen_moratoriums;
        for (const auto &moratorium : moratoriums) {
            if (!seen_moratoriums.insert(moratorium.id).second) {
                continue;
            }
            if (!TemporalOverlapEngine::overlaps(request.window, moratorium.window)) {
                continue;
            }
            if (!proximity_.intersects(request.geometry, moratorium.geometry)) {
                continue;
            }

            if (is_exempt(moratorium, request, exceptions)) {
                result.acknowledged_moratoriums.push_back(moratorium);
            } else {
                result.moratorium_violations.push_back(moratorium);
            }
        }

        int spatial = static_cast<int>(result.spatial_conflicts.size());
        int temporal = static_cast<int>(result.temporal_conflicts.size());
        int violations = static_cast<int>(result.moratorium_violations.size());

        result.summary.critical_conflicts = temporal + violations;
        result.summary.warnings = spatial - temporal;
        result.summary.total_conflicts = spatial + violations;
        result.has_conflict = result.summary.total_conflicts > 0;
        return result;
    }

} // namespace digsafe

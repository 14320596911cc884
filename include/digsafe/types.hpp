#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "digsafe/date.hpp"
#include "digsafe/geometry.hpp"

namespace digsafe {

    enum class ProjectState {
        Draft,
        ForwardPlanning,
        PendingApproval,
        Approved,
        InProgress,
        Completed,
        Rejected,
        Cancelled,
    };

    inline const char *to_string(ProjectState state) {
        switch (state) {
        case ProjectState::Draft:
            return "draft";
        case ProjectState::ForwardPlanning:
            return "forward_planning";
        case ProjectState::PendingApproval:
            return "pending_approval";
        case ProjectState::Approved:
            return "approved";
        case ProjectState::InProgress:
            return "in_progress";
        case ProjectState::Completed:
            return "completed";
        case ProjectState::Rejected:
            return "rejected";
        case ProjectState::Cancelled:
            return "cancelled";
        }
        return "unknown";
    }

    inline ProjectState parse_project_state(const std::string &s) {
        if (s == "draft")
            return ProjectState::Draft;
        if (s == "forward_planning")
            return ProjectState::ForwardPlanning;
        if (s == "pending_approval")
            return ProjectState::PendingApproval;
        if (s == "approved")
            return ProjectState::Approved;
        if (s == "in_progress")
            return ProjectState::InProgress;
        if (s == "completed")
            return ProjectState::Completed;
        if (s == "rejected")
            return ProjectState::Rejected;
        if (s == "cancelled")
            return ProjectState::Cancelled;
        throw std::invalid_argument("Unknown project state: " + s);
    }

    /**
     * @brief Whether moving a project into @p target must pass a conflict check first
     *
     * Only submissions (draft, pending_approval) are checked; later states are
     * past the checkpoint.
     */
    inline bool requires_conflict_check(ProjectState target) {
        return target == ProjectState::Draft || target == ProjectState::PendingApproval;
    }

    /**
     * @brief Whether an existing project in @p state can conflict with a new submission
     */
    inline bool is_conflict_candidate(ProjectState state) {
        return state == ProjectState::PendingApproval || state == ProjectState::Approved ||
               state == ProjectState::InProgress;
    }

    /**
     * @brief Excavation project as stored by the project registry (read-only here)
     */
    struct Project {
        std::string id;
        std::string name;
        NormalizedGeometry geometry;
        TimeWindow window;
        ProjectState state = ProjectState::Draft;
        std::string work_category;
        std::string work_type;
    };

    /**
     * @brief No-dig zone with a validity period
     */
    struct Moratorium {
        std::string id;
        std::string name;
        NormalizedGeometry geometry;
        TimeWindow window; ///< validFrom .. validTo
        std::string reason;
        std::optional<std::string> reason_detail;
        std::optional<std::string> exceptions; ///< Free-text exception conditions
        std::string municipality_code;
    };

    /**
     * @brief Coordinator override letting one project proceed inside a moratorium
     */
    struct MoratoriumException {
        std::string moratorium_id;
        std::string project_id;
        std::string approver_id;
        std::string justification;
        std::optional<Date> valid_until;
        bool revoked = false;

        /// Exception covers the whole of @p window and has not been withdrawn
        bool is_effective_for(const TimeWindow &window) const {
            if (revoked)
                return false;
            return !valid_until || *valid_until >= window.end();
        }
    };

    struct ConflictDetectionRequest {
        NormalizedGeometry geometry;
        TimeWindow window;
        std::optional<std::string> exclude_project_id;
        std::optional<std::string> project_id;

        /// Project whose moratorium exceptions apply; falls back to the excluded (self) id
        std::optional<std::string> subject_project_id() const {
            return project_id ? project_id : exclude_project_id;
        }
    };

    struct ConflictSummary {
        int total_conflicts = 0;
        int critical_conflicts = 0;
        int warnings = 0;
    };

    /**
     * @brief Classified outcome of one conflict evaluation
     *
     * Built once per request and returned by value; every count in `summary` is
     * derived from the sequences.
     */
    struct ConflictDetectionResult {
        bool has_conflict = false;
        std::vector<Project> spatial_conflicts;
        std::vector<Project> temporal_conflicts;
        std::vector<Moratorium> moratorium_violations;
        std::vector<Moratorium> acknowledged_moratoriums;
        ConflictSummary summary;
    };

} // namespace digsafe

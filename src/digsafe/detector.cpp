#include "digsafe/detector.hpp"

#include <algorithm>
#include <future>
#include <iostream>
#include <thread>
#include <vector>

namespace digsafe {

    namespace {
        struct Snapshot {
            std::vector<Project> projects;
            std::vector<Moratorium> moratoriums;
            std::vector<MoratoriumException> exceptions;
        };

        Snapshot fetch_snapshot(const ProjectSource &projects, const MoratoriumRegistry &registry,
                                const ConflictDetectionRequest &request, double threshold_m) {
            Snapshot snapshot;
            snapshot.projects = projects.find_candidates_near(request.geometry, threshold_m);
            snapshot.moratoriums = registry.find_active_in_area(request.geometry, request.window);

            auto subject = request.subject_project_id();
            if (!subject) {
                return snapshot;
            }

            for (const auto &moratorium : snapshot.moratoriums) {
                try {
                    auto found = registry.find_exceptions(moratorium.id, *subject);
                    snapshot.exceptions.insert(snapshot.exceptions.end(), found.begin(), found.end());
                } catch (const std::exception &e) {
                    std::cerr << "Warning: exception lookup failed for moratorium " << moratorium.id << ": "
                              << e.what() << " (reporting the violation)" << std::endl;
                }
            }
            return snapshot;
        }
    } // namespace

    ConflictDetectionRequest make_request(const GeometryValidator &validator, const RawGeometry &geometry,
                                          const std::string &start_date, const std::string &end_date,
                                          std::optional<std::string> exclude_project_id) {
        NormalizedGeometry normalized = validator.validate(geometry);
        TimeWindow window = TimeWindow::parse(start_date, end_date);
        return ConflictDetectionRequest{std::move(normalized), window, std::move(exclude_project_id), std::nullopt};
    }

    ConflictDetector::ConflictDetector(std::shared_ptr<const ProjectSource> projects,
                                       std::shared_ptr<const MoratoriumRegistry> moratoriums,
                                       const EngineConfig &config)
        : projects_(std::move(projects)), moratoriums_(std::move(moratoriums)), config_(config),
          aggregator_(config) {
        if (!projects_ || !moratoriums_) {
            throw std::invalid_argument("ConflictDetector requires a project source and a moratorium registry");
        }
    }

    ConflictDetectionResult ConflictDetector::detect(const ConflictDetectionRequest &request) const {
        auto projects = projects_;
        auto registry = moratoriums_;
        double threshold = config_.proximity_threshold_m;

        auto task = std::make_shared<std::packaged_task<Snapshot()>>(
            [projects, registry, request, threshold]() {
                return fetch_snapshot(*projects, *registry, request, threshold);
            });
        std::future<Snapshot> pending = task->get_future();
        std::thread([task]() { (*task)(); }).detach();

        if (pending.wait_for(config_.candidate_fetch_timeout) != std::future_status::ready) {
            throw EvaluationFailure("candidate fetch exceeded " +
                                    std::to_string(config_.candidate_fetch_timeout.count()) + " ms");
        }

        Snapshot snapshot;
        try {
            snapshot = pending.get();
        } catch (const std::exception &e) {
            throw EvaluationFailure(std::string("data source error: ") + e.what());
        } catch (...) {
            throw EvaluationFailure("data source error: unknown");
        }

        return aggregator_.detect(request, snapshot.projects, snapshot.moratoriums, snapshot.exceptions);
    }

    CheckOutcome ConflictDetector::detect_or_unverified(const ConflictDetectionRequest &request) const {
        CheckOutcome outcome;
        try {
            outcome.result = detect(request);
            outcome.verified = true;
        } catch (const EvaluationFailure &e) {
            std::cerr << "Warning: continuing without conflict verification: " << e.what() << std::endl;
            outcome.verified = false;
            outcome.disclaimer = "Conflict check could not be completed. The submission was accepted without "
                                 "verifying conflicts with other projects or moratoria.";
        }
        return outcome;
    }

    std::map<std::string, ConflictDetectionResult>
    ConflictDetector::detect_batch(const std::map<std::string, ConflictDetectionRequest> &requests) const {
        std::map<std::string, ConflictDetectionResult> results;
        for (const auto &[key, request] : requests) {
            try {
                results.emplace(key, detect(request));
            } catch (const EvaluationFailure &e) {
                std::cerr << "Error: conflict check for " << key << " failed: " << e.what() << std::endl;
            }
        }
        return results;
    }

    ConflictStatistics ConflictDetector::summarize(const std::map<std::string, ConflictDetectionResult> &results) {
        ConflictStatistics stats;
        for (const auto &entry : results) {
            const ConflictDetectionResult &result = entry.second;
            ++stats.evaluated;
            if (result.has_conflict)
                ++stats.with_conflicts;
            stats.spatial_conflicts += static_cast<int>(result.spatial_conflicts.size());
            stats.temporal_conflicts += static_cast<int>(result.temporal_conflicts.size());
            stats.moratorium_violations += static_cast<int>(result.moratorium_violations.size());
        }
        return stats;
    }

    ConflictStatistics ConflictDetector::summarize(const std::map<std::string, ConflictDetectionRequest> &requests,
                                                   const std::map<std::string, ConflictDetectionResult> &results,
                                                   const StatisticsFilter &filter,
                                                   const MunicipalityResolver &municipalities) {
        std::map<std::string, ConflictDetectionResult> selected;
        for (const auto &[key, result] : results) {
            auto it = requests.find(key);
            if (it == requests.end()) {
                std::cerr << "Warning: no request for result " << key << ", left out of statistics" << std::endl;
                continue;
            }
            const ConflictDetectionRequest &request = it->second;

            if (filter.start_date && request.window.end() < *filter.start_date)
                continue;
            if (filter.end_date && request.window.start() > *filter.end_date)
                continue;

            if (!filter.municipality_codes.empty()) {
                auto codes = municipalities.resolve(request.geometry);
                bool shared = std::any_of(codes.begin(), codes.end(), [&filter](const std::string &code) {
                    return std::find(filter.municipality_codes.begin(), filter.municipality_codes.end(), code) !=
                           filter.municipality_codes.end();
                });
                if (!shared)
                    continue;
            }
            selected.emplace(key, result);
        }
        return summarize(selected);
    }

} // namespace digsafe

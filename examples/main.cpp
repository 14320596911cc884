#include <iostream>
#include <memory>
#include <optional>

#include "digsafe/digsafe.hpp"

int main() {
    digsafe::EngineConfig config;
    digsafe::GeometryValidator validator(config);

    // Existing projects in the registry snapshot
    std::vector<digsafe::Project> projects;
    projects.push_back(digsafe::Project{
        "P-2024-0117", "Water main replacement, Vodickova",
        validator.validate(digsafe::RawGeometry::line_string({{14.4378, 50.0755}, {14.4380, 50.0757}})),
        digsafe::TimeWindow::parse("2024-03-20", "2024-04-05"), digsafe::ProjectState::Approved, "water",
        "replacement"});
    projects.push_back(digsafe::Project{
        "P-2024-0142", "Fibre duct, Jungmannova",
        validator.validate(digsafe::RawGeometry::line_string({{14.4379, 50.0754}, {14.4384, 50.0751}})),
        digsafe::TimeWindow::parse("2024-05-02", "2024-05-20"), digsafe::ProjectState::PendingApproval, "telecom",
        "new build"});

    // Old town resurfaced last year; no digging for the rest of 2024
    digsafe::TimeWindow moratorium_window = digsafe::TimeWindow::parse("2024-01-01", "2024-12-31");
    digsafe::validate_moratorium_window(moratorium_window, config.max_moratorium_years);

    std::vector<digsafe::Moratorium> moratoriums;
    moratoriums.push_back(digsafe::Moratorium{
        "M-0007", "Old town resurfacing",
        validator.validate(digsafe::RawGeometry::polygon(
            {{{14.430, 50.070}, {14.445, 50.070}, {14.445, 50.080}, {14.430, 50.080}, {14.430, 50.070}}})),
        moratorium_window, "new surface", std::string("Asphalt laid in autumn 2023"), std::nullopt, "554782"});

    auto project_source = std::make_shared<digsafe::InMemoryProjectSource>(projects);
    auto moratorium_registry = std::make_shared<digsafe::InMemoryMoratoriumRegistry>(moratoriums);
    digsafe::ConflictDetector detector(project_source, moratorium_registry, config);

    digsafe::MunicipalityResolver municipalities;
    municipalities.add("554782", validator.validate(digsafe::RawGeometry::polygon({{{14.22, 49.94},
                                                                                    {14.71, 49.94},
                                                                                    {14.71, 50.18},
                                                                                    {14.22, 50.18},
                                                                                    {14.22, 49.94}}})));

    // New submission to check
    digsafe::RawGeometry submitted =
        digsafe::RawGeometry::line_string({{14.4377, 50.0756}, {14.4377, 50.0756}, {14.4381, 50.0758}});

    std::optional<digsafe::ConflictDetectionRequest> request;
    try {
        request = digsafe::make_request(validator, submitted, "2024-03-15", "2024-03-25");
    } catch (const digsafe::ValidationError &e) {
        std::cerr << "Error: submission rejected" << std::endl;
        for (const auto &msg : e.messages()) {
            std::cerr << "  - " << msg << std::endl;
        }
        return 1;
    }

    for (const auto &warning : request->geometry.warnings) {
        std::cout << "Validation warning: " << warning << std::endl;
    }

    std::cout << "Municipalities:";
    for (const auto &code : municipalities.resolve(request->geometry)) {
        std::cout << " " << code;
    }
    std::cout << std::endl;

    digsafe::CheckOutcome outcome = detector.detect_or_unverified(*request);
    if (!outcome.verified) {
        std::cout << outcome.disclaimer << std::endl;
        return 0;
    }

    const digsafe::ConflictDetectionResult &result = *outcome.result;
    std::cout << digsafe::to_json(result) << std::endl;

    std::cout << "\nSummary:" << std::endl;
    std::cout << "  Critical conflicts: " << result.summary.critical_conflicts << std::endl;
    std::cout << "  Warnings: " << result.summary.warnings << std::endl;
    std::cout << "  Moratorium violations: " << result.moratorium_violations.size() << std::endl;

    return 0;
}

/**
 * @file Project.hpp
 * @brief Aggregate describing one study-design request and everything computed for it.
 */

#pragma once
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "DesignResult.hpp"
#include "DrugParameter.hpp"
#include "ProjectStatus.hpp"
#include "RegulatoryVerdict.hpp"

namespace beplanner::domain {

/**
 * @struct DrugIdentifier
 * @brief Identifies the investigated product.
 */
struct DrugIdentifier {
    std::string inn;      ///< International nonproprietary name (English).
    std::string innLocal; ///< Optional localized name.
    std::string dosage;   ///< e.g. "400 mg".
    std::string form;     ///< e.g. "tablets".
};

/**
 * @struct SearchSummary
 * @brief Bookkeeping of the search stage.
 */
struct SearchSummary {
    int documentsProcessed = 0;
    std::map<std::string, int> parametersFound; ///< Kind label -> accepted values.
    int parametersRejected = 0;                 ///< Implausible candidates dropped.
};

/**
 * @struct ReportArtifact
 * @brief Reference to a rendered study synopsis.
 */
struct ReportArtifact {
    std::string path;
    std::string format;
    std::chrono::system_clock::time_point renderedAt;
};

/**
 * @struct Project
 * @brief Snapshot of a project as read from the store.
 *
 * Values are copies: mutating a Project has no effect until a StageCommit carrying the
 * change is accepted by the ProjectRepository.
 */
struct Project {
    std::string id;
    DrugIdentifier drug;
    ProjectStatus status = ProjectStatus::Searching;
    std::chrono::system_clock::time_point createdAt;
    std::chrono::system_clock::time_point updatedAt;
    int attempt = 1;
    std::string message; ///< Message of the latest stage commit (error text for failures).

    std::vector<DrugParameter> parameters;
    std::optional<SearchSummary> searchSummary;
    std::optional<DesignResult> design;
    std::optional<RegulatoryVerdict> verdict;
    std::optional<ReportArtifact> report;
};

} // namespace beplanner::domain

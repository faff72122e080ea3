/**
 * @file ProjectStatus.hpp
 * @brief Value Object defining the lifecycle states of a study-design project.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace beplanner::domain {

/**
 * @enum ProjectStatus
 * @brief Closed set of pipeline states. Transitions are restricted by CanTransition().
 */
enum class ProjectStatus {
    Searching,             ///< Literature search and extraction running.
    SearchingCompleted,    ///< Parameters extracted and stored.
    DesignCompleted,       ///< Design computed and stored.
    Completed,             ///< Regulatory verdict stored; report may be generated.
    SearchFailed,          ///< Search or extraction failed for this attempt.
    DesignFailed,          ///< Design computation failed for this attempt.
    RegulatoryCheckFailed, ///< Rule evaluation could not be run for this attempt.
    Failed                 ///< Uncategorized fault.
};

/**
 * @brief Helper to convert status to its persisted/display string.
 */
inline std::string StatusToString(ProjectStatus status) {
    switch (status) {
        case ProjectStatus::Searching: return "searching";
        case ProjectStatus::SearchingCompleted: return "searching_completed";
        case ProjectStatus::DesignCompleted: return "design_completed";
        case ProjectStatus::Completed: return "completed";
        case ProjectStatus::SearchFailed: return "search_failed";
        case ProjectStatus::DesignFailed: return "design_failed";
        case ProjectStatus::RegulatoryCheckFailed: return "regulatory_check_failed";
        case ProjectStatus::Failed: return "failed";
    }
    return "unknown";
}

inline std::optional<ProjectStatus> StatusFromString(const std::string& value) {
    static const ProjectStatus all[] = {
        ProjectStatus::Searching, ProjectStatus::SearchingCompleted, ProjectStatus::DesignCompleted,
        ProjectStatus::Completed, ProjectStatus::SearchFailed, ProjectStatus::DesignFailed,
        ProjectStatus::RegulatoryCheckFailed, ProjectStatus::Failed
    };
    for (ProjectStatus s : all) {
        if (StatusToString(s) == value) return s;
    }
    return std::nullopt;
}

/**
 * @brief True for states in which no run is in progress.
 */
inline bool IsTerminal(ProjectStatus status) {
    switch (status) {
        case ProjectStatus::Completed:
        case ProjectStatus::SearchFailed:
        case ProjectStatus::DesignFailed:
        case ProjectStatus::RegulatoryCheckFailed:
        case ProjectStatus::Failed:
            return true;
        default:
            return false;
    }
}

inline bool IsFailure(ProjectStatus status) {
    return IsTerminal(status) && status != ProjectStatus::Completed;
}

/**
 * @brief The exhaustive transition table.
 * @return States reachable from @p from in a single commit.
 */
inline std::vector<ProjectStatus> AllowedTransitions(ProjectStatus from) {
    switch (from) {
        case ProjectStatus::Searching:
            return {ProjectStatus::SearchingCompleted, ProjectStatus::SearchFailed, ProjectStatus::Failed};
        case ProjectStatus::SearchingCompleted:
            return {ProjectStatus::DesignCompleted, ProjectStatus::DesignFailed, ProjectStatus::Failed};
        case ProjectStatus::DesignCompleted:
            return {ProjectStatus::Completed, ProjectStatus::RegulatoryCheckFailed, ProjectStatus::Failed};
        case ProjectStatus::SearchFailed:
        case ProjectStatus::DesignFailed:
        case ProjectStatus::RegulatoryCheckFailed:
        case ProjectStatus::Failed:
            // Only a new attempt may leave a failure state.
            return {ProjectStatus::Searching};
        case ProjectStatus::Completed:
            return {};
    }
    return {};
}

inline bool CanTransition(ProjectStatus from, ProjectStatus to) {
    for (ProjectStatus allowed : AllowedTransitions(from)) {
        if (allowed == to) return true;
    }
    return false;
}

} // namespace beplanner::domain

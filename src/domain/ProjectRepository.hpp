/**
 * @file ProjectRepository.hpp
 * @brief Interface for durable storage of projects.
 */

#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "DesignErrors.hpp"
#include "Project.hpp"

namespace beplanner::domain {

/**
 * @struct StageCommit
 * @brief Everything one pipeline stage writes, applied as a single atomic update.
 *
 * The commit is accepted only if the stored status still equals @c expectedStatus and
 * the move to @c newStatus is in the transition table. Unset optionals leave the
 * corresponding stored field untouched.
 */
struct StageCommit {
    ProjectStatus expectedStatus = ProjectStatus::Searching;
    ProjectStatus newStatus = ProjectStatus::Searching;
    std::string message;
    bool startsNewAttempt = false;

    std::optional<std::vector<DrugParameter>> parameters;
    std::optional<SearchSummary> searchSummary;
    std::optional<DesignResult> design;
    std::optional<RegulatoryVerdict> verdict;
};

/**
 * @brief Validates @p commit against @p project and applies it in place.
 *
 * Shared by every repository implementation so that the status contract is enforced
 * identically regardless of the backing store.
 * @throws InvalidStatusTransition if the stored status differs from the expected one,
 *         the transition is not in the table, or a move to @c searching is not flagged
 *         as a new attempt.
 */
inline void ApplyStageCommit(Project& project, const StageCommit& commit,
                             std::chrono::system_clock::time_point now) {
    if (project.status != commit.expectedStatus) {
        throw InvalidStatusTransition("project " + project.id + " is " + StatusToString(project.status) +
                                      ", expected " + StatusToString(commit.expectedStatus));
    }
    if (!CanTransition(project.status, commit.newStatus)) {
        throw InvalidStatusTransition("transition " + StatusToString(project.status) + " -> " +
                                      StatusToString(commit.newStatus) + " is not allowed");
    }
    if ((commit.newStatus == ProjectStatus::Searching) != commit.startsNewAttempt) {
        throw InvalidStatusTransition("only a new attempt may re-enter " + StatusToString(ProjectStatus::Searching));
    }

    if (commit.startsNewAttempt) ++project.attempt;
    if (commit.parameters) project.parameters = *commit.parameters;
    if (commit.searchSummary) project.searchSummary = *commit.searchSummary;
    if (commit.design) project.design = *commit.design;
    if (commit.verdict) project.verdict = *commit.verdict;
    project.status = commit.newStatus;
    project.message = commit.message;
    project.updatedAt = now;
}

/**
 * @class ProjectRepository
 * @brief Abstract persistence boundary used by the pipeline.
 *
 * Implementations throw ProjectStoreError when the backing store fails and
 * InvalidStatusTransition when a commit violates the status contract.
 */
class ProjectRepository {
public:
    virtual ~ProjectRepository() = default;

    /** @brief Persists a brand-new project. Its id must not exist yet. */
    virtual void create(const Project& project) = 0;

    /** @brief Loads a project by id. */
    virtual std::optional<Project> findById(const std::string& id) = 0;

    /**
     * @brief Atomically applies a stage's results and its status change.
     * @return The project as stored after the commit.
     */
    virtual Project commitStage(const std::string& id, const StageCommit& commit) = 0;

    /** @brief Records a rendered report. Never changes the status. */
    virtual void attachReport(const std::string& id, const ReportArtifact& artifact) = 0;

    /** @brief Lists stored project ids. */
    virtual std::vector<std::string> listIds() = 0;
};

} // namespace beplanner::domain

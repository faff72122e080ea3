/**
 * @file InMemoryProjectRepository.hpp
 * @brief Volatile ProjectRepository for tests and ephemeral runs.
 */

#pragma once

#include <map>
#include <mutex>

#include "domain/ProjectRepository.hpp"

namespace beplanner::infrastructure {

class InMemoryProjectRepository : public domain::ProjectRepository {
public:
    void create(const domain::Project& project) override;
    std::optional<domain::Project> findById(const std::string& id) override;
    domain::Project commitStage(const std::string& id, const domain::StageCommit& commit) override;
    void attachReport(const std::string& id, const domain::ReportArtifact& artifact) override;
    std::vector<std::string> listIds() override;

    /** @brief Number of accepted commits, across all projects. */
    size_t commitCount() const;

private:
    mutable std::mutex m_mutex;
    std::map<std::string, domain::Project> m_projects;
    size_t m_commits = 0;
};

} // namespace beplanner::infrastructure

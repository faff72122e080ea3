#include "infrastructure/InMemoryProjectRepository.hpp"
#include "domain/DesignErrors.hpp"

#include <chrono>

namespace beplanner::infrastructure {

void InMemoryProjectRepository::create(const domain::Project& project) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_projects.emplace(project.id, project).second) {
        throw domain::ProjectStoreError("project already exists: " + project.id);
    }
}

std::optional<domain::Project> InMemoryProjectRepository::findById(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_projects.find(id);
    if (it == m_projects.end()) return std::nullopt;
    return it->second;
}

domain::Project InMemoryProjectRepository::commitStage(const std::string& id, const domain::StageCommit& commit) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_projects.find(id);
    if (it == m_projects.end()) {
        throw domain::ProjectStoreError("project not found: " + id);
    }
    // Apply to a copy so a rejected commit leaves the stored project untouched.
    domain::Project updated = it->second;
    domain::ApplyStageCommit(updated, commit, std::chrono::system_clock::now());
    it->second = updated;
    ++m_commits;
    return updated;
}

void InMemoryProjectRepository::attachReport(const std::string& id, const domain::ReportArtifact& artifact) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_projects.find(id);
    if (it == m_projects.end()) {
        throw domain::ProjectStoreError("project not found: " + id);
    }
    it->second.report = artifact;
}

std::vector<std::string> InMemoryProjectRepository::listIds() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> ids;
    ids.reserve(m_projects.size());
    for (const auto& entry : m_projects) ids.push_back(entry.first);
    return ids;
}

size_t InMemoryProjectRepository::commitCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_commits;
}

} // namespace beplanner::infrastructure

/**
 * @file JsonProjectRepository.hpp
 * @brief File-system implementation of ProjectRepository (one JSON document per project).
 */

#pragma once

#include <filesystem>
#include <memory>
#include <mutex>

#include "domain/ProjectRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace beplanner::infrastructure {

/**
 * @class JsonProjectRepository
 * @brief Stores projects as @c <dataDir>/projects/<id>.json.
 *
 * Every mutation is a read-modify-write under one mutex, persisted with an atomic
 * temp-file rename. I/O and decoding failures surface as ProjectStoreError.
 */
class JsonProjectRepository : public domain::ProjectRepository {
public:
    JsonProjectRepository(const std::filesystem::path& dataDir,
                          std::shared_ptr<PersistenceService> persistence);

    void create(const domain::Project& project) override;
    std::optional<domain::Project> findById(const std::string& id) override;
    domain::Project commitStage(const std::string& id, const domain::StageCommit& commit) override;
    void attachReport(const std::string& id, const domain::ReportArtifact& artifact) override;
    std::vector<std::string> listIds() override;

    std::filesystem::path projectsDir() const { return m_projectsDir; }

private:
    std::filesystem::path pathFor(const std::string& id) const;
    std::optional<domain::Project> load(const std::string& id) const;
    void store(const domain::Project& project);

    std::filesystem::path m_projectsDir;
    std::shared_ptr<PersistenceService> m_persistence;
    std::mutex m_mutex;
};

} // namespace beplanner::infrastructure

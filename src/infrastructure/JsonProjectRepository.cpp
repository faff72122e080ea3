/**
 * @file JsonProjectRepository.cpp
 * @brief Implementation of JsonProjectRepository.
 */

#include "infrastructure/JsonProjectRepository.hpp"
#include "infrastructure/ProjectJson.hpp"
#include "domain/DesignErrors.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <nlohmann/json.hpp>

namespace beplanner::infrastructure {

namespace fs = std::filesystem;

namespace {

// Ids become file names; anything outside [A-Za-z0-9-] is refused.
bool IsSafeId(const std::string& id) {
    if (id.empty() || id.size() > 64) return false;
    return std::all_of(id.begin(), id.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-';
    });
}

} // namespace

JsonProjectRepository::JsonProjectRepository(const fs::path& dataDir,
                                             std::shared_ptr<PersistenceService> persistence)
    : m_projectsDir(dataDir / "projects")
    , m_persistence(std::move(persistence)) {
    std::error_code ec;
    fs::create_directories(m_projectsDir, ec);
    if (ec) {
        throw domain::ProjectStoreError("cannot create " + m_projectsDir.string() + ": " + ec.message());
    }
}

fs::path JsonProjectRepository::pathFor(const std::string& id) const {
    return m_projectsDir / (id + ".json");
}

std::optional<domain::Project> JsonProjectRepository::load(const std::string& id) const {
    if (!IsSafeId(id)) return std::nullopt;
    try {
        auto text = m_persistence->readText(pathFor(id));
        if (!text) return std::nullopt;
        return ProjectFromJson(nlohmann::json::parse(*text));
    } catch (const std::exception& e) {
        std::cerr << "[JsonProjectRepository] Cannot load project " << id << ": " << e.what() << std::endl;
        throw domain::ProjectStoreError("cannot load project " + id + ": " + e.what());
    }
}

void JsonProjectRepository::store(const domain::Project& project) {
    try {
        m_persistence->writeTextAtomic(pathFor(project.id), ProjectToJson(project).dump(2));
    } catch (const std::exception& e) {
        std::cerr << "[JsonProjectRepository] Cannot store project " << project.id << ": " << e.what() << std::endl;
        throw domain::ProjectStoreError("cannot store project " + project.id + ": " + e.what());
    }
}

void JsonProjectRepository::create(const domain::Project& project) {
    if (!IsSafeId(project.id)) {
        throw domain::ProjectStoreError("invalid project id: " + project.id);
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    if (load(project.id)) {
        throw domain::ProjectStoreError("project already exists: " + project.id);
    }
    store(project);
}

std::optional<domain::Project> JsonProjectRepository::findById(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return load(id);
}

domain::Project JsonProjectRepository::commitStage(const std::string& id, const domain::StageCommit& commit) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto project = load(id);
    if (!project) {
        throw domain::ProjectStoreError("project not found: " + id);
    }
    domain::ApplyStageCommit(*project, commit, std::chrono::system_clock::now());
    store(*project);
    return *project;
}

void JsonProjectRepository::attachReport(const std::string& id, const domain::ReportArtifact& artifact) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto project = load(id);
    if (!project) {
        throw domain::ProjectStoreError("project not found: " + id);
    }
    project->report = artifact;
    store(*project);
}

std::vector<std::string> JsonProjectRepository::listIds() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> ids;
    std::error_code ec;
    for (fs::directory_iterator it(m_projectsDir, ec), end; !ec && it != end; it.increment(ec)) {
        const fs::path& p = it->path();
        if (p.extension() == ".json" && IsSafeId(p.stem().string())) {
            ids.push_back(p.stem().string());
        }
    }
    if (ec) {
        throw domain::ProjectStoreError("cannot list " + m_projectsDir.string() + ": " + ec.message());
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace beplanner::infrastructure

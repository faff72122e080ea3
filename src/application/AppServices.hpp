/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/AsyncTaskManager.hpp"
#include "application/StudyPipelineService.hpp"
#include "domain/ProjectRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace beplanner::application {

struct AppServices {
    std::shared_ptr<infrastructure::PersistenceService> persistenceService;
    std::shared_ptr<domain::ProjectRepository> projectRepository;
    std::shared_ptr<AsyncTaskManager> taskManager;
    std::unique_ptr<StudyPipelineService> pipelineService;
};

} // namespace beplanner::application

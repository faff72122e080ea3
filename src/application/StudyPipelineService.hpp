/**
 * @file StudyPipelineService.hpp
 * @brief Orchestrates the search, design and regulatory stages of a study-design project.
 */

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

#include "application/AsyncTaskManager.hpp"
#include "domain/DesignPolicy.hpp"
#include "domain/LiteratureSearchService.hpp"
#include "domain/ParameterExtractionService.hpp"
#include "domain/Project.hpp"
#include "domain/ProjectRepository.hpp"
#include "domain/ReportRenderer.hpp"
#include "domain/services/DesignCalculator.hpp"
#include "domain/services/RegulatoryRuleEvaluator.hpp"

namespace beplanner::application {

/**
 * @struct PipelineOptions
 * @brief Attrition assumptions applied to every design computed by the pipeline.
 */
struct PipelineOptions {
    double dropoutRatePercent = 0.0;
    double screenFailRatePercent = 0.0;
};

/**
 * @class StudyPipelineService
 * @brief Application service owning the lifecycle of every Project.
 *
 * Runs execute on the AsyncTaskManager. Each stage ends with exactly one StageCommit;
 * failures inside a stage are converted to that stage's failure status and never discard
 * what earlier stages committed. At most one run per project id is active at any time.
 */
class StudyPipelineService {
public:
    StudyPipelineService(std::shared_ptr<domain::ProjectRepository> repository,
                         std::shared_ptr<domain::LiteratureSearchService> searchService,
                         std::shared_ptr<domain::ParameterExtractionService> extractionService,
                         std::shared_ptr<domain::ReportRenderer> reportRenderer,
                         std::shared_ptr<AsyncTaskManager> taskManager,
                         domain::DesignPolicy policy = domain::DesignPolicy::Default(),
                         PipelineOptions options = {});

    /**
     * @brief Creates a project in @c searching and schedules its first run.
     * @return The new project id. Returns before any stage has executed.
     * @throws ProjectStoreError if the project cannot be created.
     */
    std::string startPipeline(const domain::DrugIdentifier& drug);

    std::optional<domain::Project> getProject(const std::string& id);

    /**
     * @brief Renders the synopsis of a completed project and records it on the project.
     * @throws ReportNotAvailable if the project is unknown or not @c completed.
     * @throws CollaboratorUnavailable if rendering fails. The status is left untouched.
     */
    domain::ReportArtifact generateReport(const std::string& id);

    /**
     * @brief Starts a new attempt for a project in a failure state.
     * @return False when the project is unknown, has an active run or is not in a failure state.
     */
    bool retryPipeline(const std::string& id);

    /**
     * @brief True while a run of this process owns the project.
     *
     * A project with no active run and a non-terminal status was abandoned, e.g. after a
     * store error escaped the run.
     */
    bool hasActiveRun(const std::string& id);

    /** @brief Blocks until every scheduled run has finished. */
    void waitForIdle();

    /**
     * @brief Marks stored projects left in a non-terminal status by a previous process as @c failed.
     * @return Number of projects recovered.
     */
    int recoverInterruptedRuns();

    const domain::DesignPolicy& policy() const { return m_calculator.policy(); }

private:
    bool tryAcquireRun(const std::string& id);
    void releaseRun(const std::string& id);
    void schedule(const std::string& id, const domain::DrugIdentifier& drug);

    void runPipeline(const std::string& id, const domain::DrugIdentifier& drug);
    std::optional<domain::Project> runSearchStage(const std::string& id, const domain::DrugIdentifier& drug);
    std::optional<domain::Project> runDesignStage(const domain::Project& project);
    void runRegulatoryStage(const domain::Project& project);

    domain::Project commitFailure(const std::string& id, domain::ProjectStatus expected,
                                  domain::ProjectStatus failure, const std::string& message);

    std::shared_ptr<domain::ProjectRepository> m_repository;
    std::shared_ptr<domain::LiteratureSearchService> m_searchService;
    std::shared_ptr<domain::ParameterExtractionService> m_extractionService;
    std::shared_ptr<domain::ReportRenderer> m_reportRenderer;
    std::shared_ptr<AsyncTaskManager> m_taskManager;

    domain::services::DesignCalculator m_calculator;
    domain::services::RegulatoryRuleEvaluator m_evaluator;
    PipelineOptions m_options;

    std::mutex m_runsMutex;
    std::set<std::string> m_activeRuns;
};

} // namespace beplanner::application

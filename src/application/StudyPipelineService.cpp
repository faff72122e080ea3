/**
 * @file StudyPipelineService.cpp
 * @brief Implementation of StudyPipelineService.
 */

#include "application/StudyPipelineService.hpp"
#include "domain/DesignErrors.hpp"

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>

namespace beplanner::application {

using domain::ProjectStatus;

namespace {

// Random UUIDv4 text.
std::string generateUUID() {
    static std::mutex mutex;
    static std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dist;

    uint64_t hi = 0;
    uint64_t lo = 0;
    {
        std::lock_guard<std::mutex> lock(mutex);
        hi = dist(engine);
        lo = dist(engine);
    }
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL; // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL; // RFC 4122 variant

    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(8) << (hi >> 32) << '-'
        << std::setw(4) << ((hi >> 16) & 0xFFFF) << '-'
        << std::setw(4) << (hi & 0xFFFF) << '-'
        << std::setw(4) << (lo >> 48) << '-'
        << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
    return oss.str();
}

std::string describe(const domain::DrugIdentifier& drug) {
    std::string text = drug.inn;
    if (!drug.dosage.empty()) text += " " + drug.dosage;
    if (!drug.form.empty()) text += " " + drug.form;
    return text;
}

} // namespace

StudyPipelineService::StudyPipelineService(std::shared_ptr<domain::ProjectRepository> repository,
                                           std::shared_ptr<domain::LiteratureSearchService> searchService,
                                           std::shared_ptr<domain::ParameterExtractionService> extractionService,
                                           std::shared_ptr<domain::ReportRenderer> reportRenderer,
                                           std::shared_ptr<AsyncTaskManager> taskManager,
                                           domain::DesignPolicy policy,
                                           PipelineOptions options)
    : m_repository(std::move(repository))
    , m_searchService(std::move(searchService))
    , m_extractionService(std::move(extractionService))
    , m_reportRenderer(std::move(reportRenderer))
    , m_taskManager(std::move(taskManager))
    , m_calculator(policy)
    , m_evaluator(policy)
    , m_options(options) {}

std::string StudyPipelineService::startPipeline(const domain::DrugIdentifier& drug) {
    domain::Project project;
    project.id = generateUUID();
    project.drug = drug;
    project.status = ProjectStatus::Searching;
    project.createdAt = std::chrono::system_clock::now();
    project.updatedAt = project.createdAt;
    project.attempt = 1;
    project.message = "Pipeline started";

    if (!tryAcquireRun(project.id)) {
        throw std::logic_error("Duplicate project id: " + project.id);
    }
    try {
        m_repository->create(project);
    } catch (const std::exception&) {
        releaseRun(project.id);
        throw;
    }
    std::cout << "[StudyPipelineService] [" << project.id << "] Created project for "
              << describe(drug) << std::endl;

    schedule(project.id, drug);
    return project.id;
}

std::optional<domain::Project> StudyPipelineService::getProject(const std::string& id) {
    return m_repository->findById(id);
}

domain::ReportArtifact StudyPipelineService::generateReport(const std::string& id) {
    auto project = m_repository->findById(id);
    if (!project) {
        throw domain::ReportNotAvailable("Project not found: " + id);
    }
    if (project->status != ProjectStatus::Completed || !project->design || !project->verdict) {
        throw domain::ReportNotAvailable("Project " + id + " is " + domain::StatusToString(project->status) +
                                         "; a report requires a completed project");
    }

    std::cout << "[StudyPipelineService] [" << id << "] Rendering report..." << std::endl;
    domain::ReportArtifact artifact = m_reportRenderer->render(id, *project->design, *project->verdict, project->drug);
    m_repository->attachReport(id, artifact);
    std::cout << "[StudyPipelineService] [" << id << "] Report written to " << artifact.path << std::endl;
    return artifact;
}

bool StudyPipelineService::retryPipeline(const std::string& id) {
    if (!tryAcquireRun(id)) {
        std::cerr << "[StudyPipelineService] [" << id << "] Retry rejected: a run is already active" << std::endl;
        return false;
    }

    try {
        auto project = m_repository->findById(id);
        if (!project) {
            std::cerr << "[StudyPipelineService] [" << id << "] Retry rejected: project not found" << std::endl;
            releaseRun(id);
            return false;
        }
        if (!domain::IsFailure(project->status)) {
            std::cerr << "[StudyPipelineService] [" << id << "] Retry rejected: status is "
                      << domain::StatusToString(project->status) << std::endl;
            releaseRun(id);
            return false;
        }

        domain::StageCommit commit;
        commit.expectedStatus = project->status;
        commit.newStatus = ProjectStatus::Searching;
        commit.startsNewAttempt = true;
        commit.message = "Retry of attempt " + std::to_string(project->attempt);
        domain::Project updated = m_repository->commitStage(id, commit);

        std::cout << "[StudyPipelineService] [" << id << "] Starting attempt " << updated.attempt << std::endl;
        schedule(id, updated.drug);
        return true;
    } catch (const domain::InvalidStatusTransition& e) {
        std::cerr << "[StudyPipelineService] [" << id << "] Retry rejected: " << e.what() << std::endl;
        releaseRun(id);
        return false;
    } catch (const std::exception&) {
        releaseRun(id);
        throw;
    }
}

void StudyPipelineService::waitForIdle() {
    m_taskManager->WaitForIdle();
}

int StudyPipelineService::recoverInterruptedRuns() {
    int recovered = 0;
    for (const auto& id : m_repository->listIds()) {
        if (!tryAcquireRun(id)) continue; // Owned by a run of this process.
        try {
            auto project = m_repository->findById(id);
            if (project && !domain::IsTerminal(project->status)) {
                commitFailure(id, project->status, ProjectStatus::Failed,
                              "Interrupted while " + domain::StatusToString(project->status));
                std::cerr << "[StudyPipelineService] [" << id << "] Recovered interrupted run" << std::endl;
                ++recovered;
            }
        } catch (const domain::InvalidStatusTransition& e) {
            std::cerr << "[StudyPipelineService] [" << id << "] Recovery skipped: " << e.what() << std::endl;
        } catch (const std::exception&) {
            releaseRun(id);
            throw;
        }
        releaseRun(id);
    }
    return recovered;
}

bool StudyPipelineService::hasActiveRun(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_runsMutex);
    return m_activeRuns.count(id) > 0;
}

bool StudyPipelineService::tryAcquireRun(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_runsMutex);
    return m_activeRuns.insert(id).second;
}

void StudyPipelineService::releaseRun(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_runsMutex);
    m_activeRuns.erase(id);
}

void StudyPipelineService::schedule(const std::string& id, const domain::DrugIdentifier& drug) {
    auto status = m_taskManager->SubmitTask("Pipeline " + id,
        [this, id, drug](std::shared_ptr<TaskStatus>) {
            struct RunGuard {
                StudyPipelineService* service;
                std::string id;
                ~RunGuard() { service->releaseRun(id); }
            } guard{this, id};
            runPipeline(id, drug);
        });

    if (status->failed) {
        // The pool refused the task; no run will ever release the slot.
        releaseRun(id);
        commitFailure(id, ProjectStatus::Searching, ProjectStatus::Failed, status->errorMessage);
    }
}

void StudyPipelineService::runPipeline(const std::string& id, const domain::DrugIdentifier& drug) {
    auto searched = runSearchStage(id, drug);
    if (!searched) return;

    auto designed = runDesignStage(*searched);
    if (!designed) return;

    runRegulatoryStage(*designed);
}

std::optional<domain::Project> StudyPipelineService::runSearchStage(const std::string& id,
                                                                    const domain::DrugIdentifier& drug) {
    std::cout << "[StudyPipelineService] [" << id << "] Step 1: searching literature for "
              << describe(drug) << "..." << std::endl;

    std::vector<domain::DrugParameter> accepted;
    domain::SearchSummary summary;
    try {
        std::vector<domain::DocumentReference> documents = m_searchService->search(drug);
        if (documents.empty()) {
            std::cerr << "[StudyPipelineService] [" << id << "] No documents found" << std::endl;
            commitFailure(id, ProjectStatus::Searching, ProjectStatus::SearchFailed, "No documents found");
            return std::nullopt;
        }
        std::cout << "[StudyPipelineService] [" << id << "] Found " << documents.size() << " documents" << std::endl;

        for (const auto& document : documents) {
            std::vector<domain::DrugParameter> candidates;
            try {
                candidates = m_extractionService->extract(document.text, drug);
            } catch (const domain::CollaboratorUnavailable& e) {
                std::cerr << "[StudyPipelineService] [" << id << "] Extraction failed for document "
                          << document.id << ": " << e.what() << std::endl;
                commitFailure(id, ProjectStatus::Searching, ProjectStatus::SearchFailed,
                              "Parameter extraction failed for document " + document.id + ": " + e.what());
                return std::nullopt;
            }
            ++summary.documentsProcessed;

            for (auto& candidate : candidates) {
                if (candidate.sourceId.empty()) candidate.sourceId = document.id;
                if (candidate.sourceTitle.empty()) candidate.sourceTitle = document.title;
                if (!candidate.isPlausible()) {
                    ++summary.parametersRejected;
                    std::cerr << "[StudyPipelineService] [" << id << "] Rejected implausible "
                              << domain::KindToString(candidate.kind) << " = " << candidate.value
                              << " from " << candidate.sourceId << std::endl;
                    continue;
                }
                ++summary.parametersFound[domain::KindToString(candidate.kind)];
                accepted.push_back(std::move(candidate));
            }
        }
    } catch (const domain::CollaboratorUnavailable& e) {
        std::cerr << "[StudyPipelineService] [" << id << "] Search failed: " << e.what() << std::endl;
        commitFailure(id, ProjectStatus::Searching, ProjectStatus::SearchFailed,
                      std::string("Literature search failed: ") + e.what());
        return std::nullopt;
    } catch (const domain::ProjectStoreError&) {
        throw;
    } catch (const domain::InvalidStatusTransition&) {
        throw;
    } catch (const std::exception& e) {
        std::cerr << "[StudyPipelineService] [" << id << "] Unexpected error during search: " << e.what() << std::endl;
        commitFailure(id, ProjectStatus::Searching, ProjectStatus::Failed, e.what());
        return std::nullopt;
    }

    domain::StageCommit commit;
    commit.expectedStatus = ProjectStatus::Searching;
    commit.newStatus = ProjectStatus::SearchingCompleted;
    commit.message = "Extracted " + std::to_string(accepted.size()) + " parameters from " +
                     std::to_string(summary.documentsProcessed) + " documents";
    commit.parameters = std::move(accepted);
    commit.searchSummary = summary;
    domain::Project project = m_repository->commitStage(id, commit);
    std::cout << "[StudyPipelineService] [" << id << "] " << project.message << std::endl;
    return project;
}

std::optional<domain::Project> StudyPipelineService::runDesignStage(const domain::Project& project) {
    const std::string& id = project.id;
    std::cout << "[StudyPipelineService] [" << id << "] Step 2: computing design..." << std::endl;

    domain::DesignResult design;
    try {
        domain::DesignInputs inputs = domain::services::DesignCalculator::InputsFromParameters(
            project.parameters, m_options.dropoutRatePercent, m_options.screenFailRatePercent);
        design = m_calculator.compute(inputs);
    } catch (const domain::InvalidDesignInput& e) {
        std::cerr << "[StudyPipelineService] [" << id << "] Invalid design input: " << e.what() << std::endl;
        commitFailure(id, ProjectStatus::SearchingCompleted, ProjectStatus::DesignFailed, e.what());
        return std::nullopt;
    } catch (const domain::DesignComputationFailed& e) {
        std::cerr << "[StudyPipelineService] [" << id << "] Design failed: " << e.what() << std::endl;
        commitFailure(id, ProjectStatus::SearchingCompleted, ProjectStatus::DesignFailed, e.what());
        return std::nullopt;
    } catch (const std::exception& e) {
        std::cerr << "[StudyPipelineService] [" << id << "] Unexpected error during design: " << e.what() << std::endl;
        commitFailure(id, ProjectStatus::SearchingCompleted, ProjectStatus::Failed, e.what());
        return std::nullopt;
    }

    domain::StageCommit commit;
    commit.expectedStatus = ProjectStatus::SearchingCompleted;
    commit.newStatus = ProjectStatus::DesignCompleted;
    commit.message = std::to_string(design.sampleSize) + " subjects per sequence, " +
                     domain::DesignTypeToString(design.designType) + ", washout " +
                     std::to_string(design.washoutDays()) + " days";
    commit.design = design;
    domain::Project updated = m_repository->commitStage(id, commit);
    std::cout << "[StudyPipelineService] [" << id << "] Design: " << updated.message << std::endl;
    return updated;
}

void StudyPipelineService::runRegulatoryStage(const domain::Project& project) {
    const std::string& id = project.id;
    std::cout << "[StudyPipelineService] [" << id << "] Step 3: checking regulatory rules..." << std::endl;

    domain::RegulatoryVerdict verdict;
    try {
        if (!project.design) {
            throw std::logic_error("design missing after design stage");
        }
        verdict = m_evaluator.Evaluate(*project.design, project.parameters);
    } catch (const std::exception& e) {
        std::cerr << "[StudyPipelineService] [" << id << "] Regulatory check failed: " << e.what() << std::endl;
        commitFailure(id, ProjectStatus::DesignCompleted, ProjectStatus::RegulatoryCheckFailed, e.what());
        return;
    }

    domain::StageCommit commit;
    commit.expectedStatus = ProjectStatus::DesignCompleted;
    commit.newStatus = ProjectStatus::Completed;
    commit.message = verdict.compliant ? "Design is compliant" : "Design has regulatory findings";
    commit.verdict = verdict;
    m_repository->commitStage(id, commit);
    std::cout << "[StudyPipelineService] [" << id << "] Completed: " << commit.message << std::endl;
}

domain::Project StudyPipelineService::commitFailure(const std::string& id, ProjectStatus expected,
                                                    ProjectStatus failure, const std::string& message) {
    domain::StageCommit commit;
    commit.expectedStatus = expected;
    commit.newStatus = failure;
    commit.message = message;
    return m_repository->commitStage(id, commit);
}

} // namespace beplanner::application

#include <atomic>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "domain/services/DesignCalculator.hpp"
#include "domain/services/RegulatoryRuleEvaluator.hpp"
#include "infrastructure/JsonProjectRepository.hpp"
#include "infrastructure/ProjectJson.hpp"

using namespace beplanner::domain;
using namespace beplanner::infrastructure;
namespace fs = std::filesystem;

static fs::path makeTestRoot() {
    fs::path root = fs::temp_directory_path() / "beplanner_repository_test";
    std::error_code ec;
    fs::remove_all(root, ec);
    fs::create_directories(root);
    return root;
}

static std::chrono::system_clock::time_point millisNow() {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

static Project newProject(const std::string& id) {
    Project p;
    p.id = id;
    p.drug = DrugIdentifier{"ibuprofen", "ибупрофен", "400 mg", "tablets"};
    p.status = ProjectStatus::Searching;
    p.createdAt = millisNow();
    p.updatedAt = p.createdAt;
    p.attempt = 1;
    return p;
}

static void testCreateAndFind(JsonProjectRepository& repo) {
    Project p = newProject("11111111-aaaa-4bbb-8ccc-000000000001");
    repo.create(p);

    auto loaded = repo.findById(p.id);
    assert(loaded);
    assert(loaded->drug.inn == "ibuprofen");
    assert(loaded->drug.innLocal == "ибупрофен");
    assert(loaded->drug.dosage == "400 mg");
    assert(loaded->status == ProjectStatus::Searching);
    assert(loaded->createdAt == p.createdAt);
    assert(loaded->attempt == 1);
    assert(loaded->parameters.empty());
    assert(!loaded->design && !loaded->verdict && !loaded->report);

    bool threw = false;
    try {
        repo.create(p);
    } catch (const ProjectStoreError&) {
        threw = true;
    }
    assert(threw);

    assert(!repo.findById("does-not-exist"));
    assert(!repo.findById("../escape"));
    std::cout << "[PASS] Projects are created once and read back." << std::endl;
}

static void testStageCommitsPersist(JsonProjectRepository& repo, const fs::path& root) {
    const std::string id = "11111111-aaaa-4bbb-8ccc-000000000002";
    repo.create(newProject(id));

    std::vector<DrugParameter> params = {
        {ParameterKind::CvIntra, 23.5, "%", "31415926", "Two ibuprofen formulations", true},
        {ParameterKind::HalfLife, 2.1, "h", "31415926", "Two ibuprofen formulations", true},
    };
    SearchSummary summary;
    summary.documentsProcessed = 3;
    summary.parametersFound = {{"CV_intra", 1}, {"T1/2", 1}};
    summary.parametersRejected = 1;

    StageCommit search;
    search.expectedStatus = ProjectStatus::Searching;
    search.newStatus = ProjectStatus::SearchingCompleted;
    search.message = "2 parameters";
    search.parameters = params;
    search.searchSummary = summary;
    Project afterSearch = repo.commitStage(id, search);
    assert(afterSearch.status == ProjectStatus::SearchingCompleted);

    services::DesignCalculator calc;
    DesignInputs inputs = services::DesignCalculator::InputsFromParameters(params, 20.0, 12.0);
    DesignResult design = calc.compute(inputs);

    StageCommit designCommit;
    designCommit.expectedStatus = ProjectStatus::SearchingCompleted;
    designCommit.newStatus = ProjectStatus::DesignCompleted;
    designCommit.design = design;
    repo.commitStage(id, designCommit);

    RegulatoryVerdict verdict = services::RegulatoryRuleEvaluator().Evaluate(design, params);
    StageCommit check;
    check.expectedStatus = ProjectStatus::DesignCompleted;
    check.newStatus = ProjectStatus::Completed;
    check.verdict = verdict;
    repo.commitStage(id, check);

    ReportArtifact artifact{(root / "reports" / "ibuprofen.md").string(), "markdown", millisNow()};
    repo.attachReport(id, artifact);

    // A fresh instance reads the same state from disk.
    JsonProjectRepository reopened(root, std::make_shared<PersistenceService>());
    auto loaded = reopened.findById(id);
    assert(loaded);
    assert(loaded->status == ProjectStatus::Completed);
    assert(loaded->parameters.size() == 2);
    assert(loaded->parameters[0].kind == ParameterKind::CvIntra);
    assert(loaded->parameters[0].value == 23.5);
    assert(loaded->parameters[0].sourceId == "31415926");
    assert(loaded->parameters[1].unit == "h");
    assert(loaded->searchSummary);
    assert(loaded->searchSummary->documentsProcessed == 3);
    assert(loaded->searchSummary->parametersFound.at("T1/2") == 1);
    assert(loaded->searchSummary->parametersRejected == 1);

    assert(loaded->design);
    assert(loaded->design->sampleSize == design.sampleSize);
    assert(loaded->design->enrollmentWithDropout == design.enrollmentWithDropout);
    assert(loaded->design->enrollmentWithScreenFail == design.enrollmentWithScreenFail);
    assert(loaded->design->washoutPeriod == design.washoutPeriod);
    assert(loaded->design->designType == design.designType);
    assert(loaded->design->halfLifeHours == design.halfLifeHours);
    assert(loaded->design->policyVersion == design.policyVersion);

    assert(loaded->verdict);
    assert(*loaded->verdict == verdict);
    assert(loaded->report);
    assert(loaded->report->path == artifact.path);
    assert(loaded->report->renderedAt == artifact.renderedAt);
    std::cout << "[PASS] Stage results survive a reopen of the store." << std::endl;
}

static void testStaleCommitRejected(JsonProjectRepository& repo) {
    const std::string id = "11111111-aaaa-4bbb-8ccc-000000000003";
    repo.create(newProject(id));

    StageCommit fail;
    fail.expectedStatus = ProjectStatus::Searching;
    fail.newStatus = ProjectStatus::SearchFailed;
    fail.message = "No documents found";
    repo.commitStage(id, fail);

    StageCommit stale;
    stale.expectedStatus = ProjectStatus::Searching;
    stale.newStatus = ProjectStatus::SearchingCompleted;
    stale.parameters = std::vector<DrugParameter>{{ParameterKind::CvIntra, 20.0, "%", "1", "", true}};
    bool threw = false;
    try {
        repo.commitStage(id, stale);
    } catch (const InvalidStatusTransition&) {
        threw = true;
    }
    assert(threw);

    auto loaded = repo.findById(id);
    assert(loaded->status == ProjectStatus::SearchFailed);
    assert(loaded->message == "No documents found");
    assert(loaded->parameters.empty());

    threw = false;
    try {
        repo.commitStage("11111111-aaaa-4bbb-8ccc-00000000dead", fail);
    } catch (const ProjectStoreError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] A commit with a stale expected status changes nothing." << std::endl;
}

static void testConcurrentCommitsSerialize(JsonProjectRepository& repo) {
    const std::string id = "11111111-aaaa-4bbb-8ccc-000000000004";
    repo.create(newProject(id));

    StageCommit commit;
    commit.expectedStatus = ProjectStatus::Searching;
    commit.newStatus = ProjectStatus::SearchFailed;

    std::atomic<int> accepted{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            try {
                repo.commitStage(id, commit);
                accepted++;
            } catch (const InvalidStatusTransition&) {
                // lost the race
            }
        });
    }
    for (auto& t : threads) t.join();
    assert(accepted == 1);
    std::cout << "[PASS] Only one of several racing commits is accepted." << std::endl;
}

static void testListAndCorruption(JsonProjectRepository& repo) {
    auto ids = repo.listIds();
    assert(ids.size() == 4);
    for (size_t i = 1; i < ids.size(); ++i) assert(ids[i - 1] < ids[i]);

    {
        std::ofstream broken(repo.projectsDir() / "11111111-aaaa-4bbb-8ccc-00000000beef.json");
        broken << "{ not json";
    }
    bool threw = false;
    try {
        repo.findById("11111111-aaaa-4bbb-8ccc-00000000beef");
    } catch (const ProjectStoreError&) {
        threw = true;
    }
    assert(threw);

    for (const auto& entry : fs::directory_iterator(repo.projectsDir())) {
        assert(entry.path().extension() != ".tmp");
    }
    std::cout << "[PASS] Listing is sorted, corrupt records surface as store errors." << std::endl;
}

static void testStatusLabelsOnDisk() {
    Project p = newProject("11111111-aaaa-4bbb-8ccc-000000000005");
    p.status = ProjectStatus::RegulatoryCheckFailed;
    auto j = ProjectToJson(p);
    assert(j["status"] == "regulatory_check_failed");
    assert(ProjectFromJson(j).status == ProjectStatus::RegulatoryCheckFailed);

    j["status"] = "archived";
    bool threw = false;
    try {
        ProjectFromJson(j);
    } catch (const std::exception&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Unknown stored status labels are refused." << std::endl;
}

int main() {
    std::cout << "[Test] Starting JsonProjectRepository Test..." << std::endl;
    fs::path root = makeTestRoot();
    {
        JsonProjectRepository repo(root, std::make_shared<PersistenceService>());
        testCreateAndFind(repo);
        testStageCommitsPersist(repo, root);
        testStaleCommitRejected(repo);
        testConcurrentCommitsSerialize(repo);
        testListAndCorruption(repo);
    }
    testStatusLabelsOnDisk();

    std::error_code ec;
    fs::remove_all(root, ec);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}

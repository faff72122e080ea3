#include <cassert>
#include <iostream>

#include "domain/ProjectRepository.hpp"

using namespace beplanner::domain;

static const ProjectStatus kAll[] = {
    ProjectStatus::Searching, ProjectStatus::SearchingCompleted, ProjectStatus::DesignCompleted,
    ProjectStatus::Completed, ProjectStatus::SearchFailed, ProjectStatus::DesignFailed,
    ProjectStatus::RegulatoryCheckFailed, ProjectStatus::Failed
};

static void testStringRoundTrip() {
    for (ProjectStatus s : kAll) {
        auto parsed = StatusFromString(StatusToString(s));
        assert(parsed && *parsed == s);
    }
    assert(!StatusFromString("SEARCHING"));
    assert(!StatusFromString(""));
    std::cout << "[PASS] Status labels are unique and parse back." << std::endl;
}

static void testTransitionTable() {
    assert(CanTransition(ProjectStatus::Searching, ProjectStatus::SearchingCompleted));
    assert(CanTransition(ProjectStatus::Searching, ProjectStatus::SearchFailed));
    assert(!CanTransition(ProjectStatus::Searching, ProjectStatus::DesignCompleted));
    assert(!CanTransition(ProjectStatus::Searching, ProjectStatus::Completed));

    assert(CanTransition(ProjectStatus::SearchingCompleted, ProjectStatus::DesignCompleted));
    assert(CanTransition(ProjectStatus::SearchingCompleted, ProjectStatus::DesignFailed));
    assert(!CanTransition(ProjectStatus::SearchingCompleted, ProjectStatus::Searching));

    assert(CanTransition(ProjectStatus::DesignCompleted, ProjectStatus::Completed));
    assert(CanTransition(ProjectStatus::DesignCompleted, ProjectStatus::RegulatoryCheckFailed));
    assert(!CanTransition(ProjectStatus::DesignCompleted, ProjectStatus::DesignFailed));

    for (ProjectStatus s : kAll) {
        assert(!CanTransition(ProjectStatus::Completed, s));
        assert(CanTransition(s, ProjectStatus::Failed) == (s == ProjectStatus::Searching ||
                                                           s == ProjectStatus::SearchingCompleted ||
                                                           s == ProjectStatus::DesignCompleted));
        if (IsFailure(s)) {
            assert(AllowedTransitions(s).size() == 1);
            assert(CanTransition(s, ProjectStatus::Searching));
        }
    }
    std::cout << "[PASS] Transition table matches the pipeline stages." << std::endl;
}

static void testTerminalStates() {
    int terminal = 0;
    for (ProjectStatus s : kAll) {
        if (IsTerminal(s)) ++terminal;
    }
    assert(terminal == 5);
    assert(!IsFailure(ProjectStatus::Completed));
    assert(IsFailure(ProjectStatus::RegulatoryCheckFailed));
    assert(!IsTerminal(ProjectStatus::DesignCompleted));
    std::cout << "[PASS] Completed and the four failure states are terminal." << std::endl;
}

static Project projectIn(ProjectStatus status) {
    Project p;
    p.id = "p-1";
    p.drug.inn = "ibuprofen";
    p.status = status;
    p.attempt = 1;
    p.parameters = {{ParameterKind::CvIntra, 22.0, "%", "1", "", true}};
    return p;
}

static void testApplyStageCommit() {
    const auto now = std::chrono::system_clock::now();

    Project p = projectIn(ProjectStatus::SearchingCompleted);
    StageCommit fail;
    fail.expectedStatus = ProjectStatus::SearchingCompleted;
    fail.newStatus = ProjectStatus::DesignFailed;
    fail.message = "no CV";
    ApplyStageCommit(p, fail, now);
    assert(p.status == ProjectStatus::DesignFailed);
    assert(p.parameters.size() == 1);
    assert(p.message == "no CV");
    assert(p.updatedAt == now);
    assert(p.attempt == 1);

    // Stale expectation.
    bool threw = false;
    try {
        ApplyStageCommit(p, fail, now);
    } catch (const InvalidStatusTransition&) {
        threw = true;
    }
    assert(threw);
    assert(p.status == ProjectStatus::DesignFailed);

    // Re-entering searching requires the new-attempt flag.
    StageCommit retry;
    retry.expectedStatus = ProjectStatus::DesignFailed;
    retry.newStatus = ProjectStatus::Searching;
    threw = false;
    try {
        ApplyStageCommit(p, retry, now);
    } catch (const InvalidStatusTransition&) {
        threw = true;
    }
    assert(threw);
    assert(p.attempt == 1);

    retry.startsNewAttempt = true;
    ApplyStageCommit(p, retry, now);
    assert(p.status == ProjectStatus::Searching);
    assert(p.attempt == 2);

    // The flag is meaningless anywhere else.
    StageCommit bogus;
    bogus.expectedStatus = ProjectStatus::Searching;
    bogus.newStatus = ProjectStatus::SearchFailed;
    bogus.startsNewAttempt = true;
    threw = false;
    try {
        ApplyStageCommit(p, bogus, now);
    } catch (const InvalidStatusTransition&) {
        threw = true;
    }
    assert(threw);

    Project done = projectIn(ProjectStatus::Completed);
    StageCommit reopen;
    reopen.expectedStatus = ProjectStatus::Completed;
    reopen.newStatus = ProjectStatus::Searching;
    reopen.startsNewAttempt = true;
    threw = false;
    try {
        ApplyStageCommit(done, reopen, now);
    } catch (const InvalidStatusTransition&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Stage commits enforce expected status and the transition table." << std::endl;
}

static void testKindAliases() {
    assert(KindFromString("CV_intra") == ParameterKind::CvIntra);
    assert(KindFromString(" Intra subject CV ") == ParameterKind::CvIntra);
    assert(KindFromString("t1/2") == ParameterKind::HalfLife);
    assert(KindFromString("Half life") == ParameterKind::HalfLife);
    assert(KindFromString("CMAX") == ParameterKind::Cmax);
    assert(!KindFromString("clearance"));
    for (ParameterKind k : {ParameterKind::Cmax, ParameterKind::AUC, ParameterKind::HalfLife,
                            ParameterKind::CvIntra, ParameterKind::Tmax}) {
        assert(KindFromString(KindToString(k)) == k);
    }

    DrugParameter cv{ParameterKind::CvIntra, 200.0, "%", "1", "", true};
    assert(cv.isPlausible());
    cv.value = 200.5;
    assert(!cv.isPlausible());
    DrugParameter cmax{ParameterKind::Cmax, -1.0, "ng/mL", "1", "", true};
    assert(!cmax.isPlausible());
    DrugParameter halfLife{ParameterKind::HalfLife, DrugParameter::MaxHalfLifeHours, "h", "1", "", true};
    assert(halfLife.isPlausible());
    halfLife.value = 1e300;
    assert(!halfLife.isPlausible());
    std::cout << "[PASS] Parameter kinds resolve aliases and values are range checked." << std::endl;
}

int main() {
    std::cout << "[Test] Starting ProjectStatus Test..." << std::endl;
    testStringRoundTrip();
    testTransitionTable();
    testTerminalStates();
    testApplyStageCommit();
    testKindAliases();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}

/**
 * @file BePlannerApp.cpp
 * @brief Implementation of the BePlannerApp class.
 */

#include "app/BePlannerApp.hpp"

#include <chrono>
#include <iostream>
#include <thread>

#include <nlohmann/json.hpp>

#include "domain/DesignErrors.hpp"
#include "domain/services/DesignCalculator.hpp"
#include "domain/services/RegulatoryRuleEvaluator.hpp"
#include "infrastructure/JsonProjectRepository.hpp"
#include "infrastructure/MarkdownReportRenderer.hpp"
#include "infrastructure/OllamaClient.hpp"
#include "infrastructure/OllamaParameterExtractor.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/ProjectJson.hpp"
#include "infrastructure/PubMedClient.hpp"

namespace beplanner::app {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(500);

std::optional<double> NumberOption(const CommandLine& cmd, const std::string& key) {
    auto it = cmd.options.find(key);
    if (it == cmd.options.end()) return std::nullopt;
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(it->second, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed != it->second.size()) {
        throw domain::InvalidDesignInput("--" + key + " expects a number, got '" + it->second + "'");
    }
    return value;
}

std::string StringOption(const CommandLine& cmd, const std::string& key) {
    auto it = cmd.options.find(key);
    return it == cmd.options.end() ? std::string() : it->second;
}

} // namespace

std::optional<CommandLine> BePlannerApp::ParseArgs(int argc, char* argv[], std::string& error) {
    CommandLine cmd;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) == 0) {
            std::string key = arg.substr(2);
            if (key == "help") {
                cmd.command = "help";
                continue;
            }
            if (i + 1 >= argc) {
                error = "missing value for " + arg;
                return std::nullopt;
            }
            std::string value = argv[++i];
            if (key == "config") {
                cmd.configPath = value;
            } else {
                cmd.options[key] = value;
            }
        } else if (cmd.command.empty()) {
            cmd.command = arg;
        } else {
            cmd.positional.push_back(arg);
        }
    }
    if (cmd.command.empty()) {
        error = "no command given";
        return std::nullopt;
    }
    return cmd;
}

void BePlannerApp::PrintUsage() {
    std::cout <<
        "Usage: beplanner [--config <settings.json>] <command> [options]\n\n"
        "Commands:\n"
        "  calc --cv <pct> [--power <pct>] [--alpha <frac>] [--delta <pct>]\n"
        "       [--dropout <pct>] [--screen-fail <pct>] [--half-life <h>]\n"
        "                       Compute a design directly and print it as JSON.\n"
        "  run --inn <name> --dosage <d> --form <f> [--inn-local <name>]\n"
        "                       Run the full pipeline and print the project.\n"
        "  show <id>            Print a stored project.\n"
        "  list                 List stored project ids with their status.\n"
        "  retry <id>           Start a new attempt for a failed project.\n"
        "  report <id>          Render the synopsis of a completed project.\n"
        "  recover              Mark runs interrupted by a previous process as failed.\n";
}

int BePlannerApp::Run(int argc, char* argv[]) {
    std::string error;
    auto cmd = ParseArgs(argc, argv, error);
    if (!cmd) {
        std::cerr << "[BePlannerApp] " << error << std::endl;
        PrintUsage();
        return 2;
    }
    if (cmd->command == "help") {
        PrintUsage();
        return 0;
    }

    const std::filesystem::path configPath = cmd->configPath
        ? std::filesystem::path(*cmd->configPath)
        : infrastructure::PathUtils::GetDefaultConfigPath();
    m_config = infrastructure::ConfigLoader::Load(configPath);

    int code = 2;
    try {
        if (cmd->command == "calc") {
            return RunCalc(*cmd);
        }

        InitServices();
        if (cmd->command == "run") code = RunPipeline(*cmd);
        else if (cmd->command == "show") code = Show(*cmd);
        else if (cmd->command == "list") code = List();
        else if (cmd->command == "retry") code = Retry(*cmd);
        else if (cmd->command == "report") code = Report(*cmd);
        else if (cmd->command == "recover") code = Recover();
        else {
            std::cerr << "[BePlannerApp] Unknown command: " << cmd->command << std::endl;
            PrintUsage();
        }
    } catch (const domain::InvalidDesignInput& e) {
        std::cerr << "[BePlannerApp] Invalid input: " << e.what() << std::endl;
        code = 2;
    } catch (const std::exception& e) {
        std::cerr << "[BePlannerApp] Error: " << e.what() << std::endl;
        code = 1;
    }

    Shutdown();
    return code;
}

void BePlannerApp::InitServices() {
    // Dependency Injection / Composition Root
    const auto& dataDir = m_config.dataDir;
    if (!infrastructure::PathUtils::EnsureDirectory(dataDir)) {
        throw domain::ProjectStoreError("data directory unavailable: " + dataDir.string());
    }
    std::cout << "[BePlannerApp] Data directory: " << dataDir << std::endl;

    m_services.persistenceService = std::make_shared<infrastructure::PersistenceService>();
    m_services.projectRepository = std::make_shared<infrastructure::JsonProjectRepository>(
        dataDir, m_services.persistenceService);
    m_services.taskManager = std::make_shared<application::AsyncTaskManager>(
        static_cast<size_t>(m_config.workerThreads));

    auto search = std::make_shared<infrastructure::PubMedClient>(
        m_config.pubmed.baseUrl, m_config.pubmed.apiKey, m_config.pubmed.maxArticles, m_config.pubmed.timeoutSeconds);
    auto ollama = std::make_shared<infrastructure::OllamaClient>(
        m_config.ollama.host, m_config.ollama.port, m_config.ollama.timeoutSeconds);
    auto extractor = std::make_shared<infrastructure::OllamaParameterExtractor>(ollama, m_config.ollama.model);
    auto renderer = std::make_shared<infrastructure::MarkdownReportRenderer>(
        dataDir / "reports", m_services.persistenceService);

    application::PipelineOptions options;
    options.dropoutRatePercent = m_config.dropoutRatePercent;
    options.screenFailRatePercent = m_config.screenFailRatePercent;

    m_services.pipelineService = std::make_unique<application::StudyPipelineService>(
        m_services.projectRepository, search, extractor, renderer, m_services.taskManager,
        m_config.policy, options);
}

void BePlannerApp::Shutdown() {
    if (m_services.taskManager) {
        m_services.taskManager->Shutdown();
    }
}

int BePlannerApp::RunCalc(const CommandLine& cmd) {
    domain::DesignInputs inputs;
    inputs.cvIntraPercent = NumberOption(cmd, "cv");
    inputs.powerPercent = NumberOption(cmd, "power");
    inputs.alpha = NumberOption(cmd, "alpha");
    inputs.deltaPercent = NumberOption(cmd, "delta");
    inputs.dropoutRatePercent = NumberOption(cmd, "dropout").value_or(m_config.dropoutRatePercent);
    inputs.screenFailRatePercent = NumberOption(cmd, "screen-fail").value_or(m_config.screenFailRatePercent);
    inputs.halfLifeHours = NumberOption(cmd, "half-life");

    domain::services::DesignCalculator calculator(m_config.policy);
    domain::DesignResult design;
    try {
        design = calculator.compute(inputs);
    } catch (const domain::InvalidDesignInput& e) {
        std::cerr << "[BePlannerApp] Invalid input: " << e.what() << std::endl;
        return 2;
    } catch (const domain::DesignComputationFailed& e) {
        std::cerr << "[BePlannerApp] Design failed: " << e.what() << std::endl;
        return 1;
    }

    // Values given on the command line count as one manual, reliable source.
    std::vector<domain::DrugParameter> parameters;
    parameters.push_back({domain::ParameterKind::CvIntra, design.cvIntraUsed, "%", "manual", "", true});
    if (inputs.halfLifeHours) {
        parameters.push_back({domain::ParameterKind::HalfLife, *inputs.halfLifeHours, "h", "manual", "", true});
    }
    domain::services::RegulatoryRuleEvaluator evaluator(m_config.policy);
    auto verdict = evaluator.Evaluate(design, parameters);

    nlohmann::json out = {
        {"design", infrastructure::DesignToJson(design)},
        {"verdict", infrastructure::VerdictToJson(verdict)}
    };
    std::cout << out.dump(2) << std::endl;
    return 0;
}

int BePlannerApp::RunPipeline(const CommandLine& cmd) {
    domain::DrugIdentifier drug;
    drug.inn = StringOption(cmd, "inn");
    drug.innLocal = StringOption(cmd, "inn-local");
    drug.dosage = StringOption(cmd, "dosage");
    drug.form = StringOption(cmd, "form");
    if (drug.inn.empty() || drug.dosage.empty() || drug.form.empty()) {
        std::cerr << "[BePlannerApp] run requires --inn, --dosage and --form" << std::endl;
        return 2;
    }

    std::string id = m_services.pipelineService->startPipeline(drug);
    std::cout << "[BePlannerApp] Project " << id << " started" << std::endl;
    return AwaitAndPrint(id);
}

int BePlannerApp::AwaitAndPrint(const std::string& id) {
    std::optional<domain::ProjectStatus> lastStatus;
    while (true) {
        auto project = m_services.pipelineService->getProject(id);
        if (!project) {
            std::cerr << "[BePlannerApp] Project " << id << " disappeared" << std::endl;
            return 1;
        }
        if (!lastStatus || *lastStatus != project->status) {
            std::cout << "[BePlannerApp] Status: " << domain::StatusToString(project->status) << std::endl;
            lastStatus = project->status;
        }
        if (domain::IsTerminal(project->status)) {
            m_services.pipelineService->waitForIdle();
            project = m_services.pipelineService->getProject(id);
            std::cout << infrastructure::ProjectToJson(*project).dump(2) << std::endl;
            return project->status == domain::ProjectStatus::Completed ? 0 : 1;
        }
        if (!m_services.pipelineService->hasActiveRun(id)) {
            // The run ended without a terminal commit; re-read in case it committed last.
            project = m_services.pipelineService->getProject(id);
            if (project && !domain::IsTerminal(project->status)) {
                std::cerr << "[BePlannerApp] Run for " << id << " stopped in "
                          << domain::StatusToString(project->status) << "; see the log above" << std::endl;
                std::cout << infrastructure::ProjectToJson(*project).dump(2) << std::endl;
                return 1;
            }
            continue;
        }
        std::this_thread::sleep_for(kPollInterval);
    }
}

int BePlannerApp::Show(const CommandLine& cmd) {
    if (cmd.positional.empty()) {
        std::cerr << "[BePlannerApp] show requires a project id" << std::endl;
        return 2;
    }
    auto project = m_services.pipelineService->getProject(cmd.positional.front());
    if (!project) {
        std::cerr << "[BePlannerApp] Project not found: " << cmd.positional.front() << std::endl;
        return 1;
    }
    std::cout << infrastructure::ProjectToJson(*project).dump(2) << std::endl;
    return 0;
}

int BePlannerApp::List() {
    for (const auto& id : m_services.projectRepository->listIds()) {
        auto project = m_services.projectRepository->findById(id);
        if (!project) continue;
        std::cout << id << "  " << domain::StatusToString(project->status) << "  " << project->drug.inn
                  << " " << project->drug.dosage << " " << project->drug.form << std::endl;
    }
    return 0;
}

int BePlannerApp::Retry(const CommandLine& cmd) {
    if (cmd.positional.empty()) {
        std::cerr << "[BePlannerApp] retry requires a project id" << std::endl;
        return 2;
    }
    const std::string& id = cmd.positional.front();
    if (!m_services.pipelineService->retryPipeline(id)) {
        return 1;
    }
    return AwaitAndPrint(id);
}

int BePlannerApp::Report(const CommandLine& cmd) {
    if (cmd.positional.empty()) {
        std::cerr << "[BePlannerApp] report requires a project id" << std::endl;
        return 2;
    }
    try {
        auto artifact = m_services.pipelineService->generateReport(cmd.positional.front());
        std::cout << artifact.path << std::endl;
        return 0;
    } catch (const domain::ReportNotAvailable& e) {
        std::cerr << "[BePlannerApp] " << e.what() << std::endl;
    } catch (const domain::CollaboratorUnavailable& e) {
        std::cerr << "[BePlannerApp] " << e.what() << std::endl;
    }
    return 1;
}

int BePlannerApp::Recover() {
    int recovered = m_services.pipelineService->recoverInterruptedRuns();
    std::cout << "[BePlannerApp] Recovered " << recovered << " interrupted project(s)" << std::endl;
    return 0;
}

} // namespace beplanner::app

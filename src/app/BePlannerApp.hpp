/**
 * @file BePlannerApp.hpp
 * @brief Command-line front end for BEPlanner.
 */

#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "application/AppServices.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace beplanner::app {

/**
 * @struct CommandLine
 * @brief Parsed invocation: a subcommand, its --options and positional arguments.
 */
struct CommandLine {
    std::string command;
    std::map<std::string, std::string> options;
    std::vector<std::string> positional;
    std::optional<std::string> configPath;
};

/**
 * @class BePlannerApp
 * @brief Loads configuration, wires the services and dispatches subcommands.
 */
class BePlannerApp {
public:
    /**
     * @brief Runs one subcommand.
     * @return Process exit code: 0 success, 1 failure, 2 usage error.
     */
    int Run(int argc, char* argv[]);

    /**
     * @brief Splits argv into a CommandLine.
     * @param error Receives a message when parsing fails.
     */
    static std::optional<CommandLine> ParseArgs(int argc, char* argv[], std::string& error);

private:
    void InitServices();
    void Shutdown();

    int RunCalc(const CommandLine& cmd);
    int RunPipeline(const CommandLine& cmd);
    int Show(const CommandLine& cmd);
    int Retry(const CommandLine& cmd);
    int Report(const CommandLine& cmd);
    int List();
    int Recover();

    /** @brief Polls the project until it reaches a terminal status and prints it. */
    int AwaitAndPrint(const std::string& id);

    static void PrintUsage();

    infrastructure::AppConfig m_config;
    application::AppServices m_services;
};

} // namespace beplanner::app

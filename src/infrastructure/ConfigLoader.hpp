/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading application configuration (settings.json).
 *
 * Provides a unified way to access data locations, collaborator endpoints and
 * policy overrides without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "domain/DesignPolicy.hpp"

namespace beplanner::infrastructure {

struct OllamaSettings {
    std::string host = "localhost";
    int port = 11434;
    std::string model = "llama3";
    int timeoutSeconds = 120;
};

struct PubMedSettings {
    std::string baseUrl = "https://eutils.ncbi.nlm.nih.gov";
    std::string apiKey;
    int maxArticles = 5;
    int timeoutSeconds = 30;
};

/**
 * @struct AppConfig
 * @brief Fully resolved configuration. Every field has a usable default.
 */
struct AppConfig {
    std::filesystem::path dataDir;
    int workerThreads = 4;
    OllamaSettings ollama;
    PubMedSettings pubmed;
    double dropoutRatePercent = 0.0;
    double screenFailRatePercent = 0.0;
    domain::DesignPolicy policy = domain::DesignPolicy::Default();
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json.
     * @param configPath Path of the settings file. A missing file yields the defaults.
     * @return The resolved configuration; malformed content is logged and replaced by defaults.
     */
    static AppConfig Load(const std::filesystem::path& configPath);

    /** @brief Resolves a parsed settings document on top of the defaults. */
    static AppConfig FromJson(const nlohmann::json& j);

    /**
     * @brief Applies a "policy" override object to the built-in policy.
     * @param error Receives the reason when the overrides are rejected.
     * @return The overridden policy, or nullopt if the object lacks a distinct version label
     *         or contains invalid values.
     */
    static std::optional<domain::DesignPolicy> PolicyFromJson(const nlohmann::json& j, std::string& error);
};

} // namespace beplanner::infrastructure

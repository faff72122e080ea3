/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <fstream>
#include <iostream>

namespace beplanner::infrastructure {

namespace {

template <typename T>
void ReadIfPresent(const nlohmann::json& j, const char* key, T& target) {
    if (j.contains(key) && !j[key].is_null()) {
        target = j[key].get<T>();
    }
}

bool IsPercent(double value) {
    return value >= 0.0 && value < 100.0;
}

} // namespace

AppConfig ConfigLoader::Load(const std::filesystem::path& configPath) {
    if (!std::filesystem::exists(configPath)) {
        std::cout << "[ConfigLoader] No settings at " << configPath << ", using defaults" << std::endl;
        return FromJson(nlohmann::json::object());
    }

    try {
        std::ifstream f(configPath);
        nlohmann::json j;
        f >> j;
        return FromJson(j);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << configPath << ": " << e.what()
                  << ". Using defaults." << std::endl;
    }
    return FromJson(nlohmann::json::object());
}

AppConfig ConfigLoader::FromJson(const nlohmann::json& j) {
    AppConfig config;
    config.dataDir = PathUtils::GetDefaultDataDir();

    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] settings.json must contain an object. Using defaults." << std::endl;
        return config;
    }

    std::string dataDir;
    ReadIfPresent(j, "data_dir", dataDir);
    if (!dataDir.empty()) config.dataDir = dataDir;

    ReadIfPresent(j, "worker_threads", config.workerThreads);
    if (config.workerThreads < 1) {
        std::cerr << "[ConfigLoader] worker_threads must be positive, using 1" << std::endl;
        config.workerThreads = 1;
    }

    if (j.contains("ollama") && j["ollama"].is_object()) {
        const auto& o = j["ollama"];
        ReadIfPresent(o, "host", config.ollama.host);
        ReadIfPresent(o, "port", config.ollama.port);
        ReadIfPresent(o, "model", config.ollama.model);
        ReadIfPresent(o, "timeout_seconds", config.ollama.timeoutSeconds);
    }

    if (j.contains("pubmed") && j["pubmed"].is_object()) {
        const auto& p = j["pubmed"];
        ReadIfPresent(p, "base_url", config.pubmed.baseUrl);
        ReadIfPresent(p, "api_key", config.pubmed.apiKey);
        ReadIfPresent(p, "max_articles", config.pubmed.maxArticles);
        ReadIfPresent(p, "timeout_seconds", config.pubmed.timeoutSeconds);
    }

    if (j.contains("pipeline") && j["pipeline"].is_object()) {
        const auto& p = j["pipeline"];
        double dropout = config.dropoutRatePercent;
        double screenFail = config.screenFailRatePercent;
        ReadIfPresent(p, "dropout_rate", dropout);
        ReadIfPresent(p, "screen_fail_rate", screenFail);
        if (IsPercent(dropout) && IsPercent(screenFail)) {
            config.dropoutRatePercent = dropout;
            config.screenFailRatePercent = screenFail;
        } else {
            std::cerr << "[ConfigLoader] pipeline attrition rates must be in [0, 100), ignoring" << std::endl;
        }
    }

    if (j.contains("policy")) {
        std::string error;
        auto policy = PolicyFromJson(j["policy"], error);
        if (policy) {
            config.policy = *policy;
            std::cout << "[ConfigLoader] Using design policy " << config.policy.version << std::endl;
        } else {
            std::cerr << "[ConfigLoader] Policy overrides rejected: " << error
                      << ". Keeping " << config.policy.version << std::endl;
        }
    }

    return config;
}

std::optional<domain::DesignPolicy> ConfigLoader::PolicyFromJson(const nlohmann::json& j, std::string& error) {
    if (!j.is_object()) {
        error = "\"policy\" must be an object";
        return std::nullopt;
    }

    domain::DesignPolicy policy = domain::DesignPolicy::Default();
    const std::string builtIn = policy.version;

    try {
        ReadIfPresent(j, "version", policy.version);
        ReadIfPresent(j, "default_alpha", policy.defaultAlpha);
        ReadIfPresent(j, "default_power", policy.defaultPowerPercent);
        ReadIfPresent(j, "default_delta", policy.defaultDeltaPercent);
        ReadIfPresent(j, "expected_ratio", policy.expectedRatio);
        ReadIfPresent(j, "high_variability_threshold", policy.highVariabilityThresholdPercent);
        ReadIfPresent(j, "standard_minimum_per_sequence", policy.standardMinimumPerSequence);
        ReadIfPresent(j, "replicate_minimum_per_sequence", policy.replicateMinimumPerSequence);
        ReadIfPresent(j, "sample_size_search_ceiling", policy.sampleSizeSearchCeiling);
        ReadIfPresent(j, "washout_half_life_multiple", policy.washoutHalfLifeMultiple);
        ReadIfPresent(j, "default_half_life_hours", policy.defaultHalfLifeHours);
        ReadIfPresent(j, "minimum_washout_hours", policy.minimumWashoutHours);
        ReadIfPresent(j, "jurisdiction_minimum_subjects", policy.jurisdictionMinimumSubjects);
        ReadIfPresent(j, "maximum_practical_washout_days", policy.maximumPracticalWashoutDays);
        ReadIfPresent(j, "low_cv_advisory", policy.lowCvAdvisoryPercent);
    } catch (const nlohmann::json::exception& e) {
        error = e.what();
        return std::nullopt;
    }

    if (policy.version.empty() || policy.version == builtIn) {
        error = "overrides need a \"version\" label distinct from " + builtIn;
        return std::nullopt;
    }
    if (policy.expectedRatio <= 0.0 || policy.highVariabilityThresholdPercent <= 0.0 ||
        policy.standardMinimumPerSequence < 2 || policy.replicateMinimumPerSequence < 2 ||
        policy.sampleSizeSearchCeiling < 2 || policy.washoutHalfLifeMultiple <= 0.0 ||
        policy.defaultHalfLifeHours <= 0.0 || policy.minimumWashoutHours < 0 ||
        policy.jurisdictionMinimumSubjects < 1 || policy.maximumPracticalWashoutDays < 1) {
        error = "policy \"" + policy.version + "\" contains non-positive thresholds";
        return std::nullopt;
    }
    return policy;
}

} // namespace beplanner::infrastructure

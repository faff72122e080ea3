/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace beplanner::infrastructure {

class OllamaClient {
public:
    OllamaClient(const std::string& host = "localhost", int port = 11434, int timeoutSeconds = 120);

    /**
     * @brief Sends a POST request to /api/generate.
     * @return The model's response text, or nullopt on transport, HTTP or decoding errors (logged).
     */
    std::optional<std::string> generate(const std::string& model,
                                        const std::string& system,
                                        const std::string& prompt,
                                        bool forceJson = false);

private:
    std::string m_host;
    int m_port;
    int m_timeoutSeconds;
};

} // namespace beplanner::infrastructure

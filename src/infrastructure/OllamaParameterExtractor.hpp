/**
 * @file OllamaParameterExtractor.hpp
 * @brief ParameterExtractionService backed by a local Ollama server.
 */

#pragma once
#include <memory>
#include <string>
#include <vector>

#include "domain/ParameterExtractionService.hpp"
#include "infrastructure/OllamaClient.hpp"

namespace beplanner::infrastructure {

/**
 * @class OllamaParameterExtractor
 * @brief Implements ParameterExtractionService with JSON-mode generation.
 *
 * A general pass extracts every parameter kind. When it yields no CV_intra, a second
 * pass with a CV_intra-only prompt is attempted on the same text.
 */
class OllamaParameterExtractor : public domain::ParameterExtractionService {
public:
    OllamaParameterExtractor(std::shared_ptr<OllamaClient> client, std::string model);

    /** @see domain::ParameterExtractionService::extract */
    std::vector<domain::DrugParameter> extract(const std::string& documentText,
                                               const domain::DrugIdentifier& drug) override;

    /**
     * @brief Parses a model response into parameters.
     *
     * Accepts an object keyed by parameter name (canonical or alias), each entry holding
     * value/unit/found. Entries with found=false, a null value or an unknown name are
     * skipped; implausible values are dropped with a warning. Markdown code fences around
     * the object are tolerated.
     * @throws std::runtime_error if the text is not a JSON object.
     */
    static std::vector<domain::DrugParameter> ParseResponse(const std::string& responseText);

private:
    std::vector<domain::DrugParameter> runPrompt(const std::string& system, const std::string& documentText);

    std::shared_ptr<OllamaClient> m_client;
    std::string m_model;
};

} // namespace beplanner::infrastructure

/**
 * @file PromptCatalog.hpp
 * @brief Central storage for LLM extraction prompts.
 */

#pragma once

#include <string>

namespace beplanner::infrastructure {

class PromptCatalog {
public:
    /** @brief System prompt for extracting all PK parameters of @p inn in standard units. */
    static std::string GetExtractionPrompt(const std::string& inn);

    /** @brief System prompt for a second, CV_intra-only pass over the same text. */
    static std::string GetCvIntraPrompt(const std::string& inn);

    /** @brief Wraps a document text into the user message sent with either prompt. */
    static std::string BuildDocumentMessage(const std::string& documentText);
};

} // namespace beplanner::infrastructure

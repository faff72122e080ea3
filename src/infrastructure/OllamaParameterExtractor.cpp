/**
 * @file OllamaParameterExtractor.cpp
 * @brief Implementation of OllamaParameterExtractor.
 */
#include "infrastructure/OllamaParameterExtractor.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include "domain/DesignErrors.hpp"

#include <algorithm>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>

using json = nlohmann::json;

namespace beplanner::infrastructure {

namespace {

std::string StripCodeFence(const std::string& text) {
    const auto first = text.find('{');
    const auto last = text.rfind('}');
    if (first == std::string::npos || last == std::string::npos || last < first) {
        return text;
    }
    return text.substr(first, last - first + 1);
}

std::optional<double> NumberFrom(const json& value) {
    if (value.is_number()) return value.get<double>();
    if (value.is_string()) {
        try {
            size_t consumed = 0;
            const std::string s = value.get<std::string>();
            double parsed = std::stod(s, &consumed);
            if (consumed > 0) return parsed;
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

} // namespace

OllamaParameterExtractor::OllamaParameterExtractor(std::shared_ptr<OllamaClient> client, std::string model)
    : m_client(std::move(client)), m_model(std::move(model)) {}

std::vector<domain::DrugParameter> OllamaParameterExtractor::ParseResponse(const std::string& responseText) {
    json body = json::parse(StripCodeFence(responseText));
    if (!body.is_object()) {
        throw std::runtime_error("extraction response is not a JSON object");
    }

    std::vector<domain::DrugParameter> parameters;
    for (auto it = body.begin(); it != body.end(); ++it) {
        auto kind = domain::KindFromString(it.key());
        if (!kind) {
            std::cerr << "[OllamaParameterExtractor] Ignoring unknown parameter '" << it.key() << "'" << std::endl;
            continue;
        }
        const json& entry = it.value();
        if (!entry.is_object()) continue; // null: not reported
        if (!entry.contains("found") || !entry["found"].is_boolean() || !entry["found"].get<bool>()) continue;
        if (!entry.contains("value")) continue;

        auto value = NumberFrom(entry["value"]);
        if (!value) continue;

        domain::DrugParameter p;
        p.kind = *kind;
        p.value = *value;
        if (entry.contains("unit") && entry["unit"].is_string()) {
            p.unit = entry["unit"].get<std::string>();
        }
        p.isReliable = true;

        if (!p.isPlausible()) {
            std::cerr << "[OllamaParameterExtractor] Dropping implausible " << domain::KindToString(p.kind)
                      << " = " << p.value << std::endl;
            continue;
        }
        parameters.push_back(p);
    }
    return parameters;
}

std::vector<domain::DrugParameter> OllamaParameterExtractor::runPrompt(const std::string& system,
                                                                       const std::string& documentText) {
    auto response = m_client->generate(m_model, system, PromptCatalog::BuildDocumentMessage(documentText), true);
    if (!response) {
        throw domain::CollaboratorUnavailable("Ollama model " + m_model + " did not answer");
    }
    try {
        return ParseResponse(*response);
    } catch (const std::exception& e) {
        std::cerr << "[OllamaParameterExtractor] Unusable response: " << e.what() << std::endl;
        throw domain::CollaboratorUnavailable(std::string("unusable extraction response: ") + e.what());
    }
}

std::vector<domain::DrugParameter> OllamaParameterExtractor::extract(const std::string& documentText,
                                                                     const domain::DrugIdentifier& drug) {
    if (documentText.empty()) return {};

    auto parameters = runPrompt(PromptCatalog::GetExtractionPrompt(drug.inn), documentText);

    const bool hasCv = std::any_of(parameters.begin(), parameters.end(), [](const domain::DrugParameter& p) {
        return p.kind == domain::ParameterKind::CvIntra;
    });
    if (!hasCv) {
        try {
            for (auto& p : runPrompt(PromptCatalog::GetCvIntraPrompt(drug.inn), documentText)) {
                if (p.kind == domain::ParameterKind::CvIntra) parameters.push_back(p);
            }
        } catch (const domain::CollaboratorUnavailable& e) {
            // The general pass already succeeded; keep its results.
            std::cerr << "[OllamaParameterExtractor] CV_intra pass failed: " << e.what() << std::endl;
        }
    }

    std::cout << "[OllamaParameterExtractor] Extracted " << parameters.size() << " parameters" << std::endl;
    return parameters;
}

} // namespace beplanner::infrastructure

/**
 * @file ParameterExtractionService.hpp
 * @brief Interface for extracting PK values from free text.
 */

#pragma once

#include <string>
#include <vector>
#include "DrugParameter.hpp"
#include "Project.hpp"

namespace beplanner::domain {

/**
 * @class ParameterExtractionService
 * @brief Abstract interface for services that read PK parameters out of a document.
 */
class ParameterExtractionService {
public:
    virtual ~ParameterExtractionService() = default;

    /**
     * @brief Extracts parameter candidates from a document text.
     * @param documentText Abstract or body of the publication.
     * @param drug The product the values must refer to.
     * @return Candidates, possibly none. Provenance is filled in by the caller.
     * @throws CollaboratorUnavailable when the backend cannot be reached or times out.
     */
    virtual std::vector<DrugParameter> extract(const std::string& documentText, const DrugIdentifier& drug) = 0;
};

} // namespace beplanner::domain

/**
 * @file LiteratureSearchService.hpp
 * @brief Interface for bibliographic search of PK literature.
 */

#pragma once

#include <string>
#include <vector>
#include "Project.hpp"

namespace beplanner::domain {

/**
 * @struct DocumentReference
 * @brief A retrieved publication: citation id, title and the text to extract from.
 */
struct DocumentReference {
    std::string id;    ///< Citation identifier (PubMed id).
    std::string title;
    std::string text;  ///< Abstract or full text.
};

/**
 * @class LiteratureSearchService
 * @brief Abstract interface for services that find publications describing a drug's PK.
 */
class LiteratureSearchService {
public:
    virtual ~LiteratureSearchService() = default;

    /**
     * @brief Searches for documents about the drug.
     * @param drug The investigated product.
     * @return Matching documents, possibly empty.
     * @throws CollaboratorUnavailable when the backend cannot be reached or times out.
     */
    virtual std::vector<DocumentReference> search(const DrugIdentifier& drug) = 0;
};

} // namespace beplanner::domain

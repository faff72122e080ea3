/**
 * @file PubMedClient.hpp
 * @brief LiteratureSearchService backed by the NCBI E-utilities API.
 */

#pragma once
#include <map>
#include <string>
#include <vector>

#include "domain/LiteratureSearchService.hpp"

namespace beplanner::infrastructure {

/**
 * @class PubMedClient
 * @brief Searches PubMed (esearch), resolves titles (esummary) and fetches plain-text
 *        abstracts (efetch) for the matching PMIDs.
 */
class PubMedClient : public domain::LiteratureSearchService {
public:
    /**
     * @param baseUrl Scheme and host of the E-utilities server.
     * @param apiKey Optional NCBI API key; raises the request rate limit.
     */
    PubMedClient(std::string baseUrl, std::string apiKey, int maxArticles, int timeoutSeconds);

    /** @see domain::LiteratureSearchService::search */
    std::vector<domain::DocumentReference> search(const domain::DrugIdentifier& drug) override;

    /** @brief Search term used for @p drug. */
    static std::string BuildQuery(const domain::DrugIdentifier& drug);

    /** @brief Extracts the PMID list from an esearch JSON body. */
    static std::vector<std::string> ParseSearchIds(const std::string& body);

    /** @brief Maps PMID to title from an esummary JSON body. */
    static std::map<std::string, std::string> ParseTitles(const std::string& body);

private:
    std::string get(const std::string& endpoint, const std::multimap<std::string, std::string>& params);

    std::string m_baseUrl;
    std::string m_apiKey;
    int m_maxArticles;
    int m_timeoutSeconds;
};

} // namespace beplanner::infrastructure

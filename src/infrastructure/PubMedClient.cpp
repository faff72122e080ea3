/**
 * @file PubMedClient.cpp
 * @brief Implementation of PubMedClient.
 */
#include "infrastructure/PubMedClient.hpp"
#include "domain/DesignErrors.hpp"

#include <httplib.h>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace beplanner::infrastructure {

namespace {
constexpr const char* kEutilsPath = "/entrez/eutils/";
constexpr const char* kTool = "beplanner";
}

PubMedClient::PubMedClient(std::string baseUrl, std::string apiKey, int maxArticles, int timeoutSeconds)
    : m_baseUrl(std::move(baseUrl))
    , m_apiKey(std::move(apiKey))
    , m_maxArticles(maxArticles > 0 ? maxArticles : 1)
    , m_timeoutSeconds(timeoutSeconds > 0 ? timeoutSeconds : 30) {}

std::string PubMedClient::BuildQuery(const domain::DrugIdentifier& drug) {
    return drug.inn + " AND (pharmacokinetics OR bioequivalence OR bioavailability) AND healthy";
}

std::vector<std::string> PubMedClient::ParseSearchIds(const std::string& body) {
    auto j = json::parse(body);
    std::vector<std::string> ids;
    if (j.contains("esearchresult") && j["esearchresult"].contains("idlist")) {
        for (const auto& id : j["esearchresult"]["idlist"]) {
            if (id.is_string()) ids.push_back(id.get<std::string>());
        }
    }
    return ids;
}

std::map<std::string, std::string> PubMedClient::ParseTitles(const std::string& body) {
    auto j = json::parse(body);
    std::map<std::string, std::string> titles;
    if (!j.contains("result") || !j["result"].is_object()) return titles;
    const auto& result = j["result"];
    for (auto it = result.begin(); it != result.end(); ++it) {
        if (it.key() == "uids" || !it.value().is_object()) continue;
        if (it.value().contains("title") && it.value()["title"].is_string()) {
            titles[it.key()] = it.value()["title"].get<std::string>();
        }
    }
    return titles;
}

std::string PubMedClient::get(const std::string& endpoint, const std::multimap<std::string, std::string>& extra) {
    httplib::Client cli(m_baseUrl);
    cli.set_connection_timeout(m_timeoutSeconds);
    cli.set_read_timeout(m_timeoutSeconds);
    cli.set_follow_location(true);

    httplib::Params params(extra.begin(), extra.end());
    params.emplace("db", "pubmed");
    params.emplace("tool", kTool);
    if (!m_apiKey.empty()) {
        params.emplace("api_key", m_apiKey);
    }

    auto res = cli.Get(std::string(kEutilsPath) + endpoint, params, httplib::Headers{});
    if (!res) {
        std::cerr << "[PubMedClient] " << endpoint << " connection failed: " << httplib::to_string(res.error()) << std::endl;
        throw domain::CollaboratorUnavailable("PubMed " + endpoint + " unreachable: " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        std::cerr << "[PubMedClient] " << endpoint << " HTTP Error " << res->status << std::endl;
        throw domain::CollaboratorUnavailable("PubMed " + endpoint + " returned HTTP " + std::to_string(res->status));
    }
    return res->body;
}

std::vector<domain::DocumentReference> PubMedClient::search(const domain::DrugIdentifier& drug) {
    const std::string query = BuildQuery(drug);
    std::cout << "[PubMedClient] Searching: " << query << std::endl;

    std::vector<std::string> pmids;
    try {
        pmids = ParseSearchIds(get("esearch.fcgi", {
            {"term", query},
            {"retmax", std::to_string(m_maxArticles)},
            {"retmode", "json"},
            {"sort", "relevance"}
        }));
    } catch (const json::exception& e) {
        throw domain::CollaboratorUnavailable(std::string("malformed esearch response: ") + e.what());
    }
    std::cout << "[PubMedClient] Found " << pmids.size() << " articles" << std::endl;
    if (pmids.empty()) return {};

    std::string idList;
    for (const auto& id : pmids) {
        if (!idList.empty()) idList += ",";
        idList += id;
    }

    std::map<std::string, std::string> titles;
    try {
        titles = ParseTitles(get("esummary.fcgi", {{"id", idList}, {"retmode", "json"}}));
    } catch (const std::exception& e) {
        // Titles are informational only.
        std::cerr << "[PubMedClient] esummary failed, continuing without titles: " << e.what() << std::endl;
    }

    std::vector<domain::DocumentReference> documents;
    std::string lastError;
    for (const auto& pmid : pmids) {
        try {
            std::string text = get("efetch.fcgi", {{"id", pmid}, {"rettype", "abstract"}, {"retmode", "text"}});
            if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
                std::cerr << "[PubMedClient] Empty abstract for PMID " << pmid << std::endl;
                continue;
            }
            documents.push_back(domain::DocumentReference{pmid, titles.count(pmid) ? titles[pmid] : "", text});
        } catch (const domain::CollaboratorUnavailable& e) {
            lastError = e.what();
            std::cerr << "[PubMedClient] efetch failed for PMID " << pmid << ": " << e.what() << std::endl;
        }
    }

    if (documents.empty() && !lastError.empty()) {
        throw domain::CollaboratorUnavailable("no abstract could be fetched: " + lastError);
    }
    return documents;
}

} // namespace beplanner::infrastructure

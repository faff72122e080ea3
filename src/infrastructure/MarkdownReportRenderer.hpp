/**
 * @file MarkdownReportRenderer.hpp
 * @brief ReportRenderer producing a markdown study synopsis.
 */

#pragma once
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

#include "domain/ReportRenderer.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace beplanner::infrastructure {

/**
 * @class MarkdownReportRenderer
 * @brief Writes @c <reportsDir>/<inn>_<id8>.md through PersistenceService.
 */
class MarkdownReportRenderer : public domain::ReportRenderer {
public:
    MarkdownReportRenderer(std::filesystem::path reportsDir, std::shared_ptr<PersistenceService> persistence);

    /** @see domain::ReportRenderer::render */
    domain::ReportArtifact render(const std::string& projectId,
                                  const domain::DesignResult& design,
                                  const domain::RegulatoryVerdict& verdict,
                                  const domain::DrugIdentifier& drug) override;

    /** @brief Builds the synopsis text. */
    static std::string ToMarkdown(const std::string& projectId,
                                  const domain::DesignResult& design,
                                  const domain::RegulatoryVerdict& verdict,
                                  const domain::DrugIdentifier& drug,
                                  std::chrono::system_clock::time_point renderedAt);

    /** @brief File name for a project's synopsis. */
    static std::string FileNameFor(const std::string& projectId, const domain::DrugIdentifier& drug);

private:
    std::filesystem::path m_reportsDir;
    std::shared_ptr<PersistenceService> m_persistence;
};

} // namespace beplanner::infrastructure

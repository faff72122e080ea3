/**
 * @file ReportRenderer.hpp
 * @brief Interface for rendering a study synopsis.
 */

#pragma once

#include "DesignResult.hpp"
#include "Project.hpp"
#include "RegulatoryVerdict.hpp"

namespace beplanner::domain {

/**
 * @class ReportRenderer
 * @brief Abstract interface for services that turn a completed design into a document.
 */
class ReportRenderer {
public:
    virtual ~ReportRenderer() = default;

    /**
     * @brief Renders the synopsis.
     * @param projectId Owning project, used to name the artifact.
     * @param design Computed design.
     * @param verdict Regulatory verdict for the design.
     * @param drug Product metadata.
     * @return Reference to the produced artifact.
     * @throws CollaboratorUnavailable when the artifact cannot be produced.
     */
    virtual ReportArtifact render(const std::string& projectId,
                                  const DesignResult& design,
                                  const RegulatoryVerdict& verdict,
                                  const DrugIdentifier& drug) = 0;
};

} // namespace beplanner::domain

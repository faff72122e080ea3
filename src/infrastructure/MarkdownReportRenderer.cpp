/**
 * @file MarkdownReportRenderer.cpp
 * @brief Implementation of MarkdownReportRenderer.
 */

#include "infrastructure/MarkdownReportRenderer.hpp"
#include "infrastructure/PathUtils.hpp"
#include "domain/DesignErrors.hpp"

#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace beplanner::infrastructure {

namespace {

std::tm ToUtcTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    return tm;
}

std::string Percent(double value) {
    std::ostringstream oss;
    oss << value << "%";
    return oss.str();
}

} // namespace

MarkdownReportRenderer::MarkdownReportRenderer(std::filesystem::path reportsDir,
                                               std::shared_ptr<PersistenceService> persistence)
    : m_reportsDir(std::move(reportsDir)), m_persistence(std::move(persistence)) {}

std::string MarkdownReportRenderer::FileNameFor(const std::string& projectId, const domain::DrugIdentifier& drug) {
    return PathUtils::SanitizeFileName(drug.inn) + "_" + projectId.substr(0, 8) + ".md";
}

std::string MarkdownReportRenderer::ToMarkdown(const std::string& projectId,
                                               const domain::DesignResult& design,
                                               const domain::RegulatoryVerdict& verdict,
                                               const domain::DrugIdentifier& drug,
                                               std::chrono::system_clock::time_point renderedAt) {
    std::stringstream ss;
    ss << "# Bioequivalence Study Synopsis: " << drug.inn << "\n\n";
    if (!drug.innLocal.empty()) ss << "**Local name:** " << drug.innLocal << "\n";
    ss << "**Dosage:** " << drug.dosage << "\n";
    ss << "**Dosage form:** " << drug.form << "\n";
    ss << "**Project:** " << projectId << "\n\n";
    ss << "---\n\n";

    ss << "## Study Design\n\n";
    ss << "| Item | Value |\n|------|-------|\n";
    ss << "| Design | " << domain::DesignTypeToString(design.designType) << " ("
       << design.sequences() << " sequences, " << design.periods() << " periods) |\n";
    ss << "| CV_intra used | " << Percent(design.cvIntraUsed) << " |\n";
    ss << "| Significance level (alpha) | " << design.alpha << " |\n";
    ss << "| Target power | " << Percent(design.powerPercent) << " |\n";
    ss << "| Achieved power | " << std::fixed << std::setprecision(1) << design.achievedPower * 100.0
       << "% |\n" << std::defaultfloat;
    ss << "| Equivalence margin | " << Percent(design.deltaPercent) << " |\n\n";

    ss << "## Sample Size and Enrollment\n\n";
    ss << "- Evaluable subjects: " << design.totalSubjects() << " (" << design.sampleSize << " per sequence)\n";
    ss << "- Enrollment with dropout (" << Percent(design.dropoutRatePercent) << "): "
       << design.enrollmentWithDropout << " per sequence\n";
    ss << "- Enrollment with screen failures (" << Percent(design.screenFailRatePercent) << "): "
       << design.enrollmentWithScreenFail << " per sequence\n\n";

    ss << "## Washout\n\n";
    ss << "- Washout period: " << design.washoutDays() << " days\n";
    if (design.halfLifeHours) {
        ss << "- Based on T1/2 = " << *design.halfLifeHours << " h\n";
    }
    if (design.washoutFromDefaultHalfLife) {
        ss << "- No half-life was available; the default half-life was assumed.\n";
    }
    ss << "\n";

    ss << "## Regulatory Check\n\n";
    ss << "**Verdict:** " << (verdict.compliant ? "Compliant" : "Not compliant") << "\n\n";
    ss << "| Rule | Result | Details |\n|------|--------|---------|\n";
    for (const auto& outcome : verdict.outcomes) {
        ss << "| " << outcome.ruleId << " | " << (outcome.passed ? "PASS" : "FAIL") << " | "
           << outcome.message << " |\n";
    }
    ss << "\n---\n\n";

    std::tm tm = ToUtcTime(std::chrono::system_clock::to_time_t(renderedAt));
    ss << "_Rule set " << verdict.ruleSetVersion << ", design policy " << design.policyVersion
       << ". Generated " << std::put_time(&tm, "%Y-%m-%d %H:%M UTC") << "._\n";
    return ss.str();
}

domain::ReportArtifact MarkdownReportRenderer::render(const std::string& projectId,
                                                      const domain::DesignResult& design,
                                                      const domain::RegulatoryVerdict& verdict,
                                                      const domain::DrugIdentifier& drug) {
    domain::ReportArtifact artifact;
    artifact.format = "markdown";
    artifact.renderedAt = std::chrono::system_clock::now();
    const std::filesystem::path path = m_reportsDir / FileNameFor(projectId, drug);
    artifact.path = path.string();

    try {
        m_persistence->writeTextAtomic(path, ToMarkdown(projectId, design, verdict, drug, artifact.renderedAt));
    } catch (const std::exception& e) {
        std::cerr << "[MarkdownReportRenderer] Failed to write " << path << ": " << e.what() << std::endl;
        throw domain::CollaboratorUnavailable(std::string("report rendering failed: ") + e.what());
    }
    return artifact;
}

} // namespace beplanner::infrastructure

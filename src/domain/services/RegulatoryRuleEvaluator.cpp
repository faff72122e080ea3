/**
 * @file RegulatoryRuleEvaluator.cpp
 * @brief Implementation of the regulatory rule table.
 */

#include "domain/services/RegulatoryRuleEvaluator.hpp"
#include "domain/services/ParameterSelection.hpp"

#include <cmath>
#include <sstream>

namespace beplanner::domain::services {

namespace {

RuleOutcome Pass(const char* id, const std::string& message) {
    return RuleOutcome{id, true, message};
}

RuleOutcome Fail(const char* id, const std::string& message) {
    return RuleOutcome{id, false, message};
}

std::string FormatNumber(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

} // namespace

RegulatoryRuleEvaluator::RegulatoryRuleEvaluator(DesignPolicy policy) : m_policy(std::move(policy)) {}

std::vector<std::string> RegulatoryRuleEvaluator::RuleIds() {
    return {MinSampleSize, CvIntraSource, HighVariabilityDesign, WashoutMinimum, WashoutFeasibility,
            EnrollmentConsistency};
}

RegulatoryVerdict RegulatoryRuleEvaluator::Evaluate(const DesignResult& design,
                                                    const std::vector<DrugParameter>& parameters) const {
    RegulatoryVerdict verdict;
    verdict.ruleSetVersion = std::string(RuleSetVersion) + "/" + m_policy.version;
    verdict.outcomes.push_back(CheckMinSampleSize(design));
    verdict.outcomes.push_back(CheckCvIntraSource(parameters));
    verdict.outcomes.push_back(CheckHighVariabilityDesign(design));
    verdict.outcomes.push_back(CheckWashoutMinimum(design, parameters));
    verdict.outcomes.push_back(CheckWashoutFeasibility(design));
    verdict.outcomes.push_back(CheckEnrollmentConsistency(design));

    verdict.compliant = true;
    for (const auto& outcome : verdict.outcomes) {
        verdict.compliant = verdict.compliant && outcome.passed;
    }
    return verdict;
}

RuleOutcome RegulatoryRuleEvaluator::CheckMinSampleSize(const DesignResult& design) const {
    const int total = design.totalSubjects();
    const std::string figures = std::to_string(total) + " subjects (" + std::to_string(design.sampleSize) +
                                " per sequence x " + std::to_string(design.sequences()) + ")";
    if (total >= m_policy.jurisdictionMinimumSubjects) {
        return Pass(MinSampleSize, figures + " meets the minimum of " +
                                       std::to_string(m_policy.jurisdictionMinimumSubjects));
    }
    return Fail(MinSampleSize, figures + " is below the minimum of " +
                                   std::to_string(m_policy.jurisdictionMinimumSubjects));
}

RuleOutcome RegulatoryRuleEvaluator::CheckCvIntraSource(const std::vector<DrugParameter>& parameters) const {
    const size_t count = CountReliable(parameters, ParameterKind::CvIntra);
    if (count == 0) {
        return Fail(CvIntraSource, "No reliable CV_intra value backs the design");
    }
    std::string message = std::to_string(count) + " reliable CV_intra value(s) available";
    const auto lowest = SelectLowestValue(parameters, ParameterKind::CvIntra);
    if (lowest && *lowest < m_policy.lowCvAdvisoryPercent) {
        message += "; CV_intra " + FormatNumber(*lowest) + "% is below " +
                   FormatNumber(m_policy.lowCvAdvisoryPercent) + "%, verify the data source";
    }
    return Pass(CvIntraSource, message);
}

RuleOutcome RegulatoryRuleEvaluator::CheckHighVariabilityDesign(const DesignResult& design) const {
    const bool highlyVariable = design.cvIntraUsed > m_policy.highVariabilityThresholdPercent;
    const std::string cv = "CV_intra " + FormatNumber(design.cvIntraUsed) + "%";
    if (!highlyVariable) {
        return Pass(HighVariabilityDesign, cv + " does not exceed " +
                                               FormatNumber(m_policy.highVariabilityThresholdPercent) +
                                               "%; " + DesignTypeToString(design.designType) + " is acceptable");
    }
    if (design.designType == DesignType::Replicate) {
        return Pass(HighVariabilityDesign, cv + " is highly variable and a replicate design is used");
    }
    return Fail(HighVariabilityDesign, cv + " is highly variable and requires a replicate design");
}

RuleOutcome RegulatoryRuleEvaluator::CheckWashoutMinimum(const DesignResult& design,
                                                         const std::vector<DrugParameter>& parameters) const {
    const auto halfLife = SelectConservativeValue(parameters, ParameterKind::HalfLife);
    if (!halfLife) {
        return Fail(WashoutMinimum, "No reliable half-life data; washout of " +
                                        std::to_string(design.washoutDays()) + " days cannot be verified");
    }
    const double requiredHours = m_policy.washoutHalfLifeMultiple * *halfLife;
    const double actualHours = static_cast<double>(design.washoutPeriod.count());
    const std::string figures = "washout " + FormatNumber(actualHours) + " h vs " +
                                FormatNumber(m_policy.washoutHalfLifeMultiple) + " x T1/2 " +
                                FormatNumber(*halfLife) + " h = " + FormatNumber(requiredHours) + " h";
    if (actualHours >= requiredHours) {
        return Pass(WashoutMinimum, figures);
    }
    return Fail(WashoutMinimum, figures + " is too short");
}

RuleOutcome RegulatoryRuleEvaluator::CheckWashoutFeasibility(const DesignResult& design) const {
    const int days = design.washoutDays();
    const std::string figures = "washout " + std::to_string(days) + " days";
    if (days <= m_policy.maximumPracticalWashoutDays) {
        return Pass(WashoutFeasibility, figures + " within the practical maximum of " +
                                            std::to_string(m_policy.maximumPracticalWashoutDays) + " days");
    }
    return Fail(WashoutFeasibility, figures + " exceeds the practical maximum of " +
                                        std::to_string(m_policy.maximumPracticalWashoutDays) +
                                        " days; consider a parallel design");
}

RuleOutcome RegulatoryRuleEvaluator::CheckEnrollmentConsistency(const DesignResult& design) const {
    const std::string figures = std::to_string(design.sampleSize) + " <= " +
                                std::to_string(design.enrollmentWithDropout) + " <= " +
                                std::to_string(design.enrollmentWithScreenFail);
    if (design.sampleSize <= 0) {
        return Fail(EnrollmentConsistency, "sample size must be positive (" + figures + ")");
    }
    if (design.enrollmentWithDropout < design.sampleSize ||
        design.enrollmentWithScreenFail < design.enrollmentWithDropout) {
        return Fail(EnrollmentConsistency, "enrollment figures decrease (" + figures + ")");
    }
    return Pass(EnrollmentConsistency, figures);
}

} // namespace beplanner::domain::services

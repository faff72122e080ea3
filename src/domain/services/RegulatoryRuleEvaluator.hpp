/**
 * @file RegulatoryRuleEvaluator.hpp
 * @brief Advisory regulatory gate applied to a computed design.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/DesignPolicy.hpp"
#include "domain/DesignResult.hpp"
#include "domain/DrugParameter.hpp"
#include "domain/RegulatoryVerdict.hpp"

namespace beplanner::domain::services {

/**
 * @class RegulatoryRuleEvaluator
 * @brief Applies the fixed, ordered rule table to a design and its parameter set.
 *
 * Every rule is evaluated independently and always produces an outcome; missing data
 * yields a failing outcome with an explanatory message. Evaluation never throws for data
 * problems and is deterministic for equal inputs.
 */
class RegulatoryRuleEvaluator {
public:
    /** @brief Version of the rule table itself, combined with the policy version in verdicts. */
    static constexpr const char* RuleSetVersion = "be-rules-1";

    static constexpr const char* MinSampleSize = "MIN_SAMPLE_SIZE";
    static constexpr const char* CvIntraSource = "CV_INTRA_SOURCE";
    static constexpr const char* HighVariabilityDesign = "HIGH_VARIABILITY_DESIGN";
    static constexpr const char* WashoutMinimum = "WASHOUT_MINIMUM";
    static constexpr const char* WashoutFeasibility = "WASHOUT_FEASIBILITY";
    static constexpr const char* EnrollmentConsistency = "ENROLLMENT_CONSISTENCY";

    explicit RegulatoryRuleEvaluator(DesignPolicy policy = DesignPolicy::Default());

    RegulatoryVerdict Evaluate(const DesignResult& design, const std::vector<DrugParameter>& parameters) const;

    /** @brief Rule ids in evaluation order. */
    static std::vector<std::string> RuleIds();

private:
    RuleOutcome CheckMinSampleSize(const DesignResult& design) const;
    RuleOutcome CheckCvIntraSource(const std::vector<DrugParameter>& parameters) const;
    RuleOutcome CheckHighVariabilityDesign(const DesignResult& design) const;
    RuleOutcome CheckWashoutMinimum(const DesignResult& design, const std::vector<DrugParameter>& parameters) const;
    RuleOutcome CheckWashoutFeasibility(const DesignResult& design) const;
    RuleOutcome CheckEnrollmentConsistency(const DesignResult& design) const;

    DesignPolicy m_policy;
};

} // namespace beplanner::domain::services

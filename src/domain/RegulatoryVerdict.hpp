/**
 * @file RegulatoryVerdict.hpp
 * @brief Outcome of the regulatory rule table applied to a design.
 */

#pragma once
#include <string>
#include <vector>

namespace beplanner::domain {

/**
 * @struct RuleOutcome
 * @brief Result of one rule, in evaluation order.
 */
struct RuleOutcome {
    std::string ruleId;
    bool passed = false;
    std::string message;

    bool operator==(const RuleOutcome& other) const {
        return ruleId == other.ruleId && passed == other.passed && message == other.message;
    }
};

/**
 * @struct RegulatoryVerdict
 * @brief Aggregate verdict; compliant is the conjunction of every rule outcome.
 */
struct RegulatoryVerdict {
    bool compliant = false;
    std::vector<RuleOutcome> outcomes;
    std::string ruleSetVersion;

    bool operator==(const RegulatoryVerdict& other) const {
        return compliant == other.compliant && outcomes == other.outcomes &&
               ruleSetVersion == other.ruleSetVersion;
    }
};

} // namespace beplanner::domain

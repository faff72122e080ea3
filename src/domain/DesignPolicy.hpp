/**
 * @file DesignPolicy.hpp
 * @brief Versioned policy constants for design computation and regulatory review.
 */

#pragma once
#include <string>

namespace beplanner::domain {

/**
 * @struct DesignPolicy
 * @brief Every default and threshold the calculator and the rule evaluator depend on.
 *
 * A policy is identified by its version label. Any change to a field must come with a
 * new label so that stored DesignResults remain traceable to the rules that produced them.
 */
struct DesignPolicy {
    std::string version = "be-policy-2024.1";

    // Calculator defaults.
    double defaultAlpha = 0.05;        ///< Two-sided significance level (fraction).
    double defaultPowerPercent = 80.0; ///< Target power (percent).
    double defaultDeltaPercent = 20.0; ///< Equivalence margin: limits are [1 - delta, 1 / (1 - delta)].
    double expectedRatio = 0.95;       ///< Assumed test/reference geometric mean ratio.

    // Design classification.
    double highVariabilityThresholdPercent = 30.0;
    int standardMinimumPerSequence = 6;
    int replicateMinimumPerSequence = 12;
    int sampleSizeSearchCeiling = 5000; ///< Per-sequence cap for the power search.

    // Washout.
    double washoutHalfLifeMultiple = 5.0;
    double defaultHalfLifeHours = 24.0; ///< Assumed when no half-life is available.
    int minimumWashoutHours = 24;

    // Regulatory review.
    int jurisdictionMinimumSubjects = 12;
    int maximumPracticalWashoutDays = 90;
    double lowCvAdvisoryPercent = 5.0; ///< CV_intra below this is flagged for source verification.

    /** @brief The built-in policy. */
    static DesignPolicy Default() { return DesignPolicy{}; }
};

} // namespace beplanner::domain

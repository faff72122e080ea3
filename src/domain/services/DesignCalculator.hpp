/**
 * @file DesignCalculator.hpp
 * @brief Sample size, enrollment and washout computation for bioequivalence crossover studies.
 */

#pragma once

#include <chrono>
#include <optional>
#include <vector>

#include "domain/DesignPolicy.hpp"
#include "domain/DesignResult.hpp"
#include "domain/DrugParameter.hpp"

namespace beplanner::domain::services {

/**
 * @class DesignCalculator
 * @brief Pure function set over DesignInputs and a fixed DesignPolicy.
 *
 * Sample size is the smallest number of subjects per sequence for which the power of the
 * two one-sided tests (TOST) procedure in a 2x2 crossover, approximated with the
 * non-central t distribution, reaches the target power.
 */
class DesignCalculator {
public:
    explicit DesignCalculator(DesignPolicy policy = DesignPolicy::Default());

    /**
     * @brief Computes a complete design.
     * @throws InvalidDesignInput for out-of-range inputs.
     * @throws DesignComputationFailed when CV_intra is missing or no sample size reaches the power.
     */
    DesignResult compute(const DesignInputs& inputs) const;

    /**
     * @brief Builds calculator inputs from a project's parameter set.
     *
     * CV_intra and half-life are selected with SelectConservativeValue(); the remaining
     * fields are left to the policy defaults except the attrition rates, which are given.
     */
    static DesignInputs InputsFromParameters(const std::vector<DrugParameter>& parameters,
                                             double dropoutRatePercent = 0.0,
                                             double screenFailRatePercent = 0.0);

    /**
     * @brief TOST power of a 2x2 crossover with @p perSequence subjects in each sequence.
     * @return Power as a fraction in [0, 1].
     */
    double powerAt(int perSequence, double cvPercent, double alpha, double deltaPercent) const;

    /** @brief Unfloored per-sequence sample size from the power search. */
    int requiredSampleSize(double cvPercent, double powerPercent, double alpha, double deltaPercent) const;

    /** @brief Standard crossover up to the high-variability threshold, replicate above it. */
    DesignType classify(double cvPercent) const;

    /** @brief Washout rounded up to whole days, never below the policy minimum. */
    std::chrono::hours washout(std::optional<double> halfLifeHours) const;

    /**
     * @brief ceil(count / (1 - ratePercent / 100)).
     * @throws InvalidDesignInput when the rate is outside [0, 100).
     */
    static int Inflate(int count, double ratePercent, const char* rateName);

    const DesignPolicy& policy() const { return m_policy; }

private:
    void validate(double cvPercent, double powerPercent, double alpha, double deltaPercent) const;

    DesignPolicy m_policy;
};

} // namespace beplanner::domain::services

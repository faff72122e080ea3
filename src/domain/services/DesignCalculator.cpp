/**
 * @file DesignCalculator.cpp
 * @brief Implementation of DesignCalculator.
 */

#include "domain/services/DesignCalculator.hpp"
#include "domain/DesignErrors.hpp"
#include "domain/services/ParameterSelection.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

#include <boost/math/distributions/non_central_t.hpp>
#include <boost/math/distributions/students_t.hpp>

namespace beplanner::domain::services {

namespace {

// Past this non-centrality the t tails are 0 or 1 to double precision and Boost's
// series evaluation overflows.
constexpr double kMaxNonCentrality = 1000.0;

std::string Describe(const char* name, double value) {
    std::ostringstream oss;
    oss << name << " = " << value;
    return oss.str();
}

// P(T < x) for a non-central t with @p df degrees of freedom.
double NonCentralTBelow(int df, double ncp, double x) {
    if (std::abs(ncp) > kMaxNonCentrality && std::abs(ncp) > 10.0 * std::abs(x)) {
        return ncp > 0.0 ? 0.0 : 1.0;
    }
    return boost::math::cdf(boost::math::non_central_t(df, ncp), x);
}

void ValidateHalfLife(double halfLifeHours) {
    if (!std::isfinite(halfLifeHours) || halfLifeHours < 0.0 || halfLifeHours > DrugParameter::MaxHalfLifeHours) {
        throw InvalidDesignInput(Describe("half_life", halfLifeHours) + " is outside [0, " +
                                 std::to_string(static_cast<long long>(DrugParameter::MaxHalfLifeHours)) + "] hours");
    }
}

} // namespace

DesignCalculator::DesignCalculator(DesignPolicy policy) : m_policy(std::move(policy)) {}

DesignInputs DesignCalculator::InputsFromParameters(const std::vector<DrugParameter>& parameters,
                                                    double dropoutRatePercent,
                                                    double screenFailRatePercent) {
    DesignInputs inputs;
    inputs.cvIntraPercent = SelectConservativeValue(parameters, ParameterKind::CvIntra);
    inputs.halfLifeHours = SelectConservativeValue(parameters, ParameterKind::HalfLife);
    inputs.dropoutRatePercent = dropoutRatePercent;
    inputs.screenFailRatePercent = screenFailRatePercent;
    return inputs;
}

void DesignCalculator::validate(double cvPercent, double powerPercent, double alpha, double deltaPercent) const {
    if (!std::isfinite(cvPercent) || cvPercent <= 0.0 || cvPercent > DrugParameter::MaxCvPercent) {
        throw InvalidDesignInput(Describe("cv_intra", cvPercent) + " is outside (0, 200] percent");
    }
    if (!std::isfinite(powerPercent) || powerPercent <= 0.0 || powerPercent >= 100.0) {
        throw InvalidDesignInput(Describe("power", powerPercent) + " is outside (0, 100) percent");
    }
    if (!std::isfinite(alpha) || alpha <= 0.0 || alpha >= 0.5) {
        throw InvalidDesignInput(Describe("alpha", alpha) + " is outside (0, 0.5)");
    }
    if (!std::isfinite(deltaPercent) || deltaPercent <= 0.0 || deltaPercent >= 100.0) {
        throw InvalidDesignInput(Describe("delta", deltaPercent) + " is outside (0, 100) percent");
    }
    const double lower = 1.0 - deltaPercent / 100.0;
    const double upper = 1.0 / lower;
    if (m_policy.expectedRatio <= lower || m_policy.expectedRatio >= upper) {
        throw InvalidDesignInput("expected ratio " + std::to_string(m_policy.expectedRatio) +
                                 " lies outside the equivalence limits for " + Describe("delta", deltaPercent));
    }
}

double DesignCalculator::powerAt(int perSequence, double cvPercent, double alpha, double deltaPercent) const {
    const int df = 2 * perSequence - 2;
    if (df < 1) return 0.0;

    const double cv = cvPercent / 100.0;
    const double variance = std::log1p(cv * cv);
    const double se = std::sqrt(variance / perSequence);

    const double lowerLimit = std::log(1.0 - deltaPercent / 100.0);
    const double upperLimit = -lowerLimit;
    const double difference = std::log(m_policy.expectedRatio);

    const boost::math::students_t central(df);
    const double tCritical = boost::math::quantile(central, 1.0 - alpha / 2.0);

    const double lowerNcp = (difference - lowerLimit) / se;
    const double upperNcp = (difference - upperLimit) / se;

    const double power = NonCentralTBelow(df, upperNcp, -tCritical) - NonCentralTBelow(df, lowerNcp, tCritical);
    return std::clamp(power, 0.0, 1.0);
}

int DesignCalculator::requiredSampleSize(double cvPercent, double powerPercent, double alpha, double deltaPercent) const {
    validate(cvPercent, powerPercent, alpha, deltaPercent);
    const double target = powerPercent / 100.0;
    for (int n = 2; n <= m_policy.sampleSizeSearchCeiling; ++n) {
        if (powerAt(n, cvPercent, alpha, deltaPercent) >= target) {
            return n;
        }
    }
    throw DesignComputationFailed("no sample size up to " + std::to_string(m_policy.sampleSizeSearchCeiling) +
                                  " per sequence reaches " + std::to_string(powerPercent) + "% power");
}

DesignType DesignCalculator::classify(double cvPercent) const {
    return cvPercent > m_policy.highVariabilityThresholdPercent ? DesignType::Replicate
                                                                : DesignType::StandardCrossover;
}

std::chrono::hours DesignCalculator::washout(std::optional<double> halfLifeHours) const {
    const double halfLife = halfLifeHours ? *halfLifeHours : m_policy.defaultHalfLifeHours;
    ValidateHalfLife(halfLife);
    const double hours = m_policy.washoutHalfLifeMultiple * halfLife;
    const long long days = static_cast<long long>(std::ceil(hours / 24.0));
    const long long minimumDays = static_cast<long long>(std::ceil(m_policy.minimumWashoutHours / 24.0));
    return std::chrono::hours(std::max(days, minimumDays) * 24);
}

int DesignCalculator::Inflate(int count, double ratePercent, const char* rateName) {
    if (!std::isfinite(ratePercent) || ratePercent < 0.0 || ratePercent >= 100.0) {
        throw InvalidDesignInput(Describe(rateName, ratePercent) + " is outside [0, 100) percent");
    }
    // Exact for integral rates; the relative nudge absorbs the last-bit error of the division
    // so whole quotients are not rounded up.
    const double quotient = static_cast<double>(count) * 100.0 / (100.0 - ratePercent);
    const double inflated = std::ceil(quotient * (1.0 - 1e-12));
    if (inflated > static_cast<double>(std::numeric_limits<int>::max())) {
        throw InvalidDesignInput(Describe(rateName, ratePercent) + " inflates enrollment beyond a representable size");
    }
    return static_cast<int>(inflated);
}

DesignResult DesignCalculator::compute(const DesignInputs& inputs) const {
    if (!inputs.cvIntraPercent) {
        throw DesignComputationFailed("CV_intra not available; cannot calculate a defensible sample size");
    }
    if (inputs.halfLifeHours) {
        ValidateHalfLife(*inputs.halfLifeHours);
    }

    DesignResult result;
    result.cvIntraUsed = *inputs.cvIntraPercent;
    result.alpha = inputs.alpha.value_or(m_policy.defaultAlpha);
    result.powerPercent = inputs.powerPercent.value_or(m_policy.defaultPowerPercent);
    result.deltaPercent = inputs.deltaPercent.value_or(m_policy.defaultDeltaPercent);
    result.dropoutRatePercent = inputs.dropoutRatePercent;
    result.screenFailRatePercent = inputs.screenFailRatePercent;
    result.halfLifeHours = inputs.halfLifeHours;
    result.policyVersion = m_policy.version;

    int formulaSize = 0;
    try {
        formulaSize = requiredSampleSize(result.cvIntraUsed, result.powerPercent, result.alpha, result.deltaPercent);
    } catch (const InvalidDesignInput&) {
        throw;
    } catch (const DesignComputationFailed&) {
        throw;
    } catch (const std::exception& e) {
        // Numerical failures inside the distribution functions.
        throw DesignComputationFailed(std::string("power evaluation failed: ") + e.what());
    }

    result.designType = classify(result.cvIntraUsed);
    const int floor = result.designType == DesignType::Replicate ? m_policy.replicateMinimumPerSequence
                                                                 : m_policy.standardMinimumPerSequence;
    result.sampleSize = std::max(formulaSize, floor);

    result.enrollmentWithDropout = Inflate(result.sampleSize, result.dropoutRatePercent, "dropout_rate");
    result.enrollmentWithScreenFail = Inflate(result.enrollmentWithDropout, result.screenFailRatePercent, "screen_fail_rate");

    result.washoutPeriod = washout(inputs.halfLifeHours);
    result.washoutFromDefaultHalfLife = !inputs.halfLifeHours.has_value();

    try {
        result.achievedPower = powerAt(result.sampleSize, result.cvIntraUsed, result.alpha, result.deltaPercent);
    } catch (const std::exception& e) {
        throw DesignComputationFailed(std::string("power evaluation failed: ") + e.what());
    }
    return result;
}

} // namespace beplanner::domain::services

/**
 * @file DesignResult.hpp
 * @brief Inputs and outputs of a bioequivalence design computation.
 */

#pragma once
#include <chrono>
#include <optional>
#include <string>

namespace beplanner::domain {

/**
 * @enum DesignType
 * @brief Crossover scheme chosen for the study.
 */
enum class DesignType {
    StandardCrossover, ///< 2x2x2: two sequences (TR/RT), two periods.
    Replicate          ///< 2x2x4 full replicate: two sequences (TRTR/RTRT), four periods.
};

inline std::string DesignTypeToString(DesignType type) {
    switch (type) {
        case DesignType::StandardCrossover: return "2x2 crossover";
        case DesignType::Replicate: return "replicate";
    }
    return "unknown";
}

inline std::optional<DesignType> DesignTypeFromString(const std::string& value) {
    if (value == "2x2 crossover") return DesignType::StandardCrossover;
    if (value == "replicate") return DesignType::Replicate;
    return std::nullopt;
}

inline int SequenceCount(DesignType) { return 2; }

inline int PeriodCount(DesignType type) {
    return type == DesignType::Replicate ? 4 : 2;
}

/**
 * @struct DesignInputs
 * @brief Calculator inputs. Unset optionals fall back to the active DesignPolicy.
 */
struct DesignInputs {
    std::optional<double> cvIntraPercent;
    std::optional<double> deltaPercent;
    std::optional<double> powerPercent;
    std::optional<double> alpha;
    double dropoutRatePercent = 0.0;
    double screenFailRatePercent = 0.0;
    std::optional<double> halfLifeHours;
};

/**
 * @struct DesignResult
 * @brief Immutable outcome of one successful design computation.
 */
struct DesignResult {
    int sampleSize = 0;               ///< Subjects per sequence before attrition.
    int enrollmentWithDropout = 0;
    int enrollmentWithScreenFail = 0;
    std::chrono::hours washoutPeriod{0};
    double cvIntraUsed = 0.0;
    DesignType designType = DesignType::StandardCrossover;

    // Inputs actually applied.
    double alpha = 0.0;
    double powerPercent = 0.0;
    double deltaPercent = 0.0;
    double dropoutRatePercent = 0.0;
    double screenFailRatePercent = 0.0;
    std::optional<double> halfLifeHours;
    bool washoutFromDefaultHalfLife = false;

    double achievedPower = 0.0; ///< Power (fraction) of the unfloored 2x2 formula at sampleSize.
    std::string policyVersion;

    int sequences() const { return SequenceCount(designType); }
    int periods() const { return PeriodCount(designType); }
    int totalSubjects() const { return sampleSize * sequences(); }
    int washoutDays() const { return static_cast<int>(washoutPeriod.count() / 24); }
};

} // namespace beplanner::domain

/**
 * @file DrugParameter.hpp
 * @brief Domain value representing one extracted pharmacokinetic observation.
 */

#pragma once
#include <cctype>
#include <cmath>
#include <optional>
#include <string>

namespace beplanner::domain {

/**
 * @enum ParameterKind
 * @brief Closed set of PK quantities the planner understands.
 */
enum class ParameterKind {
    Cmax,     ///< Peak concentration.
    AUC,      ///< Area under the concentration-time curve.
    HalfLife, ///< Terminal elimination half-life.
    CvIntra,  ///< Intra-subject coefficient of variation.
    Tmax      ///< Time to peak concentration.
};

/**
 * @brief Canonical label used in storage and reports.
 */
inline std::string KindToString(ParameterKind kind) {
    switch (kind) {
        case ParameterKind::Cmax: return "Cmax";
        case ParameterKind::AUC: return "AUC";
        case ParameterKind::HalfLife: return "T1/2";
        case ParameterKind::CvIntra: return "CV_intra";
        case ParameterKind::Tmax: return "Tmax";
    }
    return "Unknown";
}

/**
 * @brief Maps a raw parameter name (canonical label or a known alias) to a kind.
 *
 * Matching ignores case, surrounding whitespace and treats spaces as underscores,
 * so "Intra subject CV" and "intra_subject_cv" resolve identically.
 */
inline std::optional<ParameterKind> KindFromString(const std::string& raw) {
    std::string key;
    key.reserve(raw.size());
    for (unsigned char c : raw) {
        if (std::isspace(c)) {
            key.push_back('_');
        } else {
            key.push_back(static_cast<char>(std::tolower(c)));
        }
    }
    key.erase(0, key.find_first_not_of('_'));
    while (!key.empty() && key.back() == '_') key.pop_back();

    if (key == "cmax" || key == "c_max" || key == "peak_concentration") return ParameterKind::Cmax;
    if (key == "auc" || key == "auc0-t" || key == "auc0-inf" || key == "area_under_curve") return ParameterKind::AUC;
    if (key == "t1/2" || key == "t1_2" || key == "t_half" || key == "half_life" || key == "half-life" ||
        key == "elimination_half_life") {
        return ParameterKind::HalfLife;
    }
    if (key == "cv_intra" || key == "cvintra" || key == "intra_subject_cv" || key == "intrasubject_cv" ||
        key == "within_subject_cv" || key == "withinsubject_cv" || key == "cv_w") {
        return ParameterKind::CvIntra;
    }
    if (key == "tmax" || key == "t_max" || key == "time_to_peak") return ParameterKind::Tmax;
    return std::nullopt;
}

/**
 * @struct DrugParameter
 * @brief A single PK value together with its provenance.
 */
struct DrugParameter {
    /** @brief Upper bound accepted for CV values, in percent. */
    static constexpr double MaxCvPercent = 200.0;
    /** @brief Upper bound accepted for half-lives, in hours (about a century). */
    static constexpr double MaxHalfLifeHours = 1.0e6;

    ParameterKind kind = ParameterKind::CvIntra;
    double value = 0.0;
    std::string unit;
    std::string sourceId;    ///< Citation identifier (e.g. PubMed id) or "manual".
    std::string sourceTitle; ///< Optional human-readable source title.
    bool isReliable = true;

    /**
     * @brief Checks the value invariants.
     * @return True when the value is finite, non-negative and, for CV and half-life, within
     *         MaxCvPercent and MaxHalfLifeHours.
     */
    bool isPlausible() const {
        if (!std::isfinite(value) || value < 0.0) return false;
        if (kind == ParameterKind::CvIntra && value > MaxCvPercent) return false;
        if (kind == ParameterKind::HalfLife && value > MaxHalfLifeHours) return false;
        return true;
    }
};

} // namespace beplanner::domain

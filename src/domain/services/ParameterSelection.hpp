/**
 * @file ParameterSelection.hpp
 * @brief Selection policy for duplicated PK parameters coming from several sources.
 */

#pragma once

#include <optional>
#include <vector>
#include "domain/DrugParameter.hpp"

namespace beplanner::domain::services {

/**
 * @brief Picks the most conservative reliable value of a kind.
 *
 * Unreliable and implausible entries are ignored. The maximum is used for every kind:
 * the highest CV_intra gives the largest sample size and the longest half-life gives the
 * longest washout.
 */
inline std::optional<double> SelectConservativeValue(const std::vector<DrugParameter>& parameters,
                                                     ParameterKind kind) {
    std::optional<double> selected;
    for (const auto& p : parameters) {
        if (p.kind != kind || !p.isReliable || !p.isPlausible()) continue;
        if (!selected || p.value > *selected) {
            selected = p.value;
        }
    }
    return selected;
}

/** @brief Smallest reliable, plausible value of a kind. */
inline std::optional<double> SelectLowestValue(const std::vector<DrugParameter>& parameters, ParameterKind kind) {
    std::optional<double> selected;
    for (const auto& p : parameters) {
        if (p.kind != kind || !p.isReliable || !p.isPlausible()) continue;
        if (!selected || p.value < *selected) {
            selected = p.value;
        }
    }
    return selected;
}

/** @brief Counts reliable, plausible entries of a kind. */
inline size_t CountReliable(const std::vector<DrugParameter>& parameters, ParameterKind kind) {
    size_t count = 0;
    for (const auto& p : parameters) {
        if (p.kind == kind && p.isReliable && p.isPlausible()) ++count;
    }
    return count;
}

} // namespace beplanner::domain::services

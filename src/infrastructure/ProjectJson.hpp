/**
 * @file ProjectJson.hpp
 * @brief JSON mapping of the Project aggregate and its value objects.
 */

#pragma once

#include <nlohmann/json.hpp>

#include "domain/DesignResult.hpp"
#include "domain/Project.hpp"
#include "domain/RegulatoryVerdict.hpp"

namespace beplanner::infrastructure {

nlohmann::json ProjectToJson(const domain::Project& project);

/** @throws std::runtime_error (or nlohmann::json::exception) on malformed documents. */
domain::Project ProjectFromJson(const nlohmann::json& j);

nlohmann::json DesignToJson(const domain::DesignResult& design);
domain::DesignResult DesignFromJson(const nlohmann::json& j);

nlohmann::json VerdictToJson(const domain::RegulatoryVerdict& verdict);
domain::RegulatoryVerdict VerdictFromJson(const nlohmann::json& j);

} // namespace beplanner::infrastructure

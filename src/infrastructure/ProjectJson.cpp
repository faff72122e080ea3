/**
 * @file ProjectJson.cpp
 * @brief Implementation of the Project JSON mapping.
 */

#include "infrastructure/ProjectJson.hpp"

#include <chrono>
#include <stdexcept>

namespace beplanner::infrastructure {

using json = nlohmann::json;

namespace {

// Timestamps are stored as milliseconds since the epoch.
long long ToMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point FromMillis(long long ms) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(ms)));
}

json ParameterToJson(const domain::DrugParameter& p) {
    return {
        {"kind", domain::KindToString(p.kind)},
        {"value", p.value},
        {"unit", p.unit},
        {"source_id", p.sourceId},
        {"source_title", p.sourceTitle},
        {"reliable", p.isReliable}
    };
}

domain::DrugParameter ParameterFromJson(const json& j) {
    const std::string kindLabel = j.at("kind").get<std::string>();
    auto kind = domain::KindFromString(kindLabel);
    if (!kind) {
        throw std::runtime_error("unknown parameter kind: " + kindLabel);
    }
    domain::DrugParameter p;
    p.kind = *kind;
    p.value = j.at("value").get<double>();
    p.unit = j.value("unit", "");
    p.sourceId = j.value("source_id", "");
    p.sourceTitle = j.value("source_title", "");
    p.isReliable = j.value("reliable", true);
    return p;
}

json OptionalNumber(const std::optional<double>& value) {
    return value ? json(*value) : json(nullptr);
}

} // namespace

json DesignToJson(const domain::DesignResult& d) {
    return {
        {"sample_size", d.sampleSize},
        {"enrollment_with_dropout", d.enrollmentWithDropout},
        {"enrollment_with_screen_fail", d.enrollmentWithScreenFail},
        {"washout_hours", d.washoutPeriod.count()},
        {"washout_days", d.washoutDays()},
        {"cv_intra_used", d.cvIntraUsed},
        {"design_type", domain::DesignTypeToString(d.designType)},
        {"sequences", d.sequences()},
        {"periods", d.periods()},
        {"total_subjects", d.totalSubjects()},
        {"alpha", d.alpha},
        {"power", d.powerPercent},
        {"delta", d.deltaPercent},
        {"dropout_rate", d.dropoutRatePercent},
        {"screen_fail_rate", d.screenFailRatePercent},
        {"half_life_hours", OptionalNumber(d.halfLifeHours)},
        {"washout_from_default_half_life", d.washoutFromDefaultHalfLife},
        {"achieved_power", d.achievedPower},
        {"policy_version", d.policyVersion}
    };
}

domain::DesignResult DesignFromJson(const json& j) {
    domain::DesignResult d;
    d.sampleSize = j.at("sample_size").get<int>();
    d.enrollmentWithDropout = j.at("enrollment_with_dropout").get<int>();
    d.enrollmentWithScreenFail = j.at("enrollment_with_screen_fail").get<int>();
    d.washoutPeriod = std::chrono::hours(j.at("washout_hours").get<long long>());
    d.cvIntraUsed = j.at("cv_intra_used").get<double>();

    const std::string type = j.at("design_type").get<std::string>();
    auto designType = domain::DesignTypeFromString(type);
    if (!designType) {
        throw std::runtime_error("unknown design type: " + type);
    }
    d.designType = *designType;

    d.alpha = j.at("alpha").get<double>();
    d.powerPercent = j.at("power").get<double>();
    d.deltaPercent = j.at("delta").get<double>();
    d.dropoutRatePercent = j.value("dropout_rate", 0.0);
    d.screenFailRatePercent = j.value("screen_fail_rate", 0.0);
    if (j.contains("half_life_hours") && !j["half_life_hours"].is_null()) {
        d.halfLifeHours = j["half_life_hours"].get<double>();
    }
    d.washoutFromDefaultHalfLife = j.value("washout_from_default_half_life", false);
    d.achievedPower = j.value("achieved_power", 0.0);
    d.policyVersion = j.value("policy_version", "");
    return d;
}

json VerdictToJson(const domain::RegulatoryVerdict& v) {
    json outcomes = json::array();
    for (const auto& o : v.outcomes) {
        outcomes.push_back({{"rule_id", o.ruleId}, {"passed", o.passed}, {"message", o.message}});
    }
    return {
        {"compliant", v.compliant},
        {"rule_set_version", v.ruleSetVersion},
        {"outcomes", outcomes}
    };
}

domain::RegulatoryVerdict VerdictFromJson(const json& j) {
    domain::RegulatoryVerdict v;
    v.compliant = j.at("compliant").get<bool>();
    v.ruleSetVersion = j.value("rule_set_version", "");
    for (const auto& o : j.at("outcomes")) {
        v.outcomes.push_back(domain::RuleOutcome{
            o.at("rule_id").get<std::string>(),
            o.at("passed").get<bool>(),
            o.value("message", "")
        });
    }
    return v;
}

json ProjectToJson(const domain::Project& project) {
    json j = {
        {"id", project.id},
        {"drug", {
            {"inn", project.drug.inn},
            {"inn_local", project.drug.innLocal},
            {"dosage", project.drug.dosage},
            {"form", project.drug.form}
        }},
        {"status", domain::StatusToString(project.status)},
        {"created_at", ToMillis(project.createdAt)},
        {"updated_at", ToMillis(project.updatedAt)},
        {"attempt", project.attempt},
        {"message", project.message}
    };

    j["parameters"] = json::array();
    for (const auto& p : project.parameters) {
        j["parameters"].push_back(ParameterToJson(p));
    }

    if (project.searchSummary) {
        j["search_summary"] = {
            {"documents_processed", project.searchSummary->documentsProcessed},
            {"parameters_found", project.searchSummary->parametersFound},
            {"parameters_rejected", project.searchSummary->parametersRejected}
        };
    }
    if (project.design) j["design"] = DesignToJson(*project.design);
    if (project.verdict) j["verdict"] = VerdictToJson(*project.verdict);
    if (project.report) {
        j["report"] = {
            {"path", project.report->path},
            {"format", project.report->format},
            {"rendered_at", ToMillis(project.report->renderedAt)}
        };
    }
    return j;
}

domain::Project ProjectFromJson(const json& j) {
    domain::Project project;
    project.id = j.at("id").get<std::string>();

    const auto& drug = j.at("drug");
    project.drug.inn = drug.at("inn").get<std::string>();
    project.drug.innLocal = drug.value("inn_local", "");
    project.drug.dosage = drug.value("dosage", "");
    project.drug.form = drug.value("form", "");

    const std::string status = j.at("status").get<std::string>();
    auto parsed = domain::StatusFromString(status);
    if (!parsed) {
        throw std::runtime_error("unknown status: " + status);
    }
    project.status = *parsed;
    project.createdAt = FromMillis(j.at("created_at").get<long long>());
    project.updatedAt = FromMillis(j.value("updated_at", j.at("created_at").get<long long>()));
    project.attempt = j.value("attempt", 1);
    project.message = j.value("message", "");

    if (j.contains("parameters")) {
        for (const auto& p : j["parameters"]) {
            project.parameters.push_back(ParameterFromJson(p));
        }
    }
    if (j.contains("search_summary")) {
        const auto& s = j["search_summary"];
        domain::SearchSummary summary;
        summary.documentsProcessed = s.value("documents_processed", 0);
        if (s.contains("parameters_found")) {
            summary.parametersFound = s["parameters_found"].get<std::map<std::string, int>>();
        }
        summary.parametersRejected = s.value("parameters_rejected", 0);
        project.searchSummary = summary;
    }
    if (j.contains("design")) project.design = DesignFromJson(j["design"]);
    if (j.contains("verdict")) project.verdict = VerdictFromJson(j["verdict"]);
    if (j.contains("report")) {
        const auto& r = j["report"];
        domain::ReportArtifact artifact;
        artifact.path = r.at("path").get<std::string>();
        artifact.format = r.value("format", "");
        artifact.renderedAt = FromMillis(r.value("rendered_at", 0LL));
        project.report = artifact;
    }
    return project;
}

} // namespace beplanner::infrastructure

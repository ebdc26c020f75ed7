#include "engine/Alert.hpp"

namespace securewatch {

std::string AlertStatusToString(AlertStatus status) {
    switch (status) {
        case AlertStatus::NEW:          return "new";
        case AlertStatus::ACKNOWLEDGED: return "acknowledged";
        case AlertStatus::RESOLVED:     return "resolved";
        default:                        return "unknown";
    }
}

std::optional<AlertStatus> AlertStatusFromString(const std::string& text) {
    if (text == "new") return AlertStatus::NEW;
    if (text == "acknowledged") return AlertStatus::ACKNOWLEDGED;
    if (text == "resolved") return AlertStatus::RESOLVED;
    return std::nullopt;
}

nlohmann::json Alert::ToJson() const {
    nlohmann::json j;
    j["id"] = id;
    j["matchId"] = match_id;
    j["ruleId"] = rule_id;
    j["ruleName"] = rule_name;
    j["organizationId"] = organization_id;
    j["severity"] = SeverityToString(severity);
    j["confidence"] = confidence;
    j["status"] = AlertStatusToString(status);
    j["dedupeKey"] = dedupe_key;
    j["createdAt"] = created_at;
    j["eventCount"] = EventCount();
    j["tags"] = tags;
    j["scoreFactors"] = score_factors;
    if (match) {
        j["match"] = match->ToJson();
    }
    return j;
}

Alert Alert::FromJson(const nlohmann::json& j) {
    Alert alert;
    alert.id = j.at("id").get<std::string>();
    alert.match_id = j.at("matchId").get<std::string>();
    alert.rule_id = j.at("ruleId").get<std::string>();
    alert.rule_name = j.value("ruleName", std::string());
    alert.organization_id = j.value("organizationId", std::string());
    alert.severity = SeverityFromString(j.value("severity", std::string("medium"))).value_or(Severity::MEDIUM);
    alert.confidence = j.value("confidence", 0u);
    alert.status = AlertStatusFromString(j.value("status", std::string("new"))).value_or(AlertStatus::NEW);
    alert.dedupe_key = j.at("dedupeKey").get<std::string>();
    alert.created_at = j.value("createdAt", uint64_t{0});
    alert.tags = j.value("tags", std::vector<std::string>{});
    alert.score_factors = j.value("scoreFactors", std::map<std::string, uint32_t>{});
    if (j.contains("match") && j["match"].is_object()) {
        alert.match = std::make_shared<const Match>(Match::FromJson(j["match"]));
    }
    return alert;
}

} // namespace securewatch

#include "engine/Match.hpp"

namespace securewatch {

std::string Match::IdempotencyKey() const {
    if (window_id) {
        return rule_id + "|w|" + *window_id;
    }
    return rule_id + "|e|" + (event_refs.empty() ? std::string() : event_refs.front().event_id);
}

nlohmann::json Match::ToJson() const {
    nlohmann::json j;
    j["id"] = id;
    j["ruleId"] = rule_id;
    j["ruleVersion"] = rule_version;
    j["windowId"] = window_id ? nlohmann::json(*window_id) : nlohmann::json(nullptr);
    j["timestamp"] = timestamp;
    j["rawConfidence"] = raw_confidence;
    j["correlationValues"] = correlation_values;
    j["threshold"] = threshold;
    j["eventCount"] = EventCount();

    nlohmann::json refs = nlohmann::json::array();
    for (const auto& ref : event_refs) {
        nlohmann::json r;
        r["eventId"] = ref.event_id;
        r["timestamp"] = ref.timestamp;
        r["sourceIdentifier"] = ref.source_identifier;
        r["matchedFields"] = ref.matched_fields;
        if (!ref.step.empty()) {
            r["step"] = ref.step;
        }
        refs.push_back(r);
    }
    j["eventRefs"] = refs;
    return j;
}

Match Match::FromJson(const nlohmann::json& j) {
    Match match;
    match.id = j.at("id").get<std::string>();
    match.rule_id = j.at("ruleId").get<std::string>();
    match.rule_version = j.value("ruleVersion", uint64_t{0});
    if (j.contains("windowId") && j["windowId"].is_string()) {
        match.window_id = j["windowId"].get<std::string>();
    }
    match.timestamp = j.at("timestamp").get<uint64_t>();
    match.raw_confidence = j.value("rawConfidence", 0u);
    match.correlation_values = j.value("correlationValues", std::vector<std::string>{});
    match.threshold = j.value("threshold", 1u);

    for (const auto& r : j.at("eventRefs")) {
        EventRef ref;
        ref.event_id = r.at("eventId").get<std::string>();
        ref.timestamp = r.at("timestamp").get<uint64_t>();
        ref.source_identifier = r.value("sourceIdentifier", std::string());
        ref.matched_fields = r.value("matchedFields", MatchedFields{});
        ref.step = r.value("step", std::string());
        match.event_refs.push_back(std::move(ref));
    }
    return match;
}

} // namespace securewatch

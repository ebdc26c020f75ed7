#include "engine/Rule.hpp"
#include <algorithm>

namespace securewatch {

std::string SeverityToString(Severity severity) {
    switch (severity) {
        case Severity::LOW:      return "low";
        case Severity::MEDIUM:   return "medium";
        case Severity::HIGH:     return "high";
        case Severity::CRITICAL: return "critical";
        default:                 return "unknown";
    }
}

std::optional<Severity> SeverityFromString(const std::string& text) {
    std::string lower = ToLower(text);
    if (lower == "low" || lower == "informational" || lower == "info") return Severity::LOW;
    if (lower == "medium") return Severity::MEDIUM;
    if (lower == "high") return Severity::HIGH;
    if (lower == "critical") return Severity::CRITICAL;
    return std::nullopt;
}

std::string RuleActionToString(RuleAction action) {
    switch (action) {
        case RuleAction::ALERT:    return "alert";
        case RuleAction::SUPPRESS: return "suppress";
        default:                   return "unknown";
    }
}

std::optional<RuleAction> RuleActionFromString(const std::string& text) {
    std::string lower = ToLower(text);
    if (lower == "alert") return RuleAction::ALERT;
    if (lower == "suppress") return RuleAction::SUPPRESS;
    return std::nullopt;
}

const std::vector<std::string>& Rule::GroupingFields() const {
    static const std::vector<std::string> kNone;
    if (correlation) {
        return correlation->fields;
    }
    if (sequence) {
        return sequence->fields;
    }
    return kNone;
}

bool RuleFilter::Matches(const Rule& rule) const {
    if (organization_id && !rule.AppliesToOrganization(*organization_id)) {
        return false;
    }
    if (enabled && rule.enabled != *enabled) {
        return false;
    }
    if (correlation && rule.IsMultiEvent() != *correlation) {
        return false;
    }
    if (tag && std::find(rule.tags.begin(), rule.tags.end(), *tag) == rule.tags.end()) {
        return false;
    }
    if (min_severity && static_cast<int>(rule.severity) < static_cast<int>(*min_severity)) {
        return false;
    }
    return true;
}

} // namespace securewatch

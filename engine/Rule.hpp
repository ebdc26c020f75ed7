#pragma once

#include "engine/Condition.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace securewatch {

enum class Severity {
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

enum class RuleAction {
    ALERT,
    SUPPRESS
};

std::string SeverityToString(Severity severity);
std::optional<Severity> SeverityFromString(const std::string& text);
std::string RuleActionToString(RuleAction action);
std::optional<RuleAction> RuleActionFromString(const std::string& text);

// Multi-event part of a correlation rule: `threshold` matching events sharing
// the same `fields` values within `time_window_ms` of the first one.
struct CorrelationParams {
    std::vector<std::string> fields;
    uint64_t time_window_ms{0};
    uint32_t threshold{1};
};

// One step of a sequence rule, satisfied by an event matching `conditions`.
// The following step has to arrive within `timeout_ms` of this one.
struct SequenceStep {
    std::string name;
    ConditionNode conditions;
    uint64_t timeout_ms{1800000};
};

// Steps observed for the same `fields` values, in declaration order when
// `ordered`, in any order otherwise. Completing the last step fires once
// and resets the chain.
struct SequenceParams {
    std::vector<std::string> fields;
    std::vector<SequenceStep> steps;
    bool ordered{true};
};

// Immutable once published to the registry. An update yields a new Rule
// value with a higher version.
struct Rule {
    std::string id;
    std::string organization_id;            // empty applies to every organization
    std::string name;
    std::string description;
    bool enabled{true};
    Severity severity{Severity::MEDIUM};
    std::vector<std::string> tags;
    std::vector<std::string> sources;       // source identifiers / categories, empty = any
    ConditionNode conditions;
    RuleAction action{RuleAction::ALERT};
    uint32_t base_confidence{50};
    std::vector<std::string> dedupe_fields;
    std::optional<CorrelationParams> correlation;
    std::optional<SequenceParams> sequence;
    uint64_t version{1};

    bool IsCorrelation() const { return correlation.has_value(); }
    bool IsSequence() const { return sequence.has_value(); }
    bool IsMultiEvent() const { return IsCorrelation() || IsSequence(); }

    // Fields whose values partition the rule's windows; empty for
    // single-event rules.
    const std::vector<std::string>& GroupingFields() const;

    bool AppliesToOrganization(const std::string& org) const {
        return organization_id.empty() || organization_id == org;
    }
};

using RulePtr = std::shared_ptr<const Rule>;

struct RuleFilter {
    std::optional<std::string> organization_id;
    std::optional<bool> enabled;
    std::optional<bool> correlation;        // threshold or sequence rules
    std::optional<std::string> tag;
    std::optional<Severity> min_severity;

    bool Matches(const Rule& rule) const;
};

} // namespace securewatch

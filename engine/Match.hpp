#pragma once

#include "engine/Condition.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace securewatch {

struct EventRef {
    std::string event_id;
    uint64_t timestamp{0};
    std::string source_identifier;
    MatchedFields matched_fields;
    std::string step;                       // sequence step the event satisfied
};

// Immutable record of a rule firing, either on a single event or on a
// correlation window crossing its threshold or a sequence completing.
struct Match {
    std::string id;
    std::string rule_id;
    uint64_t rule_version{0};
    std::optional<std::string> window_id;
    uint64_t timestamp{0};
    std::vector<EventRef> event_refs;       // ascending by timestamp
    uint32_t raw_confidence{0};
    std::vector<std::string> correlation_values;
    uint32_t threshold{1};

    size_t EventCount() const { return event_refs.size(); }
    bool IsCorrelation() const { return window_id.has_value(); }

    // (ruleId, windowId | eventId)
    std::string IdempotencyKey() const;

    nlohmann::json ToJson() const;
    static Match FromJson(const nlohmann::json& j);
};

} // namespace securewatch

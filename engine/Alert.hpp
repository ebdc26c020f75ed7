#pragma once

#include "engine/Match.hpp"
#include "engine/Rule.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace securewatch {

enum class AlertStatus {
    NEW,
    ACKNOWLEDGED,
    RESOLVED
};

std::string AlertStatusToString(AlertStatus status);
std::optional<AlertStatus> AlertStatusFromString(const std::string& text);

struct Alert {
    std::string id;
    std::string match_id;
    std::string rule_id;
    std::string rule_name;
    std::string organization_id;
    Severity severity{Severity::MEDIUM};
    uint32_t confidence{0};
    AlertStatus status{AlertStatus::NEW};
    std::string dedupe_key;
    uint64_t created_at{0};
    std::vector<std::string> tags;
    std::map<std::string, uint32_t> score_factors;
    std::shared_ptr<const Match> match;

    size_t EventCount() const { return match ? match->EventCount() : 0; }

    nlohmann::json ToJson() const;
    static Alert FromJson(const nlohmann::json& j);
};

} // namespace securewatch

#include "engine/Scorer.hpp"
#include "engine/Condition.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>

namespace securewatch {

Scorer::Scorer(ScoringConfig config)
    : config_(std::move(config)) {
}

bool Scorer::IsTruthy(const std::string& value) {
    std::string lower = ToLower(value);
    return !(lower.empty() || lower == "0" || lower == "false" || lower == "no" || lower == "none");
}

uint32_t Scorer::ThresholdRatioBonus(const Match& match) const {
    if (!match.IsCorrelation() || match.threshold == 0) {
        return 0;
    }
    // 1x threshold earns nothing, 2x or more earns the full bonus
    double ratio = static_cast<double>(match.EventCount()) / static_cast<double>(match.threshold);
    double scaled = std::clamp(ratio - 1.0, 0.0, 1.0) * config_.threshold_ratio_max_bonus;
    return static_cast<uint32_t>(std::lround(scaled));
}

size_t Scorer::CountThreatIntelHits(const std::vector<EventPtr>& events) const {
    size_t hits = 0;
    for (const auto& event : events) {
        for (const auto& field : config_.threat_intel_fields) {
            auto value = event->GetField(field);
            if (value && IsTruthy(*value)) {
                ++hits;
                break;
            }
        }
    }
    return hits;
}

ConfidenceScore Scorer::Score(const Match& match, const std::vector<EventPtr>& events) const {
    ConfidenceScore result;
    result.contributing_factors["base_confidence"] = match.raw_confidence;

    uint32_t ratio_bonus = ThresholdRatioBonus(match);
    if (ratio_bonus > 0) {
        result.contributing_factors["threshold_ratio"] = ratio_bonus;
    }

    size_t hits = CountThreatIntelHits(events);
    if (hits > 0 && config_.threat_intel_bonus > 0) {
        result.contributing_factors["threat_intel"] = config_.threat_intel_bonus;
    }

    uint32_t total = 0;
    for (const auto& [factor, points] : result.contributing_factors) {
        total += points;
    }
    result.confidence = std::min(total, 100u);

    LOG_TRACE("Match {} scored {} (ratio bonus {}, threat intel hits {})",
              match.id, result.confidence, ratio_bonus, hits);
    return result;
}

} // namespace securewatch

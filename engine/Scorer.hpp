#pragma once

#include "core/Config.hpp"
#include "core/SecurityEvent.hpp"
#include "engine/Match.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace securewatch {

struct ConfidenceScore {
    uint32_t confidence{0};
    std::map<std::string, uint32_t> contributing_factors;
};

// Confidence = base + threshold-ratio bonus + threat-intel bonus, clamped
// to 100. Stateless; safe to share between workers.
//
// Windows fire on the append that reaches their threshold, so matches from
// the live pipeline carry exactly `threshold` events and earn no ratio
// bonus. The bonus only applies to matches assembled from a window holding
// more events than its threshold.
class Scorer {
public:
    explicit Scorer(ScoringConfig config = {});

    ConfidenceScore Score(const Match& match, const std::vector<EventPtr>& events) const;

    // Truthy enrichment value: anything except empty, "0", "false", "no", "none".
    static bool IsTruthy(const std::string& value);

private:
    uint32_t ThresholdRatioBonus(const Match& match) const;
    size_t CountThreatIntelHits(const std::vector<EventPtr>& events) const;

    ScoringConfig config_;
};

} // namespace securewatch

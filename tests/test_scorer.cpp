#include <gtest/gtest.h>
#include "engine/Scorer.hpp"

using namespace securewatch;

namespace {

Match MakeMatch(size_t events, uint32_t threshold, bool correlation = true, uint32_t base = 50) {
    Match match;
    match.id = "m-1";
    match.rule_id = "r-1";
    match.raw_confidence = base;
    match.threshold = threshold;
    if (correlation) {
        match.window_id = "r-1#1";
    }
    for (size_t i = 0; i < events; ++i) {
        EventRef ref;
        ref.event_id = "e" + std::to_string(i);
        match.event_refs.push_back(ref);
    }
    return match;
}

std::vector<EventPtr> Events(size_t count, const std::string& intel_field = "", const std::string& intel_value = "") {
    std::vector<EventPtr> events;
    for (size_t i = 0; i < count; ++i) {
        auto event = std::make_shared<SecurityEvent>();
        event->id = "e" + std::to_string(i);
        if (i == 0 && !intel_field.empty()) {
            event->fields[intel_field] = intel_value;
        }
        events.push_back(event);
    }
    return events;
}

} // namespace

TEST(ScorerTest, BaseConfidenceOnly) {
    Scorer scorer;
    auto score = scorer.Score(MakeMatch(5, 5), Events(5));

    EXPECT_EQ(score.confidence, 50u);
    EXPECT_EQ(score.contributing_factors.size(), 1u);
    EXPECT_EQ(score.contributing_factors.at("base_confidence"), 50u);
}

TEST(ScorerTest, ThresholdRatioBonusScales) {
    Scorer scorer;

    // 1.5x threshold earns half of the bonus
    auto half = scorer.Score(MakeMatch(6, 4), Events(6));
    EXPECT_EQ(half.contributing_factors.at("threshold_ratio"), 10u);
    EXPECT_EQ(half.confidence, 60u);

    // capped at 2x
    auto full = scorer.Score(MakeMatch(40, 4), Events(40));
    EXPECT_EQ(full.contributing_factors.at("threshold_ratio"), 20u);
    EXPECT_EQ(full.confidence, 70u);
}

TEST(ScorerTest, SingleEventMatchHasNoRatioBonus) {
    Scorer scorer;
    auto score = scorer.Score(MakeMatch(1, 1, false), Events(1));
    EXPECT_EQ(score.contributing_factors.count("threshold_ratio"), 0u);
}

TEST(ScorerTest, ThreatIntelBonusAppliedOnce) {
    Scorer scorer;
    auto events = Events(3, "threat_intel_hit", "true");
    auto second = std::make_shared<SecurityEvent>();
    second->fields["threat_intel.match"] = "known-bad";
    events.push_back(second);

    auto score = scorer.Score(MakeMatch(4, 4), events);
    EXPECT_EQ(score.contributing_factors.at("threat_intel"), 15u);
    EXPECT_EQ(score.confidence, 65u);
}

TEST(ScorerTest, FalsyThreatIntelValuesIgnored) {
    Scorer scorer;
    for (const std::string value : {"", "0", "false", "No", "NONE"}) {
        auto score = scorer.Score(MakeMatch(1, 1, false), Events(1, "threat_intel_hit", value));
        EXPECT_EQ(score.contributing_factors.count("threat_intel"), 0u) << value;
    }
}

TEST(ScorerTest, ConfidenceCappedAt100) {
    Scorer scorer;
    auto score = scorer.Score(MakeMatch(10, 2, true, 90), Events(10, "threat_intel_hit", "1"));
    EXPECT_EQ(score.confidence, 100u);
    EXPECT_EQ(score.contributing_factors.at("base_confidence"), 90u);
}

TEST(ScorerTest, CustomConfiguration) {
    ScoringConfig config;
    config.threshold_ratio_max_bonus = 40;
    config.threat_intel_bonus = 0;
    config.threat_intel_fields = {"ioc"};
    Scorer scorer(config);

    auto score = scorer.Score(MakeMatch(4, 2), Events(4, "ioc", "yes"));
    EXPECT_EQ(score.contributing_factors.at("threshold_ratio"), 40u);
    EXPECT_EQ(score.contributing_factors.count("threat_intel"), 0u);
    EXPECT_EQ(score.confidence, 90u);
}

TEST(ScorerTest, IsTruthy) {
    EXPECT_TRUE(Scorer::IsTruthy("true"));
    EXPECT_TRUE(Scorer::IsTruthy("1"));
    EXPECT_TRUE(Scorer::IsTruthy("malicious"));
    EXPECT_FALSE(Scorer::IsTruthy(""));
    EXPECT_FALSE(Scorer::IsTruthy("False"));
    EXPECT_FALSE(Scorer::IsTruthy("none"));
}

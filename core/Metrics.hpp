#pragma once

#include <nlohmann/json.hpp>
#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace securewatch {

enum class Counter : size_t {
    EVENTS_RECEIVED,
    EVENTS_PROCESSED,
    EVENTS_REJECTED,
    RULE_EVALUATIONS,
    RULE_EVALUATION_ERRORS,
    MISSING_CORRELATION_FIELD,
    EVENTS_OUT_OF_WINDOW,
    WINDOWS_CREATED,
    WINDOWS_EXPIRED,
    WINDOWS_EVICTED,
    MATCHES_CREATED,
    MATCHES_MUTED,
    ALERTS_EMITTED,
    ALERTS_SUPPRESSED,
    ALERTS_DROPPED,
    ALERTS_OVERFLOWED,
    EMIT_RETRIES,
    COUNT_
};

const char* CounterToString(Counter counter);

// Per-rule evaluation statistics. Latencies are wall time in microseconds.
struct RuleStats {
    uint64_t evaluations{0};
    uint64_t matches{0};
    uint64_t total_eval_us{0};
    uint64_t max_eval_us{0};

    double AverageEvalUs() const {
        return evaluations == 0 ? 0.0 : static_cast<double>(total_eval_us) / static_cast<double>(evaluations);
    }
    nlohmann::json ToJson() const;
};

struct MetricsSnapshot {
    std::unordered_map<std::string, uint64_t> counters;
    std::unordered_map<std::string, RuleStats> rules;
    uint64_t active_windows{0};
    uint64_t degraded_rules{0};

    uint64_t Get(Counter counter) const;
    nlohmann::json ToJson() const;
};

class EngineMetrics {
public:
    EngineMetrics();

    EngineMetrics(const EngineMetrics&) = delete;
    EngineMetrics& operator=(const EngineMetrics&) = delete;

    void Increment(Counter counter, uint64_t delta = 1);
    uint64_t Get(Counter counter) const;

    void RecordRuleEvaluation(const std::string& rule_id, uint64_t elapsed_us);
    void RecordRuleMatch(const std::string& rule_id);
    RuleStats GetRuleStats(const std::string& rule_id) const;
    void ForgetRule(const std::string& rule_id);

    MetricsSnapshot Snapshot() const;
    void Reset();

private:
    std::array<std::atomic<uint64_t>, static_cast<size_t>(Counter::COUNT_)> counters_;

    struct RuleCounters {
        std::atomic<uint64_t> evaluations{0};
        std::atomic<uint64_t> matches{0};
        std::atomic<uint64_t> total_eval_us{0};
        std::atomic<uint64_t> max_eval_us{0};
    };

    RuleCounters& CountersFor(const std::string& rule_id);

    mutable std::shared_mutex rule_mutex_;
    std::unordered_map<std::string, std::unique_ptr<RuleCounters>> rule_counters_;
};

} // namespace securewatch

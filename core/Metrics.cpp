#include "core/Metrics.hpp"
#include <mutex>

namespace securewatch {

const char* CounterToString(Counter counter) {
    switch (counter) {
        case Counter::EVENTS_RECEIVED:           return "events_received";
        case Counter::EVENTS_PROCESSED:          return "events_processed";
        case Counter::EVENTS_REJECTED:           return "events_rejected";
        case Counter::RULE_EVALUATIONS:          return "rule_evaluations";
        case Counter::RULE_EVALUATION_ERRORS:    return "rule_evaluation_errors";
        case Counter::MISSING_CORRELATION_FIELD: return "missing_correlation_field";
        case Counter::EVENTS_OUT_OF_WINDOW:      return "events_out_of_window";
        case Counter::WINDOWS_CREATED:           return "windows_created";
        case Counter::WINDOWS_EXPIRED:           return "windows_expired";
        case Counter::WINDOWS_EVICTED:           return "windows_evicted";
        case Counter::MATCHES_CREATED:           return "matches_created";
        case Counter::MATCHES_MUTED:             return "matches_muted";
        case Counter::ALERTS_EMITTED:            return "alerts_emitted";
        case Counter::ALERTS_SUPPRESSED:         return "alerts_suppressed";
        case Counter::ALERTS_DROPPED:            return "alerts_dropped";
        case Counter::ALERTS_OVERFLOWED:         return "alerts_overflowed";
        case Counter::EMIT_RETRIES:              return "emit_retries";
        default:                                 return "unknown";
    }
}

nlohmann::json RuleStats::ToJson() const {
    nlohmann::json j;
    j["evaluations"] = evaluations;
    j["matches"] = matches;
    j["avg_eval_us"] = AverageEvalUs();
    j["max_eval_us"] = max_eval_us;
    return j;
}

uint64_t MetricsSnapshot::Get(Counter counter) const {
    auto it = counters.find(CounterToString(counter));
    return it != counters.end() ? it->second : 0;
}

nlohmann::json MetricsSnapshot::ToJson() const {
    nlohmann::json j;
    for (const auto& [name, value] : counters) {
        j["counters"][name] = value;
    }
    j["active_windows"] = active_windows;
    j["degraded_rules"] = degraded_rules;

    nlohmann::json rule_json = nlohmann::json::object();
    for (const auto& [rule_id, stats] : rules) {
        rule_json[rule_id] = stats.ToJson();
    }
    j["rules"] = rule_json;
    return j;
}

EngineMetrics::EngineMetrics() {
    for (auto& counter : counters_) {
        counter.store(0);
    }
}

void EngineMetrics::Increment(Counter counter, uint64_t delta) {
    counters_[static_cast<size_t>(counter)].fetch_add(delta, std::memory_order_relaxed);
}

uint64_t EngineMetrics::Get(Counter counter) const {
    return counters_[static_cast<size_t>(counter)].load(std::memory_order_relaxed);
}

EngineMetrics::RuleCounters& EngineMetrics::CountersFor(const std::string& rule_id) {
    {
        std::shared_lock<std::shared_mutex> lock(rule_mutex_);
        auto it = rule_counters_.find(rule_id);
        if (it != rule_counters_.end()) {
            return *it->second;
        }
    }

    std::unique_lock<std::shared_mutex> lock(rule_mutex_);
    auto& slot = rule_counters_[rule_id];
    if (!slot) {
        slot = std::make_unique<RuleCounters>();
    }
    return *slot;
}

void EngineMetrics::RecordRuleEvaluation(const std::string& rule_id, uint64_t elapsed_us) {
    RuleCounters& counters = CountersFor(rule_id);
    counters.evaluations.fetch_add(1, std::memory_order_relaxed);
    counters.total_eval_us.fetch_add(elapsed_us, std::memory_order_relaxed);

    uint64_t seen = counters.max_eval_us.load(std::memory_order_relaxed);
    while (elapsed_us > seen &&
           !counters.max_eval_us.compare_exchange_weak(seen, elapsed_us, std::memory_order_relaxed)) {
    }
}

void EngineMetrics::RecordRuleMatch(const std::string& rule_id) {
    CountersFor(rule_id).matches.fetch_add(1, std::memory_order_relaxed);
}

RuleStats EngineMetrics::GetRuleStats(const std::string& rule_id) const {
    RuleStats stats;
    std::shared_lock<std::shared_mutex> lock(rule_mutex_);
    auto it = rule_counters_.find(rule_id);
    if (it != rule_counters_.end()) {
        stats.evaluations = it->second->evaluations.load();
        stats.matches = it->second->matches.load();
        stats.total_eval_us = it->second->total_eval_us.load();
        stats.max_eval_us = it->second->max_eval_us.load();
    }
    return stats;
}

void EngineMetrics::ForgetRule(const std::string& rule_id) {
    std::unique_lock<std::shared_mutex> lock(rule_mutex_);
    rule_counters_.erase(rule_id);
}

MetricsSnapshot EngineMetrics::Snapshot() const {
    MetricsSnapshot snapshot;
    for (size_t i = 0; i < static_cast<size_t>(Counter::COUNT_); ++i) {
        snapshot.counters[CounterToString(static_cast<Counter>(i))] = counters_[i].load();
    }

    std::shared_lock<std::shared_mutex> lock(rule_mutex_);
    for (const auto& [rule_id, counters] : rule_counters_) {
        RuleStats& stats = snapshot.rules[rule_id];
        stats.evaluations = counters->evaluations.load();
        stats.matches = counters->matches.load();
        stats.total_eval_us = counters->total_eval_us.load();
        stats.max_eval_us = counters->max_eval_us.load();
    }
    return snapshot;
}

void EngineMetrics::Reset() {
    for (auto& counter : counters_) {
        counter.store(0);
    }
    std::unique_lock<std::shared_mutex> lock(rule_mutex_);
    rule_counters_.clear();
}

} // namespace securewatch

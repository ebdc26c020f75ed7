#include "engine/MatchAssembler.hpp"
#include "core/Identifiers.hpp"
#include "core/Logger.hpp"
#include <algorithm>

namespace securewatch {

MatchAssembler::MatchAssembler(uint64_t key_retention_ms)
    : key_retention_ms_(key_retention_ms) {}

bool MatchAssembler::Claim(const std::string& key, uint64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    return claimed_.emplace(key, now_ms).second;
}

std::optional<Match> MatchAssembler::FromWindow(const Rule& rule, const Window& window, uint64_t now_ms) {
    const std::string key = rule.id + "|w|" + window.id;
    if (!Claim(key, now_ms)) {
        LOG_DEBUG("Match for window {} already assembled", window.id);
        return std::nullopt;
    }

    Match match;
    match.id = GenerateUUID();
    match.rule_id = rule.id;
    match.rule_version = window.rule_version;
    match.window_id = window.id;
    match.raw_confidence = rule.base_confidence;
    match.correlation_values = window.correlation_values;
    match.threshold = window.threshold;

    match.event_refs.reserve(window.events.size());
    for (size_t i = 0; i < window.events.size(); ++i) {
        const EventPtr& event = window.events[i];
        EventRef ref;
        ref.event_id = event->id;
        ref.timestamp = event->timestamp;
        ref.source_identifier = event->source_identifier;
        // snapshot the values that satisfied the filter, plus the grouping fields
        EvaluateCondition(rule.conditions, *event, &ref.matched_fields);
        if (rule.sequence && i < window.steps.size() && window.steps[i] < rule.sequence->steps.size()) {
            const SequenceStep& step = rule.sequence->steps[window.steps[i]];
            ref.step = step.name;
            EvaluateCondition(step.conditions, *event, &ref.matched_fields);
        }
        const auto& fields = rule.GroupingFields();
        for (size_t f = 0; f < fields.size() && f < window.correlation_values.size(); ++f) {
            ref.matched_fields[fields[f]] = window.correlation_values[f];
        }
        match.event_refs.push_back(std::move(ref));
    }

    std::stable_sort(match.event_refs.begin(), match.event_refs.end(),
                     [](const EventRef& a, const EventRef& b) { return a.timestamp < b.timestamp; });
    match.timestamp = match.event_refs.empty() ? now_ms : match.event_refs.back().timestamp;

    LOG_DEBUG("Assembled match {} for rule {} ({} events)", match.id, rule.id, match.EventCount());
    return match;
}

std::optional<Match> MatchAssembler::FromEvent(const Rule& rule, const SecurityEvent& event,
                                               const MatchedFields& matched, uint64_t now_ms) {
    const std::string key = rule.id + "|e|" + event.id;
    if (!Claim(key, now_ms)) {
        LOG_DEBUG("Match for event {} on rule {} already assembled", event.id, rule.id);
        return std::nullopt;
    }

    Match match;
    match.id = GenerateUUID();
    match.rule_id = rule.id;
    match.rule_version = rule.version;
    match.timestamp = event.timestamp;
    match.raw_confidence = rule.base_confidence;
    match.threshold = 1;

    for (const auto& field : rule.dedupe_fields) {
        match.correlation_values.push_back(event.GetField(field).value_or(""));
    }

    EventRef ref;
    ref.event_id = event.id;
    ref.timestamp = event.timestamp;
    ref.source_identifier = event.source_identifier;
    ref.matched_fields = matched;
    match.event_refs.push_back(std::move(ref));

    return match;
}

size_t MatchAssembler::PruneKeys(uint64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = claimed_.begin(); it != claimed_.end();) {
        if (now_ms >= it->second && now_ms - it->second >= key_retention_ms_) {
            it = claimed_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t MatchAssembler::GetTrackedKeyCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return claimed_.size();
}

} // namespace securewatch

#include "engine/WindowManager.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <functional>
#include <limits>

namespace securewatch {

namespace {

// unit separator, cannot appear in normalized attribute values
constexpr char kKeySeparator = '\x1f';

} // namespace

std::string AppendStatusToString(AppendStatus status) {
    switch (status) {
        case AppendStatus::SKIPPED_MISSING_FIELD: return "SKIPPED_MISSING_FIELD";
        case AppendStatus::SKIPPED_OUT_OF_WINDOW: return "SKIPPED_OUT_OF_WINDOW";
        case AppendStatus::SKIPPED_NO_STEP:       return "SKIPPED_NO_STEP";
        case AppendStatus::APPENDED:              return "APPENDED";
        case AppendStatus::THRESHOLD_REACHED:     return "THRESHOLD_REACHED";
        case AppendStatus::APPENDED_AFTER_MATCH:  return "APPENDED_AFTER_MATCH";
        default:                                  return "UNKNOWN";
    }
}

// --- Window serialization ---

nlohmann::json Window::ToJson() const {
    nlohmann::json j;
    j["id"] = id;
    j["ruleId"] = rule_id;
    j["ruleVersion"] = rule_version;
    j["correlationValues"] = correlation_values;
    j["startTime"] = start_time;
    j["endTime"] = end_time;
    j["threshold"] = threshold;
    j["matched"] = matched;
    if (!steps.empty()) {
        j["steps"] = steps;
    }

    nlohmann::json events_json = nlohmann::json::array();
    for (const auto& event : events) {
        events_json.push_back(event->ToJson());
    }
    j["events"] = events_json;
    return j;
}

Window Window::FromJson(const nlohmann::json& j) {
    Window window;
    window.id = j.at("id").get<std::string>();
    window.rule_id = j.at("ruleId").get<std::string>();
    window.rule_version = j.value("ruleVersion", uint64_t{0});
    window.correlation_values = j.at("correlationValues").get<std::vector<std::string>>();
    window.key = WindowManager::MakeWindowKey(window.rule_id, window.correlation_values);
    window.start_time = j.at("startTime").get<uint64_t>();
    window.end_time = j.at("endTime").get<uint64_t>();
    window.threshold = j.value("threshold", 1u);
    window.matched = j.value("matched", false);
    window.steps = j.value("steps", std::vector<uint32_t>{});

    for (const auto& event_json : j.at("events")) {
        window.events.push_back(std::make_shared<const SecurityEvent>(SecurityEvent::FromJson(event_json)));
    }
    return window;
}

// --- WindowManager ---

WindowManager::WindowManager(size_t shard_count, size_t max_windows_per_rule, EngineMetrics* metrics)
    : max_windows_per_rule_(max_windows_per_rule == 0 ? std::numeric_limits<size_t>::max()
                                                      : max_windows_per_rule),
      metrics_(metrics) {
    if (shard_count == 0) {
        shard_count = 1;
    }
    shards_.reserve(shard_count);
    for (size_t i = 0; i < shard_count; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

std::optional<std::vector<std::string>> WindowManager::ExtractCorrelationValues(const Rule& rule,
                                                                                const SecurityEvent& event) {
    std::vector<std::string> values;
    const auto& fields = rule.GroupingFields();
    values.reserve(fields.size());
    for (const auto& field : fields) {
        auto value = event.GetField(field);
        if (!value) {
            return std::nullopt;
        }
        values.push_back(std::move(*value));
    }
    return values;
}

std::string WindowManager::MakeWindowKey(const std::string& rule_id, const std::vector<std::string>& values) {
    std::string key = rule_id;
    for (const auto& value : values) {
        key += kKeySeparator;
        key += value;
    }
    return key;
}

WindowManager::Shard& WindowManager::ShardFor(const std::string& key) {
    return *shards_[std::hash<std::string>{}(key) % shards_.size()];
}

const WindowManager::Shard& WindowManager::ShardFor(const std::string& key) const {
    return *shards_[std::hash<std::string>{}(key) % shards_.size()];
}

void WindowManager::Count(Counter counter, uint64_t delta) {
    if (metrics_) {
        metrics_->Increment(counter, delta);
    }
}

void WindowManager::AdjustRuleCount(const std::string& rule_id, int64_t delta) {
    std::lock_guard<std::mutex> lock(counts_mutex_);
    auto& count = rule_window_counts_[rule_id];
    if (delta < 0 && count < static_cast<size_t>(-delta)) {
        count = 0;
    } else {
        count = static_cast<size_t>(static_cast<int64_t>(count) + delta);
    }
    if (count == 0) {
        rule_window_counts_.erase(rule_id);
    }

    if (delta > 0) {
        active_windows_ += static_cast<size_t>(delta);
    } else {
        active_windows_ -= static_cast<size_t>(-delta);
    }
}

size_t WindowManager::GetRuleCountLocked(const std::string& rule_id) const {
    auto it = rule_window_counts_.find(rule_id);
    return it != rule_window_counts_.end() ? it->second : 0;
}

AppendResult WindowManager::Append(const Rule& rule, const EventPtr& event) {
    if (!rule.correlation) {
        throw RuleEvaluationError("rule " + rule.id + " has no correlation parameters");
    }

    AppendResult result;

    auto values = ExtractCorrelationValues(rule, *event);
    if (!values) {
        Count(Counter::MISSING_CORRELATION_FIELD);
        result.status = AppendStatus::SKIPPED_MISSING_FIELD;
        LOG_TRACE("Event {} lacks correlation fields for rule {}", event->id, rule.id);
        return result;
    }

    const std::string key = MakeWindowKey(rule.id, *values);
    bool created = false;
    {
        Shard& shard = ShardFor(key);
        std::lock_guard<std::mutex> lock(shard.mutex);

        auto it = shard.windows.find(key);
        if (it != shard.windows.end() && event->timestamp < it->second.start_time) {
            // arrived after a later event opened the window
            Count(Counter::EVENTS_OUT_OF_WINDOW);
            result.status = AppendStatus::SKIPPED_OUT_OF_WINDOW;
            result.window_id = it->second.id;
            result.event_count = it->second.EventCount();
            LOG_DEBUG("Event {} ({}) predates window {} (start {}), skipped",
                      event->id, event->timestamp, it->second.id, it->second.start_time);
            return result;
        }
        if (it != shard.windows.end() && event->timestamp >= it->second.end_time) {
            // windows tumble: a late-enough event retires the old window
            if (!it->second.matched) {
                Count(Counter::WINDOWS_EXPIRED);
            }
            shard.windows.erase(it);
            AdjustRuleCount(rule.id, -1);
            it = shard.windows.end();
        }

        if (it == shard.windows.end()) {
            it = shard.windows.emplace(key, MakeWindow(rule, *values, key, *event)).first;
            AdjustRuleCount(rule.id, 1);
            Count(Counter::WINDOWS_CREATED);
            created = true;
        }

        Window& window = it->second;
        window.events.push_back(event);

        result.window_id = window.id;
        result.event_count = window.EventCount();

        if (window.matched) {
            result.status = AppendStatus::APPENDED_AFTER_MATCH;
        } else if (window.EventCount() >= window.threshold) {
            window.matched = true;
            result.status = AppendStatus::THRESHOLD_REACHED;
            result.matched_window = window;
            LOG_DEBUG("Window {} reached threshold {} with {} events",
                      window.id, window.threshold, window.EventCount());
        } else {
            result.status = AppendStatus::APPENDED;
        }
    }

    if (created) {
        EnforceCapacity(rule.id, key);
    }
    return result;
}

Window WindowManager::MakeWindow(const Rule& rule, const std::vector<std::string>& values,
                                 const std::string& key, const SecurityEvent& event) {
    Window window;
    window.id = rule.id + "#" + std::to_string(next_window_seq_.fetch_add(1));
    window.rule_id = rule.id;
    window.rule_version = rule.version;
    window.correlation_values = values;
    window.key = key;
    window.start_time = event.timestamp;
    if (rule.correlation) {
        window.end_time = event.timestamp + rule.correlation->time_window_ms;
        window.threshold = rule.correlation->threshold;
    } else if (rule.sequence) {
        window.end_time = event.timestamp;      // set by the first step
        window.threshold = static_cast<uint32_t>(rule.sequence->steps.size());
    }
    return window;
}

AppendResult WindowManager::AdvanceSequence(const Rule& rule, const EventPtr& event) {
    if (!rule.sequence) {
        throw RuleEvaluationError("rule " + rule.id + " has no sequence parameters");
    }

    AppendResult result;
    const auto& steps = rule.sequence->steps;

    auto values = ExtractCorrelationValues(rule, *event);
    if (!values) {
        Count(Counter::MISSING_CORRELATION_FIELD);
        result.status = AppendStatus::SKIPPED_MISSING_FIELD;
        return result;
    }

    // step conditions do not depend on window state, evaluate them unlocked
    std::vector<bool> satisfied(steps.size(), false);
    bool any_step = false;
    for (size_t i = 0; i < steps.size(); ++i) {
        satisfied[i] = EvaluateCondition(steps[i].conditions, *event);
        any_step = any_step || satisfied[i];
    }
    if (!any_step) {
        result.status = AppendStatus::SKIPPED_NO_STEP;
        return result;
    }

    const std::string key = MakeWindowKey(rule.id, *values);
    bool created = false;
    {
        Shard& shard = ShardFor(key);
        std::lock_guard<std::mutex> lock(shard.mutex);

        auto it = shard.windows.find(key);
        if (it != shard.windows.end() && event->timestamp >= it->second.end_time) {
            // next step came too late, start over
            Count(Counter::WINDOWS_EXPIRED);
            LOG_DEBUG("Sequence {} timed out after {} of {} steps",
                      it->second.id, it->second.steps.size(), steps.size());
            shard.windows.erase(it);
            AdjustRuleCount(rule.id, -1);
            it = shard.windows.end();
        }

        if (it != shard.windows.end()) {
            const Window& current = it->second;
            uint64_t floor = rule.sequence->ordered && !current.events.empty()
                                 ? current.events.back()->timestamp
                                 : current.start_time;
            if (event->timestamp < floor) {
                Count(Counter::EVENTS_OUT_OF_WINDOW);
                result.status = AppendStatus::SKIPPED_OUT_OF_WINDOW;
                result.window_id = current.id;
                result.event_count = current.EventCount();
                return result;
            }
        }

        // pick the step this event advances
        std::optional<uint32_t> step;
        const std::vector<uint32_t> no_steps;
        const std::vector<uint32_t>& done = it != shard.windows.end() ? it->second.steps : no_steps;
        if (rule.sequence->ordered) {
            size_t next = done.size();
            if (next < steps.size() && satisfied[next]) {
                step = static_cast<uint32_t>(next);
            }
        } else {
            for (uint32_t i = 0; i < steps.size(); ++i) {
                if (satisfied[i] && std::find(done.begin(), done.end(), i) == done.end()) {
                    step = i;
                    break;
                }
            }
        }

        if (!step) {
            result.status = AppendStatus::SKIPPED_NO_STEP;
            if (it != shard.windows.end()) {
                result.window_id = it->second.id;
                result.event_count = it->second.EventCount();
            }
            return result;
        }

        if (it == shard.windows.end()) {
            it = shard.windows.emplace(key, MakeWindow(rule, *values, key, *event)).first;
            AdjustRuleCount(rule.id, 1);
            Count(Counter::WINDOWS_CREATED);
            created = true;
        }

        Window& window = it->second;
        window.events.push_back(event);
        window.steps.push_back(*step);
        window.end_time = event->timestamp + steps[*step].timeout_ms;

        result.window_id = window.id;
        result.event_count = window.EventCount();

        if (window.steps.size() >= steps.size()) {
            window.matched = true;
            result.status = AppendStatus::THRESHOLD_REACHED;
            result.matched_window = std::move(window);
            shard.windows.erase(it);
            AdjustRuleCount(rule.id, -1);
            LOG_DEBUG("Sequence {} completed ({} steps)", result.window_id, steps.size());
            return result;
        }
        result.status = AppendStatus::APPENDED;
    }

    if (created) {
        EnforceCapacity(rule.id, key);
    }
    return result;
}

void WindowManager::EnforceCapacity(const std::string& rule_id, const std::string& keep_key) {
    while (true) {
        {
            std::lock_guard<std::mutex> lock(counts_mutex_);
            if (GetRuleCountLocked(rule_id) <= max_windows_per_rule_) {
                return;
            }
        }

        // Find the oldest unmatched window of this rule, one shard at a time
        std::string victim_key;
        uint64_t victim_start = std::numeric_limits<uint64_t>::max();
        for (const auto& shard : shards_) {
            std::lock_guard<std::mutex> lock(shard->mutex);
            for (const auto& [key, window] : shard->windows) {
                if (window.rule_id == rule_id && !window.matched && key != keep_key &&
                    window.start_time < victim_start) {
                    victim_start = window.start_time;
                    victim_key = key;
                }
            }
        }

        if (victim_key.empty()) {
            return;
        }

        Shard& shard = ShardFor(victim_key);
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto it = shard.windows.find(victim_key);
        if (it == shard.windows.end() || it->second.matched) {
            continue;   // changed under us, rescan
        }
        LOG_WARN("Rule {} over window capacity ({}), evicting window {} (start {})",
                 rule_id, max_windows_per_rule_, it->second.id, it->second.start_time);
        shard.windows.erase(it);
        AdjustRuleCount(rule_id, -1);
        Count(Counter::WINDOWS_EVICTED);
    }
}

size_t WindowManager::Sweep(uint64_t now_ms) {
    size_t removed = 0;
    size_t expired_unmatched = 0;

    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        for (auto it = shard->windows.begin(); it != shard->windows.end();) {
            if (it->second.end_time <= now_ms) {
                if (!it->second.matched) {
                    ++expired_unmatched;
                }
                AdjustRuleCount(it->second.rule_id, -1);
                it = shard->windows.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }

    if (expired_unmatched > 0) {
        Count(Counter::WINDOWS_EXPIRED, expired_unmatched);
    }
    if (removed > 0) {
        LOG_DEBUG("Window sweep removed {} windows ({} unmatched)", removed, expired_unmatched);
    }
    return removed;
}

size_t WindowManager::GetActiveWindowCount() const {
    return active_windows_.load();
}

size_t WindowManager::GetWindowCount(const std::string& rule_id) const {
    std::lock_guard<std::mutex> lock(counts_mutex_);
    return GetRuleCountLocked(rule_id);
}

std::optional<Window> WindowManager::FindWindow(const std::string& rule_id,
                                                const std::vector<std::string>& values) const {
    const std::string key = MakeWindowKey(rule_id, values);
    const Shard& shard = ShardFor(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.windows.find(key);
    if (it == shard.windows.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Window> WindowManager::ExportWindows() const {
    std::vector<Window> result;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        for (const auto& [key, window] : shard->windows) {
            if (!window.matched) {
                result.push_back(window);
            }
        }
    }
    return result;
}

size_t WindowManager::ImportWindows(const std::vector<Window>& windows) {
    size_t imported = 0;
    for (const auto& source : windows) {
        Window window = source;
        window.key = MakeWindowKey(window.rule_id, window.correlation_values);

        Shard& shard = ShardFor(window.key);
        std::lock_guard<std::mutex> lock(shard.mutex);
        if (shard.windows.count(window.key)) {
            continue;
        }
        const std::string rule_id = window.rule_id;
        shard.windows.emplace(window.key, std::move(window));
        AdjustRuleCount(rule_id, 1);
        ++imported;
    }
    LOG_INFO("Restored {} of {} persisted windows", imported, windows.size());
    return imported;
}

void WindowManager::RemoveRule(const std::string& rule_id) {
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        for (auto it = shard->windows.begin(); it != shard->windows.end();) {
            if (it->second.rule_id == rule_id) {
                AdjustRuleCount(rule_id, -1);
                it = shard->windows.erase(it);
            } else {
                ++it;
            }
        }
    }
}

void WindowManager::Clear() {
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        shard->windows.clear();
    }
    std::lock_guard<std::mutex> lock(counts_mutex_);
    rule_window_counts_.clear();
    active_windows_ = 0;
}

} // namespace securewatch

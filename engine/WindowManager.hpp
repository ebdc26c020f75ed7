#pragma once

#include "core/Metrics.hpp"
#include "core/SecurityEvent.hpp"
#include "engine/Rule.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace securewatch {

// Tumbling window anchored at its first event: [start_time, end_time).
// threshold and end_time come from the rule version that created it and
// never change afterwards.
//
// Sequence rules keep their progress in the same record: `steps` holds the
// step index each event satisfied, threshold is the step count and end_time
// moves to the deadline of the next step.
struct Window {
    std::string id;
    std::string rule_id;
    uint64_t rule_version{0};
    std::vector<std::string> correlation_values;
    std::string key;
    uint64_t start_time{0};
    uint64_t end_time{0};
    uint32_t threshold{1};
    std::vector<EventPtr> events;           // arrival order
    std::vector<uint32_t> steps;            // sequence rules only, parallel to events
    bool matched{false};

    size_t EventCount() const { return events.size(); }

    nlohmann::json ToJson() const;
    static Window FromJson(const nlohmann::json& j);
};

enum class AppendStatus {
    SKIPPED_MISSING_FIELD,
    SKIPPED_OUT_OF_WINDOW,      // older than the window (or the last sequence step)
    SKIPPED_NO_STEP,            // sequence rule: not the step it waits for
    APPENDED,
    THRESHOLD_REACHED,
    APPENDED_AFTER_MATCH
};

std::string AppendStatusToString(AppendStatus status);

struct AppendResult {
    AppendStatus status{AppendStatus::APPENDED};
    std::string window_id;
    size_t event_count{0};
    std::optional<Window> matched_window;   // set only with THRESHOLD_REACHED
};

class WindowManager {
public:
    WindowManager(size_t shard_count, size_t max_windows_per_rule, EngineMetrics* metrics = nullptr);

    WindowManager(const WindowManager&) = delete;
    WindowManager& operator=(const WindowManager&) = delete;

    // `rule` must carry correlation parameters.
    AppendResult Append(const Rule& rule, const EventPtr& event);

    // Advances the sequence tracked for the event's grouping values. The
    // completed sequence is returned with THRESHOLD_REACHED and its window
    // removed, so the next occurrence starts from the first step.
    // `rule` must carry sequence parameters.
    AppendResult AdvanceSequence(const Rule& rule, const EventPtr& event);

    // Removes every window whose end_time is at or before `now_ms`.
    size_t Sweep(uint64_t now_ms);

    size_t GetActiveWindowCount() const;
    size_t GetWindowCount(const std::string& rule_id) const;
    std::optional<Window> FindWindow(const std::string& rule_id,
                                     const std::vector<std::string>& values) const;

    // Unmatched windows, for persistence across restarts.
    std::vector<Window> ExportWindows() const;
    size_t ImportWindows(const std::vector<Window>& windows);

    void RemoveRule(const std::string& rule_id);
    void Clear();

    // Grouping field values, or nullopt if the event lacks any of them.
    static std::optional<std::vector<std::string>> ExtractCorrelationValues(const Rule& rule,
                                                                            const SecurityEvent& event);
    static std::string MakeWindowKey(const std::string& rule_id, const std::vector<std::string>& values);

private:
    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, Window> windows;
    };

    Shard& ShardFor(const std::string& key);
    const Shard& ShardFor(const std::string& key) const;

    void AdjustRuleCount(const std::string& rule_id, int64_t delta);
    size_t GetRuleCountLocked(const std::string& rule_id) const;
    void EnforceCapacity(const std::string& rule_id, const std::string& keep_key);
    Window MakeWindow(const Rule& rule, const std::vector<std::string>& values,
                      const std::string& key, const SecurityEvent& event);
    void Count(Counter counter, uint64_t delta = 1);

    std::vector<std::unique_ptr<Shard>> shards_;
    const size_t max_windows_per_rule_;
    EngineMetrics* metrics_;

    // lock order: shard mutex before counts_mutex_
    mutable std::mutex counts_mutex_;
    std::unordered_map<std::string, size_t> rule_window_counts_;
    std::atomic<size_t> active_windows_{0};
    std::atomic<uint64_t> next_window_seq_{1};
};

} // namespace securewatch

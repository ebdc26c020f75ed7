#pragma once

#include "core/EventBus.hpp"
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace securewatch {

enum class DedupeState {
    NONE,
    ACTIVE,     // alert emitted, further matches suppressed
    EXPIRED     // suppression interval elapsed, entry awaiting sweep
};

std::string DedupeStateToString(DedupeState state);

struct DedupeEntry {
    std::string alert_id;
    uint64_t emitted_at{0};
    uint64_t expires_at{0};
    uint64_t suppressed_count{0};
};

// Per-key suppression. The interval runs from the emission of the alert
// that activated the key; suppressed matches do not extend it.
class Deduplicator {
public:
    explicit Deduplicator(uint64_t suppression_interval_ms);
    ~Deduplicator();

    Deduplicator(const Deduplicator&) = delete;
    Deduplicator& operator=(const Deduplicator&) = delete;

    // sha256(ruleId | trimmed, lower-cased values)
    static std::string ComputeDedupeKey(const std::string& rule_id, const std::vector<std::string>& values);

    // Atomically claims the key for `alert_id`. Returns false (and counts a
    // suppression) while the key is ACTIVE.
    bool TryAcquire(const std::string& dedupe_key, const std::string& alert_id, uint64_t now_ms);

    // Undo an acquisition whose alert never reached anyone.
    void Release(const std::string& dedupe_key, const std::string& alert_id);

    // Alert resolved downstream: the key returns to NONE immediately.
    // With a non-empty alert_id only that alert's activation is released.
    void Resolve(const std::string& dedupe_key, const std::string& alert_id = "");

    DedupeState GetState(const std::string& dedupe_key, uint64_t now_ms) const;
    uint64_t GetSuppressedCount(const std::string& dedupe_key) const;
    size_t GetTrackedKeyCount() const;

    // Drops entries whose interval has elapsed.
    size_t Sweep(uint64_t now_ms);

    // Listens for ALERT_STATUS_CHANGED on the EventBus.
    void Start();
    void Stop();

private:
    void OnAlertStatusChanged(const Notification& notification);

    const uint64_t suppression_interval_ms_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, DedupeEntry> entries_;
    SubscriptionId status_sub_id_{0};
};

} // namespace securewatch

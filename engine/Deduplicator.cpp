#include "engine/Deduplicator.hpp"
#include "engine/Condition.hpp"
#include "core/Identifiers.hpp"
#include "core/Logger.hpp"
#include <cctype>

namespace securewatch {

namespace {

std::string Normalize(const std::string& value) {
    size_t begin = 0;
    while (begin < value.size() && std::isspace(static_cast<unsigned char>(value[begin]))) ++begin;
    size_t end = value.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) --end;
    return ToLower(value.substr(begin, end - begin));
}

} // namespace

std::string DedupeStateToString(DedupeState state) {
    switch (state) {
        case DedupeState::NONE:    return "NONE";
        case DedupeState::ACTIVE:  return "ACTIVE";
        case DedupeState::EXPIRED: return "EXPIRED";
        default:                   return "UNKNOWN";
    }
}

Deduplicator::Deduplicator(uint64_t suppression_interval_ms)
    : suppression_interval_ms_(suppression_interval_ms) {}

Deduplicator::~Deduplicator() {
    Stop();
}

std::string Deduplicator::ComputeDedupeKey(const std::string& rule_id, const std::vector<std::string>& values) {
    std::string material = rule_id;
    for (const auto& value : values) {
        material += '\x1f';
        material += Normalize(value);
    }
    return Sha256Hex(material);
}

bool Deduplicator::TryAcquire(const std::string& dedupe_key, const std::string& alert_id, uint64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(dedupe_key);
    if (it != entries_.end() && now_ms < it->second.expires_at) {
        ++it->second.suppressed_count;
        LOG_DEBUG("Suppressed duplicate for key {} (alert {} active, {} suppressed)",
                  dedupe_key.substr(0, 12), it->second.alert_id, it->second.suppressed_count);
        return false;
    }

    DedupeEntry entry;
    entry.alert_id = alert_id;
    entry.emitted_at = now_ms;
    entry.expires_at = now_ms + suppression_interval_ms_;
    entries_[dedupe_key] = std::move(entry);
    return true;
}

void Deduplicator::Release(const std::string& dedupe_key, const std::string& alert_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(dedupe_key);
    if (it != entries_.end() && it->second.alert_id == alert_id) {
        entries_.erase(it);
    }
}

void Deduplicator::Resolve(const std::string& dedupe_key, const std::string& alert_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(dedupe_key);
    if (it == entries_.end()) {
        return;
    }
    // a late resolution of an older alert must not release a newer one
    if (!alert_id.empty() && it->second.alert_id != alert_id) {
        return;
    }
    entries_.erase(it);
    LOG_DEBUG("Dedupe key {} released by resolution", dedupe_key.substr(0, 12));
}

DedupeState Deduplicator::GetState(const std::string& dedupe_key, uint64_t now_ms) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(dedupe_key);
    if (it == entries_.end()) {
        return DedupeState::NONE;
    }
    return now_ms < it->second.expires_at ? DedupeState::ACTIVE : DedupeState::EXPIRED;
}

uint64_t Deduplicator::GetSuppressedCount(const std::string& dedupe_key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(dedupe_key);
    return it != entries_.end() ? it->second.suppressed_count : 0;
}

size_t Deduplicator::GetTrackedKeyCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

size_t Deduplicator::Sweep(uint64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (now_ms >= it->second.expires_at) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void Deduplicator::Start() {
    if (status_sub_id_ != 0) {
        return;
    }
    status_sub_id_ = EventBus::Instance().Subscribe(
        NotificationType::ALERT_STATUS_CHANGED,
        [this](const Notification& notification) { OnAlertStatusChanged(notification); }
    );
}

void Deduplicator::Stop() {
    if (status_sub_id_ != 0) {
        EventBus::Instance().Unsubscribe(status_sub_id_);
        status_sub_id_ = 0;
    }
}

void Deduplicator::OnAlertStatusChanged(const Notification& notification) {
    auto status_it = notification.metadata.find("status");
    auto key_it = notification.metadata.find("dedupe_key");
    if (status_it == notification.metadata.end() || key_it == notification.metadata.end()) {
        return;
    }
    if (status_it->second == "resolved") {
        Resolve(key_it->second, notification.subject_id);
    }
}

} // namespace securewatch

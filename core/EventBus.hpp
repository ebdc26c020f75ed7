#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

// Forward declare ThreadPool to avoid circular includes
namespace securewatch { class ThreadPool; }

namespace securewatch {

enum class NotificationType {
    ALERT_EMITTED,
    ALERT_STATUS_CHANGED,
    ALERT_DROPPED,
    RULE_DEGRADED
};

// Engine-level notification. `subject_id` is the alert or rule id the
// notification is about; details travel in `metadata`.
struct Notification {
    NotificationType type;
    uint64_t timestamp;
    std::string subject_id;
    std::unordered_map<std::string, std::string> metadata;

    Notification(NotificationType t, const std::string& subject)
        : type(t), timestamp(GetCurrentTimestamp()), subject_id(subject) {}

private:
    static uint64_t GetCurrentTimestamp();
};

using NotificationHandler = std::function<void(const Notification&)>;
using SubscriptionId = uint64_t;

class EventBus {
public:
    static EventBus& Instance();

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    SubscriptionId Subscribe(NotificationType type, NotificationHandler handler);
    void Unsubscribe(SubscriptionId id);
    void Publish(const Notification& notification);
    void PublishAsync(Notification notification);

    // Initialize the internal thread pool for async publishing.
    // Without it PublishAsync() delivers synchronously.
    void InitAsyncPool(size_t num_threads = 2);

    // Drain all pending async deliveries and shut down the pool.
    void ShutdownAsyncPool();

    size_t GetSubscriberCount(NotificationType type) const;
    void Clear();

private:
    EventBus() = default;

    mutable std::mutex mutex_;
    std::unordered_map<NotificationType, std::vector<std::pair<SubscriptionId, NotificationHandler>>> subscribers_;
    SubscriptionId next_id_ = 1;

    std::unique_ptr<ThreadPool> async_pool_;
};

inline std::string NotificationTypeToString(NotificationType type) {
    switch (type) {
        case NotificationType::ALERT_EMITTED:        return "ALERT_EMITTED";
        case NotificationType::ALERT_STATUS_CHANGED: return "ALERT_STATUS_CHANGED";
        case NotificationType::ALERT_DROPPED:        return "ALERT_DROPPED";
        case NotificationType::RULE_DEGRADED:        return "RULE_DEGRADED";
        default:                                     return "UNKNOWN";
    }
}

} // namespace securewatch

#pragma once

#include "core/Config.hpp"
#include "core/Metrics.hpp"
#include "engine/Alert.hpp"
#include "engine/DurabilityStore.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace securewatch {

// Downstream consumer of alerts. OnAlert throws (EmitError or any
// std::exception) when the alert was not accepted.
class AlertSink {
public:
    virtual ~AlertSink() = default;
    virtual void OnAlert(const Alert& alert) = 0;
    virtual std::string GetName() const = 0;
};

class CallbackAlertSink : public AlertSink {
public:
    CallbackAlertSink(std::string name, std::function<void(const Alert&)> callback)
        : name_(std::move(name)), callback_(std::move(callback)) {}

    void OnAlert(const Alert& alert) override { callback_(alert); }
    std::string GetName() const override { return name_; }

private:
    std::string name_;
    std::function<void(const Alert&)> callback_;
};

enum class EmitOutcome {
    DELIVERED,
    OVERFLOWED,
    DROPPED
};

std::string EmitOutcomeToString(EmitOutcome outcome);

// Delivers alerts to every registered sink with bounded exponential
// backoff. Undeliverable alerts go to the store's overflow queue when a
// store is attached, otherwise they are dropped and counted.
class AlertEmitter {
public:
    AlertEmitter(EmitConfig config, EngineMetrics* metrics = nullptr);

    void AddSink(std::shared_ptr<AlertSink> sink);
    size_t GetSinkCount() const;
    void SetOverflowStore(DurabilityStore* store);

    EmitOutcome Emit(const Alert& alert);

    // Re-delivers alerts parked in the overflow queue. Returns the number
    // delivered; failures go back to the queue.
    size_t ReplayOverflow();

private:
    bool DeliverWithRetry(AlertSink& sink, const Alert& alert);

    EmitConfig config_;
    EngineMetrics* metrics_;
    DurabilityStore* store_{nullptr};

    mutable std::mutex sinks_mutex_;
    std::vector<std::shared_ptr<AlertSink>> sinks_;
};

} // namespace securewatch

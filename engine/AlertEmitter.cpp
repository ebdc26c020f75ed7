#include "engine/AlertEmitter.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <chrono>
#include <thread>

namespace securewatch {

std::string EmitOutcomeToString(EmitOutcome outcome) {
    switch (outcome) {
        case EmitOutcome::DELIVERED:  return "DELIVERED";
        case EmitOutcome::OVERFLOWED: return "OVERFLOWED";
        case EmitOutcome::DROPPED:    return "DROPPED";
        default:                      return "UNKNOWN";
    }
}

AlertEmitter::AlertEmitter(EmitConfig config, EngineMetrics* metrics)
    : config_(config), metrics_(metrics) {}

void AlertEmitter::AddSink(std::shared_ptr<AlertSink> sink) {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    LOG_INFO("Alert sink registered: {}", sink->GetName());
    sinks_.push_back(std::move(sink));
}

size_t AlertEmitter::GetSinkCount() const {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    return sinks_.size();
}

void AlertEmitter::SetOverflowStore(DurabilityStore* store) {
    store_ = store;
}

bool AlertEmitter::DeliverWithRetry(AlertSink& sink, const Alert& alert) {
    uint64_t backoff_ms = config_.initial_backoff_ms;

    for (uint32_t attempt = 1; attempt <= config_.max_attempts; ++attempt) {
        try {
            sink.OnAlert(alert);
            if (attempt > 1) {
                LOG_INFO("Alert {} delivered to {} on attempt {}", alert.id, sink.GetName(), attempt);
            }
            return true;
        } catch (const std::exception& ex) {
            LOG_WARN("Alert {} delivery to {} failed (attempt {}/{}): {}",
                     alert.id, sink.GetName(), attempt, config_.max_attempts, ex.what());
        }

        if (attempt < config_.max_attempts) {
            if (metrics_) {
                metrics_->Increment(Counter::EMIT_RETRIES);
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
            backoff_ms = std::min(backoff_ms * 2, config_.max_backoff_ms);
        }
    }
    return false;
}

EmitOutcome AlertEmitter::Emit(const Alert& alert) {
    std::vector<std::shared_ptr<AlertSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        sinks = sinks_;
    }

    bool delivered = true;
    for (const auto& sink : sinks) {
        if (!DeliverWithRetry(*sink, alert)) {
            delivered = false;
        }
    }

    if (delivered) {
        if (metrics_) {
            metrics_->Increment(Counter::ALERTS_EMITTED);
        }
        return EmitOutcome::DELIVERED;
    }

    if (store_ && store_->EnqueueOverflowAlert(alert)) {
        if (metrics_) {
            metrics_->Increment(Counter::ALERTS_OVERFLOWED);
        }
        LOG_WARN("Alert {} parked in overflow queue after {} attempts", alert.id, config_.max_attempts);
        return EmitOutcome::OVERFLOWED;
    }

    if (metrics_) {
        metrics_->Increment(Counter::ALERTS_DROPPED);
    }
    LOG_ERROR("Alert {} for rule {} dropped after {} attempts", alert.id, alert.rule_id, config_.max_attempts);
    return EmitOutcome::DROPPED;
}

size_t AlertEmitter::ReplayOverflow() {
    if (!store_) {
        return 0;
    }

    auto pending = store_->DrainOverflowAlerts();
    if (pending.empty()) {
        return 0;
    }

    LOG_INFO("Replaying {} overflow alerts", pending.size());
    size_t delivered = 0;
    for (const auto& alert : pending) {
        if (Emit(alert) == EmitOutcome::DELIVERED) {
            ++delivered;
        }
    }
    return delivered;
}

} // namespace securewatch

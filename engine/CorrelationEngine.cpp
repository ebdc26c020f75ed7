#include "engine/CorrelationEngine.hpp"
#include "core/EventBus.hpp"
#include "core/Identifiers.hpp"
#include "core/Logger.hpp"
#include <chrono>

namespace securewatch {

CorrelationEngine::CorrelationEngine(EngineConfig config, std::shared_ptr<Clock> clock)
    : config_(std::move(config)),
      clock_(clock ? std::move(clock) : std::make_shared<SystemClock>()),
      windows_(config_.windows.shard_count, config_.windows.max_windows_per_rule, &metrics_),
      evaluator_(windows_),
      assembler_(config_.deduplication.match_key_retention_ms),
      scorer_(config_.scoring),
      deduplicator_(config_.deduplication.suppression_interval_ms),
      emitter_(config_.emit, &metrics_),
      dispatcher_(registry_, evaluator_, assembler_, metrics_, *clock_,
                  [this](const Rule& rule, const Match& match, const std::vector<EventPtr>& events) {
                      HandleMatch(rule, match, events);
                  }) {
}

CorrelationEngine::~CorrelationEngine() {
    Stop();
}

void CorrelationEngine::AttachStore(DurabilityStore* store) {
    store_ = store;
    emitter_.SetOverflowStore(store);
}

void CorrelationEngine::AddAlertSink(std::shared_ptr<AlertSink> sink) {
    emitter_.AddSink(std::move(sink));
}

bool CorrelationEngine::RestoreState() {
    if (!store_) {
        return false;
    }

    auto rules = store_->LoadRules();
    if (!rules.empty()) {
        registry_.ReplaceAll(rules);
    }

    auto windows = store_->LoadWindows();
    windows_.ImportWindows(windows);

    size_t replayed = emitter_.ReplayOverflow();
    LOG_INFO("State restored: {} rules, {} windows, {} overflow alerts delivered",
             rules.size(), windows.size(), replayed);
    return true;
}

void CorrelationEngine::Start() {
    if (running_) {
        LOG_WARN("CorrelationEngine already running");
        return;
    }

    deduplicator_.Start();
    dispatcher_.Start(config_.pipeline.worker_threads, config_.pipeline.queue_capacity);

    {
        std::lock_guard<std::mutex> lock(sweep_mutex_);
        stop_sweep_ = false;
    }
    sweep_thread_ = std::thread(&CorrelationEngine::SweepLoop, this);

    running_ = true;
    accepting_ = true;
    LOG_INFO("CorrelationEngine started ({} rules, {} shards, sweep every {} ms)",
             registry_.GetRuleCount(), config_.windows.shard_count, config_.windows.sweep_interval_ms);
}

void CorrelationEngine::Stop() {
    if (!running_) {
        return;
    }

    LOG_INFO("Stopping CorrelationEngine...");
    accepting_ = false;

    // matched windows still queued are assembled and emitted here
    dispatcher_.Stop();

    {
        std::lock_guard<std::mutex> lock(sweep_mutex_);
        stop_sweep_ = true;
    }
    sweep_cv_.notify_all();
    if (sweep_thread_.joinable()) {
        sweep_thread_.join();
    }

    deduplicator_.Stop();

    if (store_) {
        auto pending = windows_.ExportWindows();
        if (!store_->SaveWindows(pending)) {
            LOG_ERROR("Failed to persist {} in-flight windows", pending.size());
        }
        if (!store_->SaveRules(registry_.ListRules())) {
            LOG_ERROR("Failed to persist rule set");
        }
        LOG_INFO("Persisted {} in-flight windows", pending.size());
    } else if (windows_.GetActiveWindowCount() > 0) {
        LOG_INFO("Discarding {} in-flight windows (no durability store)", windows_.GetActiveWindowCount());
    }
    windows_.Clear();

    running_ = false;
    LOG_INFO("CorrelationEngine stopped");
}

EventPtr CorrelationEngine::Prepare(SecurityEvent event) {
    if (event.id.empty()) {
        event.id = GenerateUUID();
    }
    if (event.timestamp == 0) {
        event.timestamp = clock_->NowMs();
    }
    metrics_.Increment(Counter::EVENTS_RECEIVED);
    return std::make_shared<const SecurityEvent>(std::move(event));
}

bool CorrelationEngine::Submit(SecurityEvent event) {
    if (!accepting_) {
        metrics_.Increment(Counter::EVENTS_REJECTED);
        return false;
    }
    if (!dispatcher_.Dispatch(Prepare(std::move(event)))) {
        metrics_.Increment(Counter::EVENTS_REJECTED);
        return false;
    }
    return true;
}

void CorrelationEngine::ProcessEvent(SecurityEvent event) {
    dispatcher_.Route(Prepare(std::move(event)));
}

void CorrelationEngine::WaitIdle() {
    dispatcher_.WaitIdle();
}

void CorrelationEngine::HandleMatch(const Rule& rule, const Match& match, const std::vector<EventPtr>& events) {
    if (rule.action == RuleAction::SUPPRESS) {
        metrics_.Increment(Counter::MATCHES_MUTED);
        LOG_DEBUG("Rule {} matched with action=suppress, no alert", rule.id);
        return;
    }

    const uint64_t now = clock_->NowMs();
    ConfidenceScore score = scorer_.Score(match, events);

    Alert alert;
    alert.id = GenerateUUID();
    alert.dedupe_key = Deduplicator::ComputeDedupeKey(rule.id, match.correlation_values);

    if (!deduplicator_.TryAcquire(alert.dedupe_key, alert.id, now)) {
        metrics_.Increment(Counter::ALERTS_SUPPRESSED);
        return;
    }

    alert.match_id = match.id;
    alert.rule_id = rule.id;
    alert.rule_name = rule.name;
    alert.organization_id = rule.organization_id;
    if (alert.organization_id.empty()) {
        // global rule: attribute the alert to the organization of the events
        alert.organization_id = events.empty() ? "" : events.front()->organization_id;
    }
    alert.severity = rule.severity;
    alert.confidence = score.confidence;
    alert.status = AlertStatus::NEW;
    alert.created_at = now;
    alert.tags = rule.tags;
    alert.score_factors = score.contributing_factors;
    alert.match = std::make_shared<const Match>(match);

    EmitOutcome outcome = emitter_.Emit(alert);

    if (outcome == EmitOutcome::DROPPED) {
        deduplicator_.Release(alert.dedupe_key, alert.id);
        Notification notification(NotificationType::ALERT_DROPPED, alert.id);
        notification.metadata["rule_id"] = rule.id;
        notification.metadata["dedupe_key"] = alert.dedupe_key;
        EventBus::Instance().PublishAsync(std::move(notification));
        return;
    }

    LOG_INFO("Alert {} [{}] rule={} confidence={} events={} ({})",
             alert.id, SeverityToString(alert.severity), rule.id, alert.confidence,
             alert.EventCount(), EmitOutcomeToString(outcome));

    Notification notification(NotificationType::ALERT_EMITTED, alert.id);
    notification.metadata["rule_id"] = rule.id;
    notification.metadata["dedupe_key"] = alert.dedupe_key;
    notification.metadata["severity"] = SeverityToString(alert.severity);
    notification.metadata["confidence"] = std::to_string(alert.confidence);
    notification.metadata["outcome"] = EmitOutcomeToString(outcome);
    EventBus::Instance().PublishAsync(std::move(notification));
}

void CorrelationEngine::RunSweep() {
    const uint64_t now = clock_->NowMs();
    size_t windows = windows_.Sweep(now);
    size_t keys = deduplicator_.Sweep(now);
    size_t claims = assembler_.PruneKeys(now);

    if (windows + keys + claims > 0) {
        LOG_DEBUG("Sweep: {} windows, {} dedupe keys, {} idempotency keys removed", windows, keys, claims);
    }
}

void CorrelationEngine::SweepLoop() {
    const auto interval = std::chrono::milliseconds(config_.windows.sweep_interval_ms);
    std::unique_lock<std::mutex> lock(sweep_mutex_);
    while (!stop_sweep_) {
        if (sweep_cv_.wait_for(lock, interval, [this] { return stop_sweep_; })) {
            break;
        }
        lock.unlock();
        try {
            RunSweep();
        } catch (const std::exception& ex) {
            LOG_ERROR("Sweep failed: {}", ex.what());
        }
        lock.lock();
    }
}

size_t CorrelationEngine::LoadRules(const std::vector<Rule>& rules) {
    return registry_.ReplaceAll(rules);
}

RulePtr CorrelationEngine::CreateRule(Rule rule) {
    return registry_.CreateRule(std::move(rule));
}

RulePtr CorrelationEngine::UpdateRule(const std::string& id, const nlohmann::json& patch) {
    return registry_.UpdateRule(id, patch);
}

bool CorrelationEngine::DeleteRule(const std::string& id) {
    if (!registry_.DeleteRule(id)) {
        return false;
    }
    windows_.RemoveRule(id);
    metrics_.ForgetRule(id);
    return true;
}

std::vector<RulePtr> CorrelationEngine::ListRules(const RuleFilter& filter) const {
    return registry_.ListRules(filter);
}

MetricsSnapshot CorrelationEngine::GetMetrics() const {
    MetricsSnapshot snapshot = metrics_.Snapshot();
    snapshot.active_windows = windows_.GetActiveWindowCount();
    snapshot.degraded_rules = registry_.GetDegradedRules().size();
    return snapshot;
}

nlohmann::json CorrelationEngine::GetHealth() const {
    nlohmann::json j;
    j["running"] = running_.load();
    j["accepting"] = accepting_.load();
    j["rules"] = registry_.GetRuleCount();
    j["queue_size"] = dispatcher_.GetQueueSize();
    j["dedupe_keys"] = deduplicator_.GetTrackedKeyCount();

    nlohmann::json degraded = nlohmann::json::object();
    for (const auto& [id, reason] : registry_.GetDegradedRules()) {
        degraded[id] = reason;
    }
    j["degraded"] = degraded;
    j["metrics"] = GetMetrics().ToJson();
    return j;
}

} // namespace securewatch

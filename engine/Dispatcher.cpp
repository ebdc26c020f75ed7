#include "engine/Dispatcher.hpp"
#include "core/EventBus.hpp"
#include "core/Logger.hpp"
#include <chrono>

namespace securewatch {

Dispatcher::Dispatcher(RuleRegistry& registry,
                       RuleEvaluator& evaluator,
                       MatchAssembler& assembler,
                       EngineMetrics& metrics,
                       const Clock& clock,
                       MatchHandler handler)
    : registry_(registry),
      evaluator_(evaluator),
      assembler_(assembler),
      metrics_(metrics),
      clock_(clock),
      handler_(std::move(handler)) {}

Dispatcher::~Dispatcher() {
    Stop();
}

void Dispatcher::Start(size_t worker_threads, size_t queue_capacity) {
    std::unique_lock<std::shared_mutex> lock(pool_mutex_);
    if (pool_) {
        LOG_WARN("Dispatcher already running");
        return;
    }
    pool_ = std::make_unique<ThreadPool>(worker_threads, queue_capacity);
    LOG_INFO("Dispatcher started ({} workers, queue capacity {})", worker_threads, queue_capacity);
}

void Dispatcher::Stop() {
    std::unique_lock<std::shared_mutex> lock(pool_mutex_);
    if (!pool_) {
        return;
    }
    LOG_INFO("Dispatcher draining {} queued events", pool_->GetQueueSize());
    pool_->Shutdown();
    pool_.reset();
    LOG_INFO("Dispatcher stopped");
}

bool Dispatcher::Dispatch(EventPtr event) {
    std::shared_lock<std::shared_mutex> lock(pool_mutex_);
    if (!pool_) {
        return false;
    }
    try {
        pool_->Enqueue([this, event = std::move(event)]() { Route(event); });
    } catch (const std::runtime_error& ex) {
        LOG_WARN("Event rejected: {}", ex.what());
        return false;
    }
    return true;
}

void Dispatcher::WaitIdle() {
    std::shared_lock<std::shared_mutex> lock(pool_mutex_);
    if (pool_) {
        pool_->WaitIdle();
    }
}

size_t Dispatcher::GetQueueSize() const {
    std::shared_lock<std::shared_mutex> lock(pool_mutex_);
    return pool_ ? pool_->GetQueueSize() : 0;
}

bool Dispatcher::IsRunning() const {
    std::shared_lock<std::shared_mutex> lock(pool_mutex_);
    return pool_ != nullptr;
}

void Dispatcher::Route(const EventPtr& event) {
    auto snapshot = registry_.Snapshot();
    auto candidates = snapshot->Candidates(*event);

    for (const auto& rule : candidates) {
        if (!rule->AppliesToOrganization(event->organization_id)) {
            continue;
        }
        if (registry_.IsDegraded(rule->id)) {
            continue;
        }
        EvaluateRule(rule, event);
    }

    metrics_.Increment(Counter::EVENTS_PROCESSED);
}

void Dispatcher::EvaluateRule(const RulePtr& rule, const EventPtr& event) {
    metrics_.Increment(Counter::RULE_EVALUATIONS);

    std::optional<Match> match;
    std::vector<EventPtr> events;

    const auto started = std::chrono::steady_clock::now();
    auto record_latency = [&]() {
        auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - started);
        metrics_.RecordRuleEvaluation(rule->id, static_cast<uint64_t>(elapsed.count()));
    };

    try {
        EvaluationResult result = evaluator_.Evaluate(*rule, event);

        if (result.outcome == EvaluationOutcome::MATCHED) {
            match = assembler_.FromEvent(*rule, *event, result.matched_fields, clock_.NowMs());
            events.push_back(event);
        } else if (result.outcome == EvaluationOutcome::WINDOW_MATCHED && result.window) {
            match = assembler_.FromWindow(*rule, *result.window, clock_.NowMs());
            events = result.window->events;
        }
    } catch (const std::exception& ex) {
        record_latency();
        Degrade(*rule, ex.what());
        return;
    }
    record_latency();

    if (!match) {
        return;
    }

    metrics_.Increment(Counter::MATCHES_CREATED);
    metrics_.RecordRuleMatch(rule->id);
    LOG_DEBUG("Rule {} matched ({} events, key {})", rule->id, match->EventCount(), match->IdempotencyKey());

    try {
        handler_(*rule, *match, events);
    } catch (const std::exception& ex) {
        LOG_ERROR("Failed to process match {} of rule {}: {}", match->id, rule->id, ex.what());
    }
}

void Dispatcher::Degrade(const Rule& rule, const std::string& reason) {
    metrics_.Increment(Counter::RULE_EVALUATION_ERRORS);
    LOG_ERROR("Rule {} failed during evaluation: {}", rule.id, reason);
    registry_.MarkDegraded(rule.id, reason);

    Notification notification(NotificationType::RULE_DEGRADED, rule.id);
    notification.metadata["reason"] = reason;
    notification.metadata["rule_version"] = std::to_string(rule.version);
    EventBus::Instance().PublishAsync(std::move(notification));
}

} // namespace securewatch

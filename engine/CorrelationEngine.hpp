#pragma once

#include "core/Clock.hpp"
#include "core/Config.hpp"
#include "core/Metrics.hpp"
#include "engine/AlertEmitter.hpp"
#include "engine/Deduplicator.hpp"
#include "engine/Dispatcher.hpp"
#include "engine/DurabilityStore.hpp"
#include "engine/MatchAssembler.hpp"
#include "engine/RuleEvaluator.hpp"
#include "engine/RuleRegistry.hpp"
#include "engine/Scorer.hpp"
#include "engine/WindowManager.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace securewatch {

// Owns the pipeline: dispatcher -> evaluator/window manager -> assembler ->
// scorer -> deduplicator -> emitter.
class CorrelationEngine {
public:
    explicit CorrelationEngine(EngineConfig config,
                               std::shared_ptr<Clock> clock = std::make_shared<SystemClock>());
    ~CorrelationEngine();

    CorrelationEngine(const CorrelationEngine&) = delete;
    CorrelationEngine& operator=(const CorrelationEngine&) = delete;

    // Collaborators; attach before Start().
    void AttachStore(DurabilityStore* store);
    void AddAlertSink(std::shared_ptr<AlertSink> sink);

    // Restores rules (when the store has any), windows and overflow alerts
    // from the attached store. Returns false without a store.
    bool RestoreState();

    void Start();

    // Stops accepting events, drains the queue, stops the sweep thread and
    // persists unmatched windows to the store (or discards them).
    void Stop();
    bool IsRunning() const { return running_; }

    // Asynchronous ingestion. Returns false once the engine stopped accepting.
    bool Submit(SecurityEvent event);

    // Routes on the calling thread; works whether or not the engine runs.
    void ProcessEvent(SecurityEvent event);

    // Blocks until every submitted event has been processed.
    void WaitIdle();

    // One expiry pass over windows, dedupe entries and idempotency keys.
    void RunSweep();

    // Rule management
    size_t LoadRules(const std::vector<Rule>& rules);
    RulePtr CreateRule(Rule rule);
    RulePtr UpdateRule(const std::string& id, const nlohmann::json& patch);
    bool DeleteRule(const std::string& id);
    std::vector<RulePtr> ListRules(const RuleFilter& filter = {}) const;

    MetricsSnapshot GetMetrics() const;
    nlohmann::json GetHealth() const;

    const RuleRegistry& GetRegistry() const { return registry_; }
    const WindowManager& GetWindowManager() const { return windows_; }
    const Deduplicator& GetDeduplicator() const { return deduplicator_; }

private:
    EventPtr Prepare(SecurityEvent event);
    void HandleMatch(const Rule& rule, const Match& match, const std::vector<EventPtr>& events);
    void SweepLoop();

    EngineConfig config_;
    std::shared_ptr<Clock> clock_;

    EngineMetrics metrics_;
    RuleRegistry registry_;
    WindowManager windows_;
    RuleEvaluator evaluator_;
    MatchAssembler assembler_;
    Scorer scorer_;
    Deduplicator deduplicator_;
    AlertEmitter emitter_;
    Dispatcher dispatcher_;

    DurabilityStore* store_{nullptr};

    std::atomic<bool> running_{false};
    std::atomic<bool> accepting_{false};

    std::thread sweep_thread_;
    std::mutex sweep_mutex_;
    std::condition_variable sweep_cv_;
    bool stop_sweep_{false};
};

} // namespace securewatch

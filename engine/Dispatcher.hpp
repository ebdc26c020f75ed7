#pragma once

#include "core/Clock.hpp"
#include "core/Metrics.hpp"
#include "core/ThreadPool.hpp"
#include "engine/MatchAssembler.hpp"
#include "engine/RuleEvaluator.hpp"
#include "engine/RuleRegistry.hpp"
#include <functional>
#include <memory>
#include <shared_mutex>
#include <vector>

namespace securewatch {

// Receives an assembled match together with the events it covers.
using MatchHandler = std::function<void(const Rule& rule, const Match& match,
                                        const std::vector<EventPtr>& events)>;

// Routes each event to candidate rules from the current rule snapshot and
// evaluates them on a bounded worker pool. A rule that throws is degraded
// without affecting the others.
class Dispatcher {
public:
    Dispatcher(RuleRegistry& registry,
               RuleEvaluator& evaluator,
               MatchAssembler& assembler,
               EngineMetrics& metrics,
               const Clock& clock,
               MatchHandler handler);
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    void Start(size_t worker_threads, size_t queue_capacity);

    // Stops accepting, finishes every queued event, joins the workers.
    void Stop();

    // Enqueues for asynchronous routing; blocks while the queue is full.
    // Returns false when the dispatcher is not running.
    bool Dispatch(EventPtr event);

    // Synchronous routing on the calling thread.
    void Route(const EventPtr& event);

    void WaitIdle();
    size_t GetQueueSize() const;
    bool IsRunning() const;

private:
    void EvaluateRule(const RulePtr& rule, const EventPtr& event);
    void Degrade(const Rule& rule, const std::string& reason);

    RuleRegistry& registry_;
    RuleEvaluator& evaluator_;
    MatchAssembler& assembler_;
    EngineMetrics& metrics_;
    const Clock& clock_;
    MatchHandler handler_;

    // Dispatch() holds it shared, Start()/Stop() exclusive
    mutable std::shared_mutex pool_mutex_;
    std::unique_ptr<ThreadPool> pool_;
};

} // namespace securewatch

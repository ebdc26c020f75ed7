#include <gtest/gtest.h>
#include "core/Errors.hpp"
#include "core/EventBus.hpp"
#include "engine/Dispatcher.hpp"
#include <algorithm>
#include <atomic>
#include <mutex>

using namespace securewatch;

namespace {

constexpr uint64_t kBase = 1700000000000ULL;

// Fails every evaluation of rules whose id starts with "broken".
class FaultyEvaluator : public RuleEvaluator {
public:
    using RuleEvaluator::RuleEvaluator;

    EvaluationResult Evaluate(const Rule& rule, const EventPtr& event) const override {
        if (rule.id.rfind("broken", 0) == 0) {
            throw RuleEvaluationError("regex evaluation failed on 'command_line'");
        }
        return RuleEvaluator::Evaluate(rule, event);
    }
};

Rule SingleEventRule(const std::string& id, const std::string& source = "") {
    Rule rule;
    rule.id = id;
    rule.name = id;
    rule.conditions = cond::Equals("outcome", "failure");
    if (!source.empty()) {
        rule.sources = {source};
    }
    return rule;
}

EventPtr Failure(const std::string& id, const std::string& source = "auth", const std::string& org = "") {
    auto event = std::make_shared<SecurityEvent>();
    event->id = id;
    event->timestamp = kBase;
    event->source_identifier = source;
    event->organization_id = org;
    event->fields["outcome"] = "failure";
    event->fields["user"] = "alice";
    return event;
}

} // namespace

class DispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        EventBus::Instance().Clear();
    }

    void TearDown() override {
        dispatcher_.Stop();
        EventBus::Instance().Clear();
    }

    std::vector<std::string> MatchedRules() {
        std::lock_guard<std::mutex> lock(mutex_);
        return matched_rules_;
    }

    RuleRegistry registry_;
    EngineMetrics metrics_;
    WindowManager windows_{4, 100, &metrics_};
    FaultyEvaluator evaluator_{windows_};
    MatchAssembler assembler_;
    ManualClock clock_{kBase};

    std::mutex mutex_;
    std::vector<std::string> matched_rules_;

    Dispatcher dispatcher_{registry_, evaluator_, assembler_, metrics_, clock_,
        [this](const Rule& rule, const Match&, const std::vector<EventPtr>&) {
            std::lock_guard<std::mutex> lock(mutex_);
            matched_rules_.push_back(rule.id);
        }};
};

TEST_F(DispatcherTest, RoutesToMatchingRules) {
    registry_.CreateRule(SingleEventRule("any"));
    registry_.CreateRule(SingleEventRule("auth", "auth"));
    registry_.CreateRule(SingleEventRule("firewall", "firewall"));

    dispatcher_.Route(Failure("e1"));

    auto matched = MatchedRules();
    std::sort(matched.begin(), matched.end());
    EXPECT_EQ(matched, (std::vector<std::string>{"any", "auth"}));
    EXPECT_EQ(metrics_.Get(Counter::RULE_EVALUATIONS), 2u);
    EXPECT_EQ(metrics_.Get(Counter::MATCHES_CREATED), 2u);
    EXPECT_EQ(metrics_.Get(Counter::EVENTS_PROCESSED), 1u);
    EXPECT_EQ(metrics_.GetRuleStats("auth").evaluations, 1u);
}

TEST_F(DispatcherTest, RecordsPerRuleMatchesAndLatency) {
    Rule rule = SingleEventRule("auth", "auth");
    rule.conditions = cond::Equals("outcome", "failure");
    registry_.CreateRule(rule);

    dispatcher_.Route(Failure("e1"));
    dispatcher_.Route(Failure("e2"));

    SecurityEvent success;
    success.id = "e3";
    success.timestamp = 1000;
    success.source_identifier = "auth";
    success.fields["outcome"] = "success";
    dispatcher_.Route(std::make_shared<const SecurityEvent>(success));

    RuleStats stats = metrics_.GetRuleStats("auth");
    EXPECT_EQ(stats.evaluations, 3u);
    EXPECT_EQ(stats.matches, 2u);
    EXPECT_GE(stats.total_eval_us, stats.max_eval_us);
    EXPECT_GE(stats.AverageEvalUs(), 0.0);

    auto snapshot = metrics_.Snapshot();
    ASSERT_EQ(snapshot.rules.count("auth"), 1u);
    EXPECT_EQ(snapshot.rules.at("auth").matches, 2u);
    EXPECT_EQ(snapshot.ToJson()["rules"]["auth"]["evaluations"], 3);

    metrics_.ForgetRule("auth");
    EXPECT_EQ(metrics_.GetRuleStats("auth").evaluations, 0u);
}

TEST_F(DispatcherTest, SkipsRulesOfOtherOrganizations) {
    Rule scoped = SingleEventRule("scoped");
    scoped.organization_id = "org-1";
    registry_.CreateRule(scoped);

    dispatcher_.Route(Failure("e1", "auth", "org-2"));
    EXPECT_TRUE(MatchedRules().empty());

    dispatcher_.Route(Failure("e2", "auth", "org-1"));
    EXPECT_EQ(MatchedRules(), std::vector<std::string>{"scoped"});
}

TEST_F(DispatcherTest, DuplicateEventProducesOneMatch) {
    registry_.CreateRule(SingleEventRule("any"));
    dispatcher_.Route(Failure("e1"));
    dispatcher_.Route(Failure("e1"));
    EXPECT_EQ(MatchedRules().size(), 1u);
    EXPECT_EQ(metrics_.Get(Counter::MATCHES_CREATED), 1u);
}

TEST_F(DispatcherTest, FailingRuleIsDegradedAndIsolated) {
    std::atomic<int> degraded_notifications{0};
    EventBus::Instance().Subscribe(NotificationType::RULE_DEGRADED, [&](const Notification& n) {
        if (n.subject_id == "broken-rule") {
            degraded_notifications++;
        }
    });

    registry_.CreateRule(SingleEventRule("broken-rule"));
    registry_.CreateRule(SingleEventRule("healthy"));

    dispatcher_.Route(Failure("e1"));
    dispatcher_.Route(Failure("e2"));

    EXPECT_TRUE(registry_.IsDegraded("broken-rule"));
    EXPECT_FALSE(registry_.IsDegraded("healthy"));
    EXPECT_EQ(MatchedRules(), (std::vector<std::string>{"healthy", "healthy"}));
    // degraded rules are skipped afterwards
    EXPECT_EQ(metrics_.Get(Counter::RULE_EVALUATION_ERRORS), 1u);
    EXPECT_EQ(degraded_notifications, 1);
}

TEST_F(DispatcherTest, CorrelationRuleMatchesOncePerWindow) {
    Rule rule = SingleEventRule("brute-force");
    rule.correlation = CorrelationParams{{"user"}, 60000, 3};
    registry_.CreateRule(rule);

    for (int i = 0; i < 5; ++i) {
        dispatcher_.Route(Failure("e" + std::to_string(i)));
    }
    EXPECT_EQ(MatchedRules(), std::vector<std::string>{"brute-force"});
}

TEST_F(DispatcherTest, AsynchronousDispatch) {
    registry_.CreateRule(SingleEventRule("any"));
    EXPECT_FALSE(dispatcher_.Dispatch(Failure("before-start")));

    dispatcher_.Start(4, 16);
    EXPECT_TRUE(dispatcher_.IsRunning());
    for (int i = 0; i < 100; ++i) {
        EXPECT_TRUE(dispatcher_.Dispatch(Failure("e" + std::to_string(i))));
    }
    dispatcher_.WaitIdle();

    EXPECT_EQ(MatchedRules().size(), 100u);
    EXPECT_EQ(metrics_.Get(Counter::EVENTS_PROCESSED), 100u);

    dispatcher_.Stop();
    EXPECT_FALSE(dispatcher_.IsRunning());
    EXPECT_FALSE(dispatcher_.Dispatch(Failure("after-stop")));
}

TEST_F(DispatcherTest, StopDrainsQueuedEvents) {
    registry_.CreateRule(SingleEventRule("any"));
    dispatcher_.Start(1, 1000);
    for (int i = 0; i < 50; ++i) {
        dispatcher_.Dispatch(Failure("e" + std::to_string(i)));
    }
    dispatcher_.Stop();
    EXPECT_EQ(MatchedRules().size(), 50u);
}

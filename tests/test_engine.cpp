#include <gtest/gtest.h>
#include "core/Errors.hpp"
#include "core/EventBus.hpp"
#include "engine/CorrelationEngine.hpp"
#include "response/IncidentManager.hpp"
#include <algorithm>
#include <mutex>

using namespace securewatch;

namespace {

constexpr uint64_t kBase = 1700000000000ULL;
constexpr uint64_t kWindow = 300000;
constexpr uint64_t kSuppression = 600000;

EngineConfig TestConfig() {
    EngineConfig config;
    config.pipeline.worker_threads = 2;
    config.pipeline.queue_capacity = 100;
    config.windows.shard_count = 4;
    config.windows.sweep_interval_ms = 3600000;   // sweeps are driven by the tests
    config.deduplication.suppression_interval_ms = kSuppression;
    config.emit.max_attempts = 2;
    config.emit.initial_backoff_ms = 1;
    config.emit.max_backoff_ms = 1;
    return config;
}

Rule BruteForceRule() {
    Rule rule;
    rule.id = "auth-brute-force";
    rule.name = "Brute force authentication";
    rule.severity = Severity::HIGH;
    rule.sources = {"auth"};
    rule.tags = {"attack.credential_access"};
    rule.conditions = cond::Equals("outcome", "failure");
    rule.correlation = CorrelationParams{{"user"}, kWindow, 5};
    return rule;
}

Rule EncodedPowershellRule() {
    Rule rule;
    rule.id = "encoded-powershell";
    rule.name = "Encoded PowerShell";
    rule.severity = Severity::CRITICAL;
    rule.base_confidence = 80;
    rule.conditions = cond::All({cond::Contains("process", "powershell"),
                                 cond::Contains("command_line", "-enc")});
    return rule;
}

SecurityEvent AuthFailure(const std::string& user, uint64_t ts, const std::string& org = "org-1") {
    SecurityEvent event;
    event.timestamp = ts;
    event.organization_id = org;
    event.source_identifier = "auth";
    event.fields["outcome"] = "failure";
    event.fields["user"] = user;
    return event;
}

Rule EscalationSequenceRule() {
    Rule rule;
    rule.id = "guess-then-escalate";
    rule.name = "Password guessing followed by privilege escalation";
    rule.severity = Severity::CRITICAL;
    rule.base_confidence = 70;
    rule.sources = {"auth"};
    rule.conditions = cond::Exists("action");
    SequenceParams params;
    params.fields = {"user"};
    params.steps = {
        SequenceStep{"failure", cond::Equals("action", "login_failure"), 60000},
        SequenceStep{"success", cond::Equals("action", "login_success"), 60000},
        SequenceStep{"escalation", cond::Equals("action", "sudo"), 60000},
    };
    rule.sequence = params;
    return rule;
}

SecurityEvent AuthAction(const std::string& user, const std::string& action, uint64_t ts) {
    SecurityEvent event;
    event.timestamp = ts;
    event.organization_id = "org-1";
    event.source_identifier = "auth";
    event.fields["action"] = action;
    event.fields["user"] = user;
    return event;
}

SecurityEvent PowershellEvent(const std::string& host) {
    SecurityEvent event;
    event.timestamp = kBase;
    event.source_identifier = "edr";
    event.fields["process"] = "powershell.exe";
    event.fields["command_line"] = "powershell.exe -enc SQBFAFgA";
    event.fields["host"] = host;
    return event;
}

} // namespace

class CorrelationEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        EventBus::Instance().Clear();
        engine_.AddAlertSink(std::make_shared<CallbackAlertSink>("capture", [this](const Alert& alert) {
            std::lock_guard<std::mutex> lock(mutex_);
            alerts_.push_back(alert);
        }));
    }

    void TearDown() override {
        engine_.Stop();
        EventBus::Instance().Clear();
    }

    std::vector<Alert> Alerts() {
        std::lock_guard<std::mutex> lock(mutex_);
        return alerts_;
    }

    uint64_t Count(Counter counter) const {
        return engine_.GetMetrics().Get(counter);
    }

    std::shared_ptr<ManualClock> clock_ = std::make_shared<ManualClock>(kBase);
    CorrelationEngine engine_{TestConfig(), clock_};

    std::mutex mutex_;
    std::vector<Alert> alerts_;
};

TEST_F(CorrelationEngineTest, BruteForceRaisesSingleAlert) {
    engine_.CreateRule(BruteForceRule());

    for (int i = 0; i < 4; ++i) {
        engine_.ProcessEvent(AuthFailure("alice", kBase + i * 1000));
    }
    EXPECT_TRUE(Alerts().empty());

    engine_.ProcessEvent(AuthFailure("alice", kBase + 4000));
    auto alerts = Alerts();
    ASSERT_EQ(alerts.size(), 1u);

    const Alert& alert = alerts[0];
    EXPECT_EQ(alert.rule_id, "auth-brute-force");
    EXPECT_EQ(alert.rule_name, "Brute force authentication");
    EXPECT_EQ(alert.severity, Severity::HIGH);
    EXPECT_EQ(alert.status, AlertStatus::NEW);
    EXPECT_EQ(alert.organization_id, "org-1");
    EXPECT_EQ(alert.confidence, 50u);
    // fired on the fifth event exactly, no ratio bonus
    EXPECT_EQ(alert.score_factors.count("threshold_ratio"), 0u);
    EXPECT_EQ(alert.score_factors.at("base_confidence"), 50u);
    EXPECT_EQ(alert.created_at, kBase);
    EXPECT_EQ(alert.tags, std::vector<std::string>{"attack.credential_access"});
    EXPECT_EQ(alert.dedupe_key, Deduplicator::ComputeDedupeKey("auth-brute-force", {"alice"}));
    ASSERT_NE(alert.match, nullptr);
    EXPECT_EQ(alert.EventCount(), 5u);
    EXPECT_EQ(alert.match->correlation_values, std::vector<std::string>{"alice"});

    // more failures in the same window do not fire again
    engine_.ProcessEvent(AuthFailure("alice", kBase + 5000));
    engine_.ProcessEvent(AuthFailure("alice", kBase + 6000));
    EXPECT_EQ(Alerts().size(), 1u);

    EXPECT_EQ(Count(Counter::EVENTS_RECEIVED), 7u);
    EXPECT_EQ(Count(Counter::MATCHES_CREATED), 1u);
    EXPECT_EQ(Count(Counter::ALERTS_EMITTED), 1u);
}

TEST_F(CorrelationEngineTest, DifferentUsersCorrelateSeparately) {
    engine_.CreateRule(BruteForceRule());

    for (int i = 0; i < 4; ++i) {
        engine_.ProcessEvent(AuthFailure("alice", kBase + i));
        engine_.ProcessEvent(AuthFailure("bob", kBase + i));
    }
    engine_.ProcessEvent(AuthFailure("carol", kBase + 10));
    EXPECT_TRUE(Alerts().empty());
    EXPECT_EQ(engine_.GetWindowManager().GetActiveWindowCount(), 3u);

    engine_.ProcessEvent(AuthFailure("bob", kBase + 20));
    ASSERT_EQ(Alerts().size(), 1u);
    EXPECT_EQ(Alerts()[0].match->correlation_values, std::vector<std::string>{"bob"});
}

TEST_F(CorrelationEngineTest, EventsOutsideWindowDoNotCorrelate) {
    engine_.CreateRule(BruteForceRule());

    for (int i = 0; i < 4; ++i) {
        engine_.ProcessEvent(AuthFailure("alice", kBase + i * 1000));
    }
    // fifth failure lands exactly at the window end
    engine_.ProcessEvent(AuthFailure("alice", kBase + kWindow));

    EXPECT_TRUE(Alerts().empty());
    EXPECT_EQ(Count(Counter::WINDOWS_EXPIRED), 1u);
}

TEST_F(CorrelationEngineTest, DuplicateAlertsSuppressedUntilIntervalElapses) {
    engine_.CreateRule(BruteForceRule());

    auto burst = [this](uint64_t start) {
        for (int i = 0; i < 5; ++i) {
            engine_.ProcessEvent(AuthFailure("alice", start + i));
        }
    };

    burst(kBase);
    ASSERT_EQ(Alerts().size(), 1u);

    // next window crosses the threshold while the key is still active
    burst(kBase + kWindow);
    EXPECT_EQ(Alerts().size(), 1u);
    EXPECT_EQ(Count(Counter::ALERTS_SUPPRESSED), 1u);
    EXPECT_EQ(Count(Counter::MATCHES_CREATED), 2u);

    clock_->Advance(kSuppression);
    burst(kBase + 2 * kWindow);
    EXPECT_EQ(Alerts().size(), 2u);
}

TEST_F(CorrelationEngineTest, SingleEventRuleDedupesOnRuleId) {
    engine_.CreateRule(EncodedPowershellRule());

    engine_.ProcessEvent(PowershellEvent("ws-01"));
    engine_.ProcessEvent(PowershellEvent("ws-02"));

    auto alerts = Alerts();
    ASSERT_EQ(alerts.size(), 1u);
    EXPECT_EQ(alerts[0].severity, Severity::CRITICAL);
    EXPECT_EQ(alerts[0].confidence, 80u);
    EXPECT_EQ(alerts[0].EventCount(), 1u);
    EXPECT_EQ(Count(Counter::ALERTS_SUPPRESSED), 1u);
}

TEST_F(CorrelationEngineTest, DedupeFieldsSeparateSingleEventAlerts) {
    Rule rule = EncodedPowershellRule();
    rule.dedupe_fields = {"host"};
    engine_.CreateRule(rule);

    engine_.ProcessEvent(PowershellEvent("ws-01"));
    engine_.ProcessEvent(PowershellEvent("WS-01 "));
    engine_.ProcessEvent(PowershellEvent("ws-02"));

    EXPECT_EQ(Alerts().size(), 2u);
    EXPECT_EQ(Count(Counter::ALERTS_SUPPRESSED), 1u);
}

TEST_F(CorrelationEngineTest, SuppressActionMutesMatches) {
    Rule rule = EncodedPowershellRule();
    rule.action = RuleAction::SUPPRESS;
    engine_.CreateRule(rule);

    engine_.ProcessEvent(PowershellEvent("ws-01"));

    EXPECT_TRUE(Alerts().empty());
    EXPECT_EQ(Count(Counter::MATCHES_CREATED), 1u);
    EXPECT_EQ(Count(Counter::MATCHES_MUTED), 1u);
    EXPECT_EQ(engine_.GetDeduplicator().GetTrackedKeyCount(), 0u);
}

TEST_F(CorrelationEngineTest, ResolvingAlertReleasesDedupeKey) {
    auto incidents = std::make_shared<IncidentManager>();
    incidents->Initialize();
    engine_.AddAlertSink(incidents);
    engine_.CreateRule(EncodedPowershellRule());
    engine_.Start();

    engine_.ProcessEvent(PowershellEvent("ws-01"));
    ASSERT_EQ(Alerts().size(), 1u);
    const std::string key = Alerts()[0].dedupe_key;
    EXPECT_EQ(engine_.GetDeduplicator().GetState(key, clock_->NowMs()), DedupeState::ACTIVE);

    ASSERT_TRUE(incidents->ResolveAlert(Alerts()[0].id));
    EXPECT_EQ(engine_.GetDeduplicator().GetState(key, clock_->NowMs()), DedupeState::NONE);

    engine_.ProcessEvent(PowershellEvent("ws-01"));
    EXPECT_EQ(Alerts().size(), 2u);
    EXPECT_EQ(incidents->GetTotalIncidentCount(), 2u);
    EXPECT_EQ(incidents->GetOpenIncidentCount(), 1u);
}

TEST_F(CorrelationEngineTest, DroppedAlertReleasesDedupeKey) {
    CorrelationEngine engine(TestConfig(), clock_);
    int attempts = 0;
    engine.AddAlertSink(std::make_shared<CallbackAlertSink>("down", [&](const Alert&) {
        ++attempts;
        throw EmitError("unavailable");
    }));
    engine.CreateRule(EncodedPowershellRule());

    engine.ProcessEvent(PowershellEvent("ws-01"));
    engine.ProcessEvent(PowershellEvent("ws-01"));

    auto metrics = engine.GetMetrics();
    EXPECT_EQ(metrics.Get(Counter::ALERTS_DROPPED), 2u);
    EXPECT_EQ(metrics.Get(Counter::ALERTS_SUPPRESSED), 0u);
    EXPECT_EQ(metrics.Get(Counter::EMIT_RETRIES), 2u);
    EXPECT_EQ(attempts, 4);
    EXPECT_EQ(engine.GetDeduplicator().GetTrackedKeyCount(), 0u);
}

TEST_F(CorrelationEngineTest, AsynchronousSubmission) {
    engine_.CreateRule(BruteForceRule());
    EXPECT_FALSE(engine_.Submit(AuthFailure("alice", kBase)));
    EXPECT_EQ(Count(Counter::EVENTS_REJECTED), 1u);

    engine_.Start();
    EXPECT_TRUE(engine_.IsRunning());
    for (int i = 0; i < 20; ++i) {
        // same timestamp: workers may route them in any order
        EXPECT_TRUE(engine_.Submit(AuthFailure("user" + std::to_string(i % 2), kBase)));
    }
    engine_.WaitIdle();

    EXPECT_EQ(Alerts().size(), 2u);
    EXPECT_EQ(Count(Counter::EVENTS_PROCESSED), 20u);

    engine_.Stop();
    EXPECT_FALSE(engine_.IsRunning());
    EXPECT_FALSE(engine_.Submit(AuthFailure("alice", kBase)));
}

TEST_F(CorrelationEngineTest, SweepExpiresWindowsByClock) {
    engine_.CreateRule(BruteForceRule());
    engine_.ProcessEvent(AuthFailure("alice", kBase));
    EXPECT_EQ(engine_.GetWindowManager().GetActiveWindowCount(), 1u);

    clock_->Set(kBase + kWindow - 1);
    engine_.RunSweep();
    EXPECT_EQ(engine_.GetWindowManager().GetActiveWindowCount(), 1u);

    clock_->Set(kBase + kWindow);
    engine_.RunSweep();
    EXPECT_EQ(engine_.GetWindowManager().GetActiveWindowCount(), 0u);
    EXPECT_EQ(Count(Counter::WINDOWS_EXPIRED), 1u);
}

TEST_F(CorrelationEngineTest, RuleUpdateAppliesToNewWindowsOnly) {
    engine_.CreateRule(BruteForceRule());
    engine_.ProcessEvent(AuthFailure("alice", kBase));

    auto updated = engine_.UpdateRule("auth-brute-force",
        nlohmann::json::parse(R"({"correlation": {"fields": ["user"], "timeWindowMs": 300000, "threshold": 2}})"));
    ASSERT_NE(updated, nullptr);
    EXPECT_EQ(updated->version, 2u);

    // alice's open window keeps threshold 5
    engine_.ProcessEvent(AuthFailure("alice", kBase + 1));
    EXPECT_TRUE(Alerts().empty());

    engine_.ProcessEvent(AuthFailure("bob", kBase + 2));
    engine_.ProcessEvent(AuthFailure("bob", kBase + 3));
    ASSERT_EQ(Alerts().size(), 1u);
    EXPECT_EQ(Alerts()[0].match->rule_version, 2u);
}

TEST_F(CorrelationEngineTest, DeleteRuleDropsWindows) {
    engine_.CreateRule(BruteForceRule());
    engine_.ProcessEvent(AuthFailure("alice", kBase));

    EXPECT_TRUE(engine_.DeleteRule("auth-brute-force"));
    EXPECT_FALSE(engine_.DeleteRule("auth-brute-force"));
    EXPECT_EQ(engine_.GetWindowManager().GetActiveWindowCount(), 0u);
    EXPECT_TRUE(engine_.ListRules().empty());
}

TEST_F(CorrelationEngineTest, GlobalRuleAttributesEventOrganization) {
    engine_.CreateRule(BruteForceRule());
    for (int i = 0; i < 5; ++i) {
        engine_.ProcessEvent(AuthFailure("alice", kBase + i, "org-7"));
    }
    ASSERT_EQ(Alerts().size(), 1u);
    EXPECT_EQ(Alerts()[0].organization_id, "org-7");
}

TEST_F(CorrelationEngineTest, HealthReport) {
    engine_.LoadRules({BruteForceRule(), EncodedPowershellRule()});
    engine_.ProcessEvent(AuthFailure("alice", kBase));

    auto health = engine_.GetHealth();
    EXPECT_FALSE(health["running"].get<bool>());
    EXPECT_EQ(health["rules"].get<size_t>(), 2u);
    EXPECT_TRUE(health["degraded"].empty());
    EXPECT_EQ(engine_.GetMetrics().active_windows, 1u);
}

TEST_F(CorrelationEngineTest, SequenceRuleRaisesAlertOnCompletion) {
    engine_.CreateRule(EscalationSequenceRule());

    engine_.ProcessEvent(AuthAction("alice", "login_failure", kBase));
    engine_.ProcessEvent(AuthAction("alice", "sudo", kBase + 1000));
    engine_.ProcessEvent(AuthAction("alice", "login_success", kBase + 2000));
    EXPECT_TRUE(Alerts().empty());

    engine_.ProcessEvent(AuthAction("alice", "sudo", kBase + 3000));
    auto alerts = Alerts();
    ASSERT_EQ(alerts.size(), 1u);

    const Alert& alert = alerts[0];
    EXPECT_EQ(alert.rule_id, "guess-then-escalate");
    EXPECT_EQ(alert.confidence, 70u);
    EXPECT_EQ(alert.dedupe_key, Deduplicator::ComputeDedupeKey("guess-then-escalate", {"alice"}));
    ASSERT_EQ(alert.EventCount(), 3u);
    EXPECT_EQ(alert.match->event_refs[0].step, "failure");
    EXPECT_EQ(alert.match->event_refs[1].step, "success");
    EXPECT_EQ(alert.match->event_refs[2].step, "escalation");
    EXPECT_EQ(alert.match->event_refs[2].timestamp, kBase + 3000);
    EXPECT_EQ(alert.match->event_refs[2].matched_fields.at("user"), "alice");

    // the chain reset; a repeat within the suppression interval is deduplicated
    engine_.ProcessEvent(AuthAction("alice", "login_failure", kBase + 4000));
    engine_.ProcessEvent(AuthAction("alice", "login_success", kBase + 5000));
    engine_.ProcessEvent(AuthAction("alice", "sudo", kBase + 6000));
    EXPECT_EQ(Alerts().size(), 1u);
    EXPECT_EQ(Count(Counter::MATCHES_CREATED), 2u);
    EXPECT_EQ(Count(Counter::ALERTS_SUPPRESSED), 1u);

    auto stats = engine_.GetMetrics().rules.at("guess-then-escalate");
    EXPECT_EQ(stats.evaluations, 7u);
    EXPECT_EQ(stats.matches, 2u);
}

TEST_F(CorrelationEngineTest, SequenceRuleFilteredByListRules) {
    engine_.LoadRules({BruteForceRule(), EncodedPowershellRule(), EscalationSequenceRule()});

    RuleFilter multi_event;
    multi_event.correlation = true;
    auto rules = engine_.ListRules(multi_event);
    std::vector<std::string> ids;
    for (const auto& rule : rules) {
        ids.push_back(rule->id);
    }
    std::sort(ids.begin(), ids.end());
    EXPECT_EQ(ids, (std::vector<std::string>{"auth-brute-force", "guess-then-escalate"}));
}

TEST_F(CorrelationEngineTest, DeleteRuleForgetsRuleStatistics) {
    engine_.CreateRule(EncodedPowershellRule());
    engine_.ProcessEvent(PowershellEvent("ws-1"));
    EXPECT_EQ(engine_.GetMetrics().rules.at("encoded-powershell").matches, 1u);

    EXPECT_TRUE(engine_.DeleteRule("encoded-powershell"));
    EXPECT_EQ(engine_.GetMetrics().rules.count("encoded-powershell"), 0u);
}

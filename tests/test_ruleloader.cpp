#include <gtest/gtest.h>
#include "core/Errors.hpp"
#include "engine/RuleLoader.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>

using namespace securewatch;

namespace {

const char* kBruteForceRule = R"({
    "id": "auth-brute-force",
    "name": "Repeated authentication failures",
    "severity": "high",
    "baseConfidence": 60,
    "tags": ["credential-access"],
    "sources": ["auth"],
    "conditions": {"field": "outcome", "operator": "equals", "value": "failure"},
    "correlation": {"fields": ["user"], "timeWindowMs": 300000, "threshold": 5}
})";

} // namespace

TEST(RuleLoaderTest, ParsesCorrelationRule) {
    auto rule = RuleLoader::FromJson(nlohmann::json::parse(kBruteForceRule));

    EXPECT_EQ(rule.id, "auth-brute-force");
    EXPECT_EQ(rule.severity, Severity::HIGH);
    EXPECT_EQ(rule.base_confidence, 60u);
    EXPECT_EQ(rule.action, RuleAction::ALERT);
    EXPECT_TRUE(rule.enabled);
    ASSERT_TRUE(rule.IsCorrelation());
    EXPECT_EQ(rule.correlation->fields, std::vector<std::string>{"user"});
    EXPECT_EQ(rule.correlation->time_window_ms, 300000u);
    EXPECT_EQ(rule.correlation->threshold, 5u);
    EXPECT_EQ(rule.conditions.type, ConditionType::FIELD_EQUALS);
}

TEST(RuleLoaderTest, DefaultConfidenceApplies) {
    auto j = nlohmann::json::parse(R"({"id": "r1", "conditions": {"field": "a", "op": "exists"}})");
    auto rule = RuleLoader::FromJson(j, 35);
    EXPECT_EQ(rule.base_confidence, 35u);
    EXPECT_EQ(rule.name, "r1");
    EXPECT_FALSE(rule.IsCorrelation());
}

TEST(RuleLoaderTest, TimeWindowInMinutes) {
    auto j = nlohmann::json::parse(R"({
        "id": "r1",
        "conditions": {"field": "a", "op": "exists"},
        "correlation": {"group_by": ["host"], "timeWindowMinutes": 10, "threshold": 3}
    })");
    auto rule = RuleLoader::FromJson(j);
    ASSERT_TRUE(rule.IsCorrelation());
    EXPECT_EQ(rule.correlation->time_window_ms, 600000u);
    EXPECT_EQ(rule.correlation->fields, std::vector<std::string>{"host"});
}

TEST(RuleLoaderTest, ParsesSequenceRule) {
    auto j = nlohmann::json::parse(R"({
        "id": "guess-then-escalate",
        "sequence": {
            "fields": ["user"],
            "ordered": false,
            "steps": [
                {"name": "failure", "conditions": {"field": "action", "op": "equals", "value": "login_failure"},
                 "timeoutMinutes": 5},
                {"conditions": {"field": "action", "op": "equals", "value": "sudo"}}
            ]
        }
    })");
    auto rule = RuleLoader::FromJson(j);

    ASSERT_TRUE(rule.IsSequence());
    EXPECT_FALSE(rule.IsCorrelation());
    EXPECT_TRUE(rule.IsMultiEvent());
    EXPECT_FALSE(rule.sequence->ordered);
    EXPECT_EQ(rule.GroupingFields(), std::vector<std::string>{"user"});
    ASSERT_EQ(rule.sequence->steps.size(), 2u);
    EXPECT_EQ(rule.sequence->steps[0].name, "failure");
    EXPECT_EQ(rule.sequence->steps[0].timeout_ms, 300000u);
    EXPECT_EQ(rule.sequence->steps[1].name, "step2");
    EXPECT_EQ(rule.sequence->steps[1].timeout_ms, 1800000u);

    // without a rule-level filter, any step admits the event
    EXPECT_EQ(rule.conditions.type, ConditionType::OR);
    EXPECT_EQ(rule.conditions.children.size(), 2u);

    auto back = RuleLoader::FromJson(RuleLoader::ToJson(rule));
    ASSERT_TRUE(back.IsSequence());
    EXPECT_EQ(back.sequence->steps[0].timeout_ms, 300000u);
    EXPECT_FALSE(back.sequence->ordered);
}

TEST(RuleLoaderTest, RejectsInvalidSequenceRules) {
    auto step = R"({"conditions": {"field": "action", "op": "exists"}})";
    EXPECT_THROW(RuleLoader::FromJson(nlohmann::json::parse(R"({"id": "s", "sequence": {"steps": []}})")),
                 RuleValidationError);
    EXPECT_THROW(RuleLoader::FromJson(nlohmann::json::parse(
                     R"({"id": "s", "sequence": {"steps": [{"name": "no-conditions"}]}})")),
                 RuleValidationError);
    EXPECT_THROW(RuleLoader::FromJson(nlohmann::json::parse(std::string(R"({"id": "s", "sequence": {"steps": [)") +
                     R"({"conditions": {"field": "action", "op": "exists"}, "timeoutMs": 0}]}})")),
                 RuleValidationError);

    nlohmann::json both = nlohmann::json::parse(kBruteForceRule);
    both["sequence"] = {{"steps", nlohmann::json::array({nlohmann::json::parse(step)})}};
    EXPECT_THROW(RuleLoader::FromJson(both), RuleValidationError);
}

TEST(RuleLoaderTest, NestedConditionsAndOperators) {
    auto j = nlohmann::json::parse(R"({
        "id": "r2",
        "conditions": {
            "and": [
                {"field": "process", "operator": "wildcard", "value": "*powershell*"},
                {"or": [
                    {"field": "cmd", "operator": "contains", "value": "-enc"},
                    {"field": "cmd", "operator": "regex", "value": "frombase64"}
                ]},
                {"field": "port", "operator": "not_in", "values": ["80", "443"]},
                {"field": "bytes", "operator": "gt", "value": 1000},
                {"not": {"field": "user", "operator": "eq", "value": "svc"}}
            ]
        }
    })");
    auto rule = RuleLoader::FromJson(j);

    ASSERT_EQ(rule.conditions.type, ConditionType::AND);
    ASSERT_EQ(rule.conditions.children.size(), 5u);
    EXPECT_EQ(rule.conditions.children[0].type, ConditionType::FIELD_WILDCARD);
    EXPECT_EQ(rule.conditions.children[1].type, ConditionType::OR);
    EXPECT_EQ(rule.conditions.children[2].type, ConditionType::NOT);
    EXPECT_EQ(rule.conditions.children[3].type, ConditionType::FIELD_GREATER_THAN);
    EXPECT_DOUBLE_EQ(rule.conditions.children[3].number, 1000.0);

    SecurityEvent event;
    event.fields = {{"process", "C:\\Windows\\PowerShell.exe"}, {"cmd", "-EncodedCommand x"},
                    {"port", "8443"}, {"bytes", "5000"}, {"user", "alice"}};
    EXPECT_TRUE(EvaluateCondition(rule.conditions, event));

    event.fields["port"] = "443";
    EXPECT_FALSE(EvaluateCondition(rule.conditions, event));
}

TEST(RuleLoaderTest, RejectsInvalidRules) {
    EXPECT_THROW(RuleLoader::FromJson(nlohmann::json::parse(R"({"conditions": {"field": "a", "op": "exists"}})")),
                 RuleValidationError);
    EXPECT_THROW(RuleLoader::FromJson(nlohmann::json::parse(R"({"id": "r"})")), RuleValidationError);
    EXPECT_THROW(RuleLoader::FromJson(nlohmann::json::parse(
                     R"({"id": "r", "conditions": {"field": "a", "op": "soundex", "value": "x"}})")),
                 RuleValidationError);
    EXPECT_THROW(RuleLoader::FromJson(nlohmann::json::parse(
                     R"({"id": "r", "severity": "apocalyptic", "conditions": {"field": "a", "op": "exists"}})")),
                 RuleValidationError);
    EXPECT_THROW(RuleLoader::FromJson(nlohmann::json::parse(
                     R"({"id": "r", "baseConfidence": 140, "conditions": {"field": "a", "op": "exists"}})")),
                 RuleValidationError);
    EXPECT_THROW(RuleLoader::FromJson(nlohmann::json::parse(
                     R"({"id": "r", "conditions": {"field": "a", "op": "regex", "value": "(["}})")),
                 RuleValidationError);
    EXPECT_THROW(RuleLoader::FromJson(nlohmann::json::parse(
                     R"({"id": "r", "conditions": {"and": []}})")),
                 RuleValidationError);
    EXPECT_THROW(RuleLoader::FromJson(nlohmann::json::parse(
                     R"({"id": "r", "conditions": {"field": "a", "op": "exists"},
                         "correlation": {"fields": ["u"], "timeWindowMs": 0, "threshold": 2}})")),
                 RuleValidationError);
}

TEST(RuleLoaderTest, JsonRoundTripPreservesSemantics) {
    auto original = RuleLoader::FromJson(nlohmann::json::parse(kBruteForceRule));
    original.dedupe_fields = {"user"};
    original.action = RuleAction::SUPPRESS;

    auto copy = RuleLoader::FromJson(RuleLoader::ToJson(original));

    EXPECT_EQ(copy.id, original.id);
    EXPECT_EQ(copy.severity, original.severity);
    EXPECT_EQ(copy.action, RuleAction::SUPPRESS);
    EXPECT_EQ(copy.dedupe_fields, original.dedupe_fields);
    EXPECT_EQ(copy.version, original.version);
    EXPECT_EQ(RuleLoader::ToJson(copy), RuleLoader::ToJson(original));
}

TEST(RuleLoaderTest, LoadStringSkipsBadRulesAndKeepsGoodOnes) {
    const char* yaml = R"(
rules:
  - id: good-one
    severity: low
    conditions:
      field: outcome
      operator: equals
      value: failure
  - id: bad-one
    conditions:
      field: outcome
      operator: teleport
      value: x
  - id: good-two
    conditions:
      field: port
      operator: in
      values: ["22", "3389"]
)";

    auto result = RuleLoader::LoadString(yaml);
    ASSERT_EQ(result.rules.size(), 2u);
    EXPECT_EQ(result.rules[0].id, "good-one");
    EXPECT_EQ(result.rules[1].id, "good-two");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_NE(result.errors[0].find("bad-one"), std::string::npos);
}

TEST(RuleLoaderTest, QuotedYamlScalarsStayStrings) {
    YAML::Node node = YAML::Load("a: \"42\"\nb: 42\nc: true\nd: ~\ne: 1.5");
    auto j = RuleLoader::YamlToJson(node);
    EXPECT_TRUE(j["a"].is_string());
    EXPECT_TRUE(j["b"].is_number_integer());
    EXPECT_TRUE(j["c"].is_boolean());
    EXPECT_TRUE(j["d"].is_null());
    EXPECT_TRUE(j["e"].is_number_float());
}

TEST(RuleLoaderTest, LoadFileMixesNativeAndSigmaDocuments) {
    auto path = std::filesystem::temp_directory_path() / "securewatch_rules_test.yaml";
    {
        std::ofstream ofs(path);
        ofs << "- id: native-rule\n"
               "  conditions: {field: a, op: exists}\n"
               "---\n"
               "title: Sigma Rule\n"
               "id: sigma-1\n"
               "level: high\n"
               "detection:\n"
               "  sel:\n"
               "    EventID: 4625\n"
               "  condition: sel\n";
    }

    auto result = RuleLoader::LoadFile(path.string());
    std::filesystem::remove(path);

    ASSERT_EQ(result.rules.size(), 2u);
    EXPECT_EQ(result.rules[0].id, "native-rule");
    EXPECT_EQ(result.rules[1].id, "sigma-1");
    EXPECT_EQ(result.rules[1].severity, Severity::HIGH);
    EXPECT_TRUE(result.errors.empty());
}

TEST(RuleLoaderTest, MissingFileIsConfigError) {
    EXPECT_THROW(RuleLoader::LoadFile("/nonexistent/securewatch/rules.yaml"), ConfigError);
}

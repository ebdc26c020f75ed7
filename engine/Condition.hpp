#pragma once

#include "core/SecurityEvent.hpp"
#include <map>
#include <memory>
#include <regex>
#include <string>
#include <vector>

namespace securewatch {

enum class ConditionType {
    FIELD_EQUALS,
    FIELD_CONTAINS,
    FIELD_REGEX,
    FIELD_IN_SET,
    FIELD_WILDCARD,
    FIELD_EXISTS,
    FIELD_GREATER_THAN,
    FIELD_LESS_THAN,
    AND,
    OR,
    NOT
};

std::string ConditionTypeToString(ConditionType type);

// Node of a closed boolean condition tree. Leaves compare one event field;
// AND/OR/NOT combine children. Regex patterns are compiled once when the
// node is built.
struct ConditionNode {
    ConditionType type{ConditionType::AND};
    std::string field;
    std::string value;                       // FIELD_EQUALS/CONTAINS/REGEX/WILDCARD
    std::vector<std::string> values;         // FIELD_IN_SET
    double number{0.0};                      // FIELD_GREATER_THAN/LESS_THAN
    bool ignore_case{false};
    std::shared_ptr<const std::regex> regex;
    std::vector<ConditionNode> children;

    bool IsLeaf() const {
        return type != ConditionType::AND && type != ConditionType::OR && type != ConditionType::NOT;
    }
};

// Field values that satisfied the leaves of a successful evaluation.
using MatchedFields = std::map<std::string, std::string>;

// Evaluates `node` against `event`. Missing fields make comparisons false.
// Matched field values are recorded into `matched` (if given) for branches
// that contribute to a true result; nothing under a NOT is recorded.
// Throws RuleEvaluationError for structurally invalid trees.
bool EvaluateCondition(const ConditionNode& node, const SecurityEvent& event,
                       MatchedFields* matched = nullptr);

// Structural validation. Throws RuleValidationError naming `rule_id`.
void ValidateCondition(const ConditionNode& node, const std::string& rule_id = "");

// Glob match supporting '*' and '?'. Case-sensitive; callers lower-case.
bool WildcardMatch(const std::string& pattern, const std::string& text);

std::string ToLower(const std::string& text);

// Builders used by the rule loaders and tests.
namespace cond {

ConditionNode Equals(const std::string& field, const std::string& value, bool ignore_case = false);
ConditionNode Contains(const std::string& field, const std::string& value, bool ignore_case = true);
ConditionNode Regex(const std::string& field, const std::string& pattern, bool ignore_case = false);
ConditionNode InSet(const std::string& field, std::vector<std::string> values, bool ignore_case = false);
ConditionNode Wildcard(const std::string& field, const std::string& pattern, bool ignore_case = true);
ConditionNode Exists(const std::string& field);
ConditionNode GreaterThan(const std::string& field, double number);
ConditionNode LessThan(const std::string& field, double number);
ConditionNode All(std::vector<ConditionNode> children);
ConditionNode Any(std::vector<ConditionNode> children);
ConditionNode Not(ConditionNode child);

} // namespace cond

} // namespace securewatch

#include "engine/Condition.hpp"
#include "core/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace securewatch {

std::string ConditionTypeToString(ConditionType type) {
    switch (type) {
        case ConditionType::FIELD_EQUALS:       return "equals";
        case ConditionType::FIELD_CONTAINS:     return "contains";
        case ConditionType::FIELD_REGEX:        return "regex";
        case ConditionType::FIELD_IN_SET:       return "in";
        case ConditionType::FIELD_WILDCARD:     return "wildcard";
        case ConditionType::FIELD_EXISTS:       return "exists";
        case ConditionType::FIELD_GREATER_THAN: return "gt";
        case ConditionType::FIELD_LESS_THAN:    return "lt";
        case ConditionType::AND:                return "and";
        case ConditionType::OR:                 return "or";
        case ConditionType::NOT:                return "not";
        default:                                return "unknown";
    }
}

std::string ToLower(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                  [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

bool WildcardMatch(const std::string& pattern, const std::string& text) {
    size_t p = 0; // pattern index
    size_t t = 0; // text index
    size_t star_idx = std::string::npos;
    size_t match_idx = 0;

    while (t < text.length()) {
        if (p < pattern.length() && (pattern[p] == '?' || pattern[p] == text[t])) {
            ++p;
            ++t;
        } else if (p < pattern.length() && pattern[p] == '*') {
            // remember the star, try matching nothing first
            star_idx = p;
            match_idx = t;
            ++p;
        } else if (star_idx != std::string::npos) {
            // backtrack: let the last star swallow one more character
            p = star_idx + 1;
            ++match_idx;
            t = match_idx;
        } else {
            return false;
        }
    }

    while (p < pattern.length() && pattern[p] == '*') {
        ++p;
    }

    return p == pattern.length();
}

namespace {

bool ParseNumber(const std::string& text, double& out) {
    if (text.empty()) {
        return false;
    }
    const char* begin = text.c_str();
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(begin, &end);
    if (errno == ERANGE || end == begin) {
        return false;
    }
    while (*end != '\0' && std::isspace(static_cast<unsigned char>(*end))) {
        ++end;
    }
    if (*end != '\0') {
        return false;
    }
    out = value;
    return true;
}

bool CompareLeaf(const ConditionNode& node, const std::string& actual) {
    switch (node.type) {
        case ConditionType::FIELD_EQUALS:
            return node.ignore_case ? ToLower(actual) == ToLower(node.value) : actual == node.value;

        case ConditionType::FIELD_CONTAINS:
            if (node.ignore_case) {
                return ToLower(actual).find(ToLower(node.value)) != std::string::npos;
            }
            return actual.find(node.value) != std::string::npos;

        case ConditionType::FIELD_REGEX:
            if (!node.regex) {
                throw RuleEvaluationError("regex condition on '" + node.field + "' was never compiled");
            }
            try {
                return std::regex_search(actual, *node.regex);
            } catch (const std::regex_error& ex) {
                throw RuleEvaluationError("regex evaluation failed on '" + node.field + "': " + ex.what());
            }

        case ConditionType::FIELD_IN_SET: {
            const std::string needle = node.ignore_case ? ToLower(actual) : actual;
            for (const auto& candidate : node.values) {
                if ((node.ignore_case ? ToLower(candidate) : candidate) == needle) {
                    return true;
                }
            }
            return false;
        }

        case ConditionType::FIELD_WILDCARD:
            if (node.ignore_case) {
                return WildcardMatch(ToLower(node.value), ToLower(actual));
            }
            return WildcardMatch(node.value, actual);

        case ConditionType::FIELD_EXISTS:
            return true;

        case ConditionType::FIELD_GREATER_THAN: {
            double number = 0.0;
            return ParseNumber(actual, number) && number > node.number;
        }

        case ConditionType::FIELD_LESS_THAN: {
            double number = 0.0;
            return ParseNumber(actual, number) && number < node.number;
        }

        default:
            throw RuleEvaluationError("unknown leaf condition type");
    }
}

} // namespace

bool EvaluateCondition(const ConditionNode& node, const SecurityEvent& event, MatchedFields* matched) {
    switch (node.type) {
        case ConditionType::AND: {
            if (node.children.empty()) {
                throw RuleEvaluationError("AND node without children");
            }
            MatchedFields local;
            for (const auto& child : node.children) {
                if (!EvaluateCondition(child, event, matched ? &local : nullptr)) {
                    return false;
                }
            }
            if (matched) {
                matched->insert(local.begin(), local.end());
            }
            return true;
        }

        case ConditionType::OR: {
            if (node.children.empty()) {
                throw RuleEvaluationError("OR node without children");
            }
            for (const auto& child : node.children) {
                MatchedFields local;
                if (EvaluateCondition(child, event, matched ? &local : nullptr)) {
                    if (matched) {
                        matched->insert(local.begin(), local.end());
                    }
                    return true;
                }
            }
            return false;
        }

        case ConditionType::NOT:
            if (node.children.size() != 1) {
                throw RuleEvaluationError("NOT node must have exactly one child");
            }
            return !EvaluateCondition(node.children.front(), event, nullptr);

        default:
            break;
    }

    if (node.field.empty()) {
        throw RuleEvaluationError("leaf condition without field");
    }

    auto actual = event.GetField(node.field);
    if (!actual) {
        return false;
    }

    if (!CompareLeaf(node, *actual)) {
        return false;
    }

    if (matched) {
        (*matched)[node.field] = *actual;
    }
    return true;
}

void ValidateCondition(const ConditionNode& node, const std::string& rule_id) {
    switch (node.type) {
        case ConditionType::AND:
        case ConditionType::OR:
            if (node.children.empty()) {
                throw RuleValidationError(rule_id, ConditionTypeToString(node.type) + " requires at least one child");
            }
            for (const auto& child : node.children) {
                ValidateCondition(child, rule_id);
            }
            return;

        case ConditionType::NOT:
            if (node.children.size() != 1) {
                throw RuleValidationError(rule_id, "not requires exactly one child");
            }
            ValidateCondition(node.children.front(), rule_id);
            return;

        default:
            break;
    }

    if (node.field.empty()) {
        throw RuleValidationError(rule_id, ConditionTypeToString(node.type) + " condition without field");
    }
    if (!node.children.empty()) {
        throw RuleValidationError(rule_id, "leaf condition on '" + node.field + "' has children");
    }
    if (node.type == ConditionType::FIELD_REGEX && !node.regex) {
        throw RuleValidationError(rule_id, "regex condition on '" + node.field + "' is not compiled");
    }
    if (node.type == ConditionType::FIELD_IN_SET && node.values.empty()) {
        throw RuleValidationError(rule_id, "in condition on '" + node.field + "' has no values");
    }
}

namespace cond {

namespace {

ConditionNode Leaf(ConditionType type, const std::string& field, const std::string& value, bool ignore_case) {
    ConditionNode node;
    node.type = type;
    node.field = field;
    node.value = value;
    node.ignore_case = ignore_case;
    return node;
}

ConditionNode Group(ConditionType type, std::vector<ConditionNode> children) {
    ConditionNode node;
    node.type = type;
    node.children = std::move(children);
    return node;
}

} // namespace

ConditionNode Equals(const std::string& field, const std::string& value, bool ignore_case) {
    return Leaf(ConditionType::FIELD_EQUALS, field, value, ignore_case);
}

ConditionNode Contains(const std::string& field, const std::string& value, bool ignore_case) {
    return Leaf(ConditionType::FIELD_CONTAINS, field, value, ignore_case);
}

ConditionNode Regex(const std::string& field, const std::string& pattern, bool ignore_case) {
    ConditionNode node = Leaf(ConditionType::FIELD_REGEX, field, pattern, ignore_case);
    auto flags = std::regex::ECMAScript | std::regex::optimize;
    if (ignore_case) {
        flags |= std::regex::icase;
    }
    try {
        node.regex = std::make_shared<const std::regex>(pattern, flags);
    } catch (const std::regex_error& ex) {
        throw RuleValidationError("", "invalid regex '" + pattern + "' on '" + field + "': " + ex.what());
    }
    return node;
}

ConditionNode InSet(const std::string& field, std::vector<std::string> values, bool ignore_case) {
    ConditionNode node = Leaf(ConditionType::FIELD_IN_SET, field, "", ignore_case);
    node.values = std::move(values);
    return node;
}

ConditionNode Wildcard(const std::string& field, const std::string& pattern, bool ignore_case) {
    return Leaf(ConditionType::FIELD_WILDCARD, field, pattern, ignore_case);
}

ConditionNode Exists(const std::string& field) {
    return Leaf(ConditionType::FIELD_EXISTS, field, "", false);
}

ConditionNode GreaterThan(const std::string& field, double number) {
    ConditionNode node = Leaf(ConditionType::FIELD_GREATER_THAN, field, "", false);
    node.number = number;
    return node;
}

ConditionNode LessThan(const std::string& field, double number) {
    ConditionNode node = Leaf(ConditionType::FIELD_LESS_THAN, field, "", false);
    node.number = number;
    return node;
}

ConditionNode All(std::vector<ConditionNode> children) {
    return Group(ConditionType::AND, std::move(children));
}

ConditionNode Any(std::vector<ConditionNode> children) {
    return Group(ConditionType::OR, std::move(children));
}

ConditionNode Not(ConditionNode child) {
    std::vector<ConditionNode> children;
    children.push_back(std::move(child));
    return Group(ConditionType::NOT, std::move(children));
}

} // namespace cond

} // namespace securewatch

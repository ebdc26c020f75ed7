#include "engine/SigmaConverter.hpp"
#include "engine/RuleLoader.hpp"
#include "core/Errors.hpp"
#include <cctype>
#include <map>
#include <set>
#include <stdexcept>
#include <sstream>

namespace securewatch {

namespace {

const std::set<std::string> kSupportedModifiers = {"all", "contains", "startswith", "endswith", "re"};

struct Aggregation {
    std::vector<std::string> group_by;
    uint32_t threshold{1};
};

std::vector<std::string> Split(const std::string& text, char delimiter) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream iss(text);
    while (std::getline(iss, part, delimiter)) {
        parts.push_back(part);
    }
    return parts;
}

std::string Trim(const std::string& text) {
    size_t begin = 0;
    while (begin < text.size() && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    size_t end = text.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(begin, end - begin);
}

ConditionNode ValueNode(const std::string& rule_id, const std::string& field,
                        const std::set<std::string>& modifiers, const std::string& value) {
    if (modifiers.count("re")) {
        try {
            return cond::Regex(field, value, false);
        } catch (const RuleValidationError& ex) {
            throw RuleValidationError(rule_id, ex.what());
        }
    }
    if (modifiers.count("contains")) {
        return cond::Wildcard(field, "*" + value + "*");
    }
    if (modifiers.count("startswith")) {
        return cond::Wildcard(field, value + "*");
    }
    if (modifiers.count("endswith")) {
        return cond::Wildcard(field, "*" + value);
    }
    if (value.find_first_of("*?") != std::string::npos) {
        return cond::Wildcard(field, value);
    }
    return cond::Equals(field, value, true);
}

ConditionNode FieldNode(const std::string& rule_id, const std::string& key, const YAML::Node& value) {
    auto parts = Split(key, '|');
    if (parts.empty() || parts.front().empty()) {
        throw RuleValidationError(rule_id, "empty field name in detection");
    }
    const std::string field = parts.front();

    std::set<std::string> modifiers;
    for (size_t i = 1; i < parts.size(); ++i) {
        if (!kSupportedModifiers.count(parts[i])) {
            throw RuleValidationError(rule_id, "unsupported modifier '" + parts[i] + "' on '" + field + "'");
        }
        modifiers.insert(parts[i]);
    }

    if (!value || value.IsNull()) {
        return cond::Not(cond::Exists(field));
    }

    if (value.IsScalar()) {
        return ValueNode(rule_id, field, modifiers, value.as<std::string>());
    }

    if (value.IsSequence()) {
        if (value.size() == 0) {
            throw RuleValidationError(rule_id, "empty value list for '" + field + "'");
        }
        std::vector<ConditionNode> children;
        for (const auto& item : value) {
            if (!item.IsScalar()) {
                throw RuleValidationError(rule_id, "nested value for '" + field + "' is not a scalar");
            }
            children.push_back(ValueNode(rule_id, field, modifiers, item.as<std::string>()));
        }
        if (children.size() == 1) {
            return std::move(children.front());
        }
        return modifiers.count("all") ? cond::All(std::move(children)) : cond::Any(std::move(children));
    }

    throw RuleValidationError(rule_id, "unsupported value type for '" + field + "'");
}

ConditionNode SelectionMap(const std::string& rule_id, const YAML::Node& map) {
    std::vector<ConditionNode> children;
    for (const auto& entry : map) {
        children.push_back(FieldNode(rule_id, entry.first.as<std::string>(), entry.second));
    }
    if (children.empty()) {
        throw RuleValidationError(rule_id, "empty selection");
    }
    if (children.size() == 1) {
        return std::move(children.front());
    }
    return cond::All(std::move(children));
}

ConditionNode Identifier(const std::string& rule_id, const std::string& name, const YAML::Node& body) {
    if (body.IsMap()) {
        return SelectionMap(rule_id, body);
    }
    if (body.IsSequence()) {
        std::vector<ConditionNode> children;
        for (const auto& item : body) {
            if (!item.IsMap()) {
                throw RuleValidationError(rule_id, "keyword searches in '" + name + "' are not supported");
            }
            children.push_back(SelectionMap(rule_id, item));
        }
        if (children.empty()) {
            throw RuleValidationError(rule_id, "empty identifier '" + name + "'");
        }
        if (children.size() == 1) {
            return std::move(children.front());
        }
        return cond::Any(std::move(children));
    }
    throw RuleValidationError(rule_id, "identifier '" + name + "' must be a map or a list");
}

// Recursive descent over the condition expression:
//   expr   := term ("or" term)*
//   term   := factor ("and" factor)*
//   factor := "not" factor | "(" expr ")" | ("1"|"all") "of" target | identifier
class ConditionParser {
public:
    ConditionParser(const std::string& rule_id, const std::string& text,
                    const std::map<std::string, ConditionNode>& identifiers)
        : rule_id_(rule_id), identifiers_(identifiers) {
        Tokenize(text);
    }

    ConditionNode Parse() {
        if (tokens_.empty()) {
            throw RuleValidationError(rule_id_, "empty detection condition");
        }
        ConditionNode node = ParseExpr();
        if (pos_ != tokens_.size()) {
            throw RuleValidationError(rule_id_, "unexpected token '" + tokens_[pos_] + "' in condition");
        }
        return node;
    }

private:
    void Tokenize(const std::string& text) {
        std::string current;
        for (char c : text) {
            if (std::isspace(static_cast<unsigned char>(c)) || c == '(' || c == ')') {
                if (!current.empty()) {
                    tokens_.push_back(current);
                    current.clear();
                }
                if (c == '(' || c == ')') {
                    tokens_.push_back(std::string(1, c));
                }
            } else {
                current += c;
            }
        }
        if (!current.empty()) {
            tokens_.push_back(current);
        }
    }

    bool PeekKeyword(const char* keyword) const {
        return pos_ < tokens_.size() && ToLower(tokens_[pos_]) == keyword;
    }

    ConditionNode ParseExpr() {
        std::vector<ConditionNode> terms;
        terms.push_back(ParseTerm());
        while (PeekKeyword("or")) {
            ++pos_;
            terms.push_back(ParseTerm());
        }
        return terms.size() == 1 ? std::move(terms.front()) : cond::Any(std::move(terms));
    }

    ConditionNode ParseTerm() {
        std::vector<ConditionNode> factors;
        factors.push_back(ParseFactor());
        while (PeekKeyword("and")) {
            ++pos_;
            factors.push_back(ParseFactor());
        }
        return factors.size() == 1 ? std::move(factors.front()) : cond::All(std::move(factors));
    }

    ConditionNode ParseFactor() {
        if (pos_ >= tokens_.size()) {
            throw RuleValidationError(rule_id_, "condition ends unexpectedly");
        }

        if (PeekKeyword("not")) {
            ++pos_;
            return cond::Not(ParseFactor());
        }

        if (tokens_[pos_] == "(") {
            ++pos_;
            ConditionNode inner = ParseExpr();
            if (pos_ >= tokens_.size() || tokens_[pos_] != ")") {
                throw RuleValidationError(rule_id_, "unbalanced parentheses in condition");
            }
            ++pos_;
            return inner;
        }

        const std::string token = ToLower(tokens_[pos_]);
        if ((token == "1" || token == "any" || token == "all") &&
            pos_ + 1 < tokens_.size() && ToLower(tokens_[pos_ + 1]) == "of") {
            if (pos_ + 2 >= tokens_.size()) {
                throw RuleValidationError(rule_id_, "quantifier without target");
            }
            const bool all = token == "all";
            const std::string target = tokens_[pos_ + 2];
            pos_ += 3;
            return Quantified(all, target);
        }

        auto it = identifiers_.find(tokens_[pos_]);
        if (it == identifiers_.end()) {
            throw RuleValidationError(rule_id_, "unknown identifier '" + tokens_[pos_] + "' in condition");
        }
        ++pos_;
        return it->second;
    }

    ConditionNode Quantified(bool all, const std::string& target) {
        std::vector<ConditionNode> matches;
        if (target == "them") {
            for (const auto& [name, node] : identifiers_) {
                // by convention underscore-prefixed identifiers are helpers
                if (!name.empty() && name.front() == '_') continue;
                matches.push_back(node);
            }
        } else if (!target.empty() && target.back() == '*') {
            const std::string prefix = target.substr(0, target.size() - 1);
            for (const auto& [name, node] : identifiers_) {
                if (name.compare(0, prefix.size(), prefix) == 0) {
                    matches.push_back(node);
                }
            }
        } else {
            auto it = identifiers_.find(target);
            if (it != identifiers_.end()) {
                matches.push_back(it->second);
            }
        }

        if (matches.empty()) {
            throw RuleValidationError(rule_id_, "'" + target + "' matches no identifier");
        }
        if (matches.size() == 1) {
            return std::move(matches.front());
        }
        return all ? cond::All(std::move(matches)) : cond::Any(std::move(matches));
    }

    std::string rule_id_;
    const std::map<std::string, ConditionNode>& identifiers_;
    std::vector<std::string> tokens_;
    size_t pos_ = 0;
};

Aggregation ParseAggregation(const std::string& rule_id, const std::string& text) {
    Aggregation agg;
    std::istringstream iss(text);
    std::string kind;
    iss >> kind;

    if (kind.compare(0, 6, "count(") != 0 || kind.back() != ')') {
        throw RuleValidationError(rule_id, "unsupported aggregation '" + kind + "'");
    }
    if (kind != "count()") {
        throw RuleValidationError(rule_id, "distinct-count aggregations are not supported");
    }

    std::string next;
    if (!(iss >> next)) {
        throw RuleValidationError(rule_id, "invalid aggregation");
    }
    if (next == "by") {
        std::string group_field;
        if (!(iss >> group_field)) {
            throw RuleValidationError(rule_id, "missing group field in aggregation");
        }
        for (const auto& field : Split(group_field, ',')) {
            if (!Trim(field).empty()) {
                agg.group_by.push_back(Trim(field));
            }
        }
        if (!(iss >> next)) {
            throw RuleValidationError(rule_id, "invalid aggregation");
        }
    }

    std::string number;
    if (!(iss >> number)) {
        throw RuleValidationError(rule_id, "aggregation without count");
    }

    long long count = 0;
    try {
        count = std::stoll(number);
    } catch (const std::exception&) {
        throw RuleValidationError(rule_id, "aggregation count '" + number + "' is not a number");
    }

    if (next == ">=") {
        agg.threshold = static_cast<uint32_t>(count);
    } else if (next == ">") {
        agg.threshold = static_cast<uint32_t>(count + 1);
    } else {
        throw RuleValidationError(rule_id, "aggregation operator '" + next + "' is not supported");
    }
    if (count < 0 || agg.threshold == 0) {
        throw RuleValidationError(rule_id, "aggregation threshold must be at least 1");
    }
    return agg;
}

} // namespace

bool SigmaConverter::IsSigmaDocument(const YAML::Node& doc) {
    return doc.IsMap() && doc["detection"] && doc["detection"].IsMap();
}

uint64_t SigmaConverter::ParseTimeframe(const std::string& text) {
    std::string trimmed = Trim(text);
    if (trimmed.size() < 2) {
        return 0;
    }
    const char unit = static_cast<char>(std::tolower(static_cast<unsigned char>(trimmed.back())));
    const std::string digits = trimmed.substr(0, trimmed.size() - 1);
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return 0;
        }
    }

    uint64_t amount = 0;
    try {
        amount = std::stoull(digits);
    } catch (const std::out_of_range&) {
        return 0;
    }
    switch (unit) {
        case 's': return amount * 1000;
        case 'm': return amount * 60 * 1000;
        case 'h': return amount * 60 * 60 * 1000;
        case 'd': return amount * 24 * 60 * 60 * 1000;
        default:  return 0;
    }
}

Rule SigmaConverter::Convert(const YAML::Node& doc, uint32_t default_base_confidence) {
    if (!IsSigmaDocument(doc)) {
        throw RuleValidationError("", "not a SIGMA document");
    }

    Rule rule;
    rule.base_confidence = default_base_confidence;

    if (doc["title"]) {
        rule.name = doc["title"].as<std::string>();
    }
    if (doc["id"]) {
        rule.id = doc["id"].as<std::string>();
    } else if (!rule.name.empty()) {
        rule.id = ToLower(rule.name);
        for (char& c : rule.id) {
            if (std::isspace(static_cast<unsigned char>(c))) c = '_';
        }
    }
    if (rule.id.empty()) {
        throw RuleValidationError("", "SIGMA rule without id or title");
    }
    if (rule.name.empty()) {
        rule.name = rule.id;
    }

    if (doc["description"]) {
        rule.description = doc["description"].as<std::string>();
    }
    if (doc["level"]) {
        auto severity = SeverityFromString(doc["level"].as<std::string>());
        if (!severity) {
            throw RuleValidationError(rule.id, "unknown level '" + doc["level"].as<std::string>() + "'");
        }
        rule.severity = *severity;
    }
    if (doc["status"] && ToLower(doc["status"].as<std::string>()) == "deprecated") {
        rule.enabled = false;
    }
    if (doc["tags"] && doc["tags"].IsSequence()) {
        for (const auto& tag : doc["tags"]) {
            rule.tags.push_back(tag.as<std::string>());
        }
    }
    if (auto logsource = doc["logsource"]) {
        for (const char* key : {"category", "service"}) {
            if (logsource[key]) {
                rule.sources.push_back(logsource[key].as<std::string>());
            }
        }
    }

    const YAML::Node detection = doc["detection"];
    std::map<std::string, ConditionNode> identifiers;
    std::string timeframe;
    for (const auto& entry : detection) {
        const std::string key = entry.first.as<std::string>();
        if (key == "condition") continue;
        if (key == "timeframe") {
            timeframe = entry.second.as<std::string>();
            continue;
        }
        identifiers.emplace(key, Identifier(rule.id, key, entry.second));
    }
    if (timeframe.empty() && doc["timeframe"]) {
        timeframe = doc["timeframe"].as<std::string>();
    }

    const YAML::Node condition_node = detection["condition"];
    if (!condition_node) {
        throw RuleValidationError(rule.id, "detection without condition");
    }

    std::optional<Aggregation> aggregation;
    if (condition_node.IsSequence()) {
        std::vector<ConditionNode> alternatives;
        for (const auto& item : condition_node) {
            const std::string text = item.as<std::string>();
            if (text.find('|') != std::string::npos) {
                throw RuleValidationError(rule.id, "aggregations inside condition lists are not supported");
            }
            alternatives.push_back(ConditionParser(rule.id, text, identifiers).Parse());
        }
        if (alternatives.empty()) {
            throw RuleValidationError(rule.id, "empty condition list");
        }
        rule.conditions = alternatives.size() == 1 ? std::move(alternatives.front())
                                                   : cond::Any(std::move(alternatives));
    } else {
        std::string text = condition_node.as<std::string>();
        auto pipe = text.find('|');
        if (pipe != std::string::npos) {
            aggregation = ParseAggregation(rule.id, Trim(text.substr(pipe + 1)));
            text = text.substr(0, pipe);
        }
        rule.conditions = ConditionParser(rule.id, text, identifiers).Parse();
    }

    if (aggregation) {
        uint64_t window = ParseTimeframe(timeframe);
        if (window == 0) {
            throw RuleValidationError(rule.id, "aggregation requires a valid timeframe");
        }
        CorrelationParams params;
        params.fields = aggregation->group_by;
        params.time_window_ms = window;
        params.threshold = aggregation->threshold;
        rule.correlation = params;
    }

    RuleLoader::Validate(rule);
    return rule;
}

} // namespace securewatch

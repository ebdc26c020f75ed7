#include "engine/RuleLoader.hpp"
#include "engine/SigmaConverter.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include <cctype>

namespace securewatch {

namespace {

const nlohmann::json* FindKey(const nlohmann::json& j, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = j.find(key);
        if (it != j.end() && !it->is_null()) {
            return &(*it);
        }
    }
    return nullptr;
}

std::string ScalarToString(const nlohmann::json& value, const std::string& rule_id, const char* what) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "true" : "false";
    }
    if (value.is_number()) {
        return value.dump();
    }
    throw RuleValidationError(rule_id, std::string(what) + " must be a scalar");
}

std::vector<std::string> StringList(const nlohmann::json& value, const std::string& rule_id, const char* what) {
    std::vector<std::string> out;
    if (value.is_array()) {
        for (const auto& item : value) {
            out.push_back(ScalarToString(item, rule_id, what));
        }
    } else {
        out.push_back(ScalarToString(value, rule_id, what));
    }
    return out;
}

double NumberValue(const nlohmann::json& value, const std::string& rule_id, const std::string& field) {
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        try {
            size_t consumed = 0;
            double number = std::stod(value.get<std::string>(), &consumed);
            if (consumed == value.get<std::string>().size()) {
                return number;
            }
        } catch (const std::exception&) {
            // fall through to the validation error below
        }
    }
    throw RuleValidationError(rule_id, "numeric comparison on '" + field + "' needs a numeric value");
}

bool BoolKey(const nlohmann::json& j, std::initializer_list<const char*> keys, bool fallback,
             const std::string& rule_id) {
    const auto* v = FindKey(j, keys);
    if (!v) {
        return fallback;
    }
    if (!v->is_boolean()) {
        throw RuleValidationError(rule_id, std::string(*keys.begin()) + " must be a boolean");
    }
    return v->get<bool>();
}

} // namespace

ConditionNode RuleLoader::ConditionFromJson(const nlohmann::json& j, const std::string& rule_id) {
    if (!j.is_object()) {
        throw RuleValidationError(rule_id, "condition must be an object");
    }

    if (const auto* group = FindKey(j, {"and", "all"})) {
        if (!group->is_array() || group->empty()) {
            throw RuleValidationError(rule_id, "'and' requires a non-empty list");
        }
        std::vector<ConditionNode> children;
        for (const auto& child : *group) {
            children.push_back(ConditionFromJson(child, rule_id));
        }
        return cond::All(std::move(children));
    }

    if (const auto* group = FindKey(j, {"or", "any"})) {
        if (!group->is_array() || group->empty()) {
            throw RuleValidationError(rule_id, "'or' requires a non-empty list");
        }
        std::vector<ConditionNode> children;
        for (const auto& child : *group) {
            children.push_back(ConditionFromJson(child, rule_id));
        }
        return cond::Any(std::move(children));
    }

    if (const auto* inner = FindKey(j, {"not"})) {
        return cond::Not(ConditionFromJson(*inner, rule_id));
    }

    const auto* field_json = FindKey(j, {"field"});
    if (!field_json || !field_json->is_string() || field_json->get<std::string>().empty()) {
        throw RuleValidationError(rule_id, "condition requires 'field' or one of and/or/not");
    }
    const std::string field = field_json->get<std::string>();

    const auto* op_json = FindKey(j, {"operator", "op"});
    if (!op_json || !op_json->is_string()) {
        throw RuleValidationError(rule_id, "condition on '" + field + "' has no operator");
    }
    const std::string op = ToLower(op_json->get<std::string>());

    const auto* value = FindKey(j, {"value"});
    const auto* values = FindKey(j, {"values"});
    auto require_value = [&]() -> const nlohmann::json& {
        if (!value) {
            throw RuleValidationError(rule_id, "operator '" + op + "' on '" + field + "' requires a value");
        }
        return *value;
    };

    if (op == "equals" || op == "eq" || op == "==") {
        bool ignore_case = BoolKey(j, {"ignoreCase", "ignore_case"}, false, rule_id);
        return cond::Equals(field, ScalarToString(require_value(), rule_id, "value"), ignore_case);
    }
    if (op == "not_equals" || op == "ne" || op == "!=") {
        bool ignore_case = BoolKey(j, {"ignoreCase", "ignore_case"}, false, rule_id);
        return cond::Not(cond::Equals(field, ScalarToString(require_value(), rule_id, "value"), ignore_case));
    }
    if (op == "contains") {
        bool ignore_case = BoolKey(j, {"ignoreCase", "ignore_case"}, true, rule_id);
        return cond::Contains(field, ScalarToString(require_value(), rule_id, "value"), ignore_case);
    }
    if (op == "regex" || op == "regex_match" || op == "matches") {
        bool case_sensitive = BoolKey(j, {"caseSensitive", "case_sensitive"}, false, rule_id);
        bool ignore_case = BoolKey(j, {"ignoreCase", "ignore_case"}, !case_sensitive, rule_id);
        try {
            return cond::Regex(field, ScalarToString(require_value(), rule_id, "value"), ignore_case);
        } catch (const RuleValidationError& ex) {
            throw RuleValidationError(rule_id, ex.what());
        }
    }
    if (op == "in" || op == "not_in") {
        const nlohmann::json* list = values ? values : value;
        if (!list || !list->is_array() || list->empty()) {
            throw RuleValidationError(rule_id, "operator '" + op + "' on '" + field + "' requires a non-empty list");
        }
        bool ignore_case = BoolKey(j, {"ignoreCase", "ignore_case"}, false, rule_id);
        auto node = cond::InSet(field, StringList(*list, rule_id, "values"), ignore_case);
        return op == "in" ? node : cond::Not(std::move(node));
    }
    if (op == "wildcard" || op == "glob") {
        bool ignore_case = BoolKey(j, {"ignoreCase", "ignore_case"}, true, rule_id);
        return cond::Wildcard(field, ScalarToString(require_value(), rule_id, "value"), ignore_case);
    }
    if (op == "exists") {
        return cond::Exists(field);
    }
    if (op == "gt" || op == "greater_than" || op == ">") {
        return cond::GreaterThan(field, NumberValue(require_value(), rule_id, field));
    }
    if (op == "lt" || op == "less_than" || op == "<") {
        return cond::LessThan(field, NumberValue(require_value(), rule_id, field));
    }

    throw RuleValidationError(rule_id, "unknown operator '" + op + "' on '" + field + "'");
}

nlohmann::json RuleLoader::ConditionToJson(const ConditionNode& node) {
    nlohmann::json j;
    switch (node.type) {
        case ConditionType::AND:
        case ConditionType::OR: {
            nlohmann::json children = nlohmann::json::array();
            for (const auto& child : node.children) {
                children.push_back(ConditionToJson(child));
            }
            j[ConditionTypeToString(node.type)] = children;
            return j;
        }
        case ConditionType::NOT:
            j["not"] = node.children.empty() ? nlohmann::json::object() : ConditionToJson(node.children.front());
            return j;
        default:
            break;
    }

    j["field"] = node.field;
    j["operator"] = ConditionTypeToString(node.type);
    switch (node.type) {
        case ConditionType::FIELD_IN_SET:
            j["values"] = node.values;
            j["ignoreCase"] = node.ignore_case;
            break;
        case ConditionType::FIELD_GREATER_THAN:
        case ConditionType::FIELD_LESS_THAN:
            j["value"] = node.number;
            break;
        case ConditionType::FIELD_EXISTS:
            break;
        default:
            j["value"] = node.value;
            j["ignoreCase"] = node.ignore_case;
            break;
    }
    return j;
}

SequenceParams RuleLoader::SequenceFromJson(const nlohmann::json& j, const std::string& rule_id) {
    if (!j.is_object()) {
        throw RuleValidationError(rule_id, "sequence must be an object");
    }

    SequenceParams params;
    if (const auto* fields = FindKey(j, {"fields", "groupBy", "group_by"})) {
        params.fields = StringList(*fields, rule_id, "sequence.fields");
    }
    params.ordered = BoolKey(j, {"ordered"}, true, rule_id);

    const auto* steps = FindKey(j, {"steps", "events"});
    if (!steps || !steps->is_array() || steps->empty()) {
        throw RuleValidationError(rule_id, "sequence requires a non-empty 'steps' list");
    }

    for (const auto& step_json : *steps) {
        if (!step_json.is_object()) {
            throw RuleValidationError(rule_id, "sequence step must be an object");
        }
        SequenceStep step;
        step.name = "step" + std::to_string(params.steps.size() + 1);
        if (const auto* name = FindKey(step_json, {"name", "id"})) {
            step.name = ScalarToString(*name, rule_id, "step name");
        }

        const auto* conditions = FindKey(step_json, {"conditions", "condition"});
        if (!conditions) {
            throw RuleValidationError(rule_id, "sequence step '" + step.name + "' has no conditions");
        }
        step.conditions = ConditionFromJson(*conditions, rule_id);

        if (const auto* timeout = FindKey(step_json, {"timeoutMs", "timeout_ms"})) {
            step.timeout_ms = timeout->get<uint64_t>();
        } else if (const auto* minutes = FindKey(step_json, {"timeoutMinutes", "timeout_minutes"})) {
            step.timeout_ms = minutes->get<uint64_t>() * 60 * 1000;
        }
        params.steps.push_back(std::move(step));
    }
    return params;
}

Rule RuleLoader::FromJson(const nlohmann::json& j, uint32_t default_base_confidence) {
    if (!j.is_object()) {
        throw RuleValidationError("", "rule must be an object");
    }

    Rule rule;
    try {
        if (const auto* v = FindKey(j, {"id"})) {
            rule.id = ScalarToString(*v, "", "id");
        }
        if (rule.id.empty()) {
            throw RuleValidationError("", "rule without id");
        }

        if (const auto* v = FindKey(j, {"organizationId", "organization_id"})) {
            rule.organization_id = v->get<std::string>();
        }
        if (const auto* v = FindKey(j, {"name", "title"})) {
            rule.name = v->get<std::string>();
        } else {
            rule.name = rule.id;
        }
        if (const auto* v = FindKey(j, {"description"})) {
            rule.description = v->get<std::string>();
        }
        rule.enabled = BoolKey(j, {"enabled"}, true, rule.id);

        if (const auto* v = FindKey(j, {"severity"})) {
            auto severity = SeverityFromString(v->get<std::string>());
            if (!severity) {
                throw RuleValidationError(rule.id, "unknown severity '" + v->get<std::string>() + "'");
            }
            rule.severity = *severity;
        }
        if (const auto* v = FindKey(j, {"action"})) {
            auto action = RuleActionFromString(v->get<std::string>());
            if (!action) {
                throw RuleValidationError(rule.id, "unknown action '" + v->get<std::string>() + "'");
            }
            rule.action = *action;
        }

        if (const auto* v = FindKey(j, {"tags"})) {
            rule.tags = StringList(*v, rule.id, "tags");
        }
        if (const auto* v = FindKey(j, {"sources", "eventSources", "event_sources"})) {
            rule.sources = StringList(*v, rule.id, "sources");
        }
        if (const auto* v = FindKey(j, {"dedupeFields", "dedupe_fields"})) {
            rule.dedupe_fields = StringList(*v, rule.id, "dedupeFields");
        }

        rule.base_confidence = default_base_confidence;
        if (const auto* v = FindKey(j, {"baseConfidence", "base_confidence"})) {
            if (!v->is_number()) {
                throw RuleValidationError(rule.id, "baseConfidence must be a number");
            }
            double confidence = v->get<double>();
            if (confidence < 0 || confidence > 100) {
                throw RuleValidationError(rule.id, "baseConfidence must be within 0-100");
            }
            rule.base_confidence = static_cast<uint32_t>(confidence);
        }

        if (const auto* v = FindKey(j, {"version"})) {
            rule.version = v->get<uint64_t>();
        }

        const auto* conditions = FindKey(j, {"conditions", "condition"});
        if (conditions) {
            rule.conditions = ConditionFromJson(*conditions, rule.id);
        }

        if (const auto* v = FindKey(j, {"correlation"})) {
            if (!v->is_object()) {
                throw RuleValidationError(rule.id, "correlation must be an object");
            }
            CorrelationParams params;
            if (const auto* fields = FindKey(*v, {"fields", "correlationFields", "group_by", "groupBy"})) {
                params.fields = StringList(*fields, rule.id, "correlation.fields");
            }
            if (const auto* window = FindKey(*v, {"timeWindowMs", "time_window_ms"})) {
                params.time_window_ms = window->get<uint64_t>();
            } else if (const auto* minutes = FindKey(*v, {"timeWindowMinutes", "time_window_minutes"})) {
                params.time_window_ms = minutes->get<uint64_t>() * 60 * 1000;
            }
            if (const auto* threshold = FindKey(*v, {"threshold"})) {
                params.threshold = threshold->get<uint32_t>();
            }
            rule.correlation = params;
        }

        if (const auto* v = FindKey(j, {"sequence"})) {
            rule.sequence = SequenceFromJson(*v, rule.id);
        }

        if (!conditions) {
            if (!rule.sequence) {
                throw RuleValidationError(rule.id, "rule without conditions");
            }
            // a sequence rule without a filter considers events matching any step
            std::vector<ConditionNode> any_step;
            for (const auto& step : rule.sequence->steps) {
                any_step.push_back(step.conditions);
            }
            if (any_step.empty()) {
                throw RuleValidationError(rule.id, "sequence requires at least one step");
            }
            rule.conditions = any_step.size() == 1 ? any_step.front() : cond::Any(std::move(any_step));
        }
    } catch (const nlohmann::json::exception& ex) {
        throw RuleValidationError(rule.id, std::string("type mismatch: ") + ex.what());
    }

    Validate(rule);
    return rule;
}

nlohmann::json RuleLoader::ToJson(const Rule& rule) {
    nlohmann::json j;
    j["id"] = rule.id;
    j["organizationId"] = rule.organization_id;
    j["name"] = rule.name;
    j["description"] = rule.description;
    j["enabled"] = rule.enabled;
    j["severity"] = SeverityToString(rule.severity);
    j["action"] = RuleActionToString(rule.action);
    j["tags"] = rule.tags;
    j["sources"] = rule.sources;
    j["dedupeFields"] = rule.dedupe_fields;
    j["baseConfidence"] = rule.base_confidence;
    j["version"] = rule.version;
    j["conditions"] = ConditionToJson(rule.conditions);

    if (rule.correlation) {
        nlohmann::json c;
        c["fields"] = rule.correlation->fields;
        c["timeWindowMs"] = rule.correlation->time_window_ms;
        c["threshold"] = rule.correlation->threshold;
        j["correlation"] = c;
    }

    if (rule.sequence) {
        nlohmann::json seq;
        seq["fields"] = rule.sequence->fields;
        seq["ordered"] = rule.sequence->ordered;
        seq["steps"] = nlohmann::json::array();
        for (const auto& step : rule.sequence->steps) {
            nlohmann::json step_json;
            step_json["name"] = step.name;
            step_json["conditions"] = ConditionToJson(step.conditions);
            step_json["timeoutMs"] = step.timeout_ms;
            seq["steps"].push_back(step_json);
        }
        j["sequence"] = seq;
    }
    return j;
}

void RuleLoader::Validate(const Rule& rule) {
    if (rule.id.empty()) {
        throw RuleValidationError("", "rule without id");
    }
    if (rule.base_confidence > 100) {
        throw RuleValidationError(rule.id, "baseConfidence must be within 0-100");
    }
    ValidateCondition(rule.conditions, rule.id);

    if (rule.correlation) {
        if (rule.correlation->time_window_ms == 0) {
            throw RuleValidationError(rule.id, "correlation.timeWindowMs must be positive");
        }
        if (rule.correlation->threshold == 0) {
            throw RuleValidationError(rule.id, "correlation.threshold must be at least 1");
        }
        for (const auto& field : rule.correlation->fields) {
            if (field.empty()) {
                throw RuleValidationError(rule.id, "empty correlation field name");
            }
        }
    }

    if (rule.sequence) {
        if (rule.correlation) {
            throw RuleValidationError(rule.id, "a rule takes either correlation or sequence, not both");
        }
        if (rule.sequence->steps.empty()) {
            throw RuleValidationError(rule.id, "sequence requires at least one step");
        }
        for (const auto& step : rule.sequence->steps) {
            ValidateCondition(step.conditions, rule.id);
            if (step.timeout_ms == 0) {
                throw RuleValidationError(rule.id, "sequence step '" + step.name + "' needs a positive timeout");
            }
        }
        for (const auto& field : rule.sequence->fields) {
            if (field.empty()) {
                throw RuleValidationError(rule.id, "empty sequence field name");
            }
        }
    }
}

nlohmann::json RuleLoader::YamlToJson(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Map: {
            nlohmann::json j = nlohmann::json::object();
            for (const auto& entry : node) {
                j[entry.first.as<std::string>()] = YamlToJson(entry.second);
            }
            return j;
        }
        case YAML::NodeType::Sequence: {
            nlohmann::json j = nlohmann::json::array();
            for (const auto& item : node) {
                j.push_back(YamlToJson(item));
            }
            return j;
        }
        case YAML::NodeType::Scalar: {
            const std::string& text = node.Scalar();
            // quoted scalars carry the "!" tag and stay strings
            if (node.Tag() == "!") {
                return text;
            }
            if (text == "true" || text == "True" || text == "TRUE") return true;
            if (text == "false" || text == "False" || text == "FALSE") return false;
            if (text == "~" || text == "null" || text == "Null" || text == "NULL") return nullptr;

            if (!text.empty() && (std::isdigit(static_cast<unsigned char>(text[0])) || text[0] == '-')) {
                try {
                    size_t consumed = 0;
                    long long integer = std::stoll(text, &consumed);
                    if (consumed == text.size()) {
                        return integer;
                    }
                    double real = std::stod(text, &consumed);
                    if (consumed == text.size()) {
                        return real;
                    }
                } catch (const std::exception&) {
                    // not numeric, keep as string
                }
            }
            return text;
        }
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
        default:
            return nullptr;
    }
}

void RuleLoader::LoadNode(const YAML::Node& node, uint32_t default_base_confidence, RuleLoadResult& result) {
    std::string label;
    if (node.IsMap()) {
        label = node["id"] ? node["id"].as<std::string>("") : "";
        if (label.empty() && node["title"]) {
            label = node["title"].as<std::string>("");
        }
    }

    try {
        if (SigmaConverter::IsSigmaDocument(node)) {
            result.rules.push_back(SigmaConverter::Convert(node, default_base_confidence));
        } else {
            result.rules.push_back(FromJson(YamlToJson(node), default_base_confidence));
        }
        LOG_DEBUG("Loaded rule: {}", result.rules.back().id);
    } catch (const RuleValidationError& ex) {
        LOG_WARN("Skipping rule '{}': {}", label, ex.what());
        result.errors.push_back(ex.what());
    } catch (const YAML::Exception& ex) {
        LOG_WARN("Skipping rule '{}': {}", label, ex.what());
        result.errors.push_back(ex.what());
    }
}

RuleLoadResult RuleLoader::LoadDocuments(const std::vector<YAML::Node>& documents,
                                         uint32_t default_base_confidence) {
    RuleLoadResult result;

    for (const auto& doc : documents) {
        if (!doc || doc.IsNull()) {
            continue;
        }

        if (doc.IsMap() && doc["rules"]) {
            if (!doc["rules"].IsSequence()) {
                throw ConfigError("'rules' section must be a list");
            }
            for (const auto& rule_node : doc["rules"]) {
                LoadNode(rule_node, default_base_confidence, result);
            }
        } else if (doc.IsSequence()) {
            for (const auto& rule_node : doc) {
                LoadNode(rule_node, default_base_confidence, result);
            }
        } else if (doc.IsMap()) {
            LoadNode(doc, default_base_confidence, result);
        } else {
            throw ConfigError("rule document must be a mapping or a list");
        }
    }

    return result;
}

RuleLoadResult RuleLoader::LoadFile(const std::string& path, uint32_t default_base_confidence) {
    std::vector<YAML::Node> documents;
    try {
        documents = YAML::LoadAllFromFile(path);
    } catch (const YAML::Exception& ex) {
        throw ConfigError("failed to read rules from " + path + ": " + ex.what());
    }

    RuleLoadResult result = LoadDocuments(documents, default_base_confidence);
    LOG_INFO("Successfully loaded {} rules from {} ({} rejected)",
             result.rules.size(), path, result.errors.size());
    return result;
}

RuleLoadResult RuleLoader::LoadString(const std::string& text, uint32_t default_base_confidence) {
    std::vector<YAML::Node> documents;
    try {
        documents = YAML::LoadAll(text);
    } catch (const YAML::Exception& ex) {
        throw ConfigError(std::string("failed to parse rules: ") + ex.what());
    }
    return LoadDocuments(documents, default_base_confidence);
}

} // namespace securewatch

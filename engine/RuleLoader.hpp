#pragma once

#include "engine/Rule.hpp"
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>
#include <string>
#include <vector>

namespace securewatch {

struct RuleLoadResult {
    std::vector<Rule> rules;
    std::vector<std::string> errors;        // one entry per rejected rule document
};

// Translates rule documents into Rule values. Native rules are JSON objects
// (or the equivalent YAML); SIGMA documents are recognised by their
// `detection` section and handed to SigmaConverter.
class RuleLoader {
public:
    // Throws RuleValidationError on malformed input.
    static Rule FromJson(const nlohmann::json& j, uint32_t default_base_confidence = 50);
    static nlohmann::json ToJson(const Rule& rule);

    static ConditionNode ConditionFromJson(const nlohmann::json& j, const std::string& rule_id = "");
    static nlohmann::json ConditionToJson(const ConditionNode& node);
    static SequenceParams SequenceFromJson(const nlohmann::json& j, const std::string& rule_id = "");

    static void Validate(const Rule& rule);

    // Rule file: a `rules:` list, a bare list, or one or more SIGMA documents.
    // Malformed rules are skipped and reported; an unreadable file throws
    // ConfigError.
    static RuleLoadResult LoadFile(const std::string& path, uint32_t default_base_confidence = 50);
    static RuleLoadResult LoadString(const std::string& text, uint32_t default_base_confidence = 50);

    static nlohmann::json YamlToJson(const YAML::Node& node);

private:
    static RuleLoadResult LoadDocuments(const std::vector<YAML::Node>& documents,
                                        uint32_t default_base_confidence);
    static void LoadNode(const YAML::Node& node, uint32_t default_base_confidence,
                         RuleLoadResult& result);
};

} // namespace securewatch

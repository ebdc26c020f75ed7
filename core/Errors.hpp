#pragma once

#include <stdexcept>
#include <string>

namespace securewatch {

class EngineError : public std::runtime_error {
public:
    explicit EngineError(const std::string& message) : std::runtime_error(message) {}
};

// Invalid or unreadable configuration. Fatal at startup.
class ConfigError : public EngineError {
public:
    explicit ConfigError(const std::string& message) : EngineError(message) {}
};

// A rule document or rule patch that cannot be translated into a Rule.
class RuleValidationError : public EngineError {
public:
    RuleValidationError(const std::string& rule_id, const std::string& message)
        : EngineError(rule_id.empty() ? message : "rule '" + rule_id + "': " + message),
          rule_id_(rule_id) {}

    const std::string& GetRuleId() const { return rule_id_; }

private:
    std::string rule_id_;
};

// Raised while evaluating a rule against an event. The rule is degraded,
// other rules keep running.
class RuleEvaluationError : public EngineError {
public:
    explicit RuleEvaluationError(const std::string& message) : EngineError(message) {}
};

// A downstream alert sink refused or failed to take an alert.
class EmitError : public EngineError {
public:
    explicit EmitError(const std::string& message) : EngineError(message) {}
};

} // namespace securewatch

#pragma once

#include "engine/Rule.hpp"
#include <yaml-cpp/yaml.h>
#include <string>

namespace securewatch {

// Converts SIGMA detection documents into native rules.
//
// Supported: selection maps (AND of fields), lists of maps (OR), value
// lists (OR, or AND with |all), the contains/startswith/endswith/re
// modifiers, null values (field must be absent), and conditions built from
// and/or/not, parentheses, "1 of x*", "all of x*", "1 of them" and
// "all of them". A trailing "| count() by <field> >= N" together with a
// `timeframe` produces a correlation rule.
class SigmaConverter {
public:
    static bool IsSigmaDocument(const YAML::Node& doc);

    // Throws RuleValidationError for unsupported or malformed documents.
    static Rule Convert(const YAML::Node& doc, uint32_t default_base_confidence = 50);

    // "30s", "5m", "1h", "2d" -> milliseconds. Returns 0 when malformed.
    static uint64_t ParseTimeframe(const std::string& text);
};

} // namespace securewatch

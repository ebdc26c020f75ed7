#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace securewatch {

// A normalized security event as produced by the parsing pipeline.
// Attribute values are kept as strings; numeric comparisons parse on demand.
struct SecurityEvent {
    std::string id;
    uint64_t timestamp{0};              // ms since epoch
    std::string organization_id;
    std::string source_identifier;
    std::string category;
    std::unordered_map<std::string, std::string> fields;

    // Attribute lookup. Attributes shadow the envelope, so an event carrying a
    // "source" attribute resolves it before falling back to source_identifier.
    // Empty envelope values count as absent.
    std::optional<std::string> GetField(const std::string& name) const;

    nlohmann::json ToJson() const;

    // Accepts camelCase or snake_case envelope keys, numeric or ISO-8601
    // timestamps, and flattens nested objects into dotted attribute names.
    // Throws std::invalid_argument when the record is not an object or the
    // timestamp is unusable.
    static SecurityEvent FromJson(const nlohmann::json& j);
};

using EventPtr = std::shared_ptr<const SecurityEvent>;

} // namespace securewatch

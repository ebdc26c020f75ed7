#include "core/SecurityEvent.hpp"
#include "core/Identifiers.hpp"
#include <stdexcept>

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

std::string ScalarToString(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "true" : "false";
    }
    return value.dump();
}

void Flatten(const std::string& prefix, const nlohmann::json& value,
             std::unordered_map<std::string, std::string>& out) {
    if (value.is_object()) {
        for (auto it = value.begin(); it != value.end(); ++it) {
            std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();
            Flatten(key, it.value(), out);
        }
    } else if (!value.is_null()) {
        out[prefix] = ScalarToString(value);
    }
}

} // namespace

std::optional<std::string> SecurityEvent::GetField(const std::string& name) const {
    auto it = fields.find(name);
    if (it != fields.end()) {
        return it->second;
    }

    // an envelope value the event never carried is absent, not empty
    auto envelope = [](const std::string& value) -> std::optional<std::string> {
        if (value.empty()) {
            return std::nullopt;
        }
        return value;
    };

    if (name == "id") return envelope(id);
    if (name == "timestamp") return std::to_string(timestamp);
    if (name == "organizationId" || name == "organization_id") return envelope(organization_id);
    if (name == "sourceIdentifier" || name == "source_identifier" || name == "source") {
        return envelope(source_identifier);
    }
    if (name == "category") return envelope(category);
    return std::nullopt;
}

nlohmann::json SecurityEvent::ToJson() const {
    nlohmann::json j;
    j["id"] = id;
    j["timestamp"] = timestamp;
    j["organizationId"] = organization_id;
    j["sourceIdentifier"] = source_identifier;
    j["category"] = category;

    nlohmann::json attrs = nlohmann::json::object();
    for (const auto& [key, value] : fields) {
        attrs[key] = value;
    }
    j["fields"] = attrs;
    return j;
}

SecurityEvent SecurityEvent::FromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("event record is not a JSON object");
    }

    SecurityEvent event;

    if (const auto* v = FindKey(j, {"id", "eventId", "event_id"})) {
        event.id = ScalarToString(*v);
    }

    if (const auto* v = FindKey(j, {"timestamp", "@timestamp"})) {
        if (v->is_number_unsigned() || v->is_number_integer()) {
            int64_t ts = v->get<int64_t>();
            if (ts < 0) {
                throw std::invalid_argument("negative event timestamp");
            }
            event.timestamp = static_cast<uint64_t>(ts);
        } else if (v->is_string()) {
            auto parsed = ParseISO8601(v->get<std::string>());
            if (!parsed) {
                throw std::invalid_argument("unparseable event timestamp: " + v->get<std::string>());
            }
            event.timestamp = *parsed;
        } else {
            throw std::invalid_argument("event timestamp must be a number or ISO-8601 string");
        }
    }

    if (const auto* v = FindKey(j, {"organizationId", "organization_id"})) {
        event.organization_id = ScalarToString(*v);
    }
    if (const auto* v = FindKey(j, {"sourceIdentifier", "source_identifier"})) {
        event.source_identifier = ScalarToString(*v);
    }
    if (const auto* v = FindKey(j, {"category", "eventCategory"})) {
        event.category = ScalarToString(*v);
    }

    // Explicit attribute bag, plus any non-envelope top-level keys
    if (const auto* v = FindKey(j, {"fields", "attributes"})) {
        Flatten("", *v, event.fields);
    }
    static const char* kEnvelope[] = {
        "id", "eventId", "event_id", "timestamp", "@timestamp",
        "organizationId", "organization_id", "sourceIdentifier", "source_identifier",
        "category", "eventCategory", "fields", "attributes"
    };
    for (auto it = j.begin(); it != j.end(); ++it) {
        bool envelope = false;
        for (const char* key : kEnvelope) {
            if (it.key() == key) {
                envelope = true;
                break;
            }
        }
        if (!envelope) {
            Flatten(it.key(), it.value(), event.fields);
        }
    }

    return event;
}

} // namespace securewatch

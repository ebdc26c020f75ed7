#pragma once

#include "core/EventBus.hpp"
#include "engine/Alert.hpp"
#include "engine/AlertEmitter.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace securewatch {

enum class IncidentState {
    OPEN,
    ACKNOWLEDGED,
    RESOLVED
};

inline std::string IncidentStateToString(IncidentState state) {
    switch (state) {
        case IncidentState::OPEN:         return "OPEN";
        case IncidentState::ACKNOWLEDGED: return "ACKNOWLEDGED";
        case IncidentState::RESOLVED:     return "RESOLVED";
        default:                          return "UNKNOWN";
    }
}

struct StateTransition {
    IncidentState from_state;
    IncidentState to_state;
    uint64_t timestamp;
    std::string reason;
};

struct Incident {
    std::string uuid;
    std::string rule_id;
    std::string dedupe_key;
    std::string organization_id;
    Severity severity;
    uint32_t max_confidence;
    IncidentState state;
    std::vector<Alert> alerts;
    std::vector<StateTransition> state_history;
    uint64_t created_at;
    uint64_t updated_at;

    Incident()
        : severity(Severity::LOW), max_confidence(0), state(IncidentState::OPEN),
          created_at(0), updated_at(0) {}
};

// Incident collaborator: groups alerts by dedupe key while the incident is
// not resolved, and owns alert status changes. Status changes are published
// as ALERT_STATUS_CHANGED so the engine can release dedupe keys.
class IncidentManager : public AlertSink {
public:
    IncidentManager();
    ~IncidentManager() override;

    // An empty directory disables incident files. Resolved incidents stay
    // queryable for `resolved_retention_ms` after their last update.
    void Initialize(const std::string& incidents_dir = "", uint64_t resolved_retention_ms = 86400000);

    // AlertSink
    void OnAlert(const Alert& alert) override;
    std::string GetName() const override { return "IncidentManager"; }

    // Query API
    std::vector<Incident> ListIncidents() const;
    std::optional<Incident> GetIncident(const std::string& uuid) const;
    std::optional<Alert> GetAlert(const std::string& alert_id) const;
    std::optional<Incident> FindIncidentByAlert(const std::string& alert_id) const;
    size_t GetOpenIncidentCount() const;
    size_t GetTotalIncidentCount() const;

    // Mutation API
    bool AcknowledgeIncident(const std::string& uuid);
    bool ResolveIncident(const std::string& uuid, const std::string& reason = "Resolved by analyst");
    bool AcknowledgeAlert(const std::string& alert_id);
    bool ResolveAlert(const std::string& alert_id);

    // Forgets resolved incidents past retention, with their alerts.
    // Incident files on disk are kept.
    size_t PruneResolved(uint64_t now_ms);

private:
    // State machine
    bool TransitionState(Incident& incident, IncidentState new_state, const std::string& reason);
    bool IsValidTransition(IncidentState from, IncidentState to) const;
    static bool IsValidAlertTransition(AlertStatus from, AlertStatus to);
    bool SetAlertStatus(Incident& incident, Alert& alert, AlertStatus status,
                        std::vector<Notification>& notifications);

    Incident& FindOrCreateIncident(const Alert& alert);
    Incident* FindByAlertLocked(const std::string& alert_id, Alert** alert_out);

    // Persistence
    void SerializeIncident(const Incident& incident);
    std::string GetIncidentFilePath(const Incident& incident) const;

    static uint64_t GetCurrentTimestamp();
    static void PublishAll(std::vector<Notification>& notifications);

    std::unordered_map<std::string, Incident> incidents_;
    std::unordered_map<std::string, std::string> open_by_dedupe_key_;
    std::unordered_map<std::string, std::string> alert_to_incident_;
    std::string incidents_dir_;
    uint64_t resolved_retention_ms_{86400000};

    mutable std::mutex mutex_;
};

} // namespace securewatch

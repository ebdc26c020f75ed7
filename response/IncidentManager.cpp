#include "response/IncidentManager.hpp"
#include "core/Identifiers.hpp"
#include "core/Logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>

namespace securewatch {

IncidentManager::IncidentManager() = default;

IncidentManager::~IncidentManager() = default;

void IncidentManager::Initialize(const std::string& incidents_dir, uint64_t resolved_retention_ms) {
    incidents_dir_ = incidents_dir;
    resolved_retention_ms_ = resolved_retention_ms;
    if (incidents_dir_.empty()) {
        LOG_INFO("IncidentManager initialized (in-memory only)");
        return;
    }

    try {
        std::filesystem::create_directories(incidents_dir_);
        LOG_INFO("IncidentManager initialized (incidents_dir={})", incidents_dir_);
    } catch (const std::exception& ex) {
        LOG_ERROR("Failed to create incidents directory: {}", ex.what());
        incidents_dir_.clear();
    }
}

// --- AlertSink ---

void IncidentManager::OnAlert(const Alert& alert) {
    std::lock_guard<std::mutex> lock(mutex_);

    Incident& incident = FindOrCreateIncident(alert);
    incident.alerts.push_back(alert);
    incident.updated_at = GetCurrentTimestamp();
    incident.max_confidence = std::max(incident.max_confidence, alert.confidence);
    if (static_cast<int>(alert.severity) > static_cast<int>(incident.severity)) {
        incident.severity = alert.severity;
    }
    alert_to_incident_[alert.id] = incident.uuid;

    LOG_INFO("Alert {} attached to incident {} ({} alerts)", alert.id, incident.uuid, incident.alerts.size());
    SerializeIncident(incident);
}

// --- Query API ---

std::vector<Incident> IncidentManager::ListIncidents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Incident> result;
    result.reserve(incidents_.size());
    for (const auto& [uuid, incident] : incidents_) {
        result.push_back(incident);
    }
    std::sort(result.begin(), result.end(),
              [](const Incident& a, const Incident& b) { return a.created_at < b.created_at; });
    return result;
}

std::optional<Incident> IncidentManager::GetIncident(const std::string& uuid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = incidents_.find(uuid);
    if (it != incidents_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<Alert> IncidentManager::GetAlert(const std::string& alert_id) const {
    auto incident = FindIncidentByAlert(alert_id);
    if (!incident) {
        return std::nullopt;
    }
    for (const auto& alert : incident->alerts) {
        if (alert.id == alert_id) {
            return alert;
        }
    }
    return std::nullopt;
}

std::optional<Incident> IncidentManager::FindIncidentByAlert(const std::string& alert_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = alert_to_incident_.find(alert_id);
    if (it == alert_to_incident_.end()) {
        return std::nullopt;
    }
    auto inc_it = incidents_.find(it->second);
    if (inc_it == incidents_.end()) {
        return std::nullopt;
    }
    return inc_it->second;
}

size_t IncidentManager::GetOpenIncidentCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& [uuid, incident] : incidents_) {
        if (incident.state != IncidentState::RESOLVED) {
            ++count;
        }
    }
    return count;
}

size_t IncidentManager::GetTotalIncidentCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return incidents_.size();
}

// --- Mutation API ---

bool IncidentManager::AcknowledgeIncident(const std::string& uuid) {
    std::vector<Notification> notifications;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = incidents_.find(uuid);
        if (it == incidents_.end()) {
            LOG_WARN("AcknowledgeIncident: incident {} not found", uuid);
            return false;
        }
        Incident& incident = it->second;
        if (!TransitionState(incident, IncidentState::ACKNOWLEDGED, "Acknowledged by analyst")) {
            return false;
        }
        for (auto& alert : incident.alerts) {
            if (alert.status == AlertStatus::NEW) {
                SetAlertStatus(incident, alert, AlertStatus::ACKNOWLEDGED, notifications);
            }
        }
        SerializeIncident(incident);
    }
    PublishAll(notifications);
    return true;
}

bool IncidentManager::ResolveIncident(const std::string& uuid, const std::string& reason) {
    std::vector<Notification> notifications;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = incidents_.find(uuid);
        if (it == incidents_.end()) {
            LOG_WARN("ResolveIncident: incident {} not found", uuid);
            return false;
        }
        Incident& incident = it->second;
        if (!TransitionState(incident, IncidentState::RESOLVED, reason)) {
            return false;
        }
        for (auto& alert : incident.alerts) {
            if (alert.status != AlertStatus::RESOLVED) {
                SetAlertStatus(incident, alert, AlertStatus::RESOLVED, notifications);
            }
        }
        SerializeIncident(incident);
    }
    PublishAll(notifications);
    return true;
}

bool IncidentManager::AcknowledgeAlert(const std::string& alert_id) {
    std::vector<Notification> notifications;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Alert* alert = nullptr;
        Incident* incident = FindByAlertLocked(alert_id, &alert);
        if (!incident) {
            LOG_WARN("AcknowledgeAlert: alert {} not found", alert_id);
            return false;
        }
        if (!SetAlertStatus(*incident, *alert, AlertStatus::ACKNOWLEDGED, notifications)) {
            return false;
        }
        if (incident->state == IncidentState::OPEN) {
            TransitionState(*incident, IncidentState::ACKNOWLEDGED, "Alert " + alert_id + " acknowledged");
        }
        SerializeIncident(*incident);
    }
    PublishAll(notifications);
    return true;
}

bool IncidentManager::ResolveAlert(const std::string& alert_id) {
    std::vector<Notification> notifications;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Alert* alert = nullptr;
        Incident* incident = FindByAlertLocked(alert_id, &alert);
        if (!incident) {
            LOG_WARN("ResolveAlert: alert {} not found", alert_id);
            return false;
        }
        if (!SetAlertStatus(*incident, *alert, AlertStatus::RESOLVED, notifications)) {
            return false;
        }

        bool all_resolved = std::all_of(incident->alerts.begin(), incident->alerts.end(),
                                        [](const Alert& a) { return a.status == AlertStatus::RESOLVED; });
        if (all_resolved) {
            TransitionState(*incident, IncidentState::RESOLVED, "All alerts resolved");
        }
        SerializeIncident(*incident);
    }
    PublishAll(notifications);
    return true;
}

size_t IncidentManager::PruneResolved(uint64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = incidents_.begin(); it != incidents_.end();) {
        const Incident& incident = it->second;
        if (incident.state == IncidentState::RESOLVED && now_ms >= incident.updated_at &&
            now_ms - incident.updated_at >= resolved_retention_ms_) {
            for (const auto& alert : incident.alerts) {
                alert_to_incident_.erase(alert.id);
            }
            it = incidents_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        LOG_DEBUG("Pruned {} resolved incidents ({} remain)", removed, incidents_.size());
    }
    return removed;
}

// --- State Machine ---

bool IncidentManager::TransitionState(Incident& incident, IncidentState new_state, const std::string& reason) {
    if (!IsValidTransition(incident.state, new_state)) {
        LOG_WARN("Invalid state transition for incident {}: {} -> {}",
                 incident.uuid,
                 IncidentStateToString(incident.state),
                 IncidentStateToString(new_state));
        return false;
    }

    StateTransition transition;
    transition.from_state = incident.state;
    transition.to_state = new_state;
    transition.timestamp = GetCurrentTimestamp();
    transition.reason = reason;

    incident.state_history.push_back(transition);
    incident.state = new_state;
    incident.updated_at = transition.timestamp;

    if (new_state == IncidentState::RESOLVED) {
        auto it = open_by_dedupe_key_.find(incident.dedupe_key);
        if (it != open_by_dedupe_key_.end() && it->second == incident.uuid) {
            open_by_dedupe_key_.erase(it);
        }
    }

    LOG_INFO("Incident {} state: {} -> {} (reason: {})",
             incident.uuid,
             IncidentStateToString(transition.from_state),
             IncidentStateToString(new_state),
             reason);
    return true;
}

bool IncidentManager::IsValidTransition(IncidentState from, IncidentState to) const {
    switch (from) {
        case IncidentState::OPEN:
            return to == IncidentState::ACKNOWLEDGED || to == IncidentState::RESOLVED;
        case IncidentState::ACKNOWLEDGED:
            return to == IncidentState::RESOLVED;
        case IncidentState::RESOLVED:
            return false;
        default:
            return false;
    }
}

bool IncidentManager::IsValidAlertTransition(AlertStatus from, AlertStatus to) {
    switch (from) {
        case AlertStatus::NEW:
            return to == AlertStatus::ACKNOWLEDGED || to == AlertStatus::RESOLVED;
        case AlertStatus::ACKNOWLEDGED:
            return to == AlertStatus::RESOLVED;
        default:
            return false;
    }
}

bool IncidentManager::SetAlertStatus(Incident& incident, Alert& alert, AlertStatus status,
                                     std::vector<Notification>& notifications) {
    if (!IsValidAlertTransition(alert.status, status)) {
        LOG_WARN("Invalid status transition for alert {}: {} -> {}",
                 alert.id, AlertStatusToString(alert.status), AlertStatusToString(status));
        return false;
    }

    Notification notification(NotificationType::ALERT_STATUS_CHANGED, alert.id);
    notification.metadata["incident_uuid"] = incident.uuid;
    notification.metadata["dedupe_key"] = alert.dedupe_key;
    notification.metadata["from_status"] = AlertStatusToString(alert.status);
    notification.metadata["status"] = AlertStatusToString(status);
    notifications.push_back(std::move(notification));

    alert.status = status;
    incident.updated_at = GetCurrentTimestamp();
    return true;
}

// --- Incident Lookup/Creation ---

Incident& IncidentManager::FindOrCreateIncident(const Alert& alert) {
    auto key_it = open_by_dedupe_key_.find(alert.dedupe_key);
    if (key_it != open_by_dedupe_key_.end()) {
        auto inc_it = incidents_.find(key_it->second);
        if (inc_it != incidents_.end() && inc_it->second.state != IncidentState::RESOLVED) {
            return inc_it->second;
        }
    }

    Incident incident;
    incident.uuid = GenerateUUID();
    incident.rule_id = alert.rule_id;
    incident.dedupe_key = alert.dedupe_key;
    incident.organization_id = alert.organization_id;
    incident.severity = alert.severity;
    incident.state = IncidentState::OPEN;
    incident.created_at = GetCurrentTimestamp();
    incident.updated_at = incident.created_at;

    std::string uuid = incident.uuid;
    incidents_[uuid] = std::move(incident);
    open_by_dedupe_key_[alert.dedupe_key] = uuid;

    LOG_INFO("Created new incident {} for rule {}", uuid, alert.rule_id);

    return incidents_[uuid];
}

Incident* IncidentManager::FindByAlertLocked(const std::string& alert_id, Alert** alert_out) {
    auto it = alert_to_incident_.find(alert_id);
    if (it == alert_to_incident_.end()) {
        return nullptr;
    }
    auto inc_it = incidents_.find(it->second);
    if (inc_it == incidents_.end()) {
        return nullptr;
    }
    for (auto& alert : inc_it->second.alerts) {
        if (alert.id == alert_id) {
            *alert_out = &alert;
            return &inc_it->second;
        }
    }
    return nullptr;
}

// --- Persistence ---

void IncidentManager::SerializeIncident(const Incident& incident) {
    if (incidents_dir_.empty()) {
        return;
    }

    std::string filepath = GetIncidentFilePath(incident);

    try {
        nlohmann::json j;
        j["uuid"] = incident.uuid;
        j["rule_id"] = incident.rule_id;
        j["dedupe_key"] = incident.dedupe_key;
        j["organization_id"] = incident.organization_id;
        j["severity"] = SeverityToString(incident.severity);
        j["max_confidence"] = incident.max_confidence;
        j["state"] = IncidentStateToString(incident.state);
        j["created_at"] = TimestampToISO8601(incident.created_at);
        j["updated_at"] = TimestampToISO8601(incident.updated_at);

        nlohmann::json alerts_json = nlohmann::json::array();
        for (const auto& alert : incident.alerts) {
            alerts_json.push_back(alert.ToJson());
        }
        j["alerts"] = alerts_json;

        nlohmann::json history_json = nlohmann::json::array();
        for (const auto& trans : incident.state_history) {
            nlohmann::json hj;
            hj["from"] = IncidentStateToString(trans.from_state);
            hj["to"] = IncidentStateToString(trans.to_state);
            hj["timestamp"] = TimestampToISO8601(trans.timestamp);
            hj["reason"] = trans.reason;
            history_json.push_back(hj);
        }
        j["state_history"] = history_json;

        std::ofstream ofs(filepath);
        if (ofs.is_open()) {
            ofs << j.dump(2);
            LOG_DEBUG("Serialized incident {} to {}", incident.uuid, filepath);
        } else {
            LOG_ERROR("Failed to open {} for writing", filepath);
        }
    } catch (const std::exception& ex) {
        LOG_ERROR("Failed to serialize incident {}: {}", incident.uuid, ex.what());
    }
}

std::string IncidentManager::GetIncidentFilePath(const Incident& incident) const {
    std::string date_str = TimestampToDateString(incident.created_at);
    return incidents_dir_ + "/" + date_str + "_" + incident.uuid + ".json";
}

// --- Helpers ---

uint64_t IncidentManager::GetCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch());
    return static_cast<uint64_t>(ms.count());
}

void IncidentManager::PublishAll(std::vector<Notification>& notifications) {
    for (const auto& notification : notifications) {
        EventBus::Instance().Publish(notification);
    }
}

} // namespace securewatch

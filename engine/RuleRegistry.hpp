#pragma once

#include "engine/Rule.hpp"
#include "core/SecurityEvent.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace securewatch {

// Immutable view of the rule set. Readers hold a shared_ptr for the
// duration of one event and never observe a partial update.
struct RuleSnapshot {
    uint64_t generation{0};
    std::unordered_map<std::string, RulePtr> by_id;
    std::unordered_map<std::string, std::vector<RulePtr>> by_source;
    std::vector<RulePtr> any_source;

    // Enabled rules whose source filter admits the event, without duplicates.
    std::vector<RulePtr> Candidates(const SecurityEvent& event) const;
};

using RuleSnapshotPtr = std::shared_ptr<const RuleSnapshot>;

class RuleRegistry {
public:
    RuleRegistry();

    RuleRegistry(const RuleRegistry&) = delete;
    RuleRegistry& operator=(const RuleRegistry&) = delete;

    // Throws RuleValidationError for invalid rules or duplicate ids.
    // A rule without id gets a generated one.
    RulePtr CreateRule(Rule rule);

    // Applies a JSON merge patch to the current version. Returns nullptr for
    // an unknown id; throws RuleValidationError if the result is invalid.
    // Updating a rule clears its degraded state.
    RulePtr UpdateRule(const std::string& id, const nlohmann::json& patch);

    bool DeleteRule(const std::string& id);

    // Bulk replace, used at startup. Invalid rules are skipped and logged.
    size_t ReplaceAll(const std::vector<Rule>& rules);

    RulePtr GetRule(const std::string& id) const;
    std::vector<RulePtr> ListRules(const RuleFilter& filter = {}) const;
    size_t GetRuleCount() const;

    RuleSnapshotPtr Snapshot() const;

    void MarkDegraded(const std::string& id, const std::string& reason);
    bool IsDegraded(const std::string& id) const;
    std::unordered_map<std::string, std::string> GetDegradedRules() const;

private:
    void Publish(std::unordered_map<std::string, RulePtr> rules);

    // serializes writers; readers only touch snapshot_
    mutable std::mutex write_mutex_;
    std::shared_ptr<const RuleSnapshot> snapshot_;

    mutable std::shared_mutex degraded_mutex_;
    std::unordered_map<std::string, std::string> degraded_;
};

} // namespace securewatch

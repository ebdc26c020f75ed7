#include "engine/RuleRegistry.hpp"
#include "engine/RuleLoader.hpp"
#include "core/Errors.hpp"
#include "core/Identifiers.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <unordered_set>

namespace securewatch {

std::vector<RulePtr> RuleSnapshot::Candidates(const SecurityEvent& event) const {
    std::vector<RulePtr> result;
    std::unordered_set<const Rule*> seen;

    auto collect = [&](const std::vector<RulePtr>& rules) {
        for (const auto& rule : rules) {
            if (rule->enabled && seen.insert(rule.get()).second) {
                result.push_back(rule);
            }
        }
    };

    collect(any_source);
    if (!event.source_identifier.empty()) {
        auto it = by_source.find(ToLower(event.source_identifier));
        if (it != by_source.end()) collect(it->second);
    }
    if (!event.category.empty()) {
        auto it = by_source.find(ToLower(event.category));
        if (it != by_source.end()) collect(it->second);
    }
    return result;
}

RuleRegistry::RuleRegistry()
    : snapshot_(std::make_shared<const RuleSnapshot>()) {}

void RuleRegistry::Publish(std::unordered_map<std::string, RulePtr> rules) {
    auto next = std::make_shared<RuleSnapshot>();
    auto current = std::atomic_load(&snapshot_);
    next->generation = current->generation + 1;

    for (const auto& [id, rule] : rules) {
        if (rule->sources.empty()) {
            next->any_source.push_back(rule);
        } else {
            for (const auto& source : rule->sources) {
                next->by_source[ToLower(source)].push_back(rule);
            }
        }
    }

    // deterministic evaluation order within a snapshot
    auto by_id = [](const RulePtr& a, const RulePtr& b) { return a->id < b->id; };
    std::sort(next->any_source.begin(), next->any_source.end(), by_id);
    for (auto& [source, list] : next->by_source) {
        std::sort(list.begin(), list.end(), by_id);
    }

    next->by_id = std::move(rules);
    std::atomic_store(&snapshot_, std::shared_ptr<const RuleSnapshot>(std::move(next)));
}

RulePtr RuleRegistry::CreateRule(Rule rule) {
    if (rule.id.empty()) {
        rule.id = GenerateUUID();
    }
    RuleLoader::Validate(rule);

    std::lock_guard<std::mutex> lock(write_mutex_);
    auto current = std::atomic_load(&snapshot_);
    if (current->by_id.count(rule.id)) {
        throw RuleValidationError(rule.id, "a rule with this id already exists");
    }

    rule.version = 1;
    auto created = std::make_shared<const Rule>(std::move(rule));
    auto rules = current->by_id;
    rules[created->id] = created;
    Publish(std::move(rules));

    LOG_INFO("Rule created: {} ({}, {})", created->id, created->name,
             created->IsSequence() ? "sequence" : created->IsCorrelation() ? "correlation" : "single-event");
    return created;
}

RulePtr RuleRegistry::UpdateRule(const std::string& id, const nlohmann::json& patch) {
    if (!patch.is_object()) {
        throw RuleValidationError(id, "rule patch must be an object");
    }

    RulePtr updated;
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        auto current = std::atomic_load(&snapshot_);
        auto it = current->by_id.find(id);
        if (it == current->by_id.end()) {
            LOG_WARN("UpdateRule: rule {} not found", id);
            return nullptr;
        }

        nlohmann::json document = RuleLoader::ToJson(*it->second);
        document.merge_patch(patch);
        document["id"] = id;

        Rule rule = RuleLoader::FromJson(document, it->second->base_confidence);
        rule.version = it->second->version + 1;
        updated = std::make_shared<const Rule>(std::move(rule));

        auto rules = current->by_id;
        rules[id] = updated;
        Publish(std::move(rules));
    }

    {
        std::unique_lock<std::shared_mutex> lock(degraded_mutex_);
        if (degraded_.erase(id) > 0) {
            LOG_INFO("Rule {} re-enabled after update", id);
        }
    }

    LOG_INFO("Rule updated: {} (version {})", id, updated->version);
    return updated;
}

bool RuleRegistry::DeleteRule(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        auto current = std::atomic_load(&snapshot_);
        if (!current->by_id.count(id)) {
            LOG_WARN("DeleteRule: rule {} not found", id);
            return false;
        }
        auto rules = current->by_id;
        rules.erase(id);
        Publish(std::move(rules));
    }

    {
        std::unique_lock<std::shared_mutex> lock(degraded_mutex_);
        degraded_.erase(id);
    }

    LOG_INFO("Rule deleted: {}", id);
    return true;
}

size_t RuleRegistry::ReplaceAll(const std::vector<Rule>& rules) {
    std::unordered_map<std::string, RulePtr> next;
    for (const auto& rule : rules) {
        try {
            RuleLoader::Validate(rule);
        } catch (const RuleValidationError& ex) {
            LOG_WARN("Skipping rule: {}", ex.what());
            continue;
        }
        if (next.count(rule.id)) {
            LOG_WARN("Skipping duplicate rule id {}", rule.id);
            continue;
        }
        next[rule.id] = std::make_shared<const Rule>(rule);
    }

    size_t count = next.size();
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        Publish(std::move(next));
    }
    {
        std::unique_lock<std::shared_mutex> lock(degraded_mutex_);
        degraded_.clear();
    }

    LOG_INFO("Rule set replaced: {} rules active", count);
    return count;
}

RulePtr RuleRegistry::GetRule(const std::string& id) const {
    auto current = Snapshot();
    auto it = current->by_id.find(id);
    return it != current->by_id.end() ? it->second : nullptr;
}

std::vector<RulePtr> RuleRegistry::ListRules(const RuleFilter& filter) const {
    auto current = Snapshot();
    std::vector<RulePtr> result;
    for (const auto& [id, rule] : current->by_id) {
        if (filter.Matches(*rule)) {
            result.push_back(rule);
        }
    }
    std::sort(result.begin(), result.end(),
              [](const RulePtr& a, const RulePtr& b) { return a->id < b->id; });
    return result;
}

size_t RuleRegistry::GetRuleCount() const {
    return Snapshot()->by_id.size();
}

RuleSnapshotPtr RuleRegistry::Snapshot() const {
    return std::atomic_load(&snapshot_);
}

void RuleRegistry::MarkDegraded(const std::string& id, const std::string& reason) {
    std::unique_lock<std::shared_mutex> lock(degraded_mutex_);
    if (degraded_.emplace(id, reason).second) {
        LOG_WARN("Rule {} degraded: {}", id, reason);
    }
}

bool RuleRegistry::IsDegraded(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(degraded_mutex_);
    return degraded_.count(id) > 0;
}

std::unordered_map<std::string, std::string> RuleRegistry::GetDegradedRules() const {
    std::shared_lock<std::shared_mutex> lock(degraded_mutex_);
    return degraded_;
}

} // namespace securewatch

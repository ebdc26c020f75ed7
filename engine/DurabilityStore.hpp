#pragma once

#include "engine/Alert.hpp"
#include "engine/Rule.hpp"
#include "engine/WindowManager.hpp"
#include <vector>

namespace securewatch {

// Persistence collaborator for rules, in-flight windows and alerts that
// could not be delivered. Implementations report failure through the bool
// returns and log the cause.
class DurabilityStore {
public:
    virtual ~DurabilityStore() = default;

    virtual bool SaveRules(const std::vector<RulePtr>& rules) = 0;
    virtual std::vector<Rule> LoadRules() = 0;

    virtual bool SaveWindows(const std::vector<Window>& windows) = 0;
    virtual std::vector<Window> LoadWindows() = 0;

    virtual bool EnqueueOverflowAlert(const Alert& alert) = 0;
    // Removes and returns queued alerts, oldest first.
    virtual std::vector<Alert> DrainOverflowAlerts() = 0;
    virtual size_t GetOverflowCount() = 0;
};

} // namespace securewatch

#pragma once

#include "engine/Match.hpp"
#include "engine/Rule.hpp"
#include "engine/WindowManager.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace securewatch {

// Builds Matches exactly once per (ruleId, windowId | eventId). A repeated
// request for an already assembled key yields nullopt.
class MatchAssembler {
public:
    explicit MatchAssembler(uint64_t key_retention_ms = 3600000);

    std::optional<Match> FromWindow(const Rule& rule, const Window& window, uint64_t now_ms);
    std::optional<Match> FromEvent(const Rule& rule, const SecurityEvent& event,
                                   const MatchedFields& matched, uint64_t now_ms);

    // Forgets idempotency keys older than the retention period.
    size_t PruneKeys(uint64_t now_ms);
    size_t GetTrackedKeyCount() const;

private:
    bool Claim(const std::string& key, uint64_t now_ms);

    const uint64_t key_retention_ms_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, uint64_t> claimed_;
};

} // namespace securewatch

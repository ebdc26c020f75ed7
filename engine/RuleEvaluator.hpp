#pragma once

#include "engine/Condition.hpp"
#include "engine/Rule.hpp"
#include "engine/WindowManager.hpp"
#include <optional>

namespace securewatch {

enum class EvaluationOutcome {
    NO_MATCH,
    MATCHED,                    // single-event rule fired
    SKIPPED_MISSING_FIELD,      // correlation field absent
    SKIPPED_OUT_OF_WINDOW,      // event older than its window
    WINDOW_UPDATED,
    WINDOW_MATCHED              // threshold crossed or sequence completed
};

std::string EvaluationOutcomeToString(EvaluationOutcome outcome);

struct EvaluationResult {
    EvaluationOutcome outcome{EvaluationOutcome::NO_MATCH};
    MatchedFields matched_fields;
    std::optional<Window> window;
};

// Applies a rule's condition tree to an event; threshold and sequence rules
// then feed the window manager.
class RuleEvaluator {
public:
    explicit RuleEvaluator(WindowManager& windows);
    virtual ~RuleEvaluator() = default;

    virtual EvaluationResult Evaluate(const Rule& rule, const EventPtr& event) const;

private:
    WindowManager& windows_;
};

} // namespace securewatch

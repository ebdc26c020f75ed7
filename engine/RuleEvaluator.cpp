#include "engine/RuleEvaluator.hpp"

namespace securewatch {

std::string EvaluationOutcomeToString(EvaluationOutcome outcome) {
    switch (outcome) {
        case EvaluationOutcome::NO_MATCH:              return "NO_MATCH";
        case EvaluationOutcome::MATCHED:               return "MATCHED";
        case EvaluationOutcome::SKIPPED_MISSING_FIELD: return "SKIPPED_MISSING_FIELD";
        case EvaluationOutcome::SKIPPED_OUT_OF_WINDOW: return "SKIPPED_OUT_OF_WINDOW";
        case EvaluationOutcome::WINDOW_UPDATED:        return "WINDOW_UPDATED";
        case EvaluationOutcome::WINDOW_MATCHED:        return "WINDOW_MATCHED";
        default:                                       return "UNKNOWN";
    }
}

RuleEvaluator::RuleEvaluator(WindowManager& windows)
    : windows_(windows) {}

EvaluationResult RuleEvaluator::Evaluate(const Rule& rule, const EventPtr& event) const {
    EvaluationResult result;

    if (!EvaluateCondition(rule.conditions, *event, &result.matched_fields)) {
        result.matched_fields.clear();
        return result;
    }

    if (!rule.IsMultiEvent()) {
        result.outcome = EvaluationOutcome::MATCHED;
        return result;
    }

    AppendResult append = rule.IsSequence() ? windows_.AdvanceSequence(rule, event)
                                            : windows_.Append(rule, event);
    switch (append.status) {
        case AppendStatus::SKIPPED_MISSING_FIELD:
            result.outcome = EvaluationOutcome::SKIPPED_MISSING_FIELD;
            break;
        case AppendStatus::SKIPPED_OUT_OF_WINDOW:
            result.outcome = EvaluationOutcome::SKIPPED_OUT_OF_WINDOW;
            break;
        case AppendStatus::SKIPPED_NO_STEP:
            result.outcome = EvaluationOutcome::NO_MATCH;
            result.matched_fields.clear();
            break;
        case AppendStatus::THRESHOLD_REACHED:
            result.outcome = EvaluationOutcome::WINDOW_MATCHED;
            result.window = std::move(append.matched_window);
            break;
        case AppendStatus::APPENDED:
        case AppendStatus::APPENDED_AFTER_MATCH:
        default:
            result.outcome = EvaluationOutcome::WINDOW_UPDATED;
            break;
    }
    return result;
}

} // namespace securewatch

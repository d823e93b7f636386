#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace logcleaner {

class RuleContext;

/**
 * @brief A named predicate/action pair
 *
 * The predicate must be pure: same Record and RuleContext, same answer.
 * It may throw; the engine reports that as a RuleEvaluationError.
 */
struct Rule {
    using Predicate = std::function<bool(const Record&, const RuleContext&)>;

    std::string name;
    Predicate predicate;
    Decision action;
};

/**
 * @brief Already-parsed rule definition, as supplied by configuration
 *
 * `type` selects a factory in the RuleRegistry. Which of the parameter
 * fields matter depends on the type.
 */
struct RuleSpec {
    std::string name;
    std::string type;
    std::optional<DecisionKind> action;  // unset = the kind's default

    // Scope: rule only applies to these event types (empty = all)
    std::vector<std::string> event_types;

    // max_age
    int64_t max_age_days = 0;

    // anonymize
    std::vector<std::string> fields;
    MaskingAction masking = MaskingAction::REDACT;
    int prefix_len = 3;
    int suffix_len = 3;

    // attribute_match
    std::string attribute;
    std::vector<std::string> values;
};

} // namespace logcleaner

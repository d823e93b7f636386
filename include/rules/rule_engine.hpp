#pragma once

#include "core/error.hpp"
#include "rules/rule.hpp"
#include "rules/rule_context.hpp"

#include <vector>

namespace logcleaner {

/**
 * @brief Rule Engine - assigns exactly one Decision to each Record
 *
 * Resolution algorithm:
 * 1. Evaluate rules strictly in configured order
 * 2. First predicate returning true decides (its action, tagged with the
 *    rule name); later rules are not consulted
 * 3. No match → KEEP
 *
 * A predicate that throws aborts classification with RuleEvaluationError.
 * The engine holds no mutable state, so one instance may classify from
 * several threads at once.
 */
class RuleEngine {
public:
    /**
     * @throws std::invalid_argument if a rule has no predicate
     */
    explicit RuleEngine(std::vector<Rule> rules);

    /**
     * @brief Classify a record
     * @throws RuleEvaluationError if a predicate fails
     */
    [[nodiscard]] Decision classify(const Record& record, const RuleContext& context) const;

    [[nodiscard]] size_t rule_count() const { return rules_.size(); }
    [[nodiscard]] const std::vector<Rule>& rules() const { return rules_; }

private:
    std::vector<Rule> rules_;
};

} // namespace logcleaner

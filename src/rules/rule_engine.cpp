#include "rules/rule_engine.hpp"

#include <format>
#include <stdexcept>

namespace logcleaner {

RuleEngine::RuleEngine(std::vector<Rule> rules)
    : rules_(std::move(rules)) {
    for (const auto& rule : rules_) {
        if (!rule.predicate) {
            throw std::invalid_argument(
                std::format("Rule '{}' has no predicate", rule.name));
        }
    }
}

Decision RuleEngine::classify(const Record& record, const RuleContext& context) const {
    for (const auto& rule : rules_) {
        bool matched = false;
        try {
            matched = rule.predicate(record, context);
        } catch (const std::exception& e) {
            throw RuleEvaluationError(rule.name, record.line_number,
                std::format("Rule '{}' failed on line {}: {}", rule.name, record.line_number, e.what()));
        } catch (...) {
            throw RuleEvaluationError(rule.name, record.line_number,
                std::format("Rule '{}' failed on line {}: unknown error", rule.name, record.line_number));
        }

        if (matched) {
            Decision decision = rule.action;
            decision.matched_rule = rule.name;
            return decision;
        }
    }

    return Decision::keep();
}

} // namespace logcleaner

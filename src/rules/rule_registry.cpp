#include "rules/rule_registry.hpp"
#include "rules/rule_context.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>
#include <unordered_set>

namespace logcleaner {

// ============================================================================
// Registry
// ============================================================================

RuleRegistry& RuleRegistry::instance() {
    static RuleRegistry registry = [] {
        RuleRegistry r;
        register_builtin_rules(r);
        return r;
    }();
    return registry;
}

std::vector<std::string> RuleRegistry::kinds() const {
    std::vector<std::string> names;
    names.reserve(factories_.size());
    for (const auto& [type, factory] : factories_) {
        names.push_back(type);
    }
    std::sort(names.begin(), names.end());
    return names;
}

Result<Rule> RuleRegistry::create(const RuleSpec& spec) const {
    if (spec.name.empty()) {
        return Result<Rule>::error(ErrorCategory::CONFIG_ERROR, "Rule must have a name");
    }

    const auto it = factories_.find(spec.type);
    if (it == factories_.end()) {
        return Result<Rule>::error(ErrorCategory::CONFIG_ERROR,
            std::format("Rule '{}': unknown type '{}'", spec.name, spec.type));
    }

    Rule rule;
    try {
        rule = it->second(spec);
    } catch (const std::invalid_argument& e) {
        return Result<Rule>::error(ErrorCategory::CONFIG_ERROR,
            std::format("Rule '{}': {}", spec.name, e.what()));
    }

    if (!rule.predicate) {
        return Result<Rule>::error(ErrorCategory::CONFIG_ERROR,
            std::format("Rule '{}': factory for '{}' produced no predicate", spec.name, spec.type));
    }

    rule.name = spec.name;

    if (!spec.event_types.empty()) {
        std::unordered_set<std::string> scope(spec.event_types.begin(), spec.event_types.end());
        rule.predicate = [scope = std::move(scope), inner = std::move(rule.predicate)](
                             const Record& record, const RuleContext& ctx) {
            return scope.contains(record.event_type) && inner(record, ctx);
        };
    }

    return Result<Rule>::ok(std::move(rule));
}

Result<std::vector<Rule>> RuleRegistry::create_all(const std::vector<RuleSpec>& specs) const {
    std::vector<Rule> rules;
    rules.reserve(specs.size());
    std::unordered_set<std::string> names;

    for (const auto& spec : specs) {
        if (!names.insert(spec.name).second) {
            return Result<std::vector<Rule>>::error(ErrorCategory::CONFIG_ERROR,
                std::format("Duplicate rule name '{}'", spec.name));
        }
        auto result = create(spec);
        if (result.is_error()) {
            return Result<std::vector<Rule>>::error(result.error_category(), result.error_message());
        }
        rules.push_back(std::move(result.value()));
    }
    return Result<std::vector<Rule>>::ok(std::move(rules));
}

// ============================================================================
// Built-in rule kinds
// ============================================================================

namespace {

Decision make_action(const RuleSpec& spec, DecisionKind default_kind) {
    const DecisionKind kind = spec.action.value_or(default_kind);
    switch (kind) {
        case DecisionKind::KEEP:
            return Decision::keep();
        case DecisionKind::REMOVE:
            return Decision::remove();
        case DecisionKind::ANONYMIZE:
            if (spec.fields.empty()) {
                throw std::invalid_argument("anonymize action requires 'fields'");
            }
            // account_id keys the duplicate and closed-account lookups; a
            // many-to-one mask would merge accounts on the next run
            if (spec.masking != MaskingAction::HASH &&
                std::find(spec.fields.begin(), spec.fields.end(), "account_id") != spec.fields.end()) {
                throw std::invalid_argument("masking 'account_id' requires HASH masking");
            }
            return Decision::anonymize(spec.fields, spec.masking, spec.prefix_len, spec.suffix_len);
    }
    return Decision::keep();
}

Rule make_max_age_rule(const RuleSpec& spec) {
    if (spec.max_age_days <= 0) {
        throw std::invalid_argument("max_age_days must be > 0");
    }
    const auto max_age = std::chrono::days(spec.max_age_days);

    Rule rule;
    rule.predicate = [max_age](const Record& record, const RuleContext& ctx) {
        return ctx.time_reference() - record.timestamp > max_age;
    };
    rule.action = make_action(spec, DecisionKind::REMOVE);
    return rule;
}

Rule make_closed_account_rule(const RuleSpec& spec) {
    Rule rule;
    rule.predicate = [](const Record& record, const RuleContext& ctx) {
        return ctx.is_account_closed(record.account_id);
    };
    rule.action = make_action(spec, DecisionKind::REMOVE);
    return rule;
}

Rule make_duplicate_rule(const RuleSpec& spec) {
    Rule rule;
    rule.predicate = [](const Record& record, const RuleContext& ctx) {
        return !ctx.is_latest_in_group(record);
    };
    rule.action = make_action(spec, DecisionKind::REMOVE);
    return rule;
}

Rule make_anonymize_rule(const RuleSpec& spec) {
    if (spec.fields.empty()) {
        throw std::invalid_argument("anonymize requires non-empty 'fields'");
    }
    if (spec.action && *spec.action != DecisionKind::ANONYMIZE) {
        throw std::invalid_argument("anonymize rules only support the anonymize action");
    }

    Rule rule;
    rule.predicate = [fields = spec.fields](const Record& record, const RuleContext&) {
        return std::any_of(fields.begin(), fields.end(),
            [&record](const std::string& f) { return record.has_field(f); });
    };
    rule.action = make_action(spec, DecisionKind::ANONYMIZE);
    return rule;
}

Rule make_event_type_rule(const RuleSpec& spec) {
    if (spec.event_types.empty()) {
        throw std::invalid_argument("event_type requires non-empty 'event_types'");
    }

    // Matching itself is the event_types scope the registry applies
    Rule rule;
    rule.predicate = [](const Record&, const RuleContext&) { return true; };
    rule.action = make_action(spec, DecisionKind::REMOVE);
    return rule;
}

Rule make_attribute_match_rule(const RuleSpec& spec) {
    if (spec.attribute.empty()) {
        throw std::invalid_argument("attribute_match requires 'attribute'");
    }
    if (spec.values.empty()) {
        throw std::invalid_argument("attribute_match requires non-empty 'values'");
    }

    Rule rule;
    rule.predicate = [attribute = spec.attribute,
                      values = std::unordered_set<std::string>(spec.values.begin(), spec.values.end())](
                         const Record& record, const RuleContext&) {
        const auto it = record.attributes.find(attribute);
        return it != record.attributes.end() && values.contains(it->second);
    };
    rule.action = make_action(spec, DecisionKind::REMOVE);
    return rule;
}

} // anonymous namespace

void register_builtin_rules(RuleRegistry& registry) {
    registry.register_kind("max_age", make_max_age_rule);
    registry.register_kind("closed_account", make_closed_account_rule);
    registry.register_kind("duplicate", make_duplicate_rule);
    registry.register_kind("anonymize", make_anonymize_rule);
    registry.register_kind("event_type", make_event_type_rule);
    registry.register_kind("attribute_match", make_attribute_match_rule);
}

} // namespace logcleaner

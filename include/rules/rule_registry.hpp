#pragma once

#include "core/error.hpp"
#include "rules/rule.hpp"

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace logcleaner {

/**
 * @brief Registry of rule kinds
 *
 * Each kind is a factory turning a RuleSpec into a Rule. New retention
 * policies are added by registering a kind; the engine never changes.
 *
 * Usage:
 *   // Registration (at startup):
 *   RuleRegistry::instance().register_kind(
 *       "vip_hold", [](const RuleSpec& spec) { return Rule{...}; });
 *
 *   // Creation:
 *   auto rules = RuleRegistry::instance().create_all(config.rules);
 *
 * Factories report invalid parameters by throwing std::invalid_argument.
 * The registry applies the configured name and event_types scope to whatever
 * the factory returns. Registration is not synchronized; register before
 * starting worker threads.
 */
class RuleRegistry {
public:
    using Factory = std::function<Rule(const RuleSpec&)>;

    /// Process-wide registry, pre-populated with the built-in kinds
    static RuleRegistry& instance();

    /// Empty registry (no built-ins)
    RuleRegistry() = default;

    void register_kind(const std::string& type, Factory factory) {
        factories_[type] = std::move(factory);
    }

    [[nodiscard]] bool has_kind(const std::string& type) const {
        return factories_.contains(type);
    }

    [[nodiscard]] std::vector<std::string> kinds() const;

    [[nodiscard]] Result<Rule> create(const RuleSpec& spec) const;

    /// All-or-nothing: the first invalid rule fails the whole set
    [[nodiscard]] Result<std::vector<Rule>> create_all(const std::vector<RuleSpec>& specs) const;

private:
    std::unordered_map<std::string, Factory> factories_;
};

/**
 * @brief Register max_age, closed_account, duplicate, anonymize,
 *        event_type and attribute_match
 */
void register_builtin_rules(RuleRegistry& registry);

} // namespace logcleaner

#include "rules/rule_context.hpp"

namespace logcleaner {

// Unit separator cannot appear in a trimmed field of a text log line
static constexpr char kKeySeparator = '\x1f';

std::string RuleContext::group_key(const Record& record) {
    std::string key;
    key.reserve(record.account_id.size() + record.event_type.size() + 1);
    key += record.account_id;
    key += kKeySeparator;
    key += record.event_type;
    return key;
}

RuleContext RuleContext::build(const std::vector<Record>& records, Options options) {
    RuleContext ctx;
    ctx.time_reference_ = options.time_reference;
    ctx.closed_accounts_ = std::move(options.closed_accounts);
    ctx.record_count_ = records.size();

    for (const auto& record : records) {
        if (options.closing_event_types.contains(record.event_type)) {
            ctx.closed_accounts_.insert(record.account_id);
        }

        auto& group = ctx.groups_[group_key(record)];
        // Most recent wins; equal timestamps resolve to the later line
        if (group.count == 0 ||
            record.timestamp > group.latest_timestamp ||
            (record.timestamp == group.latest_timestamp && record.line_number > group.latest_line)) {
            group.latest_timestamp = record.timestamp;
            group.latest_line = record.line_number;
        }
        ++group.count;
    }

    return ctx;
}

bool RuleContext::is_latest_in_group(const Record& record) const {
    const auto it = groups_.find(group_key(record));
    if (it == groups_.end()) return true;
    return it->second.latest_line == record.line_number;
}

size_t RuleContext::group_size(const Record& record) const {
    const auto it = groups_.find(group_key(record));
    return it == groups_.end() ? 0 : it->second.count;
}

} // namespace logcleaner

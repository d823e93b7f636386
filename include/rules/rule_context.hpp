#pragma once

#include "core/types.hpp"

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace logcleaner {

/**
 * @brief Cross-record state for one cleaning run
 *
 * Built once from the full set of parsed records before any record is
 * classified, then read-only. Holds the run's time reference, the set of
 * closed accounts and the most recent record of every
 * (account_id, event_type) group.
 */
class RuleContext {
public:
    struct Options {
        Instant time_reference{};
        std::unordered_set<std::string> closed_accounts;
        std::unordered_set<std::string> closing_event_types{"account_closed", "account_deleted"};
    };

    RuleContext() = default;

    [[nodiscard]] static RuleContext build(const std::vector<Record>& records, Options options);

    [[nodiscard]] Instant time_reference() const { return time_reference_; }

    [[nodiscard]] bool is_account_closed(const std::string& account_id) const {
        return closed_accounts_.contains(account_id);
    }

    /// True when no other record of the same (account_id, event_type) is more recent
    [[nodiscard]] bool is_latest_in_group(const Record& record) const;

    /// Number of records sharing this record's (account_id, event_type)
    [[nodiscard]] size_t group_size(const Record& record) const;

    [[nodiscard]] size_t record_count() const { return record_count_; }
    [[nodiscard]] size_t closed_account_count() const { return closed_accounts_.size(); }

private:
    struct GroupInfo {
        Instant latest_timestamp{};
        size_t latest_line = 0;
        size_t count = 0;
    };

    static std::string group_key(const Record& record);

    Instant time_reference_{};
    std::unordered_set<std::string> closed_accounts_;
    std::unordered_map<std::string, GroupInfo> groups_;
    size_t record_count_ = 0;
};

} // namespace logcleaner

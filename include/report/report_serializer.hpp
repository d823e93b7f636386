#pragma once

#include "cleaner/cleaning_orchestrator.hpp"
#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace logcleaner {

/**
 * @brief JSON rendering of cleaning reports and run results
 *
 * Layout of one run:
 *   {"input": "...", "status": "success", "dry_run": false,
 *    "report": {"total_lines": 3, "kept": 1, ..., "rule_hits": {...},
 *               "malformed_lines": [{"line": 3, "reason": "...", "raw": "..."}]},
 *    "backup": {"path": "...", "bytes": 120, "retained": true}}
 *
 * "error" and "reason" appear only for failed runs, "backup" only when one
 * exists.
 */
class ReportSerializer {
public:
    [[nodiscard]] static nlohmann::json to_json(const CleaningReport& report);
    [[nodiscard]] static nlohmann::json to_json(const RunResult& result);

    /// Invocation summary: per-file results plus totals across all files
    [[nodiscard]] static nlohmann::json to_json(const std::vector<RunResult>& results);

    [[nodiscard]] static std::string serialize(const std::vector<RunResult>& results, int indent = 2);
};

} // namespace logcleaner

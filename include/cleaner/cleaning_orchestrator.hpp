#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "parser/record_parser.hpp"
#include "rules/rule_engine.hpp"
#include "writer/atomic_writer.hpp"

#include <functional>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace logcleaner {

enum class RunStatus {
    SUCCESS,
    ABORTED,    // run-level failure, partial report attached
    FATAL_IO    // input could not be read
};

[[nodiscard]] inline const char* run_status_to_string(RunStatus status) {
    switch (status) {
        case RunStatus::SUCCESS:  return "success";
        case RunStatus::ABORTED:  return "aborted";
        case RunStatus::FATAL_IO: return "fatal_io";
    }
    return "unknown";
}

/**
 * @brief Outcome of one cleaning run over one file
 */
struct RunResult {
    RunStatus status = RunStatus::SUCCESS;
    std::string input_path;
    CleaningReport report;
    ErrorCategory error_category = ErrorCategory::NONE;
    std::string reason;
    bool dry_run = false;
    std::optional<BackupHandle> backup;

    [[nodiscard]] bool ok() const { return status == RunStatus::SUCCESS; }

    static RunResult success(std::string path, CleaningReport report, bool dry_run,
                             std::optional<BackupHandle> backup = std::nullopt) {
        RunResult r;
        r.status = RunStatus::SUCCESS;
        r.input_path = std::move(path);
        r.report = std::move(report);
        r.dry_run = dry_run;
        r.backup = std::move(backup);
        return r;
    }

    static RunResult aborted(std::string path, ErrorCategory category, std::string reason,
                             CleaningReport report,
                             std::optional<BackupHandle> backup = std::nullopt) {
        RunResult r;
        r.status = RunStatus::ABORTED;
        r.input_path = std::move(path);
        r.error_category = category;
        r.reason = std::move(reason);
        r.report = std::move(report);
        r.backup = std::move(backup);
        return r;
    }

    static RunResult fatal_io(std::string path, std::string reason, CleaningReport report = {}) {
        RunResult r;
        r.status = RunStatus::FATAL_IO;
        r.input_path = std::move(path);
        r.error_category = ErrorCategory::IO_ERROR;
        r.reason = std::move(reason);
        r.report = std::move(report);
        return r;
    }
};

/**
 * @brief Cleaning Orchestrator - drives one run per input file
 *
 * Run algorithm:
 * 1. Read every line (LineReader) and parse it; malformed lines go straight
 *    to the report and are never classified
 * 2. Build the RuleContext from all parsed records
 * 3. Classify every record (RuleEngine)
 * 4. Assemble output in original line order: KEEP verbatim, ANONYMIZE
 *    masked, REMOVE omitted, malformed omitted unless preserve_malformed
 * 5. Commit through AtomicWriter, unless dry_run
 *
 * A dry run computes the same report as a real run and touches no file.
 * Runs share no mutable state, so run_many() executes files in parallel.
 */
class CleaningOrchestrator {
public:
    struct Config {
        RecordParser::Config parser;
        std::unordered_set<std::string> closed_accounts;
        std::unordered_set<std::string> closing_event_types{"account_closed", "account_deleted"};
        std::string backup_suffix = ".bak";
        // Forwarded to AtomicWriter (tests only)
        std::function<bool(AtomicWriter::Stage)> fault_injector;
    };

    CleaningOrchestrator() = default;
    explicit CleaningOrchestrator(Config config);

    [[nodiscard]] RunResult run(const std::string& input_path,
                                const RuleEngine& engine,
                                const RunOptions& options) const;

    /// Convenience overload; an invalid rule set aborts the run with CONFIG_ERROR
    [[nodiscard]] RunResult run(const std::string& input_path,
                                const std::vector<Rule>& rules,
                                const RunOptions& options) const;

    /**
     * @brief Clean several independent files on up to `workers` threads
     * @return One result per path, in the order given
     */
    [[nodiscard]] std::vector<RunResult> run_many(const std::vector<std::string>& input_paths,
                                                  const RuleEngine& engine,
                                                  const RunOptions& options,
                                                  size_t workers = 1) const;

private:
    static void tally(CleaningReport& report, const Decision& decision);

    Config config_;
    RecordParser parser_;
};

} // namespace logcleaner

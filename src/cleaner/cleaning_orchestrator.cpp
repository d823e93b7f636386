#include "cleaner/cleaning_orchestrator.hpp"
#include "core/masking.hpp"
#include "core/utils.hpp"
#include "rules/rule_context.hpp"

#include <algorithm>
#include <atomic>
#include <format>
#include <future>
#include <stdexcept>
#include <variant>

namespace logcleaner {

CleaningOrchestrator::CleaningOrchestrator(Config config)
    : config_(std::move(config)),
      parser_(config_.parser) {}

void CleaningOrchestrator::tally(CleaningReport& report, const Decision& decision) {
    switch (decision.kind) {
        case DecisionKind::KEEP:      ++report.kept; break;
        case DecisionKind::REMOVE:    ++report.removed; break;
        case DecisionKind::ANONYMIZE: ++report.anonymized; break;
    }
    if (!decision.matched_rule.empty()) {
        ++report.rule_hits[decision.matched_rule];
    }
}

RunResult CleaningOrchestrator::run(
    const std::string& input_path,
    const std::vector<Rule>& rules,
    const RunOptions& options) const {

    try {
        const RuleEngine engine(rules);
        return run(input_path, engine, options);
    } catch (const std::invalid_argument& e) {
        return RunResult::aborted(input_path, ErrorCategory::CONFIG_ERROR, e.what(), {});
    }
}

RunResult CleaningOrchestrator::run(
    const std::string& input_path,
    const RuleEngine& engine,
    const RunOptions& options) const {

    const utils::Timer timer;
    CleaningReport report;

    // ---- 1. Read + parse ---------------------------------------------------

    LineReader reader(input_path);
    if (!reader.is_open()) {
        utils::log::error(std::format("Cannot open input file: {}", input_path));
        return RunResult::fatal_io(input_path, std::format("Cannot open input file: {}", input_path));
    }

    // Output slot per input line: index into records, or into malformed_lines
    struct Slot {
        bool malformed;
        size_t index;
    };
    std::vector<Slot> slots;
    std::vector<Record> records;

    while (auto line = reader.next()) {
        ++report.total_lines;
        auto outcome = parser_.parse(*line);

        if (auto* record = std::get_if<Record>(&outcome)) {
            slots.push_back({false, records.size()});
            records.push_back(std::move(*record));
            continue;
        }

        auto& bad = std::get<MalformedRecord>(outcome);
        utils::log::debug(std::format("{}:{}: malformed: {}", input_path,
                                      bad.line.line_number, bad.reason));
        slots.push_back({true, report.malformed_lines.size()});
        report.malformed_lines.push_back(
            MalformedDiagnostic{bad.line.line_number, std::move(bad.reason), std::move(bad.line.text)});
        ++report.malformed;
    }

    if (reader.failed()) {
        utils::log::error(std::format("Read error on {} after {} lines", input_path, report.total_lines));
        return RunResult::fatal_io(input_path,
            std::format("Read error on {} after {} lines", input_path, report.total_lines),
            std::move(report));
    }

    // ---- 2. Context --------------------------------------------------------

    RuleContext::Options ctx_options;
    ctx_options.time_reference = options.time_reference.value_or(utils::now_instant());
    ctx_options.closed_accounts = config_.closed_accounts;
    ctx_options.closing_event_types = config_.closing_event_types;
    const auto context = RuleContext::build(records, std::move(ctx_options));

    // ---- 3. Classify -------------------------------------------------------

    std::vector<Decision> decisions;
    decisions.reserve(records.size());
    try {
        for (const auto& record : records) {
            decisions.push_back(engine.classify(record, context));
            tally(report, decisions.back());
        }
    } catch (const RuleEvaluationError& e) {
        utils::log::error(std::format("{}: run aborted: {}", input_path, e.what()));
        return RunResult::aborted(input_path, ErrorCategory::RULE_EVALUATION_ERROR,
                                  e.what(), std::move(report));
    }

    // ---- 4. Assemble -------------------------------------------------------

    std::vector<std::string> output;
    output.reserve(slots.size());
    for (const auto& slot : slots) {
        if (slot.malformed) {
            if (options.preserve_malformed) {
                output.push_back(report.malformed_lines[slot.index].raw);
            }
            continue;
        }

        const auto& record = records[slot.index];
        const auto& decision = decisions[slot.index];
        switch (decision.kind) {
            case DecisionKind::KEEP:
                output.push_back(record.raw);
                break;
            case DecisionKind::REMOVE:
                break;
            case DecisionKind::ANONYMIZE:
                output.push_back(parser_.render(record, MaskingEngine::mask_fields(record, decision)));
                break;
        }
    }

    const auto summary = std::format(
        "total={} kept={} removed={} anonymized={} malformed={}",
        report.total_lines, report.kept, report.removed, report.anonymized, report.malformed);

    // ---- 5. Commit ---------------------------------------------------------

    if (options.dry_run) {
        utils::log::info(std::format("[DRY RUN] {}: {} (would write {} lines, {}ms)",
                                     input_path, summary, output.size(), timer.elapsed_ms().count()));
        return RunResult::success(input_path, std::move(report), true);
    }

    AtomicWriter::Config writer_config;
    writer_config.retain_backup = options.retain_backup;
    writer_config.backup_suffix = config_.backup_suffix;
    writer_config.fault_injector = config_.fault_injector;
    const AtomicWriter writer(std::move(writer_config));

    // Verified against the report, not just the assembled vector
    const size_t expected_lines = report.kept + report.anonymized +
                                  (options.preserve_malformed ? report.malformed : 0);
    auto commit = writer.commit(input_path, output, expected_lines);
    if (!commit.success) {
        utils::log::error(std::format("{}: commit failed ({}): {}", input_path,
                                      error_category_to_string(commit.error_category),
                                      commit.error_message));
        std::optional<BackupHandle> backup;
        if (!commit.backup.backup_path.empty()) backup = std::move(commit.backup);
        return RunResult::aborted(input_path, commit.error_category, commit.error_message,
                                  std::move(report), std::move(backup));
    }

    utils::log::info(std::format("{}: {} ({} bytes written, backup {}{}, {}ms)",
                                 input_path, summary, commit.bytes_written,
                                 commit.backup.backup_path,
                                 commit.backup.retained ? "" : " removed",
                                 timer.elapsed_ms().count()));
    return RunResult::success(input_path, std::move(report), false, std::move(commit.backup));
}

std::vector<RunResult> CleaningOrchestrator::run_many(
    const std::vector<std::string>& input_paths,
    const RuleEngine& engine,
    const RunOptions& options,
    size_t workers) const {

    std::vector<RunResult> results(input_paths.size());
    if (input_paths.empty()) return results;

    // Every file in one invocation sees the same "now"
    RunOptions shared = options;
    if (!shared.time_reference) shared.time_reference = utils::now_instant();

    std::atomic<size_t> next{0};
    auto worker = [&]() {
        for (size_t i = next.fetch_add(1); i < input_paths.size(); i = next.fetch_add(1)) {
            results[i] = run(input_paths[i], engine, shared);
        }
    };

    const size_t num_workers = std::min(std::max<size_t>(workers, 1), input_paths.size());
    if (num_workers == 1) {
        worker();
        return results;
    }

    std::vector<std::future<void>> futures;
    futures.reserve(num_workers);
    for (size_t w = 0; w < num_workers; ++w) {
        futures.push_back(std::async(std::launch::async, worker));
    }
    for (auto& f : futures) f.get();

    return results;
}

} // namespace logcleaner

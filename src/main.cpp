#include "cleaner/cleaning_orchestrator.hpp"
#include "cleaner/input_discovery.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "report/report_serializer.hpp"
#include "rules/rule_engine.hpp"
#include "rules/rule_registry.hpp"

#include <cstdlib>
#include <format>
#include <fstream>
#include <iostream>
#include <string_view>

using namespace logcleaner;

namespace {

// Process exit codes
constexpr int kExitOk = 0;
constexpr int kExitConfig = 1;
constexpr int kExitAborted = 2;
constexpr int kExitFatalIo = 3;

void print_usage(const char* argv0) {
    std::cerr << std::format(
        "Usage: {} <config.toml> [--dry-run] [input ...]\n"
        "  Inputs given on the command line are added to [input] from the config.\n"
        "Exit codes: 0 success, 1 config/usage error, 2 run aborted, 3 fatal I/O\n",
        argv0);
}

int exit_code_for(const std::vector<RunResult>& results) {
    int code = kExitOk;
    for (const auto& r : results) {
        if (r.status == RunStatus::FATAL_IO) return kExitFatalIo;
        if (r.status == RunStatus::ABORTED) code = kExitAborted;
    }
    return code;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        if (argc < 2) {
            print_usage(argv[0]);
            return kExitConfig;
        }

        const std::string config_file = argv[1];
        bool force_dry_run = false;
        std::vector<std::string> cli_inputs;
        for (int i = 2; i < argc; ++i) {
            const std::string_view arg = argv[i];
            if (arg == "--dry-run") {
                force_dry_run = true;
            } else if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return kExitOk;
            } else {
                cli_inputs.emplace_back(arg);
            }
        }

        utils::log::info(std::format("[1/4] Loading configuration from {}", config_file));
        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return kExitConfig;
        }
        auto& cfg = config_result.config;

        if (const auto level = utils::log::parse_level(cfg.logging.level)) {
            utils::log::set_level(*level);
        }
        if (!cfg.logging.file.empty() && !utils::log::set_file(cfg.logging.file)) {
            utils::log::warn(std::format("Cannot open log file {}, logging to stderr only",
                                         cfg.logging.file));
        }
        cfg.apply_cli_overrides(cli_inputs, force_dry_run);

        utils::log::info(std::format("[2/4] Building {} rule(s)", cfg.rules.size()));
        auto rules = RuleRegistry::instance().create_all(cfg.rules);
        if (rules.is_error()) {
            utils::log::error(rules.error_message());
            return kExitConfig;
        }
        const RuleEngine engine(std::move(rules.value()));

        auto inputs = discover_inputs(cfg.input);
        if (inputs.is_error()) {
            utils::log::error(inputs.error_message());
            return inputs.error_category() == ErrorCategory::IO_ERROR ? kExitFatalIo : kExitConfig;
        }
        if (inputs.value().empty()) {
            utils::log::warn("No input files to clean");
        }

        utils::log::info(std::format("[3/4] Cleaning {} file(s) with {} worker(s){}",
                                     inputs.value().size(), cfg.cleaner.workers,
                                     cfg.cleaner.dry_run ? " [DRY RUN]" : ""));
        const CleaningOrchestrator orchestrator(cfg.orchestrator_config());
        const auto results = orchestrator.run_many(
            inputs.value(), engine, cfg.run_options(), static_cast<size_t>(cfg.cleaner.workers));

        const std::string report = ReportSerializer::serialize(results);
        if (cfg.cleaner.report_file.empty()) {
            std::cout << report << '\n';
        } else {
            std::ofstream out(cfg.cleaner.report_file, std::ios::out | std::ios::trunc);
            out << report << '\n';
            if (!out.good()) {
                utils::log::error(std::format("Cannot write report to {}", cfg.cleaner.report_file));
                return kExitFatalIo;
            }
        }

        const int code = exit_code_for(results);
        utils::log::info(std::format("[4/4] Done: {} file(s), exit code {}", results.size(), code));
        return code;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return kExitConfig;
    }
}

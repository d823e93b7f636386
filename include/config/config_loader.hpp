#pragma once

#include "cleaner/cleaning_orchestrator.hpp"
#include "cleaner/input_discovery.hpp"
#include "core/types.hpp"
#include "rules/rule.hpp"

#include <toml++/toml.hpp>

#include <optional>
#include <string>
#include <vector>

namespace logcleaner {

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
    std::string file;               // empty = stderr only
};

// ============================================================================
// Parser Config
// ============================================================================

struct ParserConfig {
    std::string delimiter = ",";
    std::vector<std::string> event_types;   // empty = accept any
};

// ============================================================================
// Cleaner Config
// ============================================================================

struct CleanerOptions {
    bool dry_run = false;
    bool retain_backup = true;
    bool preserve_malformed = false;
    std::optional<Instant> time_reference;  // unset = wall clock at start
    int workers = 1;
    std::string report_file;                // empty = stdout
    std::vector<std::string> closed_accounts;
    std::vector<std::string> closing_event_types{"account_closed", "account_deleted"};
    std::string backup_suffix = ".bak";
};

// ============================================================================
// CleanerConfig - Complete parsed configuration
// ============================================================================

struct CleanerConfig {
    LoggingConfig logging;
    InputConfig input;
    ParserConfig parser;
    CleanerOptions cleaner;
    std::vector<RuleSpec> rules;

    [[nodiscard]] RunOptions run_options() const;
    [[nodiscard]] CleaningOrchestrator::Config orchestrator_config() const;

    /// Command-line overrides: inputs are appended to [input] paths,
    /// the directory scan still applies.
    void apply_cli_overrides(const std::vector<std::string>& inputs, bool force_dry_run);
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        CleanerConfig config;

        static LoadResult ok(CleanerConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to cleaner.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Validate a config, returning every problem found (empty = valid)
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const CleanerConfig& config);

    // Helper: parse action string to DecisionKind
    [[nodiscard]] static std::optional<DecisionKind> parse_action(const std::string& action_str);

    // Helper: parse masking strategy string
    [[nodiscard]] static std::optional<MaskingAction> parse_masking(const std::string& masking_str);

private:
    static LoggingConfig extract_logging(const toml::table& root);
    static InputConfig extract_input(const toml::table& root);
    static ParserConfig extract_parser(const toml::table& root);
    static CleanerOptions extract_cleaner(const toml::table& root, std::vector<std::string>& errors);
    static std::vector<RuleSpec> extract_rules(const toml::table& root, std::vector<std::string>& errors);

    static LoadResult extract_and_validate(const toml::table& tbl);
};

} // namespace logcleaner

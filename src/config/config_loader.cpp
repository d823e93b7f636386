#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "rules/rule_registry.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

using namespace std::string_literals;

namespace logcleaner {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            if (const char* env_val = std::getenv(var_name.c_str())) {
                result += env_val;
            }
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_node(toml::node& node);

void expand_env_vars_in_table(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        expand_env_vars_in_node(val);
    }
}

void expand_env_vars_in_node(toml::node& node) {
    if (auto* s = node.as_string()) {
        *s = expand_env_vars(s->get());
    } else if (auto* tbl = node.as_table()) {
        expand_env_vars_in_table(*tbl);
    } else if (auto* arr = node.as_array()) {
        for (auto& elem : *arr) {
            expand_env_vars_in_node(elem);
        }
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars, arrays concatenate.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else if (val.is_array() && base.contains(key) && base[key].is_array()) {
            auto& base_arr = *base[key].as_array();
            for (const auto& elem : *val.as_array()) {
                base_arr.push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

/**
 * @brief Resolve `include = "shared_rules.toml"` directives, relative to the including file.
 */
void resolve_includes(toml::table& root, const std::filesystem::path& base_dir,
                      std::unordered_set<std::string>& visited, int depth) {
    if (depth > 10) {
        throw std::runtime_error("Config include depth exceeds 10 (circular include?)");
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (const auto* single = inc_node.as_string()) {
        paths.emplace_back(single->get());
    } else if (const auto* many = inc_node.as_array()) {
        for (const auto& item : *many) {
            if (const auto* s = item.as_string()) {
                paths.emplace_back(s->get());
            }
        }
    }
    root.erase("include");

    namespace fs = std::filesystem;
    for (const auto& rel_path : paths) {
        const std::string abs_path = fs::canonical(base_dir / rel_path).string();
        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        resolve_includes(included, fs::path(abs_path).parent_path(), visited, depth + 1);

        // Including file wins over what it includes
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_in_table(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    namespace fs = std::filesystem;
    auto result = toml::parse_file(file_path);

    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, fs::path(file_path).parent_path(), visited, 0);

    expand_env_vars_in_table(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

/**
 * @brief Native TOML dates and date-times as UTC instants.
 * Local date-times (no offset) are taken as UTC.
 */
std::optional<Instant> toml_instant(const toml::date& d, const toml::time& t, int offset_minutes) {
    using namespace std::chrono;
    const year_month_day ymd{year{d.year}, month{d.month}, day{d.day}};
    if (!ymd.ok()) return std::nullopt;
    return sys_days{ymd} + hours{t.hour} + minutes{t.minute} + seconds{t.second}
         - minutes{offset_minutes};
}

std::optional<Instant> toml_instant(const toml::node& node) {
    if (const auto* d = node.as_date()) {
        return toml_instant(d->get(), toml::time{}, 0);
    }
    if (const auto* dt = node.as_date_time()) {
        const auto& v = dt->get();
        return toml_instant(v.date, v.time, v.offset ? v.offset->minutes : 0);
    }
    return std::nullopt;
}

} // anonymous namespace

// ============================================================================
// CleanerConfig
// ============================================================================

RunOptions CleanerConfig::run_options() const {
    RunOptions options;
    options.dry_run = cleaner.dry_run;
    options.retain_backup = cleaner.retain_backup;
    options.preserve_malformed = cleaner.preserve_malformed;
    options.time_reference = cleaner.time_reference;
    return options;
}

CleaningOrchestrator::Config CleanerConfig::orchestrator_config() const {
    CleaningOrchestrator::Config cfg;
    if (!parser.delimiter.empty()) {
        cfg.parser.delimiter = parser.delimiter.front();
    }
    cfg.parser.allowed_event_types.insert(parser.event_types.begin(), parser.event_types.end());
    cfg.closed_accounts.insert(cleaner.closed_accounts.begin(), cleaner.closed_accounts.end());
    cfg.closing_event_types = std::unordered_set<std::string>(
        cleaner.closing_event_types.begin(), cleaner.closing_event_types.end());
    cfg.backup_suffix = cleaner.backup_suffix;
    return cfg;
}

void CleanerConfig::apply_cli_overrides(const std::vector<std::string>& inputs, bool force_dry_run) {
    input.paths.insert(input.paths.end(), inputs.begin(), inputs.end());
    if (force_dry_run) {
        cleaner.dry_run = true;
    }
}

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Helpers ---------------------------------------------------------------

std::optional<DecisionKind> ConfigLoader::parse_action(const std::string& action_str) {
    static const std::unordered_map<std::string, DecisionKind> lookup = {
        {"keep",      DecisionKind::KEEP},
        {"remove",    DecisionKind::REMOVE},
        {"anonymize", DecisionKind::ANONYMIZE},
    };

    const auto it = lookup.find(utils::to_lower(action_str));
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

std::optional<MaskingAction> ConfigLoader::parse_masking(const std::string& masking_str) {
    static const std::unordered_map<std::string, MaskingAction> lookup = {
        {"none",    MaskingAction::NONE},
        {"redact",  MaskingAction::REDACT},
        {"partial", MaskingAction::PARTIAL},
        {"hash",    MaskingAction::HASH},
        {"nullify", MaskingAction::NULLIFY},
    };

    const auto it = lookup.find(utils::to_lower(masking_str));
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

// ---- Section extractors ----------------------------------------------------

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;
    const auto& l = *logging;

    cfg.level = l["level"].value_or(cfg.level);
    cfg.file = l["file"].value_or(""s);
    return cfg;
}

InputConfig ConfigLoader::extract_input(const toml::table& root) {
    InputConfig cfg;
    const auto* input = root["input"].as_table();
    if (!input) return cfg;
    const auto& in = *input;

    cfg.paths = toml_string_array(in, "paths");
    cfg.directory = in["directory"].value_or(""s);
    cfg.pattern = in["pattern"].value_or(cfg.pattern);
    return cfg;
}

ParserConfig ConfigLoader::extract_parser(const toml::table& root) {
    ParserConfig cfg;
    const auto* parser = root["parser"].as_table();
    if (!parser) return cfg;
    const auto& p = *parser;

    cfg.delimiter = p["delimiter"].value_or(cfg.delimiter);
    cfg.event_types = toml_string_array(p, "event_types");
    return cfg;
}

CleanerOptions ConfigLoader::extract_cleaner(const toml::table& root, std::vector<std::string>& errors) {
    CleanerOptions cfg;
    const auto* cleaner = root["cleaner"].as_table();
    if (!cleaner) return cfg;
    const auto& c = *cleaner;

    cfg.dry_run            = c["dry_run"].value_or(cfg.dry_run);
    cfg.retain_backup      = c["retain_backup"].value_or(cfg.retain_backup);
    cfg.preserve_malformed = c["preserve_malformed"].value_or(cfg.preserve_malformed);
    cfg.workers            = static_cast<int>(c["workers"].value_or(cfg.workers));
    cfg.report_file        = c["report_file"].value_or(""s);
    cfg.backup_suffix      = c["backup_suffix"].value_or(cfg.backup_suffix);
    cfg.closed_accounts    = toml_string_array(c, "closed_accounts");
    if (c.contains("closing_event_types")) {
        cfg.closing_event_types = toml_string_array(c, "closing_event_types");
    }

    if (const auto* node = c.get("time_reference")) {
        if (const auto* ref = node->as_string()) {
            cfg.time_reference = utils::parse_instant(ref->get());
            if (!cfg.time_reference) {
                errors.push_back(std::format("cleaner.time_reference '{}' is not a valid timestamp", ref->get()));
            }
        } else if (node->is_date() || node->is_date_time()) {
            cfg.time_reference = toml_instant(*node);
            if (!cfg.time_reference) {
                errors.push_back("cleaner.time_reference is not a valid date");
            }
        } else {
            errors.push_back("cleaner.time_reference must be a timestamp string or a TOML date/date-time");
        }
    }
    return cfg;
}

std::vector<RuleSpec> ConfigLoader::extract_rules(const toml::table& root, std::vector<std::string>& errors) {
    std::vector<RuleSpec> result;
    const auto* arr = root["rules"].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    size_t index = 0;
    for (const auto& elem : *arr) {
        const auto* r = elem.as_table();
        if (!r) {
            errors.push_back(std::format("rules[{}] must be a table", index++));
            continue;
        }

        RuleSpec spec;
        spec.name = (*r)["name"].value_or(""s);
        spec.type = (*r)["type"].value_or(""s);

        if (const auto* action_node = (*r)["action"].as_string()) {
            spec.action = parse_action(action_node->get());
            if (!spec.action) {
                errors.push_back(std::format("rules[{}].action '{}' must be keep, remove or anonymize",
                                             index, action_node->get()));
            }
        }

        spec.event_types = toml_string_array(*r, "event_types");
        spec.max_age_days = (*r)["max_age_days"].value_or(int64_t{0});

        spec.fields = toml_string_array(*r, "fields");
        if (const auto* masking_node = (*r)["masking"].as_string()) {
            const auto masking = parse_masking(masking_node->get());
            if (masking) {
                spec.masking = *masking;
            } else {
                errors.push_back(std::format("rules[{}].masking '{}' is not a known strategy",
                                             index, masking_node->get()));
            }
        }
        spec.prefix_len = static_cast<int>((*r)["prefix_len"].value_or(spec.prefix_len));
        spec.suffix_len = static_cast<int>((*r)["suffix_len"].value_or(spec.suffix_len));

        spec.attribute = (*r)["attribute"].value_or(""s);
        spec.values = toml_string_array(*r, "values");

        result.push_back(std::move(spec));
        ++index;
    }

    return result;
}

// ---- Shared extraction + validation ----------------------------------------

ConfigLoader::LoadResult ConfigLoader::extract_and_validate(const toml::table& tbl) {
    std::vector<std::string> errors;

    CleanerConfig config;
    config.logging = extract_logging(tbl);
    config.input = extract_input(tbl);
    config.parser = extract_parser(tbl);
    config.cleaner = extract_cleaner(tbl, errors);
    config.rules = extract_rules(tbl, errors);

    const auto validation_errors = validate_config(config);
    errors.insert(errors.end(), validation_errors.begin(), validation_errors.end());

    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return extract_and_validate(tbl);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return extract_and_validate(tbl);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const CleanerConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be debug, info, warn or error, got '{}'",
                                     config.logging.level));
    }

    if (config.parser.delimiter.size() != 1) {
        errors.push_back(std::format("parser.delimiter must be a single character, got '{}'",
                                     config.parser.delimiter));
    }

    if (config.cleaner.workers <= 0) {
        errors.push_back(std::format("cleaner.workers must be > 0, got {}", config.cleaner.workers));
    }

    if (config.cleaner.backup_suffix.empty()) {
        errors.push_back("cleaner.backup_suffix must not be empty");
    }

    std::unordered_set<std::string> names;
    const auto& registry = RuleRegistry::instance();
    for (size_t i = 0; i < config.rules.size(); ++i) {
        const auto& spec = config.rules[i];
        if (spec.name.empty()) {
            errors.push_back(std::format("rules[{}].name must not be empty", i));
            continue;
        }
        if (!names.insert(spec.name).second) {
            errors.push_back(std::format("rules[{}]: duplicate rule name '{}'", i, spec.name));
        }
        if (spec.prefix_len < 0 || spec.suffix_len < 0) {
            errors.push_back(std::format("rules[{}].prefix_len/suffix_len must be >= 0", i));
        }
        if (!registry.has_kind(spec.type)) {
            errors.push_back(std::format("rules[{}].type '{}' is not a known rule type", i, spec.type));
            continue;
        }
        if (auto created = registry.create(spec); created.is_error()) {
            errors.push_back(std::format("rules[{}]: {}", i, created.error_message()));
        }
    }

    return errors;
}

} // namespace logcleaner

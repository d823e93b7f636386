#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace logcleaner {

// ============================================================================
// Basic Types
// ============================================================================

/// Instants are UTC, second resolution.
using Instant = std::chrono::sys_seconds;

/**
 * @brief One unparsed line of the input file plus its 1-based line number
 */
struct RawLine {
    std::string text;
    size_t line_number = 0;
};

/**
 * @brief A successfully parsed log entry
 *
 * Always traces back to exactly one RawLine through line_number and raw.
 */
struct Record {
    std::string account_id;
    Instant timestamp{};
    std::string event_type;
    std::string raw;
    std::unordered_map<std::string, std::string> attributes;
    size_t line_number = 0;

    [[nodiscard]] bool has_field(const std::string& field) const {
        return field == "account_id" || attributes.contains(field);
    }
};

/**
 * @brief A line that failed to parse; never classified
 */
struct MalformedRecord {
    RawLine line;
    std::string reason;
};

// ============================================================================
// Decisions
// ============================================================================

enum class DecisionKind {
    KEEP,
    REMOVE,
    ANONYMIZE
};

enum class MaskingAction {
    NONE,
    REDACT,     // Replace entire value
    PARTIAL,    // Keep prefix/suffix, mask middle
    HASH,       // SHA256 hash (deterministic)
    NULLIFY     // Replace with NULL
};

/**
 * @brief Outcome the rule engine attaches to a Record
 *
 * fields/masking are only meaningful for ANONYMIZE. matched_rule is empty
 * when no rule matched and the default KEEP applied.
 */
struct Decision {
    DecisionKind kind = DecisionKind::KEEP;
    std::vector<std::string> fields;
    MaskingAction masking = MaskingAction::REDACT;
    int prefix_len = 3;
    int suffix_len = 3;
    std::string matched_rule;

    static Decision keep() { return Decision{}; }

    static Decision remove() {
        Decision d;
        d.kind = DecisionKind::REMOVE;
        return d;
    }

    static Decision anonymize(std::vector<std::string> fields,
                              MaskingAction masking = MaskingAction::REDACT,
                              int prefix_len = 3, int suffix_len = 3) {
        Decision d;
        d.kind = DecisionKind::ANONYMIZE;
        d.fields = std::move(fields);
        d.masking = masking;
        d.prefix_len = prefix_len;
        d.suffix_len = suffix_len;
        return d;
    }
};

// ============================================================================
// Report
// ============================================================================

struct MalformedDiagnostic {
    size_t line_number = 0;
    std::string reason;
    std::string raw;

    bool operator==(const MalformedDiagnostic&) const = default;
};

/**
 * @brief Outcome counts of one cleaning run
 *
 * Invariant: kept + removed + anonymized + malformed == total_lines once the
 * run has classified every line.
 */
struct CleaningReport {
    size_t total_lines = 0;
    size_t kept = 0;
    size_t removed = 0;
    size_t anonymized = 0;
    size_t malformed = 0;
    std::vector<MalformedDiagnostic> malformed_lines;
    std::map<std::string, size_t> rule_hits;  // rule name -> records decided

    [[nodiscard]] size_t accounted() const {
        return kept + removed + anonymized + malformed;
    }

    bool operator==(const CleaningReport&) const = default;
};

// ============================================================================
// Run options / results
// ============================================================================

struct RunOptions {
    bool dry_run = false;
    bool retain_backup = true;
    bool preserve_malformed = false;
    std::optional<Instant> time_reference;  // "now" when unset
};

/**
 * @brief Reference to the byte-for-byte copy of an input file
 */
struct BackupHandle {
    std::string original_path;
    std::string backup_path;
    uintmax_t bytes = 0;
    bool retained = true;
};

} // namespace logcleaner

#pragma once

#include "core/types.hpp"

#include <fstream>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <variant>

namespace logcleaner {

/// Either a parsed Record or a diagnostic for a line that did not parse.
using ParseOutcome = std::variant<Record, MalformedRecord>;

/**
 * @brief Single-pass reader yielding RawLines from a file
 *
 * Line numbers are 1-based. A trailing newline at end of file does not
 * produce an extra empty line. The reader cannot be rewound; a new run
 * opens a new reader.
 */
class LineReader {
public:
    explicit LineReader(const std::string& path);

    [[nodiscard]] bool is_open() const { return stream_.is_open(); }

    /// Next line, or nullopt at end of input (or on a read error, see failed())
    [[nodiscard]] std::optional<RawLine> next();

    /// True when reading stopped because of an I/O error rather than EOF
    [[nodiscard]] bool failed() const { return stream_.bad(); }

private:
    std::ifstream stream_;
    size_t line_number_ = 0;
};

/**
 * @brief Record parser - converts raw lines into Records
 *
 * Line layout (delimiter configurable, default ','):
 *   timestamp <d> account_id <d> event_type [<d> key=value ...]
 *
 * Extra columns without '=' are kept positionally as "col<N>". Parsing
 * never throws on bad input: every problem yields a MalformedRecord with a
 * human-readable reason. Parsing a line depends on nothing but that line.
 */
class RecordParser {
public:
    struct Config {
        char delimiter = ',';
        // Empty = any non-empty event type is accepted
        std::unordered_set<std::string> allowed_event_types;
    };

    RecordParser() = default;
    explicit RecordParser(Config config);

    [[nodiscard]] ParseOutcome parse(const RawLine& line) const;

    /**
     * @brief Re-emit a record with some field values replaced
     *
     * Untouched columns are copied byte-for-byte from record.raw; only the
     * value part of a replaced column changes. "account_id" addresses
     * column 1, any other name an attribute column.
     */
    [[nodiscard]] std::string render(
        const Record& record,
        const std::unordered_map<std::string, std::string>& replacements) const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    static constexpr size_t kTimestampColumn = 0;
    static constexpr size_t kAccountColumn = 1;
    static constexpr size_t kEventTypeColumn = 2;
    static constexpr size_t kFirstAttributeColumn = 3;

    [[nodiscard]] static std::string positional_key(size_t column);

    Config config_;
};

} // namespace logcleaner

#include "parser/record_parser.hpp"
#include "core/utils.hpp"

#include <cctype>
#include <format>

namespace logcleaner {

namespace {

MalformedRecord malformed(const RawLine& line, std::string reason) {
    return MalformedRecord{line, std::move(reason)};
}

// Replace the whitespace-trimmed part of token[from..] with value, keeping
// the surrounding whitespace.
std::string replace_trimmed_span(const std::string& token, size_t from, const std::string& value) {
    const auto start = token.find_first_not_of(" \t", from);
    if (start == std::string::npos) {
        return token + value;
    }
    const auto end = token.find_last_not_of(" \t");
    return token.substr(0, start) + value + token.substr(end + 1);
}

// Position of the key/value separator in an attribute column, or npos.
// "key=value" wins; otherwise "Key: value" (identifier key, colon followed
// by whitespace or end of column) as found in labelled exports.
size_t attribute_separator(const std::string& token) {
    if (const auto eq = token.find('='); eq != std::string::npos) {
        return eq;
    }

    const auto colon = token.find(':');
    if (colon == std::string::npos) return std::string::npos;
    if (colon + 1 < token.size() && token[colon + 1] != ' ' && token[colon + 1] != '\t') {
        return std::string::npos;
    }

    const std::string key = utils::trim(token.substr(0, colon));
    if (key.empty() || !std::isalpha(static_cast<unsigned char>(key.front()))) {
        return std::string::npos;
    }
    for (const char c : key) {
        const auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '_' && c != '-' && c != '.') return std::string::npos;
    }
    return colon;
}

} // anonymous namespace

// ============================================================================
// LineReader
// ============================================================================

LineReader::LineReader(const std::string& path)
    : stream_(path, std::ios::in | std::ios::binary) {}

std::optional<RawLine> LineReader::next() {
    if (!stream_.is_open()) return std::nullopt;

    std::string text;
    if (!std::getline(stream_, text)) {
        return std::nullopt;
    }
    return RawLine{std::move(text), ++line_number_};
}

// ============================================================================
// RecordParser
// ============================================================================

RecordParser::RecordParser(Config config)
    : config_(std::move(config)) {}

std::string RecordParser::positional_key(size_t column) {
    return std::format("col{}", column);
}

ParseOutcome RecordParser::parse(const RawLine& line) const {
    std::string work = line.text;
    if (!work.empty() && work.back() == '\r') {
        work.pop_back();
    }
    if (utils::trim(work).empty()) {
        return malformed(line, "empty line");
    }

    const auto tokens = utils::split(work, config_.delimiter);
    if (tokens.size() < kFirstAttributeColumn) {
        return malformed(line, std::format("expected at least {} fields, got {}",
                                           kFirstAttributeColumn, tokens.size()));
    }

    const std::string ts_text = utils::trim(tokens[kTimestampColumn]);
    const auto timestamp = utils::parse_instant(ts_text);
    if (!timestamp) {
        return malformed(line, std::format("unparsable timestamp '{}'", ts_text));
    }

    Record record;
    record.timestamp = *timestamp;
    record.account_id = utils::trim(tokens[kAccountColumn]);
    if (record.account_id.empty()) {
        return malformed(line, "empty account_id");
    }

    record.event_type = utils::trim(tokens[kEventTypeColumn]);
    if (record.event_type.empty()) {
        return malformed(line, "empty event_type");
    }
    if (!config_.allowed_event_types.empty() &&
        !config_.allowed_event_types.contains(record.event_type)) {
        return malformed(line, std::format("unknown event_type '{}'", record.event_type));
    }

    for (size_t col = kFirstAttributeColumn; col < tokens.size(); ++col) {
        const std::string token = utils::trim(tokens[col]);
        if (token.empty()) continue;

        std::string key;
        std::string value;
        const auto eq = attribute_separator(token);
        if (eq == std::string::npos) {
            key = positional_key(col);
            value = token;
        } else {
            key = utils::trim(token.substr(0, eq));
            value = utils::trim(token.substr(eq + 1));
            if (key.empty()) key = positional_key(col);
        }

        if (!record.attributes.emplace(key, std::move(value)).second) {
            return malformed(line, std::format("duplicate attribute '{}'", key));
        }
    }

    record.raw = line.text;
    record.line_number = line.line_number;
    return record;
}

std::string RecordParser::render(
    const Record& record,
    const std::unordered_map<std::string, std::string>& replacements) const {

    if (replacements.empty()) return record.raw;

    std::string body = record.raw;
    std::string line_ending;
    if (!body.empty() && body.back() == '\r') {
        body.pop_back();
        line_ending = "\r";
    }

    auto tokens = utils::split(body, config_.delimiter);

    if (const auto it = replacements.find("account_id");
        it != replacements.end() && tokens.size() > kAccountColumn) {
        tokens[kAccountColumn] = replace_trimmed_span(tokens[kAccountColumn], 0, it->second);
    }

    for (size_t col = kFirstAttributeColumn; col < tokens.size(); ++col) {
        auto& token = tokens[col];
        const std::string trimmed = utils::trim(token);
        if (trimmed.empty()) continue;

        const auto eq = attribute_separator(token);
        std::string key = (eq == std::string::npos) ? std::string{} : utils::trim(token.substr(0, eq));
        if (key.empty()) key = positional_key(col);

        const auto it = replacements.find(key);
        if (it == replacements.end()) continue;

        token = (eq == std::string::npos)
            ? replace_trimmed_span(token, 0, it->second)
            : replace_trimmed_span(token, eq + 1, it->second);
    }

    std::string out;
    out.reserve(record.raw.size());
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0) out += config_.delimiter;
        out += tokens[i];
    }
    out += line_ending;
    return out;
}

} // namespace logcleaner

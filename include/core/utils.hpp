#pragma once

#include "core/types.hpp"

#include <atomic>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <format>
#include <fstream>
#include <iostream>
#include <mutex>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace logcleaner::utils {

// ============================================================================
// UUID Generation
// ============================================================================

inline std::string generate_uuid() {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dis;

    uint64_t high = dis(gen);
    uint64_t low = dis(gen);

    return std::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
        static_cast<uint32_t>(high >> 32),
        static_cast<uint16_t>((high >> 16) & 0xFFFF),
        static_cast<uint16_t>(high & 0xFFFF),
        static_cast<uint16_t>(low >> 48),
        low & 0xFFFFFFFFFFFF);
}

// ============================================================================
// Numeric Parsing (std::from_chars, no exceptions or locale)
// ============================================================================

// Parse integer, returns std::nullopt unless the whole view is consumed
template<typename T>
    requires std::is_integral_v<T>
[[nodiscard]] inline std::optional<T> try_parse_int(std::string_view sv) {
    T result{};
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), result);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) return std::nullopt;
    return result;
}

// ============================================================================
// Time Utilities
// ============================================================================

inline std::chrono::system_clock::time_point now() {
    return std::chrono::system_clock::now();
}

inline Instant now_instant() {
    return std::chrono::floor<std::chrono::seconds>(now());
}

namespace detail {
    // Exactly `width` ASCII digits
    inline std::optional<int> fixed_digits(std::string_view sv, size_t pos, size_t width) {
        if (pos + width > sv.size()) return std::nullopt;
        const auto part = sv.substr(pos, width);
        for (const char c : part) {
            if (c < '0' || c > '9') return std::nullopt;
        }
        return try_parse_int<int>(part);
    }
} // namespace detail

/**
 * @brief Parse a UTC instant
 *
 * Accepts YYYY-MM-DD, YYYY-MM-DDTHH:MM:SS and YYYY-MM-DD HH:MM:SS, each
 * optionally followed by a fractional part (truncated) and/or 'Z'.
 * Calendar dates are validated.
 */
[[nodiscard]] inline std::optional<Instant> parse_instant(std::string_view sv) {
    using namespace std::chrono;

    if (sv.size() < 10 || sv[4] != '-' || sv[7] != '-') return std::nullopt;
    const auto y = detail::fixed_digits(sv, 0, 4);
    const auto m = detail::fixed_digits(sv, 5, 2);
    const auto d = detail::fixed_digits(sv, 8, 2);
    if (!y || !m || !d) return std::nullopt;

    const year_month_day ymd{year{*y}, month{static_cast<unsigned>(*m)},
                             day{static_cast<unsigned>(*d)}};
    if (!ymd.ok()) return std::nullopt;

    Instant result = sys_days{ymd};
    size_t pos = 10;

    if (pos < sv.size() && (sv[pos] == 'T' || sv[pos] == ' ')) {
        if (pos + 9 > sv.size() || sv[pos + 3] != ':' || sv[pos + 6] != ':') return std::nullopt;
        const auto hh = detail::fixed_digits(sv, pos + 1, 2);
        const auto mm = detail::fixed_digits(sv, pos + 4, 2);
        const auto ss = detail::fixed_digits(sv, pos + 7, 2);
        if (!hh || !mm || !ss || *hh > 23 || *mm > 59 || *ss > 59) return std::nullopt;
        result += hours{*hh} + minutes{*mm} + seconds{*ss};
        pos += 9;

        if (pos < sv.size() && sv[pos] == '.') {
            ++pos;
            const size_t digits_start = pos;
            while (pos < sv.size() && sv[pos] >= '0' && sv[pos] <= '9') ++pos;
            if (pos == digits_start) return std::nullopt;
        }
    }

    if (pos < sv.size() && sv[pos] == 'Z') ++pos;
    if (pos != sv.size()) return std::nullopt;
    return result;
}

/// ISO-8601 "YYYY-MM-DDTHH:MM:SSZ"
inline std::string format_instant(Instant instant) {
    using namespace std::chrono;
    const auto day_point = floor<days>(instant);
    const year_month_day ymd{day_point};
    const hh_mm_ss hms{instant - day_point};
    return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}Z",
        static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
        static_cast<unsigned>(ymd.day()), hms.hours().count(),
        hms.minutes().count(), hms.seconds().count());
}

/// Filename-safe "YYYYMMDDTHHMMSSZ"
inline std::string format_compact_instant(Instant instant) {
    std::string iso = format_instant(instant);
    std::string out;
    out.reserve(iso.size());
    for (const char c : iso) {
        if (c != '-' && c != ':') out += c;
    }
    return out;
}

// ============================================================================
// String Utilities
// ============================================================================

inline std::string to_lower(const std::string& str) {
    std::string result = str;
    for (char& c : result) {
        c = std::tolower(static_cast<unsigned char>(c));
    }
    return result;
}

inline std::string trim(const std::string& str) {
    const auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

// Keeps empty tokens, including a trailing one ("a,b," -> {"a","b",""})
inline std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    size_t start = 0;
    while (true) {
        const auto pos = str.find(delimiter, start);
        if (pos == std::string::npos) {
            tokens.emplace_back(str.substr(start));
            break;
        }
        tokens.emplace_back(str.substr(start, pos - start));
        start = pos + 1;
    }
    return tokens;
}

// ============================================================================
// Performance Timer
// ============================================================================

class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    template<typename Duration = std::chrono::microseconds>
    Duration elapsed() const {
        const auto end = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<Duration>(end - start_);
    }

    std::chrono::milliseconds elapsed_ms() const {
        return elapsed<std::chrono::milliseconds>();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// ============================================================================
// Logging (thread-safe, stderr + optional file, level-tagged)
// ============================================================================

namespace log {

enum class Level { DEBUG, INFO, WARN, ERROR };

namespace detail {
    inline std::mutex& log_mutex() {
        static std::mutex m;
        return m;
    }

    inline std::atomic<Level>& threshold() {
        static std::atomic<Level> level{Level::INFO};
        return level;
    }

    // Guarded by log_mutex()
    inline std::ofstream& file_stream() {
        static std::ofstream stream;
        return stream;
    }

    inline void write(Level level, const std::string& msg) {
        if (level < threshold().load(std::memory_order_relaxed)) return;

        const char* tag = "";
        switch (level) {
            case Level::DEBUG: tag = "DEBUG"; break;
            case Level::INFO:  tag = "INFO "; break;
            case Level::WARN:  tag = "WARN "; break;
            case Level::ERROR: tag = "ERROR"; break;
        }

        const auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf;
        ::localtime_r(&time, &tm_buf);

        char time_buf[16];
        std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);

        const auto formatted = std::format("{}.{:03d} [{}] {}\n",
            time_buf, static_cast<int>(ms.count()), tag, msg);

        std::lock_guard<std::mutex> lock(log_mutex());
        std::cerr << formatted;
        if (file_stream().is_open()) {
            file_stream() << formatted;
            file_stream().flush();
        }
    }
} // namespace detail

inline void set_level(Level level) {
    detail::threshold().store(level, std::memory_order_relaxed);
}

[[nodiscard]] inline std::optional<Level> parse_level(const std::string& name) {
    const std::string lower = to_lower(name);
    if (lower == "debug") return Level::DEBUG;
    if (lower == "info") return Level::INFO;
    if (lower == "warn" || lower == "warning") return Level::WARN;
    if (lower == "error") return Level::ERROR;
    return std::nullopt;
}

/// Mirror log output to a file (append). Returns false if it cannot be opened.
[[nodiscard]] inline bool set_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(detail::log_mutex());
    auto& stream = detail::file_stream();
    if (stream.is_open()) stream.close();
    if (path.empty()) return true;
    stream.open(path, std::ios::app);
    return stream.is_open();
}

inline void debug(const std::string& msg) {
    detail::write(Level::DEBUG, msg);
}

inline void info(const std::string& msg) {
    detail::write(Level::INFO, msg);
}

inline void warn(const std::string& msg) {
    detail::write(Level::WARN, msg);
}

inline void error(const std::string& msg) {
    detail::write(Level::ERROR, msg);
}

} // namespace log

} // namespace logcleaner::utils

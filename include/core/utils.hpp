#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cctype>
#include <ctime>
#include <format>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace steadfast::utils {

// ============================================================================
// Timestamps
// ============================================================================

/**
 * @brief UTC ISO-8601 with milliseconds, e.g. "2026-01-31T12:00:00.123Z"
 *
 * Every timestamp in status documents and log lines uses this form.
 */
inline std::string format_timestamp(const std::chrono::system_clock::time_point& tp) {
    const auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs).count();
    const std::time_t time = std::chrono::system_clock::to_time_t(secs);

    std::tm utc{};
    ::gmtime_r(&time, &utc);

    return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z",
        utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
        utc.tm_hour, utc.tm_min, utc.tm_sec, static_cast<int>(millis));
}

inline std::optional<std::string> format_optional_timestamp(
    const std::optional<std::chrono::system_clock::time_point>& tp) {
    return tp ? std::optional<std::string>(format_timestamp(*tp)) : std::nullopt;
}

// ============================================================================
// Strings
// ============================================================================

namespace detail {
    template<typename CaseFn>
    std::string map_chars(std::string_view str, CaseFn fn) {
        std::string out(str);
        std::transform(out.begin(), out.end(), out.begin(), [fn](char c) {
            return static_cast<char>(fn(static_cast<unsigned char>(c)));
        });
        return out;
    }
} // namespace detail

inline std::string to_lower(std::string_view str) {
    return detail::map_chars(str, [](unsigned char c) { return std::tolower(c); });
}

inline std::string to_upper(std::string_view str) {
    return detail::map_chars(str, [](unsigned char c) { return std::toupper(c); });
}

inline std::string trim(std::string_view str) {
    constexpr std::string_view ws = " \t\n\r\f\v";
    const auto first = str.find_first_not_of(ws);
    if (first == std::string_view::npos) return {};
    return std::string(str.substr(first, str.find_last_not_of(ws) - first + 1));
}

// SQL shortened for a log line; "..." marks the cut
inline std::string truncate(std::string_view str, size_t max_len) {
    if (str.size() <= max_len) return std::string(str);
    return std::string(str.substr(0, max_len)) + "...";
}

// ============================================================================
// Timer
// ============================================================================

class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    [[nodiscard]] std::chrono::milliseconds elapsed_ms() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_);
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// ============================================================================
// Logging: one line per message on stderr,
// "<ISO-8601 UTC> <LEVEL> [Component] message"
// ============================================================================

namespace log {

enum class Level { DEBUG, INFO, WARN, ERROR };

[[nodiscard]] inline constexpr std::string_view level_name(Level level) noexcept {
    switch (level) {
        case Level::DEBUG: return "DEBUG";
        case Level::INFO:  return "INFO";
        case Level::WARN:  return "WARN";
        case Level::ERROR: return "ERROR";
    }
    return "?";
}

namespace detail {
    inline std::atomic<Level>& threshold() {
        static std::atomic<Level> level{Level::INFO};
        return level;
    }

    inline void emit(Level level, std::string_view msg) {
        if (level < threshold().load(std::memory_order_relaxed)) return;

        const auto line = std::format("{} {:<5} {}\n",
            format_timestamp(std::chrono::system_clock::now()), level_name(level), msg);

        static std::mutex sink_mutex;
        std::lock_guard lock(sink_mutex);
        std::cerr << line;
    }
} // namespace detail

inline void set_level(Level level) {
    detail::threshold().store(level, std::memory_order_relaxed);
}

/**
 * @brief "debug" / "info" / "warn" (or "warning") / "error", any case
 */
[[nodiscard]] inline std::optional<Level> parse_level(std::string_view name) {
    const auto lower = to_lower(name);
    if (lower == "debug") return Level::DEBUG;
    if (lower == "info") return Level::INFO;
    if (lower == "warn" || lower == "warning") return Level::WARN;
    if (lower == "error") return Level::ERROR;
    return std::nullopt;
}

inline void debug(std::string_view msg) { detail::emit(Level::DEBUG, msg); }
inline void info(std::string_view msg) { detail::emit(Level::INFO, msg); }
inline void warn(std::string_view msg) { detail::emit(Level::WARN, msg); }
inline void error(std::string_view msg) { detail::emit(Level::ERROR, msg); }

} // namespace log

} // namespace steadfast::utils

#pragma once

#include <string>
#include <string_view>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <format>
#include <iostream>
#include <mutex>
#include <optional>
#include <type_traits>
#include <vector>

namespace motya::utils {

// ============================================================================
// Numeric Parsing (std::from_chars, locale independent)
// ============================================================================

// Parse integer, returns std::nullopt on failure or trailing garbage
template<typename T>
    requires std::is_integral_v<T>
[[nodiscard]] inline std::optional<T> try_parse_int(std::string_view sv, int base = 10) {
    T result{};
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), result, base);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) return std::nullopt;
    return result;
}

// ============================================================================
// String Utilities
// ============================================================================

/**
 * @brief Render a list as ["a", "b"] for error messages.
 */
template<typename Range>
[[nodiscard]] inline std::string quoted_list(const Range& items) {
    std::string out = "[";
    bool first = true;
    for (const auto& item : items) {
        if (!first) out += ", ";
        out += '"';
        out += item;
        out += '"';
        first = false;
    }
    out += ']';
    return out;
}

// ============================================================================
// Logging (stderr, one line per record, serialized across threads)
// ============================================================================

namespace log {

enum class Level : uint8_t { INFO = 0, WARN = 1, ERROR = 2 };

namespace detail {

// MOTYA_LOG_QUIET set to anything but "0" raises the threshold to WARN
inline Level threshold() {
    static const Level min_level = [] {
        const char* env = std::getenv("MOTYA_LOG_QUIET");
        return (env != nullptr && std::string_view(env) != "0") ? Level::WARN : Level::INFO;
    }();
    return min_level;
}

inline std::string_view level_tag(Level level) {
    switch (level) {
        case Level::INFO:  return "info";
        case Level::WARN:  return "warn";
        case Level::ERROR: return "error";
    }
    return "?";
}

inline void emit(Level level, std::string_view msg) {
    if (level < threshold()) return;

    const auto now = std::chrono::system_clock::now();
    const auto secs = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm local{};
    ::localtime_r(&secs, &local);
    char clock[16];
    std::strftime(clock, sizeof(clock), "%H:%M:%S", &local);

    const auto line = std::format("{}.{:03} motya-config {:<5} {}\n",
                                  clock, millis, level_tag(level), msg);

    static std::mutex sink_mutex;
    std::lock_guard<std::mutex> guard(sink_mutex);
    std::cerr << line;
}

} // namespace detail

inline void info(std::string_view msg)  { detail::emit(Level::INFO, msg); }
inline void warn(std::string_view msg)  { detail::emit(Level::WARN, msg); }
inline void error(std::string_view msg) { detail::emit(Level::ERROR, msg); }

} // namespace log

} // namespace motya::utils

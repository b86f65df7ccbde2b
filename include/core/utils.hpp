#pragma once

#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <format>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rowmap::utils {

// ============================================================================
// String Utilities
// ============================================================================

inline std::string to_lower(std::string_view str) {
    std::string result(str);
    for (char& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

[[nodiscard]] inline bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

// Case-insensitive prefix test (regionMatches semantics)
[[nodiscard]] inline bool istarts_with(std::string_view str, std::string_view prefix) {
    return str.size() >= prefix.size() && iequals(str.substr(0, prefix.size()), prefix);
}

inline std::string trim(std::string_view str) {
    const auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) {
        return "";
    }
    const auto end = str.find_last_not_of(" \t\n\r");
    return std::string(str.substr(start, end - start + 1));
}

inline std::string join(const std::vector<std::string>& parts, std::string_view sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

// ============================================================================
// Logging (thread-safe, stderr, level-tagged)
// ============================================================================

namespace log {

enum class Level { DEBUG, INFO, WARN, ERROR };

[[nodiscard]] inline std::optional<Level> parse_level(std::string_view text) {
    const auto lower = to_lower(text);
    if (lower == "debug") return Level::DEBUG;
    if (lower == "info")  return Level::INFO;
    if (lower == "warn" || lower == "warning") return Level::WARN;
    if (lower == "error") return Level::ERROR;
    return std::nullopt;
}

namespace detail {
    inline std::mutex& log_mutex() {
        static std::mutex m;
        return m;
    }

    inline std::atomic<Level>& min_level() {
        static std::atomic<Level> level{Level::INFO};
        return level;
    }

    inline void write(Level level, const std::string& msg) {
        if (level < min_level().load(std::memory_order_relaxed)) return;

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
    }
} // namespace detail

inline void set_level(Level level) {
    detail::min_level().store(level, std::memory_order_relaxed);
}

[[nodiscard]] inline Level level() {
    return detail::min_level().load(std::memory_order_relaxed);
}

[[nodiscard]] inline bool enabled(Level l) {
    return l >= level();
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

} // namespace rowmap::utils

#pragma once

#include <atomic>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <format>
#include <iostream>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <type_traits>

namespace anonymizer::utils {

// ============================================================================
// Random Source (one engine per thread, no shared state)
// ============================================================================

inline std::mt19937_64& rng() {
    static thread_local std::mt19937_64 gen{std::random_device{}()};
    return gen;
}

// Uniform integer in [lo, hi]
template<typename T>
    requires std::is_integral_v<T>
[[nodiscard]] inline T random_int(T lo, T hi) {
    std::uniform_int_distribution<T> dis(lo, hi);
    return dis(rng());
}

[[nodiscard]] inline std::string random_digits(size_t count) {
    std::string out;
    out.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        out += static_cast<char>('0' + random_int(0, 9));
    }
    return out;
}

[[nodiscard]] inline std::string random_upper_letters(size_t count) {
    std::string out;
    out.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        out += static_cast<char>('A' + random_int(0, 25));
    }
    return out;
}

// ============================================================================
// UUID Generation (RFC 4122 version 4)
// ============================================================================

inline std::string generate_uuid_v4() {
    std::uniform_int_distribution<uint64_t> dis;
    uint64_t high = dis(rng());
    uint64_t low = dis(rng());

    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // version 4
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;    // variant 10xx

    return std::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
        static_cast<uint32_t>(high >> 32),
        static_cast<uint16_t>((high >> 16) & 0xFFFF),
        static_cast<uint16_t>(high & 0xFFFF),
        static_cast<uint16_t>(low >> 48),
        low & 0xFFFFFFFFFFFF);
}

// ============================================================================
// Numeric Parsing (std::from_chars, whole input must parse)
// ============================================================================

template<typename T>
    requires std::is_integral_v<T>
[[nodiscard]] inline std::optional<T> try_parse_int(std::string_view sv) {
    T result{};
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), result);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) return std::nullopt;
    return result;
}

// ============================================================================
// String Utilities
// ============================================================================

inline std::string trim(const std::string& str) {
    const auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

[[nodiscard]] inline std::string repeat(std::string_view unit, size_t times) {
    std::string out;
    out.reserve(unit.size() * times);
    for (size_t i = 0; i < times; ++i) {
        out.append(unit);
    }
    return out;
}

// ============================================================================
// UTF-8 Utilities (lengths and slices count code points, not bytes)
// ============================================================================

[[nodiscard]] inline bool is_utf8_continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

[[nodiscard]] inline size_t utf8_length(std::string_view s) {
    size_t n = 0;
    for (const char c : s) {
        if (!is_utf8_continuation(c)) ++n;
    }
    return n;
}

// Byte offset of the code point with index `cp` (s.size() when past the end)
[[nodiscard]] inline size_t utf8_offset(std::string_view s, size_t cp) {
    size_t seen = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if (is_utf8_continuation(s[i])) continue;
        if (seen == cp) return i;
        ++seen;
    }
    return s.size();
}

// Code points [first, first + count)
[[nodiscard]] inline std::string_view utf8_substr(std::string_view s, size_t first, size_t count) {
    const size_t begin = utf8_offset(s, first);
    const size_t end = utf8_offset(s, first + count);
    return s.substr(begin, end - begin);
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
// Logging (thread-safe, stderr, level-tagged)
// ============================================================================

namespace log {

enum class Level { DEBUG, INFO, WARN, ERROR };

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

} // namespace anonymizer::utils

// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

/**
 * @file Log.h
 * @brief Leveled logging for the vault core and its hosts
 *
 * Format strings are checked at compile time through std::format and the
 * caller's file and line are captured with std::source_location at the call
 * site. Lines go to a replaceable sink, which defaults to stderr.
 *
 * @code
 * CertenVault::Log::info("Vault unlocked, {} keys", key_count);
 * CertenVault::Log::warning("Supplied dataForSignature differs for {}", signer_url);
 * @endcode
 *
 * @warning Never pass key material, mnemonics or passwords as arguments
 */

#ifndef CERTENVAULT_LOG_H
#define CERTENVAULT_LOG_H

#include <atomic>
#include <chrono>
#include <concepts>
#include <ctime>
#include <format>
#include <functional>
#include <iostream>
#include <mutex>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace CertenVault::Log {

enum class Level {
    Debug,
    Info,
    Warning,
    Error
};

/// Receives one fully formatted line, without the trailing newline
using Sink = std::function<void(Level, std::string_view)>;

namespace detail {

inline std::atomic<Level>& threshold() {
    static std::atomic<Level> level{Level::Info};
    return level;
}

// Guards both the sink and the write so lines never interleave
inline std::mutex& sink_mutex() {
    static std::mutex mutex;
    return mutex;
}

inline Sink& sink() {
    static Sink current;
    return current;
}

inline constexpr std::string_view tag(Level level) noexcept {
    switch (level) {
        case Level::Debug:   return "DEBUG";
        case Level::Info:    return "INFO ";
        case Level::Warning: return "WARN ";
        case Level::Error:   return "ERROR";
    }
    return "?????";
}

inline constexpr std::string_view basename(std::string_view path) noexcept {
    const auto slash = path.find_last_of('/');
    return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

inline std::string timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&seconds, &tm);
    return std::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}.{:03d}",
        tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
        tm.tm_hour, tm.tm_min, tm.tm_sec, ms.count());
}

/**
 * Format string paired with the location of the call that supplied it.
 *
 * The default argument is evaluated where the logging function is called,
 * not inside this header.
 */
template<typename... Args>
struct LocatedFormat {
    template<typename T>
        requires std::convertible_to<const T&, std::string_view>
    consteval LocatedFormat(const T& text, std::source_location where = std::source_location::current())
        : fmt(text)
        , location(where) {
    }

    std::format_string<Args...> fmt;
    std::source_location location;
};

template<typename... Args>
using FormatAt = LocatedFormat<std::type_identity_t<Args>...>;

inline void write(Level level, std::string_view message, const std::source_location& where) {
    auto line = std::format("[{}] {}: {} ({}:{})",
        timestamp(), tag(level), message, basename(where.file_name()), where.line());

    std::lock_guard lock(sink_mutex());
    if (auto& current = sink(); current) {
        current(level, line);
    } else {
        std::cerr << line << '\n';
    }
}

template<typename... Args>
void emit(Level level, const LocatedFormat<Args...>& format, Args&&... args) {
    if (level < threshold().load(std::memory_order_relaxed)) {
        return;
    }
    write(level, std::format(format.fmt, std::forward<Args>(args)...), format.location);
}

}  // namespace detail

inline void set_level(Level level) noexcept {
    detail::threshold().store(level, std::memory_order_relaxed);
}

[[nodiscard]] inline Level level() noexcept {
    return detail::threshold().load(std::memory_order_relaxed);
}

/**
 * @brief Route log lines somewhere other than stderr
 *
 * Passing an empty function restores the stderr sink. Used by tests to
 * capture output.
 */
inline void set_sink(Sink sink) {
    std::lock_guard lock(detail::sink_mutex());
    detail::sink() = std::move(sink);
}

template<typename... Args>
void debug(detail::FormatAt<Args...> format, Args&&... args) {
    detail::emit<Args...>(Level::Debug, format, std::forward<Args>(args)...);
}

template<typename... Args>
void info(detail::FormatAt<Args...> format, Args&&... args) {
    detail::emit<Args...>(Level::Info, format, std::forward<Args>(args)...);
}

template<typename... Args>
void warning(detail::FormatAt<Args...> format, Args&&... args) {
    detail::emit<Args...>(Level::Warning, format, std::forward<Args>(args)...);
}

template<typename... Args>
void error(detail::FormatAt<Args...> format, Args&&... args) {
    detail::emit<Args...>(Level::Error, format, std::forward<Args>(args)...);
}

}  // namespace CertenVault::Log

#endif  // CERTENVAULT_LOG_H

#pragma once

/**
 * @file logger.hpp
 * @brief Process-wide diagnostic logging for the vault and the signer engine.
 *
 * Messages go to stderr as "[KEYSTR] <LEVEL> <component>: <text>".
 * The threshold starts from the KEYSTR_LOG_LEVEL environment variable
 * (trace, debug, info, warn, error, off) and defaults to warn.
 *
 * Never pass secret keys, shared secrets, passwords or decrypted
 * payloads to these macros. Public keys go through ShortKey().
 */

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <span>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace keystr::debug {

enum class LogLevel : uint8_t {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Off = 5
};

inline LogLevel ParseLogLevel(std::string_view text, LogLevel fallback) noexcept {
    if (text == "trace") return LogLevel::Trace;
    if (text == "debug") return LogLevel::Debug;
    if (text == "info") return LogLevel::Info;
    if (text == "warn") return LogLevel::Warn;
    if (text == "error") return LogLevel::Error;
    if (text == "off") return LogLevel::Off;
    return fallback;
}

inline const char* LevelToString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off: return "OFF";
    }
    return "UNKNOWN";
}

namespace detail {

inline std::atomic<LogLevel>& Threshold() noexcept {
    static std::atomic<LogLevel> threshold{[] {
        const char* env = std::getenv("KEYSTR_LOG_LEVEL");
        return env != nullptr ? ParseLogLevel(env, LogLevel::Warn) : LogLevel::Warn;
    }()};
    return threshold;
}

}

inline void SetLogLevel(LogLevel level) noexcept {
    detail::Threshold().store(level, std::memory_order_relaxed);
}

inline LogLevel GetLogLevel() noexcept {
    return detail::Threshold().load(std::memory_order_relaxed);
}

inline bool IsEnabled(LogLevel level) noexcept {
    return level != LogLevel::Off && level >= GetLogLevel();
}

/// First eight bytes of a public key, hex encoded.
inline std::string ShortKey(std::span<const uint8_t> public_key) {
    std::string out;
    for (size_t i = 0; i < public_key.size() && i < 8; ++i) {
        out += fmt::format("{:02x}", public_key[i]);
    }
    return out;
}

template<typename... Args>
void Log(LogLevel level, std::string_view component, fmt::format_string<Args...> format, Args&&... args) {
    if (!IsEnabled(level)) {
        return;
    }
    const std::string text = fmt::format(format, std::forward<Args>(args)...);
    fprintf(stderr, "[KEYSTR] %s %.*s: %s\n",
        LevelToString(level),
        static_cast<int>(component.size()), component.data(),
        text.c_str());
    fflush(stderr);
}

}

#define KEYSTR_LOG_TRACE(component, ...) \
    ::keystr::debug::Log(::keystr::debug::LogLevel::Trace, component, __VA_ARGS__)
#define KEYSTR_LOG_DEBUG(component, ...) \
    ::keystr::debug::Log(::keystr::debug::LogLevel::Debug, component, __VA_ARGS__)
#define KEYSTR_LOG_INFO(component, ...) \
    ::keystr::debug::Log(::keystr::debug::LogLevel::Info, component, __VA_ARGS__)
#define KEYSTR_LOG_WARN(component, ...) \
    ::keystr::debug::Log(::keystr::debug::LogLevel::Warn, component, __VA_ARGS__)
#define KEYSTR_LOG_ERROR(component, ...) \
    ::keystr::debug::Log(::keystr::debug::LogLevel::Error, component, __VA_ARGS__)

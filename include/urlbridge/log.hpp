/**
 * @file log.hpp
 * @brief Module tagged logging, filtered here and printed by spdlog
 * @version 0.1
 * @date 2026-03-02
 *
 * Every message carries a module name ("Bridge", "Curl", "Client"...).
 * Without URLBRIDGE_USE_LOG all the macros below expand to nothing.
 */
#pragma once

#include <urlbridge/defines.hpp>

#define URLBRIDGE_TRACE_LEVEL URLBRIDGE_LOG_MAKE_LEVEL(Trace)
#define URLBRIDGE_DEBUG_LEVEL URLBRIDGE_LOG_MAKE_LEVEL(Debug)
#define URLBRIDGE_INFO_LEVEL  URLBRIDGE_LOG_MAKE_LEVEL(Info)
#define URLBRIDGE_WARN_LEVEL  URLBRIDGE_LOG_MAKE_LEVEL(Warn)
#define URLBRIDGE_ERROR_LEVEL URLBRIDGE_LOG_MAKE_LEVEL(Error)

#define URLBRIDGE_TRACE(mod, ...) URLBRIDGE_LOG(URLBRIDGE_TRACE_LEVEL, mod, __VA_ARGS__)
#define URLBRIDGE_DEBUG(mod, ...) URLBRIDGE_LOG(URLBRIDGE_DEBUG_LEVEL, mod, __VA_ARGS__)
#define URLBRIDGE_INFO(mod, ...)  URLBRIDGE_LOG(URLBRIDGE_INFO_LEVEL, mod, __VA_ARGS__)
#define URLBRIDGE_WARN(mod, ...)  URLBRIDGE_LOG(URLBRIDGE_WARN_LEVEL, mod, __VA_ARGS__)
#define URLBRIDGE_ERROR(mod, ...) URLBRIDGE_LOG(URLBRIDGE_ERROR_LEVEL, mod, __VA_ARGS__)

#if !defined(URLBRIDGE_USE_LOG)

#define URLBRIDGE_LOG_MAKE_LEVEL(name) 0
#define URLBRIDGE_LOG_SET_LEVEL(level) do { } while (0)
#define URLBRIDGE_LOG_ADD_WHITELIST(mod) do { } while (0)
#define URLBRIDGE_LOG_ADD_BLACKLIST(mod) do { } while (0)
#define URLBRIDGE_LOG(level, mod, ...) do { } while (0)

#else

#include <source_location>
#include <string_view>

URLBRIDGE_NS_BEGIN

namespace logging {

/**
 * @brief Severity, ordered from the most verbose, Off silences everything
 *
 */
enum class LogLevel : int {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Off
};

/**
 * @brief Whether a message of this level from this module passes the filters
 *
 * The level threshold is checked first. A blacklisted module never passes, and once the whitelist
 * is non-empty only the modules on it do. Module names compare case-insensitively.
 */
extern auto URLBRIDGE_API check(LogLevel level, std::string_view mod) -> bool;

/// Hand an already formatted message to the spdlog logger
extern auto URLBRIDGE_API write(LogLevel level, std::string_view mod, std::source_location where, std::string_view content) -> void;

extern auto URLBRIDGE_API setLevel(LogLevel level) -> void;
extern auto URLBRIDGE_API addWhitelist(std::string_view mod) -> void;
extern auto URLBRIDGE_API addBlacklist(std::string_view mod) -> void;

} // namespace logging

URLBRIDGE_NS_END

#define URLBRIDGE_LOG_MAKE_LEVEL(name) ::URLBRIDGE_NAMESPACE::logging::LogLevel::name
#define URLBRIDGE_LOG_SET_LEVEL(level) ::URLBRIDGE_NAMESPACE::logging::setLevel(level)
#define URLBRIDGE_LOG_ADD_WHITELIST(mod) ::URLBRIDGE_NAMESPACE::logging::addWhitelist(mod)
#define URLBRIDGE_LOG_ADD_BLACKLIST(mod) ::URLBRIDGE_NAMESPACE::logging::addBlacklist(mod)

// Arguments are only formatted when the message passes the filters
#define URLBRIDGE_LOG(level, mod, ...)                                                     \
    do {                                                                                   \
        namespace urlbridge_log_ = ::URLBRIDGE_NAMESPACE::logging;                         \
        if (urlbridge_log_::check(level, mod)) {                                           \
            urlbridge_log_::write(level, mod, std::source_location::current(),             \
                                  ::URLBRIDGE_NAMESPACE::fmtlib::format(__VA_ARGS__));     \
        }                                                                                  \
    } while (0)

#endif

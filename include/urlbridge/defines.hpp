/**
 * @file defines.hpp
 * @brief Namespace, symbol export, version and the fmt glue every header relies on
 * @version 0.1
 * @date 2026-03-02
 *
 */
#pragma once

#include <cstdlib>
#include <utility>
#include <version>

#if !defined(URLBRIDGE_NAMESPACE)
    #define URLBRIDGE_NAMESPACE urlbridge
#endif

#define URLBRIDGE_NS_BEGIN namespace URLBRIDGE_NAMESPACE {
#define URLBRIDGE_NS_END }

#define URLBRIDGE_VERSION_MAJOR 0
#define URLBRIDGE_VERSION_MINOR 1
#define URLBRIDGE_VERSION_PATCH 0

#define URLBRIDGE_STRINGIFY_IMPL(x) #x
#define URLBRIDGE_STRINGIFY(x) URLBRIDGE_STRINGIFY_IMPL(x)

/// "0.1.0"
#define URLBRIDGE_VERSION_STRING         \
    URLBRIDGE_STRINGIFY(URLBRIDGE_VERSION_MAJOR) "." \
    URLBRIDGE_STRINGIFY(URLBRIDGE_VERSION_MINOR) "." \
    URLBRIDGE_STRINGIFY(URLBRIDGE_VERSION_PATCH)

// --- Symbols, the library is built with _URLBRIDGE_SOURCE
#if defined(_WIN32)
    #define URLBRIDGE_EXPORT __declspec(dllexport)
    #define URLBRIDGE_IMPORT __declspec(dllimport)
#elif defined(__GNUC__)
    #define URLBRIDGE_EXPORT __attribute__((visibility("default")))
    #define URLBRIDGE_IMPORT
#else
    #define URLBRIDGE_EXPORT
    #define URLBRIDGE_IMPORT
#endif

#if defined(_URLBRIDGE_SOURCE)
    #define URLBRIDGE_API URLBRIDGE_EXPORT
#else
    #define URLBRIDGE_API URLBRIDGE_IMPORT
#endif

#if defined(_MSC_VER)
    #define URLBRIDGE_UNREACHABLE() __assume(0)
#elif defined(__GNUC__)
    #define URLBRIDGE_UNREACHABLE() __builtin_unreachable()
#else
    #define URLBRIDGE_UNREACHABLE() std::abort()
#endif

#if defined(__cpp_exceptions)
    #define URLBRIDGE_THROW(x) throw x
#else
    #define URLBRIDGE_THROW(x) std::abort()
#endif

// --- Formatting goes through fmt
#include <fmt/format.h>
#include <fmt/chrono.h> // Durations in log messages

/**
 * @brief Open a fmt::formatter specialization for a type of this namespace
 *
 * The body only has to provide format(), parse() accepts only "{}".
 */
#define URLBRIDGE_FORMATTER(type)                                  \
    template <>                                                    \
    struct fmt::formatter<URLBRIDGE_NAMESPACE::type> :             \
        URLBRIDGE_NAMESPACE::detail::DefaultFormatter

URLBRIDGE_NS_BEGIN

namespace fmtlib = ::fmt;

namespace detail {

struct DefaultFormatter {
    constexpr auto parse(fmtlib::format_parse_context &ctxt) const noexcept {
        return ctxt.begin();
    }

    // Lets the format() bodies call format_to unqualified
    template <typename Out, typename ...Args>
    static auto format_to(Out &&out, fmtlib::format_string<Args...> fmt, Args &&...args) {
        return fmtlib::format_to(std::forward<Out>(out), fmt, std::forward<Args>(args)...);
    }
};

} // namespace detail

URLBRIDGE_NS_END

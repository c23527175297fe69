/**
 * @file result.hpp
 * @brief Result<T, E> is std::expected, the error side of every fallible call here
 * @version 0.1
 * @date 2026-03-02
 *
 */
#pragma once

#include <urlbridge/defines.hpp>

#if !defined(__cpp_lib_expected) || __cpp_lib_expected < 202202L
    #error "urlbridge needs std::expected (C++23)"
#endif

#include <expected>

URLBRIDGE_NS_BEGIN

template <typename T, typename E>
using Result = std::expected<T, E>;

template <typename E>
using Unexpected = std::unexpected<E>;

URLBRIDGE_NS_END

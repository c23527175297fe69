/**
 * @file functional.hpp
 * @brief Type erased callables for queued work and completion callbacks
 * @version 0.1
 * @date 2026-03-02
 *
 */
#pragma once

#include <urlbridge/defines.hpp>
#include <functional>

URLBRIDGE_NS_BEGIN

namespace detail {

// Work items capture promises and unique_ptrs, so copyability cannot be required.
// Standard libraries without move_only_function get std::function, callers then keep captures copyable.
#if defined(__cpp_lib_move_only_function)
    template <typename Signature>
    using MoveOnlyFunction = std::move_only_function<Signature>;
#else
    template <typename Signature>
    using MoveOnlyFunction = std::function<Signature>;
#endif

} // namespace detail

URLBRIDGE_NS_END

/**
 * @file buffer.hpp
 * @brief Byte views shared by bodies, uploads and responses
 * @version 0.1
 * @date 2026-03-02
 *
 */
#pragma once

#include <urlbridge/defines.hpp>
#include <string_view>
#include <concepts>
#include <cstddef>
#include <span>

URLBRIDGE_NS_BEGIN

/// Read-only bytes, never owning
using Buffer        = std::span<const std::byte>;

/// Writable bytes, never owning (read buffers, upload chunks)
using MutableBuffer = std::span<std::byte>;

/**
 * @brief Anything std::span can deduce from (arrays, string, vector, string_view)
 *
 * @tparam T
 */
template <typename T>
concept IntoSpan = requires(T &t) {
    std::span(t);
};

/**
 * @brief A contiguous container we can grow and then fill in place, used as the output of the codecs
 *
 * @tparam T
 */
template <typename T>
concept MemContainer = IntoSpan<T> && requires(T &t, size_t n) {
    t.resize(n);
    { std::span(t).size_bytes() } -> std::convertible_to<size_t>;
};

inline auto makeBuffer(const void *data, size_t len) noexcept -> Buffer {
    return {static_cast<const std::byte *>(data), len};
}

inline auto makeBuffer(void *data, size_t len) noexcept -> MutableBuffer {
    return {static_cast<std::byte *>(data), len};
}

/**
 * @brief Take the bytes of a container, const containers give a Buffer and mutable ones a MutableBuffer
 *
 * @param container
 */
template <IntoSpan T>
inline auto makeBuffer(T &&container) noexcept {
    auto view = std::span(container);
    return makeBuffer(view.data(), view.size_bytes());
}

/**
 * @brief Look at the bytes as characters, without copying
 *
 * @param bytes
 * @return std::string_view
 */
inline auto viewAsText(Buffer bytes) noexcept -> std::string_view {
    return {reinterpret_cast<const char *>(bytes.data()), bytes.size()};
}

URLBRIDGE_NS_END

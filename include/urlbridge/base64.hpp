/**
 * @file base64.hpp
 * @brief Standard alphabet base64 (RFC 4648), padded, for the text-only C interface
 * @version 0.1
 * @date 2026-03-02
 *
 */
#pragma once

#include <urlbridge/buffer.hpp>
#include <optional>
#include <cstdint>
#include <string>
#include <vector>
#include <array>
#include <span>

URLBRIDGE_NS_BEGIN

namespace base64 {

inline constexpr std::string_view alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

namespace detail {
    inline constexpr uint8_t Invalid = 0xff;

    // char => 6 bit value, '=' is handled apart and maps to Invalid like any other stranger
    inline constexpr auto reverse = []() consteval {
        std::array<uint8_t, 256> table {};
        table.fill(Invalid);
        for (size_t i = 0; i < alphabet.size(); ++i) {
            table[static_cast<unsigned char>(alphabet[i])] = static_cast<uint8_t>(i);
        }
        return table;
    }();
}

inline constexpr auto encodeLength(std::span<const std::byte> data) noexcept -> size_t {
    return (data.size() + 2) / 3 * 4;
}

/**
 * @brief Encode into a caller provided buffer
 *
 * @param in
 * @param out At least encodeLength(in) chars
 * @return size_t The chars written, 0 if out is too small
 */
inline constexpr auto encodeTo(std::span<const std::byte> in, std::span<char> out) noexcept -> size_t {
    if (out.size() < encodeLength(in)) {
        return 0;
    }
    uint32_t acc = 0;
    int bits = 0;
    size_t pos = 0;
    for (auto byte : in) {
        acc = (acc << 8) | std::to_integer<uint32_t>(byte);
        bits += 8;
        while (bits >= 6) {
            bits -= 6;
            out[pos++] = alphabet[(acc >> bits) & 0x3f];
        }
    }
    if (bits > 0) {
        out[pos++] = alphabet[(acc << (6 - bits)) & 0x3f];
    }
    while (pos % 4 != 0) {
        out[pos++] = '=';
    }
    return pos;
}

template <MemContainer T = std::string>
inline auto encode(std::span<const std::byte> in) -> T {
    T text;
    text.resize(encodeLength(in));
    text.resize(encodeTo(in, text));
    return text;
}

inline auto encode(std::string_view in) -> std::string {
    return encode(std::as_bytes(std::span(in)));
}

/**
 * @brief The decoded size announced by the length and the trailing padding
 *
 * @param encoded
 * @return size_t 0 when the length is not a multiple of 4
 */
inline constexpr auto decodeLength(std::string_view encoded) noexcept -> size_t {
    if (encoded.size() % 4 != 0) {
        return 0;
    }
    size_t pad = 0;
    while (pad < 2 && pad < encoded.size() && encoded[encoded.size() - 1 - pad] == '=') {
        ++pad;
    }
    return encoded.size() / 4 * 3 - pad;
}

/**
 * @brief Decode into a caller provided buffer
 *
 * Rejects a length that is not a multiple of 4, more than two '=', '=' anywhere but the tail
 * and any char outside the alphabet.
 *
 * @param in
 * @param out At least decodeLength(in) bytes
 * @return std::optional<size_t> The bytes written, nullopt on malformed input or a short buffer
 */
inline constexpr auto decodeTo(std::string_view in, std::span<std::byte> out) noexcept -> std::optional<size_t> {
    if (in.size() % 4 != 0 || out.size() < decodeLength(in)) {
        return std::nullopt;
    }
    auto payload = in;
    while (!payload.empty() && payload.back() == '=') {
        payload.remove_suffix(1);
    }
    if (in.size() - payload.size() > 2) {
        return std::nullopt;
    }
    uint32_t acc = 0;
    int bits = 0;
    size_t pos = 0;
    for (auto ch : payload) {
        auto value = detail::reverse[static_cast<unsigned char>(ch)];
        if (value == detail::Invalid) {
            return std::nullopt;
        }
        acc = (acc << 6) | value;
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out[pos++] = std::byte((acc >> bits) & 0xff);
        }
    }
    return pos;
}

/**
 * @brief Decode into a new container
 *
 * @tparam T std::vector<std::byte> by default, std::string works as well
 * @param in
 * @return std::optional<T> nullopt on malformed input
 */
template <MemContainer T = std::vector<std::byte> >
inline auto decode(std::string_view in) -> std::optional<T> {
    T bytes;
    bytes.resize(decodeLength(in));
    auto len = decodeTo(in, makeBuffer(bytes));
    if (!len) {
        return std::nullopt;
    }
    bytes.resize(*len);
    return bytes;
}

} // namespace base64

URLBRIDGE_NS_END

/**
 * @file mem.hpp
 * @brief ASCII string helpers for header names, tokens and log modules
 * @version 0.1
 * @date 2026-03-02
 *
 */
#pragma once

#include <urlbridge/defines.hpp>
#include <string_view>
#include <algorithm>
#include <string>

URLBRIDGE_NS_BEGIN

namespace mem {

// Locale independent, header names are ASCII
constexpr auto asciiLower(char ch) noexcept -> char {
    return (ch >= 'A' && ch <= 'Z') ? static_cast<char>(ch - 'A' + 'a') : ch;
}

constexpr auto iequals(std::string_view a, std::string_view b) noexcept -> bool {
    return std::ranges::equal(a, b, {}, asciiLower, asciiLower);
}

/**
 * @brief Drop spaces, tabs, CR and LF from both ends
 *
 * @param text
 * @return std::string_view A view into text, empty when nothing else is left
 */
constexpr auto trim(std::string_view text) noexcept -> std::string_view {
    constexpr std::string_view blank = " \t\r\n";
    auto first = text.find_first_not_of(blank);
    if (first == std::string_view::npos) {
        return {};
    }
    return text.substr(first, text.find_last_not_of(blank) - first + 1);
}

/// Transparent less-than ignoring ASCII case, for maps and sets keyed by header or module names
struct CaseCompare {
    using is_transparent = void;

    constexpr auto operator()(std::string_view a, std::string_view b) const noexcept -> bool {
        return std::ranges::lexicographical_compare(a, b, {}, asciiLower, asciiLower);
    }
};

} // namespace mem

URLBRIDGE_NS_END

// SPDX-License-Identifier: GPL-2.0-only
// Copyright 2025 Jaroslav Rohel, jaroslav.rohel@gmail.com

#ifndef _UNIDECODE_PAGE_HPP_
#define _UNIDECODE_PAGE_HPP_

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

namespace unidecode {

constexpr std::size_t PAGE_SIZE = 256;

// Replacement strings for one page, indexed by the low byte of a code point
using Page = std::array<std::string, PAGE_SIZE>;


// Page number in fixed point with one fractional bit.
// Integer part is the high byte of a code point (`cp >> 8`). The half step is used only by
// the German variant of page 0x00 (page 0.5).
class PageKey {
public:
    constexpr PageKey() = default;

    static constexpr PageKey from_high(std::uint32_t high) noexcept { return PageKey(high << 1); }
    static constexpr PageKey from_high_half(std::uint32_t high) noexcept { return PageKey((high << 1) | 1); }

    constexpr std::uint32_t get_high() const noexcept { return value >> 1; }
    constexpr bool is_half() const noexcept { return (value & 1) != 0; }

    // Raw fixed point value (page number * 2)
    constexpr std::uint32_t get_value() const noexcept { return value; }

    // Resource name of the page: "x" + lowercase hex number with at least 2 digits, the half step
    // is written as hex fraction ".8" ("x00", "x1f6", "x00.8").
    std::string name() const;

    constexpr auto operator<=>(const PageKey &) const = default;

private:
    constexpr explicit PageKey(std::uint32_t value) noexcept : value(value) {}

    std::uint32_t value{0};
};


struct PageKeyHash {
    std::size_t operator()(const PageKey & key) const noexcept { return std::hash<std::uint32_t>{}(key.get_value()); }
};


// Returns page filled with "_"
Page make_placeholder_page();

// Creates page from `entries`. Missing entries are padded with "_", surplus entries are dropped.
// `source_name` is used in log messages only.
Page make_page(std::vector<std::string> entries, std::string_view source_name);

// Reads page entries from the text `input`. One entry per line in low byte order.
// Surrounding whitespace is trimmed. An entry enclosed in double quotes is taken verbatim and
// may contain escape sequences \\ \" \n \r \t \xHH. Unquoted empty lines and lines starting with '#'
// are skipped.
// `source_name` is used in log messages only.
Page parse_page(std::istream & input, std::string_view source_name);

}  // namespace unidecode

#endif

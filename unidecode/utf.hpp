// SPDX-License-Identifier: GPL-2.0-only
// Copyright 2025 Jaroslav Rohel, jaroslav.rohel@gmail.com

#ifndef _UNIDECODE_UTF_HPP_
#define _UNIDECODE_UTF_HPP_

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace unidecode {

constexpr std::uint32_t REPLACEMENT_CODEPOINT = 0xFFFD;

inline bool is_high_surrogate(std::uint32_t cp) { return cp >= 0xD800 && cp <= 0xDBFF; }
inline bool is_low_surrogate(std::uint32_t cp) { return cp >= 0xDC00 && cp <= 0xDFFF; }

inline std::uint32_t combine_surrogates(std::uint32_t high, std::uint32_t low) {
    return (((high - 0xD800) << 10) | (low - 0xDC00)) + 0x10000;
}

/// Decodes one Unicode scalar value from UTF-8 `input` starting at `offset` and advances `offset`
/// past it.
/// Encoded surrogates are accepted: a high surrogate followed by a low surrogate (CESU-8) is combined
/// into one scalar value, an unpaired one is returned as is.
/// Returns {REPLACEMENT_CODEPOINT, false} and advances `offset` by one byte on an invalid lead byte,
/// an invalid continuation byte or a truncated sequence.
std::pair<std::uint32_t, bool> next_utf8_codepoint(std::string_view input, std::size_t & offset);

/// Decodes one Unicode scalar value from UTF-16 `input` starting at `offset` and advances `offset`
/// past it. A surrogate that is not part of a valid pair is returned as its own value.
std::uint32_t next_utf16_codepoint(std::u16string_view input, std::size_t & offset);

/// Appends UTF-8 encoding of `cp` to `output`. Surrogate values are encoded like any other
/// code point (3 bytes).
void append_utf8(std::string & output, std::uint32_t cp);

}  // namespace unidecode

#endif

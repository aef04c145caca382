// SPDX-License-Identifier: GPL-2.0-only
// Copyright 2025 Jaroslav Rohel, jaroslav.rohel@gmail.com

#include "utf.hpp"

namespace unidecode {

namespace {

// Decodes a single UTF-8 sequence without surrogate pairing.
// Returns the code point and the sequence length, or {REPLACEMENT_CODEPOINT, 0} if invalid.
std::pair<std::uint32_t, std::size_t> decode_utf8_sequence(std::string_view input, std::size_t offset) {
    const auto * const bytes = reinterpret_cast<const unsigned char *>(input.data()) + offset;
    const auto available = input.size() - offset;

    std::uint32_t cp;
    std::size_t len;
    if (bytes[0] < 0x80) {
        return {bytes[0], 1};
    }
    if (bytes[0] >= 0xC2 && bytes[0] <= 0xDF) {
        cp = bytes[0] & 0x1F;
        len = 2;
    } else if ((bytes[0] & 0xF0) == 0xE0) {
        cp = bytes[0] & 0x0F;
        len = 3;
    } else if (bytes[0] >= 0xF0 && bytes[0] <= 0xF4) {
        cp = bytes[0] & 0x07;
        len = 4;
    } else {
        return {REPLACEMENT_CODEPOINT, 0};  // continuation byte, overlong 2-byte lead or out of range
    }

    if (available < len) {
        return {REPLACEMENT_CODEPOINT, 0};
    }
    for (std::size_t i = 1; i < len; ++i) {
        if ((bytes[i] & 0xC0) != 0x80) {
            return {REPLACEMENT_CODEPOINT, 0};
        }
        cp = (cp << 6) | (bytes[i] & 0x3F);
    }
    // overlong forms and values above the Unicode range
    if ((len == 3 && cp < 0x800) || (len == 4 && (cp < 0x10000 || cp > 0x10FFFF))) {
        return {REPLACEMENT_CODEPOINT, 0};
    }

    return {cp, len};
}

}  // namespace


std::pair<std::uint32_t, bool> next_utf8_codepoint(std::string_view input, std::size_t & offset) {
    const auto [cp, len] = decode_utf8_sequence(input, offset);
    if (len == 0) {
        ++offset;
        return {REPLACEMENT_CODEPOINT, false};
    }
    offset += len;

    if (is_high_surrogate(cp) && offset < input.size()) {
        const auto [low, low_len] = decode_utf8_sequence(input, offset);
        if (low_len != 0 && is_low_surrogate(low)) {
            offset += low_len;
            return {combine_surrogates(cp, low), true};
        }
    }

    return {cp, true};
}


std::uint32_t next_utf16_codepoint(std::u16string_view input, std::size_t & offset) {
    const std::uint32_t unit = input[offset++];
    if (is_high_surrogate(unit) && offset < input.size()) {
        const std::uint32_t unit2 = input[offset];
        if (is_low_surrogate(unit2)) {
            ++offset;
            return combine_surrogates(unit, unit2);
        }
    }
    return unit;
}


void append_utf8(std::string & output, std::uint32_t cp) {
    if (cp < 0x80) {
        output += static_cast<char>(cp);
    } else if (cp < 0x800) {
        output += static_cast<char>(0xC0 | (cp >> 6));
        output += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        output += static_cast<char>(0xE0 | (cp >> 12));
        output += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        output += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        output += static_cast<char>(0xF0 | (cp >> 18));
        output += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        output += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        output += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

}  // namespace unidecode

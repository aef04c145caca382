// SPDX-License-Identifier: GPL-2.0-only
// Copyright 2025 Jaroslav Rohel, jaroslav.rohel@gmail.com

#include "unicode_to_ascii.hpp"

#include "spacing.hpp"
#include "utf.hpp"
#include "utils.hpp"

#include <utility>

namespace unidecode {

namespace {

constexpr std::uint32_t EM_DASH = 0x2014;

// Options resolved for one call
struct Settings {
    bool german;
    bool smart_spacing;
    bool resolve_markers;
    const std::vector<SkipRange> & skip_ranges;
};


Settings resolve_options(const Options & options) {
    const bool smart_spacing = options.deferred_smart_spacing || options.smart_spacing;
    return {options.german, smart_spacing, smart_spacing && !options.deferred_smart_spacing, options.skip_ranges};
}


// Pages beyond BMP with transliterations. This doesn't cover all emoji, just those defined.
bool is_emoji_page(std::uint32_t high) { return high == 0x1F4 || high == 0x1F6 || high == 0x1F9; }


// Unpaired surrogate halves land here (0xD800 - 0xDFFF). The bands are wider than the surrogate
// area and the whole of them is dropped.
bool is_isolated_surrogate_band(std::uint32_t high) {
    return (high > 0x18 && high < 0x1E) || (high > 0xD7 && high < 0xF9);
}


bool is_skipped(std::uint32_t cp, const std::vector<SkipRange> & skip_ranges) {
    for (const auto & range : skip_ranges) {
        if (range.contains(cp)) {
            return true;
        }
    }
    return false;
}


// Appends substitution of non-ASCII `cp` to `output`.
// `original` is the input encoding of `cp`, it is copied to `output` when `cp` is in a skip range.
void substitute(
    PageCache & cache, std::uint32_t cp, std::string_view original, const Settings & settings, std::string & output) {
    if (is_skipped(cp, settings.skip_ranges)) {
        output += original;
        return;
    }

    const auto high = cp >> 8;
    const auto low = cp & 0xFF;
    const bool emoji = is_emoji_page(high);

    if (is_isolated_surrogate_band(high)) {
        return;
    }
    if (high > 0xFF && !emoji) {
        output += '_';
        return;
    }

    const auto key = high == 0 && settings.german ? PageKey::from_high_half(high) : PageKey::from_high(high);
    const std::string & replacement = cache.get_page(key)[low];

    if (!settings.smart_spacing) {
        output += replacement;
        return;
    }

    if (cp == EM_DASH) {
        output += EM_DASH_MARKED;
    } else if (replacement == "_" || replacement == "[?]" || is_ascii_word(replacement)) {
        output += replacement;
    } else if (emoji) {
        output += BOUNDARY_MARKER;
        output += SPACE_MARKER;
        output += replacement;
        output += SPACE_MARKER;
        output += BOUNDARY_MARKER;
    } else {
        output += BOUNDARY_MARKER;
        output += trim_ascii_space(replacement);
        output += BOUNDARY_MARKER;
    }
}


bool is_hex_digit(char c) { return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F'); }


bool parse_code_point(std::string_view text, std::uint32_t & cp) {
    if (text.starts_with("U+") || text.starts_with("u+")) {
        text.remove_prefix(2);
    }
    if (text.empty() || text.size() > 6) {
        return false;
    }
    std::uint32_t value = 0;
    for (const char c : text) {
        if (!is_hex_digit(c)) {
            return false;
        }
        value = (value << 4) | static_cast<std::uint32_t>(c <= '9' ? c - '0' : (ascii_to_upper(c) - 'A' + 10));
    }
    if (value > 0x10FFFF) {
        return false;
    }
    cp = value;
    return true;
}


template <typename CharT>
std::basic_string<CharT> fold_diaeresis(std::basic_string_view<CharT> input, std::basic_string_view<CharT> diaeresis) {
    std::basic_string<CharT> output;
    output.reserve(input.size());

    for (std::size_t i = 0; i < input.size();) {
        const CharT ch = input[i];
        const bool upper = ch == 'A' || ch == 'O' || ch == 'U';
        const bool lower = ch == 'a' || ch == 'o' || ch == 'u';
        if ((upper || lower) && input.substr(i + 1, diaeresis.size()) == diaeresis) {
            output += ch;
            output += static_cast<CharT>(upper ? 'E' : 'e');
            i += 1 + diaeresis.size();
            continue;
        }
        output += ch;
        ++i;
    }

    return output;
}

}  // namespace


Transliterator::Transliterator(std::shared_ptr<PageCache> cache) : cache(std::move(cache)) {}


std::string Transliterator::transliterate(std::string_view input, const Options & options) const {
    if (input.empty()) {
        return {};
    }

    const auto settings = resolve_options(options);

    std::string folded;
    if (settings.german) {
        folded = fold_german_diaeresis(input);
        input = folded;
    }

    std::string result;
    result.reserve(input.size());

    for (std::size_t i = 0; i < input.size();) {
        const unsigned char c = input[i];
        if (c < 0x80) {
            result += static_cast<char>(c);
            ++i;
            continue;
        }

        const auto start = i;
        const auto [cp, is_ok] = next_utf8_codepoint(input, i);
        if (!is_ok) {
            result += '_';
            continue;
        }
        substitute(*cache, cp, input.substr(start, i - start), settings, result);
    }

    if (settings.resolve_markers) {
        return resolve_spacing(result);
    }
    return result;
}


std::string Transliterator::transliterate(std::u16string_view input, const Options & options) const {
    if (input.empty()) {
        return {};
    }

    const auto settings = resolve_options(options);

    std::u16string folded;
    if (settings.german) {
        folded = fold_german_diaeresis(input);
        input = folded;
    }

    std::string result;
    result.reserve(input.size());

    std::string original;
    for (std::size_t i = 0; i < input.size();) {
        const char16_t unit = input[i];
        if (unit < 0x80) {
            result += static_cast<char>(unit);
            ++i;
            continue;
        }

        const auto cp = next_utf16_codepoint(input, i);
        original.clear();
        append_utf8(original, cp);
        substitute(*cache, cp, original, settings, result);
    }

    if (settings.resolve_markers) {
        return resolve_spacing(result);
    }
    return result;
}


bool parse_skip_range(std::string_view text, SkipRange & range) {
    const auto dash = text.find('-');
    if (dash == std::string_view::npos) {
        return false;
    }
    SkipRange parsed{};
    if (!parse_code_point(text.substr(0, dash), parsed.low) || !parse_code_point(text.substr(dash + 1), parsed.high)) {
        return false;
    }
    if (parsed.low > parsed.high) {
        return false;
    }
    range = parsed;
    return true;
}


std::string fold_german_diaeresis(std::string_view input) {
    return fold_diaeresis(input, std::string_view("\xCC\x88"));
}


std::u16string fold_german_diaeresis(std::u16string_view input) {
    return fold_diaeresis(input, std::u16string_view(u"\u0308"));
}

}  // namespace unidecode

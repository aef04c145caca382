// SPDX-License-Identifier: GPL-2.0-only
// Copyright 2025 Jaroslav Rohel, jaroslav.rohel@gmail.com

#ifndef _UNIDECODE_UNICODE_TO_ASCII_HPP_
#define _UNIDECODE_UNICODE_TO_ASCII_HPP_

#include "page_cache.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace unidecode {

// Inclusive range of code points
struct SkipRange {
    std::uint32_t low;
    std::uint32_t high;

    bool contains(std::uint32_t cp) const noexcept { return low <= cp && cp <= high; }
};


struct Options {
    // Transliterate umlauts the German way ("Ä" -> "AE", "ö" -> "oe")
    bool german{false};

    // Insert spaces between multi-character substitutions and neighbouring words
    bool smart_spacing{false};

    // Implies `smart_spacing`, but the markers are left in the output to be resolved later
    // by `resolve_spacing`
    bool deferred_smart_spacing{false};

    // Code points passed to the output untouched. The first range containing the code point wins.
    std::vector<SkipRange> skip_ranges;
};


// Converts Unicode text to printable ASCII using transliteration pages.
// Never throws because of the text or the pages. Characters without transliteration become "_",
// unpaired surrogates are dropped.
class Transliterator {
public:
    explicit Transliterator(std::shared_ptr<PageCache> cache);

    /// Transliterates UTF-8 `input`.
    std::string transliterate(std::string_view input, const Options & options = {}) const;

    /// Transliterates UTF-16 `input`. Characters kept by skip ranges are written in UTF-8.
    /// An unpaired surrogate kept by a skip range is written as its 3-byte encoding, which is not
    /// valid UTF-8.
    std::string transliterate(std::u16string_view input, const Options & options = {}) const;

private:
    std::shared_ptr<PageCache> cache;
};


// Parses skip range "<LOW>-<HIGH>" of hexadecimal code points, e.g. "00C0-00FF" or "U+00C0-U+00FF".
// Only hex digits are accepted (no sign, "0x" prefix or whitespace), values up to 0x10FFFF, LOW <= HIGH.
// Returns false on invalid input, `range` is not modified in that case.
bool parse_skip_range(std::string_view text, SkipRange & range);


// Replaces A, O, U (both cases) followed by U+0308 (combining diaeresis) with the letter and "E" / "e",
// e.g. "A" U+0308 -> "AE", "o" U+0308 -> "oe".
std::string fold_german_diaeresis(std::string_view input);
std::u16string fold_german_diaeresis(std::u16string_view input);

}  // namespace unidecode

#endif

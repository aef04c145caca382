// SPDX-License-Identifier: GPL-2.0-only
// Copyright 2025 Jaroslav Rohel, jaroslav.rohel@gmail.com

#ifndef _UNIDECODE_SPACING_HPP_
#define _UNIDECODE_SPACING_HPP_

#include <string>
#include <string_view>

namespace unidecode {

// Markers inserted by smart spacing substitution, removed by `resolve_spacing`.
// They are the characters U+0080 and U+0081 in UTF-8, so they cannot be confused with continuation
// bytes of characters copied from the input.
// Output of `resolve_spacing` never contains them (unless the input contained U+0080/U+0081 itself).

// Boundary of a multi-character substitution
inline constexpr std::string_view BOUNDARY_MARKER = "\xC2\x80";

// Boundary already resolved to a single space
inline constexpr std::string_view SPACE_MARKER = "\xC2\x81";

// Em dash substitution, resolved to " - " between two words
inline constexpr std::string_view EM_DASH_MARKED = "\xC2\x80--\xC2\x80";


/// Replaces the markers in `text` by spaces where a substitution touches a word and removes the rest.
/// Text without markers is returned unchanged.
/// Outputs of several deferred transliterations may be concatenated and resolved at once.
std::string resolve_spacing(std::string_view text);

}  // namespace unidecode

#endif

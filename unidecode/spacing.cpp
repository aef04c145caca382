// SPDX-License-Identifier: GPL-2.0-only
// Copyright 2025 Jaroslav Rohel, jaroslav.rohel@gmail.com

#include "spacing.hpp"

#include "utils.hpp"

#include <cstddef>

namespace unidecode {

namespace {

constexpr std::size_t MARKER_LEN = BOUNDARY_MARKER.size();


bool is_boundary_at(std::string_view text, std::size_t pos) { return text.substr(pos, MARKER_LEN) == BOUNDARY_MARKER; }

bool is_space_marker_at(std::string_view text, std::size_t pos) { return text.substr(pos, MARKER_LEN) == SPACE_MARKER; }

bool is_word_at(std::string_view text, std::size_t pos) { return pos < text.size() && is_ascii_word_char(text[pos]); }


// word + em dash + word -> "word - word"
std::string spread_em_dashes(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size();) {
        const auto after_dash = i + 1 + EM_DASH_MARKED.size();
        if (is_word_at(text, i) && text.substr(i + 1, EM_DASH_MARKED.size()) == EM_DASH_MARKED &&
            is_word_at(text, after_dash)) {
            out += text[i];
            out += " - ";
            out += text[after_dash];
            i = after_dash + 1;
            continue;
        }
        out += text[i++];
    }
    return out;
}


// Removes boundary markers not followed by a word character
std::string drop_open_boundaries(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size();) {
        if (is_boundary_at(text, i)) {
            if (is_word_at(text, i + MARKER_LEN)) {
                out += BOUNDARY_MARKER;
            }
            i += MARKER_LEN;
            continue;
        }
        out += text[i++];
    }
    return out;
}


// Two adjacent boundaries or a boundary after a word character become a space marker
std::string mark_spaces(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size();) {
        if (is_boundary_at(text, i) && is_boundary_at(text, i + MARKER_LEN)) {
            out += SPACE_MARKER;
            i += 2 * MARKER_LEN;
            continue;
        }
        if (is_word_at(text, i) && is_boundary_at(text, i + 1)) {
            out += text[i];
            out += SPACE_MARKER;
            i += 1 + MARKER_LEN;
            continue;
        }
        out += text[i++];
    }
    return out;
}


std::string drop_boundaries(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size();) {
        if (is_boundary_at(text, i)) {
            i += MARKER_LEN;
            continue;
        }
        out += text[i++];
    }
    return out;
}


// Removes space markers at the beginning and at the end of the text
std::string_view trim_space_markers(std::string_view text) {
    while (is_space_marker_at(text, 0)) {
        text.remove_prefix(MARKER_LEN);
    }
    while (text.size() >= MARKER_LEN && is_space_marker_at(text, text.size() - MARKER_LEN)) {
        text.remove_suffix(MARKER_LEN);
    }
    return text;
}


// marker + space + marker -> two spaces, keeps the gap that already existed in the input
std::string keep_existing_gaps(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size();) {
        if (is_space_marker_at(text, i) && i + MARKER_LEN < text.size() && text[i + MARKER_LEN] == ' ' &&
            is_space_marker_at(text, i + MARKER_LEN + 1)) {
            out += "  ";
            i += 2 * MARKER_LEN + 1;
            continue;
        }
        out += text[i++];
    }
    return out;
}


// Optional whitespace followed by a run of space markers -> one space
std::string expand_space_markers(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size();) {
        std::size_t run = i;
        if (is_ascii_space(text[run]) && is_space_marker_at(text, run + 1)) {
            ++run;
        }
        if (is_space_marker_at(text, run)) {
            while (is_space_marker_at(text, run)) {
                run += MARKER_LEN;
            }
            out += ' ';
            i = run;
            continue;
        }
        out += text[i++];
    }
    return out;
}

}  // namespace


std::string resolve_spacing(std::string_view text) {
    // The passes must run in this order, each one works on the output of the previous one.
    auto out = spread_em_dashes(text);
    out = drop_open_boundaries(out);
    out = mark_spaces(out);
    out = drop_boundaries(out);
    out = std::string(trim_space_markers(out));
    out = keep_existing_gaps(out);
    return expand_space_markers(out);
}

}  // namespace unidecode

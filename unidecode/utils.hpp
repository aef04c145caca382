// SPDX-License-Identifier: GPL-2.0-only
// Copyright 2025 Jaroslav Rohel, jaroslav.rohel@gmail.com

#ifndef _UNIDECODE_UTILS_HPP_
#define _UNIDECODE_UTILS_HPP_

#include <cstdio>
#include <format>
#include <string>
#include <string_view>

//#define DEBUG

namespace unidecode {

// The C++23 language provides `std::print`.
// This is implementation for C++20.
template <typename... Args>
void print(std::FILE * stream, std::format_string<Args...> fmt, Args &&... args) {
    std::string formatted_string = std::vformat(fmt.get(), std::make_format_args(args...));
    std::fputs(formatted_string.c_str(), stream);
}


#ifdef DEBUG
template <typename... Args>
void dbg_print(std::format_string<Args...> fmt, Args &&... args) {
    std::string formatted_string = std::vformat(fmt.get(), std::make_format_args(args...));
    std::fputs(formatted_string.c_str(), stderr);
}
#else
#define dbg_print(fmt, ...)
#endif


inline char ascii_to_upper(char c) {
    if ((c >= 'a') && (c <= 'z')) {
        c -= 'a' - 'A';
    }
    return c;
}


// Word character in the sense of the regular expression `\w`: [A-Za-z0-9_]
inline bool is_ascii_word_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}


inline bool is_ascii_space(char c) { return c == ' ' || (c >= '\t' && c <= '\r'); }


// Returns true if `text` is not empty and consists of word characters only (`^\w+$`)
inline bool is_ascii_word(std::string_view text) {
    if (text.empty()) {
        return false;
    }
    for (const char c : text) {
        if (!is_ascii_word_char(c)) {
            return false;
        }
    }
    return true;
}


// Removes leading and trailing ASCII whitespace
inline std::string_view trim_ascii_space(std::string_view text) {
    std::size_t start = 0;
    while (start < text.size() && is_ascii_space(text[start])) {
        ++start;
    }
    std::size_t end = text.size();
    while (end > start && is_ascii_space(text[end - 1])) {
        --end;
    }
    return text.substr(start, end - start);
}

}  // namespace unidecode

#endif

// SPDX-License-Identifier: GPL-2.0-only
// Copyright 2025 Jaroslav Rohel, jaroslav.rohel@gmail.com

#include "page.hpp"

#include "logger.hpp"
#include "utils.hpp"

#include <format>
#include <utility>

namespace unidecode {

namespace {

int hex_digit_value(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}


// Converts quoted `token` (without the quotes) to the entry value.
// Returns false on an invalid escape sequence.
bool unescape_token(std::string_view token, std::string & value) {
    value.clear();
    for (std::size_t i = 0; i < token.size(); ++i) {
        const char ch = token[i];
        if (ch != '\\') {
            value += ch;
            continue;
        }
        if (++i >= token.size()) {
            return false;
        }
        switch (token[i]) {
            case '\\':
                value += '\\';
                break;
            case '"':
                value += '"';
                break;
            case 'n':
                value += '\n';
                break;
            case 'r':
                value += '\r';
                break;
            case 't':
                value += '\t';
                break;
            case 'x': {
                if (i + 2 >= token.size()) {
                    return false;
                }
                const int hi = hex_digit_value(token[i + 1]);
                const int lo = hex_digit_value(token[i + 2]);
                if (hi < 0 || lo < 0) {
                    return false;
                }
                value += static_cast<char>((hi << 4) | lo);
                i += 2;
                break;
            }
            default:
                return false;
        }
    }
    return true;
}


bool is_ascii(std::string_view text) {
    for (const char c : text) {
        if (static_cast<unsigned char>(c) > 0x7F) {
            return false;
        }
    }
    return true;
}

}  // namespace


std::string PageKey::name() const {
    return std::format("x{:02x}{}", get_high(), is_half() ? ".8" : "");
}


Page make_placeholder_page() {
    Page page;
    page.fill("_");
    return page;
}


Page make_page(std::vector<std::string> entries, std::string_view source_name) {
    if (entries.size() > PAGE_SIZE) {
        log(LogLevel::WARNING,
            "Page \"{}\" has {} entries, entries above {} are ignored\n",
            source_name,
            entries.size(),
            PAGE_SIZE);
    } else if (entries.size() < PAGE_SIZE) {
        log(LogLevel::DEBUG,
            "Page \"{}\" has only {} entries, padding with \"_\"\n",
            source_name,
            entries.size());
    }

    Page page;
    for (std::size_t i = 0; i < PAGE_SIZE; ++i) {
        page[i] = i < entries.size() ? std::move(entries[i]) : "_";
    }
    return page;
}


Page parse_page(std::istream & input, std::string_view source_name) {
    std::vector<std::string> entries;
    entries.reserve(PAGE_SIZE);

    std::string line;
    std::size_t line_number = 0;

    while (std::getline(input, line)) {
        ++line_number;

        auto token = trim_ascii_space(line);
        if (token.empty() || token[0] == '#') {
            continue;
        }

        std::string value;
        if (token.size() >= 2 && token.front() == '"' && token.back() == '"') {
            if (!unescape_token(token.substr(1, token.size() - 2), value)) {
                log(LogLevel::WARNING,
                    "Invalid escape sequence in page \"{}\" on line {}, using \"_\"\n",
                    source_name,
                    line_number);
                value = "_";
            }
        } else {
            value = token;
        }

        if (!is_ascii(value)) {
            log(LogLevel::WARNING, "Non-ASCII entry in page \"{}\" on line {}\n", source_name, line_number);
        }

        entries.push_back(std::move(value));
    }

    return make_page(std::move(entries), source_name);
}

}  // namespace unidecode

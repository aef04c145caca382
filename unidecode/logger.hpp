// SPDX-License-Identifier: GPL-2.0-only
// Copyright 2025 Jaroslav Rohel, jaroslav.rohel@gmail.com

#ifndef _UNIDECODE_LOGGER_HPP_
#define _UNIDECODE_LOGGER_HPP_

#include <format>
#include <string>
#include <string_view>

namespace unidecode {

enum class LogLevel : int { CRITICAL, ERROR, WARNING, NOTICE, INFO, DEBUG, TRACE };

extern LogLevel global_log_level;

// Converts level name (case insensitive, e.g. "debug") to `level`.
// Returns false if the name is unknown, `level` is not modified in that case.
bool parse_log_level(std::string_view name, LogLevel & level);

namespace detail {

void log(LogLevel level, const std::string & message);

}


template <typename... Args>
void log(LogLevel level, std::format_string<Args...> fmt, Args &&... args) {
    if (level <= global_log_level) {
        auto message = std::vformat(fmt.get(), std::make_format_args(args...));
        detail::log(level, message);
    }
}

}  // namespace unidecode

#endif

// SPDX-License-Identifier: GPL-2.0-only
// Copyright 2025 Jaroslav Rohel, jaroslav.rohel@gmail.com

#include "logger.hpp"

#include "utils.hpp"

#include <array>
#include <chrono>
#include <cstdio>

namespace unidecode {

namespace {

constexpr auto LOG_LEVEL_C_STR =
    std::to_array<const char *>({"CRITICAL", "ERROR", "WARNING", "NOTICE", "INFO", "DEBUG", "TRACE"});

}  // namespace

LogLevel global_log_level = LogLevel::WARNING;


bool parse_log_level(std::string_view name, LogLevel & level) {
    for (std::size_t i = 0; i < LOG_LEVEL_C_STR.size(); ++i) {
        const std::string_view level_name(LOG_LEVEL_C_STR[i]);
        if (level_name.size() != name.size()) {
            continue;
        }
        bool match = true;
        for (std::size_t j = 0; j < name.size(); ++j) {
            if (ascii_to_upper(name[j]) != level_name[j]) {
                match = false;
                break;
            }
        }
        if (match) {
            level = static_cast<LogLevel>(i);
            return true;
        }
    }
    return false;
}


namespace detail {

void log(LogLevel level, const std::string & message) {
    auto now = std::chrono::system_clock::now();
    auto formatted_message = std::format(
        "{:%FT%TZ} {} {}",
        std::chrono::time_point_cast<std::chrono::milliseconds>(now),
        LOG_LEVEL_C_STR[static_cast<int>(level)],
        message);
    std::fputs(formatted_message.c_str(), stderr);
}

}  // namespace detail

}  // namespace unidecode

// SPDX-License-Identifier: GPL-2.0-only
// Copyright 2025 Jaroslav Rohel, jaroslav.rohel@gmail.com

#include "config.hpp"
#include "logger.hpp"
#include "page_cache.hpp"
#include "page_store.hpp"
#include "spacing.hpp"
#include "unicode_to_ascii.hpp"
#include "utils.hpp"

#include <cstdint>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#define PROGRAM_VERSION "1.0.0"

namespace unidecode {

namespace {

void print_help(const char * program_name) {
    print(
        stdout,
        "unidecode {} , Copyright 2025 Jaroslav Rohel <jaroslav.rohel@gmail.com>\n"
        "unidecode comes with ABSOLUTELY NO WARRANTY. This is free software\n"
        "and you are welcome to redistribute it under the terms of the GNU GPL v2.\n\n",
        PROGRAM_VERSION);

    print(stdout, "Usage:\n");
    print(
        stdout,
        "{} [--help] [--tables-dir=<DIR>] [--german] [--smart-spacing] [--deferred-smart-spacing] "
        "[--skip-range=<LOW>-<HIGH> ...] [--log-level=<LEVEL>] [TEXT ...]\n\n",
        program_name);

    print(
        stdout,
        "Transliterates each TEXT argument, or standard input line by line if no TEXT is given.\n\n"
        "Options:\n"
        "  --help                      Display this help\n"
        "  --tables-dir=<DIR>          Directory with transliteration pages, \"{}\" by default\n"
        "  --german                    German transliteration of umlauts (\"AE\", \"oe\", ...)\n"
        "  --smart-spacing             Separate multi-character substitutions from words by spaces\n"
        "  --deferred-smart-spacing    Join all texts by spaces, smart spacing resolved once for the result\n"
        "  --skip-range=<LOW>-<HIGH>   Hexadecimal code point range copied to output untouched, can repeat\n"
        "  --log-level=<LEVEL>         CRITICAL, ERROR, WARNING, NOTICE, INFO, DEBUG, TRACE (WARNING by default)\n",
        UNIDECODE_TABLES_DIR);
}


}  // namespace

}  // namespace unidecode


using namespace unidecode;
int main(int argc, char ** argv) {
    std::filesystem::path tables_dir = UNIDECODE_TABLES_DIR;
    Options options;
    std::vector<std::string_view> texts;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);
        if (arg == "--help") {
            print_help(argv[0]);
            return 0;
        }
        if (arg.starts_with("--tables-dir=")) {
            tables_dir = arg.substr(13);
            continue;
        }
        if (arg == "--german") {
            options.german = true;
            continue;
        }
        if (arg == "--smart-spacing") {
            options.smart_spacing = true;
            continue;
        }
        if (arg == "--deferred-smart-spacing") {
            options.deferred_smart_spacing = true;
            continue;
        }
        if (arg.starts_with("--skip-range=")) {
            SkipRange range{};
            if (!parse_skip_range(arg.substr(13), range)) {
                print(stdout, "Invalid skip range \"{}\". Expected <LOW>-<HIGH> in hexadecimal.\n", arg.substr(13));
                return -1;
            }
            options.skip_ranges.push_back(range);
            continue;
        }
        if (arg.starts_with("--log-level=")) {
            if (!parse_log_level(arg.substr(12), global_log_level)) {
                print(stdout, "Unknown log level \"{}\"\n", arg.substr(12));
                return -1;
            }
            continue;
        }
        if (arg.starts_with("--")) {
            print(stdout, "Unknown argument \"{}\"\n", arg);
            return -1;
        }
        texts.push_back(arg);
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(tables_dir, ec)) {
        log(LogLevel::WARNING,
            "Tables directory \"{}\" not found, all non-ASCII characters will be replaced by \"_\"\n",
            tables_dir.string());
    }

    dbg_print(
        "Options: german={} smart_spacing={} deferred_smart_spacing={} skip_ranges={}\n",
        options.german,
        options.smart_spacing,
        options.deferred_smart_spacing,
        options.skip_ranges.size());

    try {
        auto cache = std::make_shared<PageCache>(std::make_shared<DirectoryPageStore>(tables_dir));
        const Transliterator transliterator(cache);

        // In deferred mode the fragments are joined by spaces and spacing is resolved once
        // for the whole output.
        std::string deferred_output;
        auto process_line = [&](std::string_view line) {
            auto ascii = transliterator.transliterate(line, options);
            if (options.deferred_smart_spacing) {
                if (!deferred_output.empty()) {
                    deferred_output += ' ';
                }
                deferred_output += ascii;
            } else {
                print(stdout, "{}\n", ascii);
            }
        };

        if (texts.empty()) {
            std::string line;
            while (std::getline(std::cin, line)) {
                process_line(line);
            }
        } else {
            for (const auto text : texts) {
                process_line(text);
            }
        }

        if (options.deferred_smart_spacing) {
            print(stdout, "{}\n", resolve_spacing(deferred_output));
        }

        log(LogLevel::INFO, "{} transliteration pages used\n", cache->size());
    } catch (const std::exception & ex) {
        print(stderr, "ERROR: {}\n", ex.what());
        return 1;
    }

    return 0;
}

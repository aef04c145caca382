// SPDX-License-Identifier: GPL-2.0-only
// Copyright 2025 Jaroslav Rohel, jaroslav.rohel@gmail.com

#include "page_store.hpp"

#include "config.hpp"

#include <errno.h>

#include <format>
#include <fstream>
#include <system_error>
#include <utility>

namespace unidecode {

DirectoryPageStore::DirectoryPageStore(std::filesystem::path directory) : directory(std::move(directory)) {}


std::filesystem::path DirectoryPageStore::get_page_path(PageKey key) const {
    return directory / (key.name() + UNIDECODE_PAGE_FILE_EXT);
}


Page DirectoryPageStore::load(PageKey key) {
    const auto path = get_page_path(key);
    std::ifstream file(path);
    if (!file) {
        auto message = std::system_category().message(errno);
        throw PageLoadError(std::format("Unable to open page file \"{}\": {}", path.string(), message), key);
    }

    auto page = parse_page(file, path.string());
    if (file.bad()) {
        throw PageLoadError(std::format("Error reading page file \"{}\"", path.string()), key);
    }
    return page;
}


void MemoryPageStore::add_page(PageKey key, std::vector<std::string> entries) {
    pages.insert_or_assign(key, make_page(std::move(entries), key.name()));
}


Page MemoryPageStore::load(PageKey key) {
    auto it = pages.find(key);
    if (it == pages.end()) {
        throw PageLoadError(std::format("Page \"{}\" is not registered", key.name()), key);
    }
    return it->second;
}

}  // namespace unidecode

// SPDX-License-Identifier: GPL-2.0-only
// Copyright 2025 Jaroslav Rohel, jaroslav.rohel@gmail.com

#ifndef _UNIDECODE_PAGE_STORE_HPP_
#define _UNIDECODE_PAGE_STORE_HPP_

#include "page.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace unidecode {

class PageLoadError : public std::runtime_error {
public:
    PageLoadError(const std::string & msg, PageKey key) : runtime_error(msg), key(key) {}
    PageKey get_key() const noexcept { return key; }

private:
    PageKey key;
};


// Source of transliteration pages
class PageStore {
public:
    virtual ~PageStore() = default;

    /// Loads page `key`. The returned page always has PAGE_SIZE entries.
    /// Throws PageLoadError if the page does not exist or cannot be read.
    virtual Page load(PageKey key) = 0;
};


// Pages stored as text files in one directory, file name is PageKey::name() + UNIDECODE_PAGE_FILE_EXT.
// File format is described at `parse_page`.
class DirectoryPageStore : public PageStore {
public:
    explicit DirectoryPageStore(std::filesystem::path directory);

    const std::filesystem::path & get_directory() const noexcept { return directory; }

    // Returns path of the file with page `key`
    std::filesystem::path get_page_path(PageKey key) const;

    Page load(PageKey key) override;

private:
    std::filesystem::path directory;
};


// Pages registered in memory at load time
class MemoryPageStore : public PageStore {
public:
    // Registers page `key`, replaces a previously registered one.
    // Missing entries are padded with "_".
    void add_page(PageKey key, std::vector<std::string> entries);

    bool has_page(PageKey key) const { return pages.contains(key); }

    Page load(PageKey key) override;

private:
    std::unordered_map<PageKey, Page, PageKeyHash> pages;
};

}  // namespace unidecode

#endif

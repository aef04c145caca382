// SPDX-License-Identifier: GPL-2.0-only
// Copyright 2025 Jaroslav Rohel, jaroslav.rohel@gmail.com

#ifndef _UNIDECODE_PAGE_CACHE_HPP_
#define _UNIDECODE_PAGE_CACHE_HPP_

#include "page.hpp"
#include "page_store.hpp"

#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <unordered_map>

namespace unidecode {

// Lazily loaded pages. Every page is loaded from the store at most once (except for concurrent
// first accesses) and stays in the cache for the lifetime of the cache object.
// Safe for use from multiple threads.
class PageCache {
public:
    explicit PageCache(std::shared_ptr<PageStore> store);

    /// Returns page `key`, loads it from the store on first access.
    /// If the store fails to load the page, a page of "_" is cached and returned instead.
    /// The returned reference is valid for the lifetime of the cache.
    const Page & get_page(PageKey key);

    /// Returns true if page `key` is already cached (loaded or replaced by placeholder page)
    bool contains(PageKey key) const;

    /// Returns the number of cached pages
    std::size_t size() const;

    // PageCache is shared by reference. Make sure no one copies the PageCache by mistake.
    PageCache(const PageCache &) = delete;
    PageCache & operator=(const PageCache &) = delete;

private:
    std::shared_ptr<PageStore> store;
    mutable std::shared_mutex mutex;
    std::unordered_map<PageKey, std::unique_ptr<const Page>, PageKeyHash> pages;
};

}  // namespace unidecode

#endif

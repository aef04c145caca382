// SPDX-License-Identifier: GPL-2.0-only
// Copyright 2025 Jaroslav Rohel, jaroslav.rohel@gmail.com

#include "page_cache.hpp"

#include "logger.hpp"

#include <exception>
#include <mutex>
#include <utility>

namespace unidecode {

PageCache::PageCache(std::shared_ptr<PageStore> store) : store(std::move(store)) {}


const Page & PageCache::get_page(PageKey key) {
    {
        std::shared_lock lock(mutex);
        auto it = pages.find(key);
        if (it != pages.end()) {
            return *it->second;
        }
    }

    // The page is loaded without holding the lock. Concurrent loads of the same page are possible,
    // the first inserted page is kept.
    std::unique_ptr<const Page> page;
    try {
        page = std::make_unique<const Page>(store->load(key));
    } catch (const std::exception & ex) {
        log(LogLevel::NOTICE, "Using placeholder for page \"{}\": {}\n", key.name(), ex.what());
        page = std::make_unique<const Page>(make_placeholder_page());
    } catch (...) {
        log(LogLevel::WARNING, "Using placeholder for page \"{}\": unknown error in page store\n", key.name());
        page = std::make_unique<const Page>(make_placeholder_page());
    }

    std::unique_lock lock(mutex);
    const auto [it, inserted] = pages.try_emplace(key, std::move(page));
    if (inserted) {
        log(LogLevel::DEBUG, "Page \"{}\" cached\n", key.name());
    }
    return *it->second;
}


bool PageCache::contains(PageKey key) const {
    std::shared_lock lock(mutex);
    return pages.contains(key);
}


std::size_t PageCache::size() const {
    std::shared_lock lock(mutex);
    return pages.size();
}

}  // namespace unidecode

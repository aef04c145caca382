// SPDX-License-Identifier: GPL-2.0-only
// Copyright 2025 Jaroslav Rohel, jaroslav.rohel@gmail.com

// =============================================================================
// Page cache tests
// =============================================================================

#include "page_cache.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

using namespace unidecode;

namespace {

// Memory store counting load attempts
class CountingPageStore : public MemoryPageStore {
public:
    Page load(PageKey key) override {
        ++loads;
        return MemoryPageStore::load(key);
    }

    std::atomic<int> loads{0};
};

}  // namespace

class PageCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = std::make_shared<CountingPageStore>();
        store->add_page(PageKey::from_high(0x04), {"A", "B", "V"});
        cache = std::make_unique<PageCache>(store);
    }

    std::shared_ptr<CountingPageStore> store;
    std::unique_ptr<PageCache> cache;
};

TEST_F(PageCacheTest, LoadsPageOnce) {
    const auto key = PageKey::from_high(0x04);
    EXPECT_FALSE(cache->contains(key));

    const auto & page = cache->get_page(key);
    EXPECT_EQ(page[1], "B");
    EXPECT_EQ(page[3], "_");
    EXPECT_TRUE(cache->contains(key));

    const auto & again = cache->get_page(key);
    EXPECT_EQ(&page, &again);
    EXPECT_EQ(store->loads.load(), 1);
    EXPECT_EQ(cache->size(), 1u);
}

// A page the store cannot provide is replaced by "_" and the replacement is cached too
TEST_F(PageCacheTest, MissingPageFallsBackOnce) {
    const auto key = PageKey::from_high(0x03);

    const auto & page = cache->get_page(key);
    EXPECT_EQ(page.size(), PAGE_SIZE);
    for (const auto & entry : page) {
        EXPECT_EQ(entry, "_");
    }

    cache->get_page(key);
    cache->get_page(key);
    EXPECT_EQ(store->loads.load(), 1);
    EXPECT_TRUE(cache->contains(key));
}

TEST_F(PageCacheTest, HalfPageIsSeparateEntry) {
    store->add_page(PageKey::from_high(0), {"x"});
    store->add_page(PageKey::from_high_half(0), {"y"});

    EXPECT_EQ(cache->get_page(PageKey::from_high(0))[0], "x");
    EXPECT_EQ(cache->get_page(PageKey::from_high_half(0))[0], "y");
    EXPECT_EQ(cache->size(), 2u);
}

// All threads must see the same cached page
TEST_F(PageCacheTest, ConcurrentAccess) {
    constexpr int THREADS = 8;
    const auto key = PageKey::from_high(0x04);
    std::vector<const Page *> results(THREADS, nullptr);

    std::vector<std::thread> threads;
    for (int i = 0; i < THREADS; ++i) {
        threads.emplace_back([this, &results, key, i]() { results[i] = &cache->get_page(key); });
    }
    for (auto & thread : threads) {
        thread.join();
    }

    for (const auto * page : results) {
        EXPECT_EQ(page, results[0]);
    }
    EXPECT_EQ((*results[0])[2], "V");
    EXPECT_GE(store->loads.load(), 1);
    EXPECT_EQ(cache->size(), 1u);
}

namespace {

// Store failing with an exception not derived from std::exception
class ThrowingPageStore : public PageStore {
public:
    Page load(PageKey) override { throw 42; }
};

}  // namespace

TEST(PageCacheStoreErrorTest, NonStandardExceptionFallsBack) {
    PageCache cache(std::make_shared<ThrowingPageStore>());
    const auto key = PageKey::from_high(0x05);

    const auto & page = cache.get_page(key);
    EXPECT_EQ(page[0], "_");
    EXPECT_EQ(page[255], "_");
    EXPECT_TRUE(cache.contains(key));
}

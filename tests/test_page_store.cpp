// SPDX-License-Identifier: GPL-2.0-only
// Copyright 2025 Jaroslav Rohel, jaroslav.rohel@gmail.com

// =============================================================================
// Page store tests
// =============================================================================

#include "page_store.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <string>

using namespace unidecode;

class DirectoryPageStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        dir = std::filesystem::temp_directory_path() / ("unidecode_store_" + std::to_string(rd()));
        std::filesystem::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    void write_file(const std::string & name, const std::string & content) {
        std::ofstream file(dir / name);
        file << content;
    }

    std::filesystem::path dir;
};

TEST_F(DirectoryPageStoreTest, PagePaths) {
    DirectoryPageStore store(dir);
    EXPECT_EQ(store.get_directory().string(), dir.string());
    EXPECT_EQ(store.get_page_path(PageKey::from_high(0x20)).string(), (dir / "x20.txt").string());
    EXPECT_EQ(store.get_page_path(PageKey::from_high(0x1F6)).string(), (dir / "x1f6.txt").string());
    EXPECT_EQ(store.get_page_path(PageKey::from_high_half(0)).string(), (dir / "x00.8.txt").string());
}

TEST_F(DirectoryPageStoreTest, LoadsPageFile) {
    write_file("x00.txt", "a\nb\n\" c \"\n");
    write_file("x00.8.txt", "ae\n");

    DirectoryPageStore store(dir);
    const auto page = store.load(PageKey::from_high(0));
    EXPECT_EQ(page[0], "a");
    EXPECT_EQ(page[1], "b");
    EXPECT_EQ(page[2], " c ");
    EXPECT_EQ(page[3], "_");

    const auto german_page = store.load(PageKey::from_high_half(0));
    EXPECT_EQ(german_page[0], "ae");
}

TEST_F(DirectoryPageStoreTest, MissingPageThrows) {
    DirectoryPageStore store(dir);
    const auto key = PageKey::from_high(0x4E);
    try {
        store.load(key);
        FAIL() << "PageLoadError expected";
    } catch (const PageLoadError & ex) {
        EXPECT_EQ(ex.get_key(), key);
        EXPECT_NE(std::string(ex.what()).find("x4e.txt"), std::string::npos);
    }
}

TEST(MemoryPageStoreTest, RegisteredPages) {
    MemoryPageStore store;
    const auto key = PageKey::from_high(0x04);
    EXPECT_FALSE(store.has_page(key));
    EXPECT_THROW(store.load(key), PageLoadError);

    store.add_page(key, {"A", "B"});
    EXPECT_TRUE(store.has_page(key));
    auto page = store.load(key);
    EXPECT_EQ(page[0], "A");
    EXPECT_EQ(page[2], "_");

    store.add_page(key, {"Z"});
    page = store.load(key);
    EXPECT_EQ(page[0], "Z");
    EXPECT_EQ(page[1], "_");
}

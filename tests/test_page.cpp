// SPDX-License-Identifier: GPL-2.0-only
// Copyright 2025 Jaroslav Rohel, jaroslav.rohel@gmail.com

// =============================================================================
// Page key and page file parsing tests
// =============================================================================

#include "page.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

using namespace unidecode;

TEST(PageKeyTest, Names) {
    EXPECT_EQ(PageKey::from_high(0x00).name(), "x00");
    EXPECT_EQ(PageKey::from_high(0x0e).name(), "x0e");
    EXPECT_EQ(PageKey::from_high(0x20).name(), "x20");
    EXPECT_EQ(PageKey::from_high(0x1F6).name(), "x1f6");
    EXPECT_EQ(PageKey::from_high_half(0x00).name(), "x00.8");
}

// German half page is a distinct key next to its integer page
TEST(PageKeyTest, HalfStepIsDistinct) {
    const auto page0 = PageKey::from_high(0);
    const auto page0_half = PageKey::from_high_half(0);
    const auto page1 = PageKey::from_high(1);

    EXPECT_NE(page0, page0_half);
    EXPECT_LT(page0, page0_half);
    EXPECT_LT(page0_half, page1);
    EXPECT_EQ(page0_half.get_high(), 0u);
    EXPECT_TRUE(page0_half.is_half());
    EXPECT_FALSE(page1.is_half());
    EXPECT_EQ(PageKeyHash{}(page0), PageKeyHash{}(PageKey::from_high(0)));
}

TEST(PageTest, PlaceholderPage) {
    const auto page = make_placeholder_page();
    for (const auto & entry : page) {
        EXPECT_EQ(entry, "_");
    }
}

// Short pages are padded with "_", surplus entries dropped
TEST(PageTest, MakePageNormalizesSize) {
    const auto short_page = make_page({"a", "b"}, "test");
    EXPECT_EQ(short_page[0], "a");
    EXPECT_EQ(short_page[1], "b");
    EXPECT_EQ(short_page[2], "_");
    EXPECT_EQ(short_page[255], "_");

    std::vector<std::string> entries(300, "x");
    entries[255] = "last";
    entries[256] = "dropped";
    const auto long_page = make_page(entries, "test");
    EXPECT_EQ(long_page.size(), PAGE_SIZE);
    EXPECT_EQ(long_page[255], "last");
}

TEST(PageTest, ParseEntries) {
    std::istringstream input(
        "# page x00 sample\n"
        "\"\"\n"
        "plain\n"
        "   trimmed  \t\n"
        "\n"
        "\" 1/2 \"\n"
        "\"\\\"q\\\"\"\n"
        "\"#\"\n"
        "\"a\\\\b\"\n"
        "\"\\x41\\t\"\n"
        "[?]\n");

    const auto page = parse_page(input, "sample");
    EXPECT_EQ(page[0], "");
    EXPECT_EQ(page[1], "plain");
    EXPECT_EQ(page[2], "trimmed");
    EXPECT_EQ(page[3], " 1/2 ");
    EXPECT_EQ(page[4], "\"q\"");
    EXPECT_EQ(page[5], "#");
    EXPECT_EQ(page[6], "a\\b");
    EXPECT_EQ(page[7], "A\t");
    EXPECT_EQ(page[8], "[?]");
    EXPECT_EQ(page[9], "_");
}

TEST(PageTest, InvalidEscapeBecomesPlaceholder) {
    std::istringstream input(
        "\"\\q\"\n"
        "\"\\x4\"\n"
        "\"ok\\\"\n"
        "next\n");

    const auto page = parse_page(input, "sample");
    EXPECT_EQ(page[0], "_");
    EXPECT_EQ(page[1], "_");
    EXPECT_EQ(page[2], "_");
    EXPECT_EQ(page[3], "next");
}

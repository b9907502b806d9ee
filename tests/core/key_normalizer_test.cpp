/**
 * @file key_normalizer_test.cpp
 * @brief Unit tests for key normalization
 */

#include <gtest/gtest.h>

#include "core/key_normalizer.hpp"

namespace suffixsort {
namespace {

// "café" precomposed and with a combining acute accent
constexpr std::string_view kCafeComposed = "caf\xC3\xA9";
constexpr std::string_view kCafeDecomposed = "cafe\xCC\x81";

TEST(KeyNormalizerTest, PlainDecode) {
    EXPECT_EQ(normalize_key("Apple", SortConfig{}), U"Apple");
    EXPECT_EQ(normalize_key(kCafeDecomposed, SortConfig{}), U"café");
}

TEST(KeyNormalizerTest, EmptyKey) {
    SortConfig config;
    config.normalize = true;
    config.ignore_case = true;
    EXPECT_TRUE(normalize_key("", config).empty());
}

TEST(KeyNormalizerTest, NfcComposes) {
    SortConfig config;
    config.normalize = true;

    EXPECT_EQ(normalize_key(kCafeDecomposed, config), U"café");
    EXPECT_EQ(normalize_key(kCafeComposed, config), U"café");
}

TEST(KeyNormalizerTest, CaseFolding) {
    SortConfig config;
    config.ignore_case = true;

    EXPECT_EQ(normalize_key("Apple", config), U"apple");
    EXPECT_EQ(normalize_key("\xC3\x84PFEL", config), U"äpfel");  // ÄPFEL
}

TEST(KeyNormalizerTest, FullCaseFoldingExpands) {
    SortConfig config;
    config.ignore_case = true;

    // ß folds to "ss"
    EXPECT_EQ(normalize_key("stra\xC3\x9F" "e", config), U"strasse");
    EXPECT_EQ(normalize_key("STRASSE", config), U"strasse");
}

TEST(KeyNormalizerTest, NormalizeBeforeFold) {
    SortConfig config;
    config.normalize = true;
    config.ignore_case = true;

    // "CAFE" + combining acute composes to "CAFÉ", then folds
    EXPECT_EQ(normalize_key("CAFE\xCC\x81", config), U"café");
}

TEST(KeyNormalizerTest, IllFormedPassesThrough) {
    SortConfig config;
    config.normalize = true;

    std::u32string key = normalize_key("e\xCC\x81\xFF", config);
    EXPECT_EQ(key, (std::u32string{U'e', 0x0301, 0xDCFF}));
}

TEST(KeyNormalizerTest, IllFormedStillFoldsCase) {
    SortConfig config;
    config.ignore_case = true;
    config.normalize = true;

    std::u32string key = normalize_key("AB\xFF", config);
    EXPECT_EQ(key, (std::u32string{U'a', U'b', 0xDCFF}));
}

}  // namespace
}  // namespace suffixsort

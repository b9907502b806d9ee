/**
 * @file sort_driver_test.cpp
 * @brief Unit tests for the sort driver
 */

#include <gtest/gtest.h>

#include <tbb/global_control.h>

#include <string>
#include <vector>

#include "common/config.hpp"
#include "core/key_normalizer.hpp"
#include "core/sort_driver.hpp"
#include "suffixsort/sorter.hpp"

namespace suffixsort {
namespace {

/// Lines whose key is the whole line
std::vector<ProcessedLine> make_lines(const std::vector<std::string>& keys,
                                      const SortConfig& config) {
    std::vector<ProcessedLine> lines;
    for (size_t i = 0; i < keys.size(); ++i) {
        ProcessedLine line;
        line.original = keys[i];
        line.index = i;
        line.key_length = keys[i].size();
        line.word_found = !keys[i].empty();
        line.sort_key = normalize_key(keys[i], config);
        lines.push_back(std::move(line));
    }
    return lines;
}

/// Many lines sharing a handful of keys, enough to take the parallel path
std::vector<std::string> make_duplicate_keys(size_t count) {
    const std::vector<std::string> words = {"rain", "Spain", "plain", "main", "a", "cat", "hat"};
    std::vector<std::string> keys;
    keys.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        keys.push_back(words[(i * 7 + i / 3) % words.size()]);
    }
    return keys;
}

std::vector<size_t> indices_of(const std::vector<ProcessedLine>& lines) {
    std::vector<size_t> out;
    for (const auto& line : lines) {
        out.push_back(line.index);
    }
    return out;
}

void expect_ordered(const std::vector<ProcessedLine>& lines, const SortConfig& config,
                    bool stable) {
    const InverseComparator cmp(config);
    for (size_t i = 1; i < lines.size(); ++i) {
        const auto order = cmp.compare_keys(lines[i - 1].sort_key, lines[i].sort_key);
        ASSERT_TRUE(order <= 0) << "at position " << i;
        if (stable && order == 0) {
            ASSERT_LT(lines[i - 1].index, lines[i].index) << "at position " << i;
        }
    }
}

TEST(SortDriverTest, EmptyAndSingle) {
    std::vector<ProcessedLine> lines;
    sort_lines(lines, SortConfig{});
    EXPECT_TRUE(lines.empty());

    lines = make_lines({"only"}, SortConfig{});
    sort_lines(lines, SortConfig{});
    ASSERT_EQ(lines.size(), 1);
    EXPECT_EQ(lines[0].original, "only");
}

TEST(SortDriverTest, SortsBySuffix) {
    SortConfig config;
    auto lines = make_lines({"zz", "b", "a", "ab", "ba"}, config);
    sort_lines(lines, config);

    std::vector<std::string> sorted;
    for (const auto& line : lines) {
        sorted.push_back(line.original);
    }
    EXPECT_EQ(sorted, (std::vector<std::string>{"a", "ba", "b", "ab", "zz"}));
}

TEST(SortDriverTest, StableKeepsInputOrderOfDuplicates) {
    SortConfig config;
    config.stable = true;
    config.ignore_case = true;
    auto lines = make_lines({"Cat", "dog", "cat", "CAT", "Dog", "bat"}, config);
    sort_lines(lines, config);

    // dog < bat < cat when read backwards
    EXPECT_EQ(indices_of(lines), (std::vector<size_t>{1, 4, 5, 0, 2, 3}));
}

TEST(SortDriverTest, UnstableProducesValidOrder) {
    SortConfig config;
    auto lines = make_lines(make_duplicate_keys(500), config);
    sort_lines(lines, config);
    expect_ordered(lines, config, false);
}

TEST(SortDriverTest, ParallelStable) {
    SortConfig config;
    config.stable = true;
    auto lines = make_lines(make_duplicate_keys(config::kParallelThreshold * 4), config);
    sort_lines(lines, config);

    ASSERT_EQ(lines.size(), config::kParallelThreshold * 4);
    expect_ordered(lines, config, true);
}

TEST(SortDriverTest, ParallelUnstable) {
    SortConfig config;
    config.reverse = true;
    auto lines = make_lines(make_duplicate_keys(config::kParallelThreshold * 4), config);
    sort_lines(lines, config);
    expect_ordered(lines, config, false);
}

TEST(SortDriverTest, StableResultIndependentOfThreadCount) {
    SortConfig config;
    config.stable = true;
    const auto keys = make_duplicate_keys(config::kParallelThreshold * 3);

    auto parallel = make_lines(keys, config);
    sort_lines(parallel, config);

    auto single = make_lines(keys, config);
    {
        tbb::global_control limit(tbb::global_control::max_allowed_parallelism, 1);
        sort_lines(single, config);
    }

    EXPECT_EQ(indices_of(parallel), indices_of(single));
}

}  // namespace
}  // namespace suffixsort

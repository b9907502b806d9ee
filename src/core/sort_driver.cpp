/**
 * @file sort_driver.cpp
 * @brief Sort driver implementation
 */

#include "core/sort_driver.hpp"

#include <algorithm>
#include <execution>
#include <utility>

#include "common/config.hpp"
#include "common/logger.hpp"
#include "suffixsort/sorter.hpp"

namespace suffixsort {

namespace {

template <typename Policy, typename Compare>
void run_sort(Policy&& policy, std::vector<ProcessedLine>& lines, bool stable, Compare comp) {
    if (stable) {
        std::stable_sort(std::forward<Policy>(policy), lines.begin(), lines.end(), comp);
    } else {
        std::sort(std::forward<Policy>(policy), lines.begin(), lines.end(), comp);
    }
}

}  // namespace

void sort_lines(std::vector<ProcessedLine>& lines, const SortConfig& config) {
    if (lines.size() < 2) {
        return;
    }

    const InverseComparator comparator(config);
    auto comp = [&comparator](const ProcessedLine& a, const ProcessedLine& b) {
        return comparator.compare_keys(a.sort_key, b.sort_key) < 0;
    };

    const bool parallel = lines.size() >= config::kParallelThreshold;
    LOG_DEBUG("Sorting {} lines ({}, {})", lines.size(), parallel ? "parallel" : "sequential",
              config.stable ? "stable" : "unstable");

    if (parallel) {
        run_sort(std::execution::par, lines, config.stable, comp);
    } else {
        run_sort(std::execution::seq, lines, config.stable, comp);
    }
}

}  // namespace suffixsort

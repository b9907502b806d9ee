#pragma once

/**
 * @file sort_driver.hpp
 * @brief Orders processed lines with the inverse comparator
 *
 * Design Goals:
 * 1. std::sort for the default (unstable) path
 * 2. std::stable_sort when equal keys must keep input order
 * 3. Parallel execution policy for large inputs; the parallel
 *    stable_sort is a merge sort and keeps its stability guarantee
 */

#include <vector>

#include "suffixsort/processed_line.hpp"
#include "suffixsort/sort_config.hpp"

namespace suffixsort {

/**
 * @brief Sort lines in place by their comparison keys
 *
 * With `stable` unset the relative order of equal keys is unspecified.
 */
void sort_lines(std::vector<ProcessedLine>& lines, const SortConfig& config);

}  // namespace suffixsort

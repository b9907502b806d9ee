#pragma once

/**
 * @file output_projector.hpp
 * @brief Right alignment support for the output projection
 *
 * project_line and project_lines themselves are declared in the public
 * sorter.hpp.
 */

#include <vector>

#include "suffixsort/processed_line.hpp"
#include "suffixsort/sort_config.hpp"

namespace suffixsort {

/**
 * @brief Compute the alignment target over all lines of an output set
 *
 * With word_only (and not use_entire_line) keys are printed alone and
 * aligned on their widths. Otherwise whole lines are printed and aligned
 * on the column at which their key ends. Lines without a word do not
 * contribute.
 */
[[nodiscard]] PaddingInfo compute_padding_info(const std::vector<ProcessedLine>& lines,
                                               const SortConfig& config) noexcept;

}  // namespace suffixsort

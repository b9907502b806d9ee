#pragma once

/**
 * @file sorter.hpp
 * @brief Inverse lexicographic sorting pipeline
 */

#include <compare>
#include <string>
#include <string_view>
#include <vector>

#include "suffixsort/processed_line.hpp"
#include "suffixsort/sort_config.hpp"

namespace suffixsort {

/**
 * @brief Compares strings from their last character towards their first
 *
 * Keys are compared code point by code point starting at the end. The
 * first mismatch decides; if one key runs out first it sorts before the
 * other. With `reverse` set the result is inverted. The comparator
 * captures only a copy of the configuration and is safe to share between
 * threads.
 *
 * Example usage:
 * @code
 * suffixsort::SortConfig config;
 * config.ignore_case = true;
 * auto cmp = suffixsort::make_comparator(config);
 * std::sort(words.begin(), words.end(), [&](const auto& a, const auto& b) {
 *     return cmp(a, b) < 0;
 * });
 * @endcode
 */
class InverseComparator {
public:
    explicit InverseComparator(const SortConfig& config) noexcept : config_(config) {}

    /**
     * @brief Compare two UTF-8 strings
     *
     * Both strings are normalized and case folded according to the
     * configuration before comparison.
     */
    [[nodiscard]] std::strong_ordering operator()(std::string_view a, std::string_view b) const;

    /**
     * @brief Compare two keys already in comparison form
     * @see ProcessedLine::sort_key
     */
    [[nodiscard]] std::strong_ordering compare_keys(std::u32string_view a,
                                                    std::u32string_view b) const noexcept;

    /// Strict weak ordering adapter for standard algorithms
    [[nodiscard]] bool less(std::string_view a, std::string_view b) const {
        return (*this)(a, b) < 0;
    }

    [[nodiscard]] const SortConfig& config() const noexcept { return config_; }

private:
    SortConfig config_;
};

/**
 * @brief Create a standalone comparator for caller-driven sorting
 */
[[nodiscard]] InverseComparator make_comparator(const SortConfig& config) noexcept;

/**
 * @brief Extract keys from, filter and sort a set of lines
 * @param config Sorting options
 * @param lines Raw input lines (without terminators)
 * @return Ordered lines plus padding information when right_align is set
 */
[[nodiscard]] SortResult process_lines(const SortConfig& config, std::vector<std::string> lines);

/**
 * @brief Render one ordered line for output
 * @param padding Padding from the same SortResult, if any
 */
[[nodiscard]] std::string project_line(const ProcessedLine& line, const SortConfig& config,
                                       const std::optional<PaddingInfo>& padding);

/**
 * @brief Render every line of a result, in order
 */
[[nodiscard]] std::vector<std::string> project_lines(const SortResult& result,
                                                     const SortConfig& config);

}  // namespace suffixsort

#pragma once

/**
 * @file key_extractor.hpp
 * @brief Derives the sort key of a line
 *
 * Word rules:
 * - use_entire_line: the key is the full line
 * - dictionary_order: the first run of alphabetic characters
 * - default: the first whitespace-delimited token
 */

#include <cstddef>
#include <string_view>

#include "suffixsort/sort_config.hpp"

namespace suffixsort {

/**
 * @brief Location of a key inside its line
 */
struct ExtractedKey {
    size_t offset = 0;   ///< Byte offset in the line
    size_t length = 0;   ///< Length in bytes
    size_t column = 0;   ///< Starting column in code points
    size_t width = 0;    ///< Width in code points
    bool word_found = false;

    [[nodiscard]] std::string_view view(std::string_view line) const noexcept {
        return line.substr(offset, length);
    }
};

/**
 * @brief Extract the sort key of `line`
 *
 * Pure function of its arguments. When no word exists the key is empty
 * and `word_found` is false.
 */
[[nodiscard]] ExtractedKey extract_key(std::string_view line, const SortConfig& config) noexcept;

}  // namespace suffixsort

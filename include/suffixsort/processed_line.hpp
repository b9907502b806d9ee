#pragma once

/**
 * @file processed_line.hpp
 * @brief Per-line results of the sorting pipeline
 */

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace suffixsort {

/**
 * @brief One input line together with its extracted sort key
 *
 * The key is stored as a byte range into `original`, so it can never
 * refer to a different line. `sort_key` is the normalized, possibly
 * case-folded form used only for comparison.
 */
struct ProcessedLine {
    /// Input line, unchanged
    std::string original;

    /// Comparison form of the key (code points)
    std::u32string sort_key;

    /// Position of the line in the input
    size_t index = 0;

    /// Byte offset of the key in `original`
    size_t key_offset = 0;

    /// Key length in bytes
    size_t key_length = 0;

    /// Code point column at which the key starts
    size_t key_column = 0;

    /// Key width in code points
    size_t key_width = 0;

    /// False when no word could be found under the active word rule
    bool word_found = false;

    /// The key as it appears in the original line
    [[nodiscard]] std::string_view key() const noexcept {
        return std::string_view(original).substr(key_offset, key_length);
    }

    /// Column just past the key's last code point
    [[nodiscard]] size_t key_end_column() const noexcept {
        return key_column + key_width;
    }
};

/**
 * @brief Alignment data computed once over the whole output set
 */
struct PaddingInfo {
    /// Widest key width, or rightmost key end column
    size_t max_width = 0;

    /// Align on key end columns in the original line rather than on key widths
    bool use_end_column = false;
};

/**
 * @brief Ordered output of the pipeline
 */
struct SortResult {
    std::vector<ProcessedLine> lines;

    /// Present only when right alignment was requested
    std::optional<PaddingInfo> padding;
};

}  // namespace suffixsort

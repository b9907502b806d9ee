#pragma once

/**
 * @file sort_config.hpp
 * @brief Options controlling key extraction, comparison and output
 */

namespace suffixsort {

/**
 * @brief Configuration for one sorting run
 *
 * A flat set of independent flags. Every combination is valid; flags that
 * have no meaning in combination with others are silently ignored
 * (e.g. dictionary_order and word_only do nothing with use_entire_line).
 *
 * Example usage:
 * @code
 * suffixsort::SortConfig config;
 * config.ignore_case = true;
 * config.stable = true;
 * auto result = suffixsort::process_lines(config, std::move(lines));
 * @endcode
 */
struct SortConfig {
    /// Compare keys after full Unicode case folding
    bool ignore_case = false;

    /// Use the whole line as the sort key instead of its first word
    bool use_entire_line = false;

    /// A word is the first run of alphabetic characters (default: first
    /// whitespace-delimited token)
    bool dictionary_order = false;

    /// Invert the comparison result
    bool reverse = false;

    /// Keep equal keys in input order
    bool stable = false;

    /// Pad output so that keys end in the same column. Whole lines are
    /// aligned on the column where their key ends (not on key width, so
    /// leading whitespace or punctuation is accounted for); with word_only
    /// the keys alone are aligned on their widths. Lines without a word are
    /// left unpadded.
    bool right_align = false;

    /// Drop lines in which no word was found
    bool exclude_no_word = false;

    /// Emit only the key instead of the whole line
    bool word_only = false;

    /// Compare keys in Unicode canonical composition (NFC)
    bool normalize = false;
};

}  // namespace suffixsort

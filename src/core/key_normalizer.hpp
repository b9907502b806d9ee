#pragma once

/**
 * @file key_normalizer.hpp
 * @brief Converts an extracted key into its comparison form
 */

#include <string>
#include <string_view>

#include "suffixsort/sort_config.hpp"

namespace suffixsort {

/**
 * @brief Produce the code point sequence a key is compared by
 *
 * Applies NFC when `normalize` is set, then full case folding when
 * `ignore_case` is set. Keys containing ill-formed UTF-8 skip NFC and are
 * folded one code point at a time. The displayed key is never changed.
 */
[[nodiscard]] std::u32string normalize_key(std::string_view key, const SortConfig& config);

}  // namespace suffixsort

/**
 * @file inverse_comparator.cpp
 * @brief Back-to-front key comparison
 *
 * Keys are walked from their last code point towards their first. The
 * first differing pair decides by code point value. When one key is
 * exhausted first it is the shorter suffix and sorts first, so "a"
 * precedes "aa" and "ba". The result is a total order over code point
 * sequences, which parallel and merge based sorts rely on.
 */

#include <algorithm>

#include "core/key_normalizer.hpp"
#include "suffixsort/sorter.hpp"

namespace suffixsort {

std::strong_ordering InverseComparator::operator()(std::string_view a, std::string_view b) const {
    return compare_keys(normalize_key(a, config_), normalize_key(b, config_));
}

std::strong_ordering InverseComparator::compare_keys(std::u32string_view a,
                                                     std::u32string_view b) const noexcept {
    std::strong_ordering ordering = std::strong_ordering::equal;

    auto a_it = a.rbegin();
    auto b_it = b.rbegin();
    for (; a_it != a.rend() && b_it != b.rend(); ++a_it, ++b_it) {
        if (*a_it != *b_it) {
            ordering = *a_it <=> *b_it;
            break;
        }
    }

    if (ordering == 0) {
        ordering = a.size() <=> b.size();
    }

    if (config_.reverse) {
        return 0 <=> ordering;
    }
    return ordering;
}

InverseComparator make_comparator(const SortConfig& config) noexcept {
    return InverseComparator(config);
}

}  // namespace suffixsort

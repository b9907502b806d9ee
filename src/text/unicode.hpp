#pragma once

/**
 * @file unicode.hpp
 * @brief UTF-8 decoding and character classes
 *
 * Lines are treated as UTF-8. Bytes that do not form a valid sequence are
 * decoded one at a time to placeholder code points in U+DC80..U+DCFF,
 * which valid UTF-8 can never produce. Decoding is therefore total and
 * distinct byte strings stay distinct after decoding.
 */

#include <cstddef>
#include <string>
#include <string_view>

namespace suffixsort {

/**
 * @brief Result of decoding a byte string
 */
struct DecodedText {
    std::u32string code_points;
    bool well_formed = true;
};

/**
 * @brief Decode one code point starting at byte offset `pos`
 * @param text UTF-8 text; `pos` must be less than `text.size()`
 * @param pos Advanced past the decoded bytes
 */
char32_t next_code_point(std::string_view text, size_t& pos) noexcept;

/**
 * @brief Decode a whole string
 */
[[nodiscard]] DecodedText decode_utf8(std::string_view text);

/**
 * @brief Number of code points (placeholders included) in `text`
 */
[[nodiscard]] size_t code_point_count(std::string_view text) noexcept;

/// True for placeholders standing in for ill-formed bytes
[[nodiscard]] constexpr bool is_ill_formed_placeholder(char32_t c) noexcept {
    return c >= 0xDC80 && c <= 0xDCFF;
}

/// Unicode Alphabetic property
[[nodiscard]] bool is_alphabetic(char32_t c) noexcept;

/// Unicode White_Space property
[[nodiscard]] bool is_whitespace(char32_t c) noexcept;

}  // namespace suffixsort

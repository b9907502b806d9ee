/**
 * @file unicode.cpp
 * @brief UTF-8 decoding on top of ICU's code point macros and properties
 */

#include "text/unicode.hpp"

#include <unicode/uchar.h>
#include <unicode/utf8.h>

#include <cstdint>

#include "common/config.hpp"

namespace suffixsort {

char32_t next_code_point(std::string_view text, size_t& pos) noexcept {
    const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());
    const auto length = static_cast<int64_t>(text.size());
    auto i = static_cast<int64_t>(pos);

    UChar32 c;
    U8_NEXT(bytes, i, length, c);

    if (c < 0) {
        // Consume only the lead byte; any trailing bytes decode on their own
        const char32_t placeholder = config::kIllFormedByteBase | bytes[pos];
        ++pos;
        return placeholder;
    }

    pos = static_cast<size_t>(i);
    return static_cast<char32_t>(c);
}

DecodedText decode_utf8(std::string_view text) {
    DecodedText decoded;
    decoded.code_points.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        const char32_t c = next_code_point(text, pos);
        if (is_ill_formed_placeholder(c)) {
            decoded.well_formed = false;
        }
        decoded.code_points.push_back(c);
    }

    return decoded;
}

size_t code_point_count(std::string_view text) noexcept {
    size_t count = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        next_code_point(text, pos);
        ++count;
    }
    return count;
}

bool is_alphabetic(char32_t c) noexcept {
    return !is_ill_formed_placeholder(c) && u_isUAlphabetic(static_cast<UChar32>(c));
}

bool is_whitespace(char32_t c) noexcept {
    return !is_ill_formed_placeholder(c) && u_isUWhiteSpace(static_cast<UChar32>(c));
}

}  // namespace suffixsort

/**
 * @file key_extractor.cpp
 * @brief Key extraction implementation
 */

#include "core/key_extractor.hpp"

#include "text/unicode.hpp"

namespace suffixsort {

namespace {

bool is_word_char(char32_t c, bool dictionary_order) noexcept {
    return dictionary_order ? is_alphabetic(c) : !is_whitespace(c);
}

}  // namespace

ExtractedKey extract_key(std::string_view line, const SortConfig& config) noexcept {
    ExtractedKey key;

    if (config.use_entire_line) {
        key.length = line.size();
        key.width = code_point_count(line);
        key.word_found = !line.empty();
        return key;
    }

    size_t pos = 0;
    size_t column = 0;

    // Skip to the first word character
    while (pos < line.size()) {
        size_t next = pos;
        if (is_word_char(next_code_point(line, next), config.dictionary_order)) {
            break;
        }
        pos = next;
        ++column;
    }

    if (pos == line.size()) {
        return key;
    }

    key.offset = pos;
    key.column = column;
    key.word_found = true;

    // Extend the run
    while (pos < line.size()) {
        size_t next = pos;
        if (!is_word_char(next_code_point(line, next), config.dictionary_order)) {
            break;
        }
        pos = next;
        ++key.width;
    }

    key.length = pos - key.offset;
    return key;
}

}  // namespace suffixsort

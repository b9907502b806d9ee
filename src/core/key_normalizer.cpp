/**
 * @file key_normalizer.cpp
 * @brief Key normalization using ICU
 */

#include "core/key_normalizer.hpp"

#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf16.h>

#include "common/logger.hpp"
#include "text/unicode.hpp"

namespace suffixsort {

namespace {

icu::UnicodeString to_unicode_string(const std::u32string& code_points) {
    icu::UnicodeString text;
    for (const char32_t c : code_points) {
        text.append(static_cast<UChar32>(c));
    }
    return text;
}

std::u32string to_code_points(const icu::UnicodeString& text) {
    std::u32string out;
    out.reserve(static_cast<size_t>(text.length()));
    for (int32_t i = 0; i < text.length();) {
        const UChar32 c = text.char32At(i);
        out.push_back(static_cast<char32_t>(c));
        i += U16_LENGTH(c);
    }
    return out;
}

/// NFC, leaving the text untouched if ICU cannot provide or apply it
icu::UnicodeString compose(const icu::UnicodeString& text) {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* nfc = icu::Normalizer2::getNFCInstance(status);
    if (U_FAILURE(status)) {
        LOG_WARN("NFC normalizer unavailable: {}", u_errorName(status));
        return text;
    }

    icu::UnicodeString composed = nfc->normalize(text, status);
    if (U_FAILURE(status)) {
        LOG_DEBUG("NFC normalization failed ({}), comparing key as is", u_errorName(status));
        return text;
    }
    return composed;
}

}  // namespace

std::u32string normalize_key(std::string_view key, const SortConfig& config) {
    DecodedText decoded = decode_utf8(key);

    if (!config.normalize && !config.ignore_case) {
        return std::move(decoded.code_points);
    }

    if (!decoded.well_formed) {
        if (config.normalize) {
            LOG_DEBUG("Key contains ill-formed UTF-8, skipping NFC");
        }
        if (config.ignore_case) {
            for (auto& c : decoded.code_points) {
                c = static_cast<char32_t>(u_foldCase(static_cast<UChar32>(c), U_FOLD_CASE_DEFAULT));
            }
        }
        return std::move(decoded.code_points);
    }

    icu::UnicodeString text = to_unicode_string(decoded.code_points);
    if (config.normalize) {
        text = compose(text);
    }
    if (config.ignore_case) {
        text.foldCase(U_FOLD_CASE_DEFAULT);
    }
    return to_code_points(text);
}

}  // namespace suffixsort

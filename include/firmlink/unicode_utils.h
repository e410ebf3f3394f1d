#pragma once

#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf16.h>
#include <unicode/utf8.h>
#include <unicode/utypes.h>
#include <string>

namespace firmlink {
namespace unicode {

/**
 * Convert std::string (assumed UTF-8) to ICU UnicodeString
 * Invalid sequences become U+FFFD
 */
inline icu::UnicodeString to_unicode_string(const std::string& utf8_str) {
    return icu::UnicodeString::fromUTF8(icu::StringPiece(utf8_str.c_str(), static_cast<int32_t>(utf8_str.length())));
}

/**
 * Convert ICU UnicodeString to std::string (UTF-8)
 */
inline std::string from_unicode_string(const icu::UnicodeString& ustr) {
    std::string result;
    ustr.toUTF8String(result);
    return result;
}

/**
 * Count Unicode characters (code points) in a UTF-8 string
 */
inline size_t char_count(const std::string& utf8_str) {
    if (utf8_str.empty()) {
        return 0;
    }
    return static_cast<size_t>(to_unicode_string(utf8_str).countChar32());
}

/**
 * Canonically decompose and drop non-spacing marks ("Nestlé" -> "Nestle").
 * Returns the input unchanged if ICU cannot provide the NFD instance.
 */
inline icu::UnicodeString strip_marks(const icu::UnicodeString& input) {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* nfd = icu::Normalizer2::getNFDInstance(status);
    if (U_FAILURE(status) || nfd == nullptr) {
        return input;
    }
    icu::UnicodeString decomposed = nfd->normalize(input, status);
    if (U_FAILURE(status)) {
        return input;
    }
    icu::UnicodeString result;
    for (int32_t i = 0; i < decomposed.length();) {
        UChar32 c = decomposed.char32At(i);
        if (u_charType(c) != U_NON_SPACING_MARK) {
            result.append(c);
        }
        i += U16_LENGTH(c);
    }
    return result;
}

inline bool is_alnum(UChar32 c) {
    return u_isalnum(c) != 0;
}

/**
 * Hyphen-like characters: ASCII hyphen-minus, U+2010 hyphen, U+2011 non-breaking hyphen
 */
inline bool is_hyphen(UChar32 c) {
    return c == 0x2D || c == 0x2010 || c == 0x2011;
}

/**
 * Characters deleted outright from names: periods and apostrophes
 */
inline bool is_elided(UChar32 c) {
    return c == 0x2E || c == 0x27 || c == 0x2019 || c == 0x02BC || c == 0x60 || c == 0xB4;
}

/**
 * True when every byte sequence is well-formed UTF-8
 */
inline bool is_valid_utf8(const std::string& str) {
    const char* s = str.data();
    int32_t length = static_cast<int32_t>(str.size());
    for (int32_t i = 0; i < length;) {
        UChar32 c;
        U8_NEXT(s, i, length, c);
        if (c < 0) {
            return false;
        }
    }
    return true;
}

/**
 * Sanitize a string to ensure it's valid UTF-8
 * Replaces invalid sequences with replacement character (U+FFFD)
 */
inline std::string sanitize_utf8(const std::string& str) {
    if (str.empty()) {
        return str;
    }
    return from_unicode_string(to_unicode_string(str));
}

}  // namespace unicode
}  // namespace firmlink

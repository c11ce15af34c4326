#pragma once

#include <string>
#include <string_view>
#include <unicode/unistr.h>
#include <unicode/uchar.h>
#include <unicode/utf8.h>

namespace rdu::util {

/// Make raw filename bytes safe to display.
/// Linux names are arbitrary bytes; ill-formed UTF-8 sequences become U+FFFD.
inline std::string to_display_string(std::string_view raw) {
    if (raw.empty()) {
        return std::string();
    }

    icu::UnicodeString text = icu::UnicodeString::fromUTF8(
        icu::StringPiece(raw.data(), static_cast<int32_t>(raw.size())));

    std::string result;
    text.toUTF8String(result);
    return result;
}

/// Terminal columns occupied by one code point.
/// Combining marks and other zero-width characters take 0 columns,
/// East Asian wide and fullwidth characters take 2.
inline int codepoint_width(UChar32 c) {
    if (c == 0) return 0;
    if (c < 0x20 || (c >= 0x7F && c < 0xA0)) return 0;

    int8_t category = static_cast<int8_t>(u_charType(c));
    if (category == U_NON_SPACING_MARK || category == U_ENCLOSING_MARK ||
        category == U_FORMAT_CHAR) {
        return 0;
    }

    int eaw = u_getIntPropertyValue(c, UCHAR_EAST_ASIAN_WIDTH);
    if (eaw == U_EA_WIDE || eaw == U_EA_FULLWIDTH) {
        return 2;
    }
    return 1;
}

/// Decode the code point at byte offset i and advance i past it.
/// Malformed bytes decode to a negative value and advance by one byte.
inline UChar32 next_codepoint(std::string_view s, size_t& i) {
    int32_t offset = static_cast<int32_t>(i);
    UChar32 c = 0;
    U8_NEXT(reinterpret_cast<const uint8_t*>(s.data()), offset, static_cast<int32_t>(s.size()), c);
    i = static_cast<size_t>(offset);
    return c;
}

/// Terminal columns occupied by a UTF-8 string (no escape sequences).
inline int display_width(std::string_view s) {
    int cols = 0;
    size_t i = 0;
    while (i < s.size()) {
        UChar32 c = next_codepoint(s, i);
        cols += (c < 0) ? 1 : codepoint_width(c);
    }
    return cols;
}

}  // namespace rdu::util

#pragma once

#include <codecvt>
#include <locale>
#include <string>

namespace util {

enum : char16_t {
    REPLACEMENT_CHARACTER = 0xFFFD,
};

static inline bool is_high_surrogate(char16_t c) {
    return c >= 0xD800 && c <= 0xDBFF;
}

static inline bool is_low_surrogate(char16_t c) {
    return c >= 0xDC00 && c <= 0xDFFF;
}

// sanitize replaces unpaired surrogate code units with U+FFFD. Recovered text
// is spliced at arbitrary code unit offsets, so pairs can be split.
static inline std::u16string sanitize(
    const std::u16string& s) {
    std::u16string out;
    out.reserve(s.size());

    for (size_t i = 0, l = s.size(); i < l; ++i) {
        char16_t c = s[i];
        if (is_high_surrogate(c)) {
            if (i + 1 < l && is_low_surrogate(s[i + 1])) {
                out.push_back(c);
                out.push_back(s[i + 1]);
                ++i;
                continue;
            }
            out.push_back(REPLACEMENT_CHARACTER);
        } else if (is_low_surrogate(c)) {
            out.push_back(REPLACEMENT_CHARACTER);
        } else {
            out.push_back(c);
        }
    }

    return out;
}

// to_utf8 encodes UTF-16 code units as UTF-8.
static inline std::string to_utf8(
    const std::u16string& s) {
    std::wstring_convert<std::codecvt_utf8_utf16<char16_t>, char16_t> converter;
    return converter.to_bytes(sanitize(s));
}

// to_wide converts UTF-16 code units for display on wide streams (logs and
// error messages).
static inline std::wstring to_wide(
    const std::u16string& s) {
    std::wstring_convert<std::codecvt_utf8<wchar_t>> converter;
    return converter.from_bytes(to_utf8(s));
}

// to_wide widens a UTF-8 string, such as a path, for wide streams.
static inline std::wstring to_wide(
    const std::string& s) {
    std::wstring_convert<std::codecvt_utf8<wchar_t>> converter(
        "?", L"?");
    return converter.from_bytes(s);
}

}

/**
 * pacs adapter - version 1.00
 * --------------------------------------------------------
 *
 * SPDX-FileCopyrightText: 2025 psynectic
 * SPDX-License-Identifier: MIT
 *
 */

#pragma once
#include <string>
#include <string_view>
#include <cstddef>
#include <cstdint>
#ifdef USE_UTF8PROC
#include <utf8proc.h>
#endif

namespace pacs {

// Case-insensitive ASCII prefix test at position pos
inline bool starts_with_ci(std::string_view s, size_t pos, std::string_view prefix) {
    if (s.size() - pos < prefix.size()) return false;
    for (size_t k = 0; k < prefix.size(); ++k) {
        unsigned char a = static_cast<unsigned char>(s[pos + k]);
        unsigned char b = static_cast<unsigned char>(prefix[k]);
        if (a >= 'a' && a <= 'z') a = static_cast<unsigned char>(a - 'a' + 'A');
        if (b >= 'a' && b <= 'z') b = static_cast<unsigned char>(b - 'a' + 'A');
        if (a != b) return false;
    }
    return true;
}

// Position just past the '>' closing a markup declaration that starts at pos.
// Quoted literals and a bracketed internal subset are skipped as a whole.
// Returns s.size() if the declaration never closes.
inline size_t skip_declaration(std::string_view s, size_t pos) {
    char quote = 0;
    int brackets = 0;
    for (size_t i = pos; i < s.size(); ++i) {
        const char c = s[i];
        if (quote) {
            if (c == quote) quote = 0;
            continue;
        }
        switch (c) {
        case '"':
        case '\'':
            quote = c;
            break;
        case '[':
            ++brackets;
            break;
        case ']':
            if (brackets > 0) --brackets;
            break;
        case '>':
            if (brackets == 0) return i + 1;
            break;
        default:
            break;
        }
    }
    return s.size();
}

// Comment or CDATA section starting at pos: position just past its end
// (s.size() if unterminated). 0 if neither starts there.
inline size_t skip_verbatim(std::string_view s, size_t pos) {
    const char* close = nullptr;
    size_t open = 0;
    if (s.compare(pos, 4, "<!--") == 0)           { close = "-->"; open = 4; }
    else if (s.compare(pos, 9, "<![CDATA[") == 0) { close = "]]>"; open = 9; }
    else return 0;
    const size_t end = s.find(close, pos + open);
    return end == std::string_view::npos ? s.size() : end + 3;
}

// Removes every <!DOCTYPE ...> (internal subset included) and every stray
// <!ENTITY ...> declaration. Comments and CDATA sections are copied verbatim.
// Runs before any XML parser sees untrusted input.
inline std::string sanitize_xml(std::string_view in) {
    std::string out;
    out.reserve(in.size());

    size_t i = 0;
    while (i < in.size()) {
        if (in[i] != '<') {
            out.push_back(in[i++]);
            continue;
        }
        if (const size_t end = skip_verbatim(in, i)) {
            out.append(in.substr(i, end - i));
            i = end;
        } else if (starts_with_ci(in, i, "<!DOCTYPE") || starts_with_ci(in, i, "<!ENTITY")) {
            i = skip_declaration(in, i + 2);
        } else {
            out.push_back(in[i++]);
        }
    }
    return out;
}

// Same scan as sanitize_xml: markup inside comments and CDATA does not count.
inline bool has_dangerous_declarations(std::string_view s) {
    size_t i = 0;
    while (i < s.size()) {
        if (s[i] != '<') {
            ++i;
        } else if (const size_t end = skip_verbatim(s, i)) {
            i = end;
        } else if (starts_with_ci(s, i, "<!DOCTYPE") || starts_with_ci(s, i, "<!ENTITY")) {
            return true;
        } else {
            ++i;
        }
    }
    return false;
}

inline bool is_blank(std::string_view s) {
    for (unsigned char c : s)
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') return false;
    return true;
}

#ifdef USE_UTF8PROC

    inline bool is_valid_utf8(std::string_view s) {
        const auto* p = reinterpret_cast<const utf8proc_uint8_t*>(s.data());
        utf8proc_ssize_t left = static_cast<utf8proc_ssize_t>(s.size());
        while (left > 0) {
            utf8proc_int32_t cp = 0;
            const utf8proc_ssize_t n = utf8proc_iterate(p, left, &cp);
            if (n <= 0 || cp < 0) return false;
            p += n;
            left -= n;
        }
        return true;
    }

#else // USE_UTF8PROC not defined

    // Minimal decoder: rejects overlong forms, surrogates and code points > U+10FFFF
    inline bool is_valid_utf8(std::string_view s) {
        size_t i = 0;
        while (i < s.size()) {
            const unsigned char c = static_cast<unsigned char>(s[i]);
            if (c < 0x80) { ++i; continue; }

            size_t len = 0;
            std::uint32_t cp = 0;
            if ((c & 0xE0) == 0xC0)      { len = 2; cp = c & 0x1F; }
            else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
            else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
            else return false;

            if (i + len > s.size()) return false;
            for (size_t k = 1; k < len; ++k) {
                const unsigned char cc = static_cast<unsigned char>(s[i + k]);
                if ((cc & 0xC0) != 0x80) return false;
                cp = (cp << 6) | (cc & 0x3F);
            }
            if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000))
                return false;
            if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
                return false;
            i += len;
        }
        return true;
    }

#endif // USE_UTF8PROC

} // namespace pacs

/**
 * pacs adapter - version 1.00
 * --------------------------------------------------------
 *
 * SPDX-FileCopyrightText: 2025 psynectic
 * SPDX-License-Identifier: MIT
 *
 */

#pragma once
#include "pacs_model.hpp"
#include <string>
#include <string_view>
#include <set>
#include <limits>
#include <algorithm>
#include <cctype>

namespace pacs {

inline std::string trim_copy(std::string_view sv) {
    auto is_space = [](unsigned char c){ return c==' '||c=='\t'||c=='\n'||c=='\r'||c=='\f'||c=='\v'; };
    size_t b = 0, e = sv.size();
    while (b < e && is_space(static_cast<unsigned char>(sv[b]))) ++b;
    while (e > b && is_space(static_cast<unsigned char>(sv[e-1]))) --e;
    return std::string(sv.substr(b, e - b));
}

inline std::string upper_trim(std::string_view s) {
    std::string r = trim_copy(s);
    std::transform(r.begin(), r.end(), r.begin(),
                   [](unsigned char c){ return static_cast<char>(c < 0x80 ? std::toupper(c) : c); });
    return r;
}

// ---------- Currency allow-list ----------
// ISO-4217 majors plus metals, SDR and two native placeholders (CBT, CUSD).
// Extendable at runtime; a code not in the list is never accepted.
class CurrencyAllowList {
public:
    CurrencyAllowList() : codes_(defaults().begin(), defaults().end()) {}

    static const std::vector<std::string>& defaults() {
        static const std::vector<std::string> d{
            // major fiat
            "USD","EUR","GBP","JPY","CHF","CAD","AUD","NZD",
            "CNY","HKD","SGD","KRW","INR","MXN","BRL","ZAR",
            // nordic
            "SEK","NOK","DKK",
            // middle east
            "AED","SAR","ILS",
            // other
            "RUB","TRY","PLN","CZK","HUF","THB","MYR","IDR","PHP",
            // precious metals
            "XAU","XAG","XPT","XPD",
            // special drawing rights
            "XDR",
            // native assets
            "CBT","CUSD"
        };
        return d;
    }

    // Codes are stored upper-case; only 3-4 ASCII letters are admitted.
    bool add(std::string_view code) {
        std::string c = upper_trim(code);
        if (c.size() < 3 || c.size() > 4) return false;
        for (unsigned char ch : c)
            if (ch < 'A' || ch > 'Z') return false;
        codes_.insert(std::move(c));
        return true;
    }

    bool contains(std::string_view code) const {
        std::string c = upper_trim(code);
        if (c.empty()) return false;
        return codes_.find(c) != codes_.end();
    }

    std::size_t size() const { return codes_.size(); }

private:
    std::set<std::string> codes_;
};

// ---------- Decimal ----------

// "50000.00", "+1.5", "-3", ".25" -> Decimal. No grouping, no exponent,
// at most 18 digits (ActiveCurrencyAndAmount totalDigits).
inline bool parse_decimal(std::string_view text, Decimal& out) {
    std::string s = trim_copy(text);
    if (s.empty()) return false;

    size_t i = 0;
    bool neg = false;
    if (s[i] == '+' || s[i] == '-') { neg = (s[i] == '-'); ++i; }

    std::uint64_t acc = 0;
    int digits = 0;           // significant digits, leading zeros excluded
    int scale = 0;
    bool anyDigit = false;
    bool seenDot = false;
    const std::uint64_t limit = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());

    for (; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (c == '.') {
            if (seenDot) return false;
            seenDot = true;
            continue;
        }
        if (c < '0' || c > '9') return false;
        unsigned d = static_cast<unsigned>(c - '0');
        if (acc > (limit - d) / 10ull) return false;
        acc = acc * 10ull + d;
        anyDigit = true;
        if (acc != 0) ++digits;
        if (seenDot) ++scale;
    }
    if (!anyDigit) return false;
    if (digits > 18) return false;

    out.units = neg ? -static_cast<std::int64_t>(acc) : static_cast<std::int64_t>(acc);
    out.scale = scale;
    return true;
}

inline std::string format_decimal(const Decimal& d) {
    std::uint64_t v = d.units < 0 ? static_cast<std::uint64_t>(-(d.units + 1)) + 1u
                                  : static_cast<std::uint64_t>(d.units);
    std::string digits = std::to_string(v);
    if (d.scale > 0) {
        if (static_cast<int>(digits.size()) <= d.scale)
            digits.insert(0, static_cast<size_t>(d.scale + 1 - static_cast<int>(digits.size())), '0');
        digits.insert(digits.size() - static_cast<size_t>(d.scale), 1, '.');
    }
    if (d.units < 0) digits.insert(digits.begin(), '-');
    return digits;
}

// strip trailing fractional zeros so that 50000.00 and 50000 compare equal
inline Decimal normalized(Decimal d) {
    while (d.scale > 0 && d.units % 10 == 0) {
        d.units /= 10;
        --d.scale;
    }
    if (d.units == 0) d.scale = 0;
    return d;
}

inline bool operator==(const Decimal& a, const Decimal& b) {
    const Decimal x = normalized(a), y = normalized(b);
    return x.units == y.units && x.scale == y.scale;
}
inline bool operator!=(const Decimal& a, const Decimal& b) { return !(a == b); }

inline bool is_positive(const Decimal& d) { return d.units > 0; }

inline bool operator==(const PaymentAmount& a, const PaymentAmount& b) {
    return a.value == b.value && a.currency == b.currency;
}
inline bool operator!=(const PaymentAmount& a, const PaymentAmount& b) { return !(a == b); }

inline std::string format_amount(const PaymentAmount& a) {
    return format_decimal(a.value) + " " + a.currency;
}

} // namespace pacs

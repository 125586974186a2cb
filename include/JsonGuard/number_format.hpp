#pragma once

#include <charconv>
#include <cmath>
#include <cstddef>
#include <string>
#include <system_error>

#ifndef JSONGUARD_NUMBER_BUF_SIZE
#define JSONGUARD_NUMBER_BUF_SIZE 64
#endif

namespace JsonGuard::number_format_detail {

constexpr std::size_t NumberBufSize = JSONGUARD_NUMBER_BUF_SIZE;

// Largest decimal exponent still written in plain notation, and the smallest
// one written as 0.000ddd (ECMAScript Number::toString layout).
constexpr int kMaxPlainExp = 21;
constexpr int kMinPlainExp = -6;

// Appends the shortest round-trip representation of `value`.
// Non-finite values have no JSON spelling and are written as null.
inline void append_number(std::string & out, double value) {
    if (!std::isfinite(value)) {
        out += "null";
        return;
    }
    if (value == 0) {       // also -0
        out += '0';
        return;
    }
    if (value < 0) {
        out += '-';
        value = -value;
    }

    char buf[NumberBufSize];
    auto [end, ec] = std::to_chars(buf, buf + NumberBufSize, value, std::chars_format::scientific);
    if (ec != std::errc()) {
        out += "null";
        return;
    }

    // buf holds d[.ddd]e(+|-)xx
    char digits[NumberBufSize];
    int k = 0;
    const char * p = buf;
    for (; p < end && *p != 'e'; ++p) {
        if (*p != '.') digits[k++] = *p;
    }
    int exponent = 0;
    if (p < end) {
        ++p;
        bool negative = false;
        if (p < end && (*p == '+' || *p == '-')) {
            negative = *p == '-';
            ++p;
        }
        std::from_chars(p, end, exponent);
        if (negative) exponent = -exponent;
    }

    // value == 0.digits * 10^n
    const int n = exponent + 1;
    if (k <= n && n <= kMaxPlainExp) {
        out.append(digits, static_cast<std::size_t>(k));
        out.append(static_cast<std::size_t>(n - k), '0');
    } else if (0 < n && n <= kMaxPlainExp) {
        out.append(digits, static_cast<std::size_t>(n));
        out += '.';
        out.append(digits + n, static_cast<std::size_t>(k - n));
    } else if (kMinPlainExp < n && n <= 0) {
        out += "0.";
        out.append(static_cast<std::size_t>(-n), '0');
        out.append(digits, static_cast<std::size_t>(k));
    } else {
        out += digits[0];
        if (k > 1) {
            out += '.';
            out.append(digits + 1, static_cast<std::size_t>(k - 1));
        }
        const int e = n - 1;
        out += 'e';
        out += e < 0 ? '-' : '+';
        out += std::to_string(e < 0 ? -e : e);
    }
}

} // namespace JsonGuard::number_format_detail

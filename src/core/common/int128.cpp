#include "ledger_math/core/int128.h"

#include <algorithm>
#include <cctype>

namespace ledger_math {
namespace {

bool ParseMagnitude(const std::string& digits, Uint128 limit, Uint128* out, std::string* error) {
    if (digits.empty()) {
        if (error != nullptr) {
            *error = "empty integer literal";
        }
        return false;
    }
    Uint128 value = 0;
    bool seen_digit = false;
    for (const char ch : digits) {
        if (ch == '_' || ch == '\'') {
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(ch))) {
            if (error != nullptr) {
                *error = std::string("invalid digit in integer literal: ") + ch;
            }
            return false;
        }
        const auto digit = static_cast<Uint128>(ch - '0');
        if (value > (limit - digit) / 10) {
            if (error != nullptr) {
                *error = "integer literal out of range: " + digits;
            }
            return false;
        }
        value = value * 10 + digit;
        seen_digit = true;
    }
    if (!seen_digit) {
        if (error != nullptr) {
            *error = "integer literal has no digits: " + digits;
        }
        return false;
    }
    *out = value;
    return true;
}

}  // namespace

std::string ToDecimalString(Uint128 value) {
    if (value == 0) {
        return "0";
    }
    std::string text;
    while (value != 0) {
        text.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }
    std::reverse(text.begin(), text.end());
    return text;
}

std::string ToDecimalString(Int128 value) {
    if (value < 0) {
        return "-" + ToDecimalString(UnsignedAbs(value));
    }
    return ToDecimalString(static_cast<Uint128>(value));
}

bool ParseUint128(const std::string& text, Uint128* out, std::string* error) {
    if (out == nullptr) {
        if (error != nullptr) {
            *error = "output pointer is null";
        }
        return false;
    }
    std::string digits = text;
    if (!digits.empty() && digits.front() == '+') {
        digits.erase(digits.begin());
    }
    return ParseMagnitude(digits, kUint128Max, out, error);
}

bool ParseInt128(const std::string& text, Int128* out, std::string* error) {
    if (out == nullptr) {
        if (error != nullptr) {
            *error = "output pointer is null";
        }
        return false;
    }
    std::string digits = text;
    bool negative = false;
    if (!digits.empty() && (digits.front() == '-' || digits.front() == '+')) {
        negative = digits.front() == '-';
        digits.erase(digits.begin());
    }
    const Uint128 limit = negative ? UnsignedAbs(kInt128Min) : static_cast<Uint128>(kInt128Max);
    Uint128 magnitude = 0;
    if (!ParseMagnitude(digits, limit, &magnitude, error)) {
        return false;
    }
    *out = negative ? static_cast<Int128>(~magnitude + 1) : static_cast<Int128>(magnitude);
    return true;
}

}  // namespace ledger_math

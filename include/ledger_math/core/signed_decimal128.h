#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>

#include "ledger_math/core/basis_points.h"
#include "ledger_math/core/int128.h"

namespace ledger_math {

constexpr Int128 kSignedDecimalOne = 10'000'000'000;

// Signed decimal with ten fractional digits in a 128-bit integer.
// Every raw operator is overflow-checked and throws NumericalError; the
// Checked* members return std::nullopt instead.
class SignedDecimal128 {
public:
    static constexpr int kPrecision = 10;
    static constexpr unsigned kBits = 128;
    static constexpr unsigned kMaxPowerIndex = 12;
    static constexpr std::size_t kByteSize = 16;
    using Bits = std::array<std::uint8_t, kByteSize>;

    constexpr SignedDecimal128() = default;

    static constexpr SignedDecimal128 One() { return SignedDecimal128(kSignedDecimalOne); }
    static constexpr SignedDecimal128 Zero() { return SignedDecimal128(0); }
    static constexpr SignedDecimal128 Max() { return SignedDecimal128(kInt128Max); }
    static constexpr SignedDecimal128 Min() { return SignedDecimal128(kInt128Min); }

    static constexpr SignedDecimal128 FromI128(Int128 raw) { return SignedDecimal128(raw); }

    // value * 10^exponent. 10 + exponent must index the 10^0..10^12 table,
    // otherwise std::invalid_argument is thrown.
    static SignedDecimal128 FromDecimal(Int128 value, int exponent);
    static SignedDecimal128 FromBps(std::uint16_t basis_points);
    static SignedDecimal128 FromBits(const Bits& bits);

    // Throws NumericalError with kOverflow above UINT64_MAX and with
    // kNegativeValue below zero.
    std::uint64_t AsU64(int exponent) const;

    // Rounded twice (int128 -> double, then the division); the relative error
    // stays within two double epsilons across the whole range.
    double AsF64() const;

    constexpr Int128 ToI128() const { return raw_; }

    std::optional<SignedDecimal128> CheckedAdd(const SignedDecimal128& rhs) const;
    std::optional<SignedDecimal128> CheckedSub(const SignedDecimal128& rhs) const;
    std::optional<SignedDecimal128> CheckedMul(const SignedDecimal128& rhs) const;
    std::optional<SignedDecimal128> CheckedDiv(const SignedDecimal128& rhs) const;

    SignedDecimal128 Add(const SignedDecimal128& rhs) const;
    SignedDecimal128 Sub(const SignedDecimal128& rhs) const;
    SignedDecimal128 Mul(const SignedDecimal128& rhs) const;
    // Truncates toward zero.
    SignedDecimal128 Div(const SignedDecimal128& rhs) const;
    SignedDecimal128 MulScalar(Int128 rhs) const;
    SignedDecimal128 DivScalar(Int128 rhs) const;
    // Min() has no positive counterpart and throws.
    SignedDecimal128 Negate() const;

    Bits IntoBits() const;
    std::string ToString() const;

    SignedDecimal128& operator+=(const SignedDecimal128& rhs);
    SignedDecimal128& operator-=(const SignedDecimal128& rhs);
    SignedDecimal128& operator*=(const SignedDecimal128& rhs);
    SignedDecimal128& operator/=(const SignedDecimal128& rhs);

    friend constexpr bool operator==(const SignedDecimal128& a, const SignedDecimal128& b) {
        return a.raw_ == b.raw_;
    }
    friend constexpr bool operator!=(const SignedDecimal128& a, const SignedDecimal128& b) {
        return a.raw_ != b.raw_;
    }
    friend constexpr bool operator<(const SignedDecimal128& a, const SignedDecimal128& b) {
        return a.raw_ < b.raw_;
    }
    friend constexpr bool operator<=(const SignedDecimal128& a, const SignedDecimal128& b) {
        return a.raw_ <= b.raw_;
    }
    friend constexpr bool operator>(const SignedDecimal128& a, const SignedDecimal128& b) {
        return a.raw_ > b.raw_;
    }
    friend constexpr bool operator>=(const SignedDecimal128& a, const SignedDecimal128& b) {
        return a.raw_ >= b.raw_;
    }

private:
    explicit constexpr SignedDecimal128(Int128 raw) : raw_(raw) {}

    Int128 raw_{0};
};

static_assert(SignedDecimal128::kByteSize * 8 == SignedDecimal128::kBits,
              "SignedDecimal128 byte form must cover the full backing width");

SignedDecimal128 operator+(const SignedDecimal128& lhs, const SignedDecimal128& rhs);
SignedDecimal128 operator-(const SignedDecimal128& lhs, const SignedDecimal128& rhs);
SignedDecimal128 operator*(const SignedDecimal128& lhs, const SignedDecimal128& rhs);
SignedDecimal128 operator/(const SignedDecimal128& lhs, const SignedDecimal128& rhs);
SignedDecimal128 operator*(const SignedDecimal128& lhs, std::int64_t rhs);
SignedDecimal128 operator/(const SignedDecimal128& lhs, std::int64_t rhs);
SignedDecimal128 operator-(const SignedDecimal128& value);

std::ostream& operator<<(std::ostream& os, const SignedDecimal128& value);

}  // namespace ledger_math

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <utility>

#include "ledger_math/core/basis_points.h"
#include "ledger_math/core/rounding.h"
#include "ledger_math/core/wide_int.h"

namespace ledger_math {

// Large unsigned decimal quantity: a 192-bit integer with 50 binary
// fractional bits. Decimal exponents are converted through a power-of-ten
// table covering 10^0..10^16.
//
// Overflow discipline: the raw operators (Add/Sub/Mul/Div and their infix
// forms) throw NumericalError when the exact result does not fit in 192
// bits. The Saturating* members clamp and the Checked* members return
// std::nullopt instead.
class WideDecimal {
public:
    static constexpr int kPrecision = 50;
    static constexpr unsigned kBits = 192;
    static constexpr unsigned kMaxTenPowExponent = 16;
    // Decimal digits a 50-bit binary fraction resolves; used when rendering.
    static constexpr int kDisplayFractionDigits = 15;
    static constexpr std::size_t kByteSize = 24;
    using Bits = std::array<std::uint8_t, kByteSize>;

    WideDecimal() = default;

    static WideDecimal One();
    static WideDecimal Zero();
    static WideDecimal Max();
    static WideDecimal Min();

    static WideDecimal FromRaw(const Uint192& raw);
    static WideDecimal FromInteger(const Uint192& value);

    // value * 10^exponent. Negative exponents divide and round the binary
    // representation up, so AsDecimal() at the same exponent returns `value`.
    static WideDecimal FromDecimal(const Uint192& value, int exponent);
    static WideDecimal FromU64(std::uint64_t value, int exponent);
    static WideDecimal FromBps(std::uint16_t basis_points);
    static WideDecimal FromBits(const Bits& bits);

    // Throws std::invalid_argument above kMaxTenPowExponent.
    static Uint192 TenPow(unsigned exponent);

    Uint192 AsDecimal(int exponent) const;
    std::uint64_t AsU64(int exponent) const;
    std::uint64_t AsU64Ceil(int exponent) const;
    std::uint64_t AsU64Rounded(int exponent) const;
    std::uint64_t AsU64(int exponent, FixedRoundingMode mode) const;

    // Raises the raw integer to the raw integer of `exponent`. Callers scale
    // the exponent themselves; this is not decimal-aware exponentiation.
    WideDecimal Pow(const WideDecimal& exponent) const;

    WideDecimal SaturatingAdd(const WideDecimal& rhs) const;
    WideDecimal SaturatingSub(const WideDecimal& rhs) const;
    WideDecimal SaturatingMul(const WideDecimal& rhs) const;

    std::optional<WideDecimal> CheckedAdd(const WideDecimal& rhs) const;
    std::optional<WideDecimal> CheckedSub(const WideDecimal& rhs) const;
    std::optional<WideDecimal> CheckedMul(const WideDecimal& rhs) const;
    std::optional<WideDecimal> CheckedDiv(const WideDecimal& rhs) const;

    WideDecimal Add(const WideDecimal& rhs) const;
    WideDecimal Sub(const WideDecimal& rhs) const;
    WideDecimal Mul(const WideDecimal& rhs) const;
    WideDecimal Div(const WideDecimal& rhs) const;
    WideDecimal MulScalar(const Uint192& rhs) const;
    WideDecimal DivScalar(const Uint192& rhs) const;

    // Folds [first, last) with Add(); Zero() for an empty range.
    template <typename Iterator>
    static WideDecimal Sum(Iterator first, Iterator last) {
        WideDecimal total;
        for (; first != last; ++first) {
            total = total.Add(*first);
        }
        return total;
    }

    Bits IntoBits() const;
    std::string ToString() const;

    const Uint192& raw() const { return raw_; }

    WideDecimal& operator+=(const WideDecimal& rhs);
    WideDecimal& operator-=(const WideDecimal& rhs);
    WideDecimal& operator*=(const WideDecimal& rhs);
    WideDecimal& operator/=(const WideDecimal& rhs);

    friend bool operator==(const WideDecimal& a, const WideDecimal& b) { return a.raw_ == b.raw_; }
    friend bool operator!=(const WideDecimal& a, const WideDecimal& b) { return a.raw_ != b.raw_; }
    friend bool operator<(const WideDecimal& a, const WideDecimal& b) { return a.raw_ < b.raw_; }
    friend bool operator<=(const WideDecimal& a, const WideDecimal& b) { return a.raw_ <= b.raw_; }
    friend bool operator>(const WideDecimal& a, const WideDecimal& b) { return a.raw_ > b.raw_; }
    friend bool operator>=(const WideDecimal& a, const WideDecimal& b) { return a.raw_ >= b.raw_; }

private:
    explicit WideDecimal(Uint192 raw) : raw_(std::move(raw)) {}

    Uint192 raw_{0};
};

static_assert(WideDecimal::kByteSize == WideDecimal::kBits / 8,
              "WideDecimal byte form must cover the full backing width");
static_assert(WideDecimal::kByteSize % 8 == 0, "WideDecimal byte form must be 8-byte aligned");
static_assert(std::tuple_size<WideDecimal::Bits>::value == 24,
              "WideDecimal serializes to exactly 24 bytes");

WideDecimal operator+(const WideDecimal& lhs, const WideDecimal& rhs);
WideDecimal operator-(const WideDecimal& lhs, const WideDecimal& rhs);
WideDecimal operator*(const WideDecimal& lhs, const WideDecimal& rhs);
WideDecimal operator/(const WideDecimal& lhs, const WideDecimal& rhs);
WideDecimal operator*(const WideDecimal& lhs, std::uint64_t rhs);
WideDecimal operator/(const WideDecimal& lhs, std::uint64_t rhs);

std::ostream& operator<<(std::ostream& os, const WideDecimal& value);

}  // namespace ledger_math

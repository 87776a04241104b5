#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <type_traits>

#include "ledger_math/core/int128.h"

namespace ledger_math {

constexpr Uint128 kFp32One = static_cast<Uint128>(1) << 32;

// Unsigned 32.32 fixed point held in a 128-bit integer so that products and
// pre-scaled dividends have headroom. Add, Sub and Mul wrap modulo 2^128.
// Div also wraps once the pre-scaled dividend raw * 2^32 passes 128 bits
// (raw >= 2^96). The Checked* members report overflow instead.
class NarrowFixedPoint {
public:
    static constexpr int kFractionalBits = 32;
    static constexpr std::size_t kByteSize = 16;
    using Bits = std::array<std::uint8_t, kByteSize>;

    constexpr NarrowFixedPoint() = default;

    static constexpr NarrowFixedPoint One() { return NarrowFixedPoint(kFp32One); }
    static constexpr NarrowFixedPoint Zero() { return NarrowFixedPoint(0); }
    static constexpr NarrowFixedPoint Max() { return NarrowFixedPoint(kUint128Max); }
    static constexpr NarrowFixedPoint Min() { return NarrowFixedPoint(0); }

    // raw = value * 2^32; any unsigned input narrower than 128 bits fits.
    template <typename T>
    static constexpr NarrowFixedPoint FromInteger(T value) {
        static_assert(std::is_integral<T>::value && std::is_unsigned<T>::value &&
                          !std::is_same<T, bool>::value && sizeof(T) < sizeof(Uint128),
                      "NarrowFixedPoint::FromInteger requires an unsigned integer below 128 bits");
        return NarrowFixedPoint(static_cast<Uint128>(value) * kFp32One);
    }

    // Wraps a raw 128-bit pattern without any logical conversion.
    static constexpr NarrowFixedPoint WrapU128(Uint128 raw) { return NarrowFixedPoint(raw); }

    // Upcasts a 64-bit value that already carries the 2^32 scale.
    static constexpr NarrowFixedPoint UpcastFp32(std::uint64_t fp) {
        return NarrowFixedPoint(static_cast<Uint128>(fp));
    }

    static NarrowFixedPoint FromBits(const Bits& bits);

    std::optional<std::uint64_t> AsDecimalU64() const;
    std::optional<std::uint64_t> AsDecimalU64Ceil() const;
    std::optional<std::uint64_t> DowncastU64() const;
    std::optional<std::uint64_t> DecimalU64Mul(std::uint64_t rhs) const;
    std::optional<std::uint64_t> U64Div(std::uint64_t rhs) const;

    NarrowFixedPoint Add(const NarrowFixedPoint& rhs) const;
    NarrowFixedPoint Sub(const NarrowFixedPoint& rhs) const;
    NarrowFixedPoint Mul(const NarrowFixedPoint& rhs) const;
    NarrowFixedPoint Div(const NarrowFixedPoint& rhs) const;
    NarrowFixedPoint MulScalar(Uint128 rhs) const;
    NarrowFixedPoint DivScalar(Uint128 rhs) const;

    std::optional<NarrowFixedPoint> CheckedAdd(const NarrowFixedPoint& rhs) const;
    std::optional<NarrowFixedPoint> CheckedSub(const NarrowFixedPoint& rhs) const;
    std::optional<NarrowFixedPoint> CheckedMul(const NarrowFixedPoint& rhs) const;
    std::optional<NarrowFixedPoint> CheckedDiv(const NarrowFixedPoint& rhs) const;

    Bits IntoBits() const;
    std::string ToString() const;

    constexpr Uint128 raw() const { return raw_; }

    NarrowFixedPoint& operator+=(const NarrowFixedPoint& rhs);
    NarrowFixedPoint& operator-=(const NarrowFixedPoint& rhs);
    NarrowFixedPoint& operator*=(const NarrowFixedPoint& rhs);
    NarrowFixedPoint& operator/=(const NarrowFixedPoint& rhs);

    friend constexpr bool operator==(const NarrowFixedPoint& a, const NarrowFixedPoint& b) {
        return a.raw_ == b.raw_;
    }
    friend constexpr bool operator!=(const NarrowFixedPoint& a, const NarrowFixedPoint& b) {
        return a.raw_ != b.raw_;
    }
    friend constexpr bool operator<(const NarrowFixedPoint& a, const NarrowFixedPoint& b) {
        return a.raw_ < b.raw_;
    }
    friend constexpr bool operator<=(const NarrowFixedPoint& a, const NarrowFixedPoint& b) {
        return a.raw_ <= b.raw_;
    }
    friend constexpr bool operator>(const NarrowFixedPoint& a, const NarrowFixedPoint& b) {
        return a.raw_ > b.raw_;
    }
    friend constexpr bool operator>=(const NarrowFixedPoint& a, const NarrowFixedPoint& b) {
        return a.raw_ >= b.raw_;
    }

private:
    explicit constexpr NarrowFixedPoint(Uint128 raw) : raw_(raw) {}

    Uint128 raw_{0};
};

NarrowFixedPoint operator+(const NarrowFixedPoint& lhs, const NarrowFixedPoint& rhs);
NarrowFixedPoint operator-(const NarrowFixedPoint& lhs, const NarrowFixedPoint& rhs);
NarrowFixedPoint operator*(const NarrowFixedPoint& lhs, const NarrowFixedPoint& rhs);
NarrowFixedPoint operator/(const NarrowFixedPoint& lhs, const NarrowFixedPoint& rhs);
NarrowFixedPoint operator*(const NarrowFixedPoint& lhs, std::uint64_t rhs);
NarrowFixedPoint operator/(const NarrowFixedPoint& lhs, std::uint64_t rhs);

std::ostream& operator<<(std::ostream& os, const NarrowFixedPoint& value);

}  // namespace ledger_math

#include "ledger_math/core/narrow_fixed_point.h"

#include <cstring>
#include <ostream>

#include "ledger_math/core/numerical_error.h"
#include "ledger_math/core/wide_int.h"

namespace ledger_math {
namespace {

constexpr Uint128 kU64Max = static_cast<Uint128>(UINT64_MAX);
constexpr Uint128 kLowMask = kFp32One - 1;
constexpr int kFractionDigits = 32;

// 10^32 / 2^32 == 5^32, so a 32-bit binary fraction is exact in 32 decimal digits.
constexpr Uint128 Pow5(int exponent) {
    Uint128 value = 1;
    for (int i = 0; i < exponent; ++i) {
        value *= 5;
    }
    return value;
}

void ThrowIfZero(Uint128 divisor, const NarrowFixedPoint& dividend) {
    if (divisor == 0) {
        throw NumericalError(NumericalErrorCode::kZeroDivision, dividend.ToString());
    }
}

}  // namespace

NarrowFixedPoint NarrowFixedPoint::FromBits(const Bits& bits) {
    Uint128 raw = 0;
    std::memcpy(&raw, bits.data(), kByteSize);
    return NarrowFixedPoint(raw);
}

std::optional<std::uint64_t> NarrowFixedPoint::AsDecimalU64() const {
    const Uint128 integer = raw_ / kFp32One;
    if (integer > kU64Max) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(integer);
}

std::optional<std::uint64_t> NarrowFixedPoint::AsDecimalU64Ceil() const {
    // Distance to the next whole unit; zero when the fraction is already zero.
    const auto low = static_cast<std::uint32_t>(raw_);
    const auto add_one = static_cast<Uint128>(static_cast<std::uint32_t>(~low + 1U));
    Uint128 rounded = 0;
    if (__builtin_add_overflow(raw_, add_one, &rounded)) {
        return std::nullopt;
    }
    return NarrowFixedPoint(rounded).AsDecimalU64();
}

std::optional<std::uint64_t> NarrowFixedPoint::DowncastU64() const {
    if (raw_ > kU64Max) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(raw_);
}

std::optional<std::uint64_t> NarrowFixedPoint::DecimalU64Mul(std::uint64_t rhs) const {
    return MulScalar(rhs).AsDecimalU64();
}

std::optional<std::uint64_t> NarrowFixedPoint::U64Div(std::uint64_t rhs) const {
    return DivScalar(rhs).AsDecimalU64();
}

NarrowFixedPoint NarrowFixedPoint::Add(const NarrowFixedPoint& rhs) const {
    return NarrowFixedPoint(raw_ + rhs.raw_);
}

NarrowFixedPoint NarrowFixedPoint::Sub(const NarrowFixedPoint& rhs) const {
    return NarrowFixedPoint(raw_ - rhs.raw_);
}

NarrowFixedPoint NarrowFixedPoint::Mul(const NarrowFixedPoint& rhs) const {
    return NarrowFixedPoint((raw_ * rhs.raw_) / kFp32One);
}

NarrowFixedPoint NarrowFixedPoint::Div(const NarrowFixedPoint& rhs) const {
    ThrowIfZero(rhs.raw_, *this);
    return NarrowFixedPoint((raw_ * kFp32One) / rhs.raw_);
}

NarrowFixedPoint NarrowFixedPoint::MulScalar(Uint128 rhs) const {
    return NarrowFixedPoint(raw_ * rhs);
}

NarrowFixedPoint NarrowFixedPoint::DivScalar(Uint128 rhs) const {
    ThrowIfZero(rhs, *this);
    return NarrowFixedPoint(raw_ / rhs);
}

std::optional<NarrowFixedPoint> NarrowFixedPoint::CheckedAdd(const NarrowFixedPoint& rhs) const {
    Uint128 sum = 0;
    if (__builtin_add_overflow(raw_, rhs.raw_, &sum)) {
        return std::nullopt;
    }
    return NarrowFixedPoint(sum);
}

std::optional<NarrowFixedPoint> NarrowFixedPoint::CheckedSub(const NarrowFixedPoint& rhs) const {
    if (rhs.raw_ > raw_) {
        return std::nullopt;
    }
    return NarrowFixedPoint(raw_ - rhs.raw_);
}

std::optional<NarrowFixedPoint> NarrowFixedPoint::CheckedMul(const NarrowFixedPoint& rhs) const {
    const Uint256 product = WidenToUint256(raw_) * WidenToUint256(rhs.raw_);
    const auto narrowed = NarrowToUint128(product >> kFractionalBits);
    if (!narrowed.has_value()) {
        return std::nullopt;
    }
    return NarrowFixedPoint(*narrowed);
}

std::optional<NarrowFixedPoint> NarrowFixedPoint::CheckedDiv(const NarrowFixedPoint& rhs) const {
    if (rhs.raw_ == 0) {
        return std::nullopt;
    }
    const Uint256 scaled = WidenToUint256(raw_) << kFractionalBits;
    const auto narrowed = NarrowToUint128(scaled / WidenToUint256(rhs.raw_));
    if (!narrowed.has_value()) {
        return std::nullopt;
    }
    return NarrowFixedPoint(*narrowed);
}

NarrowFixedPoint::Bits NarrowFixedPoint::IntoBits() const {
    Bits bits{};
    std::memcpy(bits.data(), &raw_, kByteSize);
    return bits;
}

std::string NarrowFixedPoint::ToString() const {
    const std::string integer = ToDecimalString(raw_ >> kFractionalBits);
    std::string fraction = ToDecimalString((raw_ & kLowMask) * Pow5(kFractionDigits));
    fraction.insert(0, kFractionDigits - fraction.size(), '0');
    const auto last = fraction.find_last_not_of('0');
    fraction = last == std::string::npos ? "0" : fraction.substr(0, last + 1);
    return integer + "." + fraction;
}

NarrowFixedPoint& NarrowFixedPoint::operator+=(const NarrowFixedPoint& rhs) {
    raw_ += rhs.raw_;
    return *this;
}

NarrowFixedPoint& NarrowFixedPoint::operator-=(const NarrowFixedPoint& rhs) {
    raw_ -= rhs.raw_;
    return *this;
}

NarrowFixedPoint& NarrowFixedPoint::operator*=(const NarrowFixedPoint& rhs) {
    raw_ *= rhs.raw_;
    raw_ /= kFp32One;
    return *this;
}

NarrowFixedPoint& NarrowFixedPoint::operator/=(const NarrowFixedPoint& rhs) {
    *this = Div(rhs);
    return *this;
}

NarrowFixedPoint operator+(const NarrowFixedPoint& lhs, const NarrowFixedPoint& rhs) {
    return lhs.Add(rhs);
}

NarrowFixedPoint operator-(const NarrowFixedPoint& lhs, const NarrowFixedPoint& rhs) {
    return lhs.Sub(rhs);
}

NarrowFixedPoint operator*(const NarrowFixedPoint& lhs, const NarrowFixedPoint& rhs) {
    return lhs.Mul(rhs);
}

NarrowFixedPoint operator/(const NarrowFixedPoint& lhs, const NarrowFixedPoint& rhs) {
    return lhs.Div(rhs);
}

NarrowFixedPoint operator*(const NarrowFixedPoint& lhs, std::uint64_t rhs) {
    return lhs.MulScalar(rhs);
}

NarrowFixedPoint operator/(const NarrowFixedPoint& lhs, std::uint64_t rhs) {
    return lhs.DivScalar(rhs);
}

std::ostream& operator<<(std::ostream& os, const NarrowFixedPoint& value) {
    return os << value.ToString();
}

}  // namespace ledger_math

#include "ledger_math/core/signed_decimal128.h"

#include <cstring>
#include <ostream>
#include <stdexcept>

#include "ledger_math/core/numerical_error.h"
#include "ledger_math/core/wide_int.h"

namespace ledger_math {
namespace {

constexpr std::array<Int128, SignedDecimal128::kMaxPowerIndex + 1> kPowersOfTen = {
    1,
    10,
    100,
    1'000,
    10'000,
    100'000,
    1'000'000,
    10'000'000,
    100'000'000,
    1'000'000'000,
    10'000'000'000,
    100'000'000'000,
    1'000'000'000'000,
};

constexpr Int128 kU64Max = static_cast<Int128>(UINT64_MAX);

Int128 PowerOfTen(long long extra_precision) {
    const unsigned long long index = extra_precision < 0
                                         ? static_cast<unsigned long long>(-extra_precision)
                                         : static_cast<unsigned long long>(extra_precision);
    if (index > SignedDecimal128::kMaxPowerIndex) {
        throw std::invalid_argument("no support for exponent: " +
                                    std::to_string(extra_precision - SignedDecimal128::kPrecision));
    }
    return kPowersOfTen[index];
}

}  // namespace

SignedDecimal128 SignedDecimal128::FromDecimal(Int128 value, int exponent) {
    const long long extra_precision = static_cast<long long>(kPrecision) + exponent;
    const Int128 factor = PowerOfTen(extra_precision);
    if (extra_precision < 0) {
        return SignedDecimal128(value / factor);
    }
    Int128 scaled = 0;
    if (__builtin_mul_overflow(value, factor, &scaled)) {
        throw NumericalError(NumericalErrorCode::kOverflow,
                             ToDecimalString(value) + "e" + std::to_string(exponent));
    }
    return SignedDecimal128(scaled);
}

SignedDecimal128 SignedDecimal128::FromBps(std::uint16_t basis_points) {
    return FromDecimal(basis_points, kBpsExponent);
}

SignedDecimal128 SignedDecimal128::FromBits(const Bits& bits) {
    Int128 raw = 0;
    std::memcpy(&raw, bits.data(), kByteSize);
    return SignedDecimal128(raw);
}

std::uint64_t SignedDecimal128::AsU64(int exponent) const {
    const long long extra_precision = static_cast<long long>(kPrecision) + exponent;
    const Int128 factor = PowerOfTen(extra_precision);
    // Scaling down truncates toward zero, so small negative values still convert to 0.
    if (raw_ < 0 && (extra_precision < 0 || raw_ / factor < 0)) {
        throw NumericalError(NumericalErrorCode::kNegativeValue,
                             ToString(),
                             "cannot convert to u64 because value < 0");
    }
    Int128 target = 0;
    if (extra_precision < 0) {
        if (__builtin_mul_overflow(raw_, factor, &target)) {
            throw NumericalError(
                NumericalErrorCode::kOverflow, ToString(), "cannot convert to u64 due to overflow");
        }
    } else {
        target = raw_ / factor;
    }
    if (target > kU64Max) {
        throw NumericalError(
            NumericalErrorCode::kOverflow, ToString(), "cannot convert to u64 due to overflow");
    }
    return static_cast<std::uint64_t>(target);
}

double SignedDecimal128::AsF64() const {
    return static_cast<double>(raw_) / static_cast<double>(kSignedDecimalOne);
}

std::optional<SignedDecimal128> SignedDecimal128::CheckedAdd(const SignedDecimal128& rhs) const {
    Int128 sum = 0;
    if (__builtin_add_overflow(raw_, rhs.raw_, &sum)) {
        return std::nullopt;
    }
    return SignedDecimal128(sum);
}

std::optional<SignedDecimal128> SignedDecimal128::CheckedSub(const SignedDecimal128& rhs) const {
    Int128 difference = 0;
    if (__builtin_sub_overflow(raw_, rhs.raw_, &difference)) {
        return std::nullopt;
    }
    return SignedDecimal128(difference);
}

std::optional<SignedDecimal128> SignedDecimal128::CheckedMul(const SignedDecimal128& rhs) const {
    const Int256 product = WidenToInt256(raw_) * WidenToInt256(rhs.raw_);
    const auto narrowed = NarrowToInt128(product / WidenToInt256(kSignedDecimalOne));
    if (!narrowed.has_value()) {
        return std::nullopt;
    }
    return SignedDecimal128(*narrowed);
}

std::optional<SignedDecimal128> SignedDecimal128::CheckedDiv(const SignedDecimal128& rhs) const {
    if (rhs.raw_ == 0) {
        return std::nullopt;
    }
    const Int256 scaled = WidenToInt256(raw_) * WidenToInt256(kSignedDecimalOne);
    const auto narrowed = NarrowToInt128(scaled / WidenToInt256(rhs.raw_));
    if (!narrowed.has_value()) {
        return std::nullopt;
    }
    return SignedDecimal128(*narrowed);
}

SignedDecimal128 SignedDecimal128::Add(const SignedDecimal128& rhs) const {
    const auto sum = CheckedAdd(rhs);
    if (!sum.has_value()) {
        throw NumericalError(NumericalErrorCode::kAdditionOverflow, ToString());
    }
    return *sum;
}

SignedDecimal128 SignedDecimal128::Sub(const SignedDecimal128& rhs) const {
    const auto difference = CheckedSub(rhs);
    if (!difference.has_value()) {
        throw NumericalError(NumericalErrorCode::kSubtractionUnderflow, ToString());
    }
    return *difference;
}

SignedDecimal128 SignedDecimal128::Mul(const SignedDecimal128& rhs) const {
    const auto product = CheckedMul(rhs);
    if (!product.has_value()) {
        throw NumericalError(NumericalErrorCode::kMultiplicationOverflow, ToString());
    }
    return *product;
}

SignedDecimal128 SignedDecimal128::Div(const SignedDecimal128& rhs) const {
    if (rhs.raw_ == 0) {
        throw NumericalError(NumericalErrorCode::kZeroDivision, ToString());
    }
    const auto quotient = CheckedDiv(rhs);
    if (!quotient.has_value()) {
        throw NumericalError(NumericalErrorCode::kOverflow, ToString());
    }
    return *quotient;
}

SignedDecimal128 SignedDecimal128::MulScalar(Int128 rhs) const {
    Int128 product = 0;
    if (__builtin_mul_overflow(raw_, rhs, &product)) {
        throw NumericalError(NumericalErrorCode::kMultiplicationOverflow, ToString());
    }
    return SignedDecimal128(product);
}

SignedDecimal128 SignedDecimal128::DivScalar(Int128 rhs) const {
    if (rhs == 0) {
        throw NumericalError(NumericalErrorCode::kZeroDivision, ToString());
    }
    if (rhs == -1 && raw_ == kInt128Min) {
        throw NumericalError(NumericalErrorCode::kOverflow, ToString());
    }
    return SignedDecimal128(raw_ / rhs);
}

SignedDecimal128 SignedDecimal128::Negate() const {
    if (raw_ == kInt128Min) {
        throw NumericalError(NumericalErrorCode::kOverflow, ToString(), "cannot negate minimum value");
    }
    return SignedDecimal128(-raw_);
}

SignedDecimal128::Bits SignedDecimal128::IntoBits() const {
    Bits bits{};
    std::memcpy(bits.data(), &raw_, kByteSize);
    return bits;
}

std::string SignedDecimal128::ToString() const {
    // Split the magnitude, not the signed value: a signed remainder changes
    // sign with the value and values in (-1, 0) have a zero integer part.
    const Uint128 magnitude = UnsignedAbs(raw_);
    const Uint128 one = static_cast<Uint128>(kSignedDecimalOne);
    const std::string integer = ToDecimalString(magnitude / one);
    std::string fraction = ToDecimalString(magnitude % one);
    fraction.insert(0, kPrecision - fraction.size(), '0');
    const auto last = fraction.find_last_not_of('0');
    fraction = last == std::string::npos ? "0" : fraction.substr(0, last + 1);
    return (raw_ < 0 ? "-" : "") + integer + "." + fraction;
}

SignedDecimal128& SignedDecimal128::operator+=(const SignedDecimal128& rhs) {
    *this = Add(rhs);
    return *this;
}

SignedDecimal128& SignedDecimal128::operator-=(const SignedDecimal128& rhs) {
    *this = Sub(rhs);
    return *this;
}

SignedDecimal128& SignedDecimal128::operator*=(const SignedDecimal128& rhs) {
    *this = Mul(rhs);
    return *this;
}

SignedDecimal128& SignedDecimal128::operator/=(const SignedDecimal128& rhs) {
    *this = Div(rhs);
    return *this;
}

SignedDecimal128 operator+(const SignedDecimal128& lhs, const SignedDecimal128& rhs) {
    return lhs.Add(rhs);
}

SignedDecimal128 operator-(const SignedDecimal128& lhs, const SignedDecimal128& rhs) {
    return lhs.Sub(rhs);
}

SignedDecimal128 operator*(const SignedDecimal128& lhs, const SignedDecimal128& rhs) {
    return lhs.Mul(rhs);
}

SignedDecimal128 operator/(const SignedDecimal128& lhs, const SignedDecimal128& rhs) {
    return lhs.Div(rhs);
}

SignedDecimal128 operator*(const SignedDecimal128& lhs, std::int64_t rhs) {
    return lhs.MulScalar(rhs);
}

SignedDecimal128 operator/(const SignedDecimal128& lhs, std::int64_t rhs) {
    return lhs.DivScalar(rhs);
}

SignedDecimal128 operator-(const SignedDecimal128& value) { return value.Negate(); }

std::ostream& operator<<(std::ostream& os, const SignedDecimal128& value) {
    return os << value.ToString();
}

}  // namespace ledger_math

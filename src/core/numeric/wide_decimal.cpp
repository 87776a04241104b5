#include "ledger_math/core/wide_decimal.h"

#include <cstring>
#include <ostream>
#include <stdexcept>

#include "ledger_math/core/numerical_error.h"

namespace ledger_math {
namespace {

constexpr std::array<std::uint64_t, WideDecimal::kMaxTenPowExponent + 1> kTenPowers = {
    1ULL,
    10ULL,
    100ULL,
    1'000ULL,
    10'000ULL,
    100'000ULL,
    1'000'000ULL,
    10'000'000ULL,
    100'000'000ULL,
    1'000'000'000ULL,
    10'000'000'000ULL,
    100'000'000'000ULL,
    1'000'000'000'000ULL,
    10'000'000'000'000ULL,
    100'000'000'000'000ULL,
    1'000'000'000'000'000ULL,
    10'000'000'000'000'000ULL,
};

const Uint384& Max192() {
    static const Uint384 kMax = (Uint384(1) << WideDecimal::kBits) - 1;
    return kMax;
}

Uint384 Widen(const Uint192& value) { return Uint384(value); }

std::optional<Uint192> Narrow(const Uint384& value) {
    if (value > Max192()) {
        return std::nullopt;
    }
    return static_cast<Uint192>(value);
}

unsigned ExponentMagnitude(int exponent) {
    return exponent < 0 ? static_cast<unsigned>(-(exponent + 1)) + 1U
                        : static_cast<unsigned>(exponent);
}

std::uint64_t NarrowToU64(const Uint384& value) {
    if (value > Uint384(UINT64_MAX)) {
        throw NumericalError(NumericalErrorCode::kOverflow,
                             value.str(),
                             "cannot convert to u64 due to overflow");
    }
    return static_cast<std::uint64_t>(value);
}

}  // namespace

WideDecimal WideDecimal::One() { return WideDecimal(Uint192(1) << kPrecision); }

WideDecimal WideDecimal::Zero() { return WideDecimal(Uint192(0)); }

WideDecimal WideDecimal::Max() { return WideDecimal(static_cast<Uint192>(Max192())); }

WideDecimal WideDecimal::Min() { return Zero(); }

WideDecimal WideDecimal::FromRaw(const Uint192& raw) { return WideDecimal(raw); }

WideDecimal WideDecimal::FromInteger(const Uint192& value) { return FromDecimal(value, 0); }

Uint192 WideDecimal::TenPow(unsigned exponent) {
    if (exponent > kMaxTenPowExponent) {
        throw std::invalid_argument("no support for exponent: " + std::to_string(exponent));
    }
    return Uint192(kTenPowers[exponent]);
}

WideDecimal WideDecimal::FromDecimal(const Uint192& value, int exponent) {
    const Uint384 factor(TenPow(ExponentMagnitude(exponent)));
    const Uint384 expanded = Widen(value) << kPrecision;
    const Uint384 scaled =
        exponent < 0 ? Uint384((expanded + factor - 1) / factor) : Uint384(expanded * factor);
    const auto narrowed = Narrow(scaled);
    if (!narrowed.has_value()) {
        throw NumericalError(NumericalErrorCode::kOverflow,
                             value.str() + "e" + std::to_string(exponent));
    }
    return WideDecimal(*narrowed);
}

WideDecimal WideDecimal::FromU64(std::uint64_t value, int exponent) {
    return FromDecimal(Uint192(value), exponent);
}

WideDecimal WideDecimal::FromBps(std::uint16_t basis_points) {
    return FromDecimal(Uint192(basis_points), kBpsExponent);
}

WideDecimal WideDecimal::FromBits(const Bits& bits) {
    Uint192 raw(0);
    for (std::size_t limb = 0; limb < kByteSize / 8; ++limb) {
        std::uint64_t word = 0;
        std::memcpy(&word, bits.data() + limb * 8, sizeof(word));
        raw |= Uint192(word) << (64 * limb);
    }
    return WideDecimal(raw);
}

Uint192 WideDecimal::AsDecimal(int exponent) const {
    const Uint384 factor(TenPow(ExponentMagnitude(exponent)));
    const Uint384 scaled =
        exponent < 0 ? Uint384(Widen(raw_) * factor) : Uint384(Widen(raw_) / factor);
    const auto narrowed = Narrow(scaled >> kPrecision);
    if (!narrowed.has_value()) {
        throw NumericalError(NumericalErrorCode::kOverflow, ToString());
    }
    return *narrowed;
}

std::uint64_t WideDecimal::AsU64(int exponent) const {
    return AsU64(exponent, FixedRoundingMode::kDown);
}

std::uint64_t WideDecimal::AsU64Ceil(int exponent) const {
    return AsU64(exponent, FixedRoundingMode::kUp);
}

std::uint64_t WideDecimal::AsU64Rounded(int exponent) const {
    return AsU64(exponent, FixedRoundingMode::kHalfUp);
}

std::uint64_t WideDecimal::AsU64(int exponent, FixedRoundingMode mode) const {
    // Target value is raw * 10^-exponent / 2^50, evaluated as one division.
    const Uint384 factor(TenPow(ExponentMagnitude(exponent)));
    Uint384 numerator = Widen(raw_);
    Uint384 denominator = Uint384(1) << kPrecision;
    if (exponent < 0) {
        numerator *= factor;
    } else {
        denominator *= factor;
    }
    switch (mode) {
        case FixedRoundingMode::kDown:
            break;
        case FixedRoundingMode::kUp:
            numerator += denominator - 1;
            break;
        case FixedRoundingMode::kHalfUp:
            numerator += denominator >> 1;
            break;
    }
    return NarrowToU64(numerator / denominator);
}

WideDecimal WideDecimal::Pow(const WideDecimal& exponent) const {
    if (exponent.raw_ == 0) {
        return WideDecimal(Uint192(1));
    }
    if (raw_ <= 1) {
        return *this;
    }
    // Any base >= 2 overflows 192 bits once the exponent reaches 192.
    if (exponent.raw_ >= kBits) {
        throw NumericalError(NumericalErrorCode::kMultiplicationOverflow, ToString());
    }
    auto remaining = static_cast<unsigned>(exponent.raw_);
    Uint384 base = Widen(raw_);
    Uint384 result(1);
    while (true) {
        if ((remaining & 1U) != 0) {
            result *= base;
            if (result > Max192()) {
                throw NumericalError(NumericalErrorCode::kMultiplicationOverflow, ToString());
            }
        }
        remaining >>= 1U;
        if (remaining == 0) {
            break;
        }
        base *= base;
        if (base > Max192()) {
            throw NumericalError(NumericalErrorCode::kMultiplicationOverflow, ToString());
        }
    }
    return WideDecimal(static_cast<Uint192>(result));
}

WideDecimal WideDecimal::SaturatingAdd(const WideDecimal& rhs) const {
    const auto sum = CheckedAdd(rhs);
    return sum.has_value() ? *sum : Max();
}

WideDecimal WideDecimal::SaturatingSub(const WideDecimal& rhs) const {
    const auto difference = CheckedSub(rhs);
    return difference.has_value() ? *difference : Zero();
}

WideDecimal WideDecimal::SaturatingMul(const WideDecimal& rhs) const {
    const auto product = CheckedMul(rhs);
    return product.has_value() ? *product : Max();
}

std::optional<WideDecimal> WideDecimal::CheckedAdd(const WideDecimal& rhs) const {
    const auto sum = Narrow(Widen(raw_) + Widen(rhs.raw_));
    if (!sum.has_value()) {
        return std::nullopt;
    }
    return WideDecimal(*sum);
}

std::optional<WideDecimal> WideDecimal::CheckedSub(const WideDecimal& rhs) const {
    if (rhs.raw_ > raw_) {
        return std::nullopt;
    }
    return WideDecimal(Uint192(raw_ - rhs.raw_));
}

std::optional<WideDecimal> WideDecimal::CheckedMul(const WideDecimal& rhs) const {
    const auto product = Narrow((Widen(raw_) * Widen(rhs.raw_)) >> kPrecision);
    if (!product.has_value()) {
        return std::nullopt;
    }
    return WideDecimal(*product);
}

std::optional<WideDecimal> WideDecimal::CheckedDiv(const WideDecimal& rhs) const {
    if (rhs.raw_ == 0) {
        return std::nullopt;
    }
    const auto quotient = Narrow((Widen(raw_) << kPrecision) / Widen(rhs.raw_));
    if (!quotient.has_value()) {
        return std::nullopt;
    }
    return WideDecimal(*quotient);
}

WideDecimal WideDecimal::Add(const WideDecimal& rhs) const {
    const auto sum = CheckedAdd(rhs);
    if (!sum.has_value()) {
        throw NumericalError(NumericalErrorCode::kAdditionOverflow, ToString());
    }
    return *sum;
}

WideDecimal WideDecimal::Sub(const WideDecimal& rhs) const {
    const auto difference = CheckedSub(rhs);
    if (!difference.has_value()) {
        throw NumericalError(NumericalErrorCode::kSubtractionUnderflow, ToString());
    }
    return *difference;
}

WideDecimal WideDecimal::Mul(const WideDecimal& rhs) const {
    const auto product = CheckedMul(rhs);
    if (!product.has_value()) {
        throw NumericalError(NumericalErrorCode::kMultiplicationOverflow, ToString());
    }
    return *product;
}

WideDecimal WideDecimal::Div(const WideDecimal& rhs) const {
    if (rhs.raw_ == 0) {
        throw NumericalError(NumericalErrorCode::kZeroDivision, ToString());
    }
    const auto quotient = CheckedDiv(rhs);
    if (!quotient.has_value()) {
        throw NumericalError(NumericalErrorCode::kOverflow, ToString());
    }
    return *quotient;
}

WideDecimal WideDecimal::MulScalar(const Uint192& rhs) const {
    const auto product = Narrow(Widen(raw_) * Widen(rhs));
    if (!product.has_value()) {
        throw NumericalError(NumericalErrorCode::kMultiplicationOverflow, ToString());
    }
    return WideDecimal(*product);
}

WideDecimal WideDecimal::DivScalar(const Uint192& rhs) const {
    if (rhs == 0) {
        throw NumericalError(NumericalErrorCode::kZeroDivision, ToString());
    }
    return WideDecimal(Uint192(raw_ / rhs));
}

WideDecimal::Bits WideDecimal::IntoBits() const {
    Bits bits{};
    const Uint192 mask(UINT64_MAX);
    for (std::size_t limb = 0; limb < kByteSize / 8; ++limb) {
        const auto word = static_cast<std::uint64_t>((raw_ >> (64 * limb)) & mask);
        std::memcpy(bits.data() + limb * 8, &word, sizeof(word));
    }
    return bits;
}

std::string WideDecimal::ToString() const {
    const Uint384 unit(kTenPowers[kDisplayFractionDigits]);
    const Uint384 scaled = (Widen(raw_) * unit) >> kPrecision;
    const std::string integer = Uint384(scaled / unit).str();
    std::string fraction = std::to_string(static_cast<std::uint64_t>(scaled % unit));
    fraction.insert(0, kDisplayFractionDigits - fraction.size(), '0');
    const auto last = fraction.find_last_not_of('0');
    fraction = last == std::string::npos ? "0" : fraction.substr(0, last + 1);
    return integer + "." + fraction;
}

WideDecimal& WideDecimal::operator+=(const WideDecimal& rhs) {
    *this = Add(rhs);
    return *this;
}

WideDecimal& WideDecimal::operator-=(const WideDecimal& rhs) {
    *this = Sub(rhs);
    return *this;
}

WideDecimal& WideDecimal::operator*=(const WideDecimal& rhs) {
    *this = Mul(rhs);
    return *this;
}

WideDecimal& WideDecimal::operator/=(const WideDecimal& rhs) {
    *this = Div(rhs);
    return *this;
}

WideDecimal operator+(const WideDecimal& lhs, const WideDecimal& rhs) { return lhs.Add(rhs); }

WideDecimal operator-(const WideDecimal& lhs, const WideDecimal& rhs) { return lhs.Sub(rhs); }

WideDecimal operator*(const WideDecimal& lhs, const WideDecimal& rhs) { return lhs.Mul(rhs); }

WideDecimal operator/(const WideDecimal& lhs, const WideDecimal& rhs) { return lhs.Div(rhs); }

WideDecimal operator*(const WideDecimal& lhs, std::uint64_t rhs) {
    return lhs.MulScalar(Uint192(rhs));
}

WideDecimal operator/(const WideDecimal& lhs, std::uint64_t rhs) {
    return lhs.DivScalar(Uint192(rhs));
}

std::ostream& operator<<(std::ostream& os, const WideDecimal& value) {
    return os << value.ToString();
}

}  // namespace ledger_math

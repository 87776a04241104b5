#pragma once

#include <cstdint>
#include <optional>

#include <boost/multiprecision/cpp_int.hpp>

#include "ledger_math/core/int128.h"

namespace ledger_math {

namespace mp = boost::multiprecision;

// Fixed-width unchecked backends: overflow is detected by the callers, which
// keep intermediates in a type twice as wide as the stored value.
using Uint192 = mp::number<
    mp::cpp_int_backend<192, 192, mp::unsigned_magnitude, mp::unchecked, void>>;
using Uint256 = mp::number<
    mp::cpp_int_backend<256, 256, mp::unsigned_magnitude, mp::unchecked, void>>;
using Uint384 = mp::number<
    mp::cpp_int_backend<384, 384, mp::unsigned_magnitude, mp::unchecked, void>>;
using Int256 =
    mp::number<mp::cpp_int_backend<256, 256, mp::signed_magnitude, mp::unchecked, void>>;

inline Uint256 WidenToUint256(Uint128 value) {
    return (Uint256(HighWord(value)) << 64) | Uint256(LowWord(value));
}

inline Int256 WidenToInt256(Int128 value) {
    const Uint128 magnitude = UnsignedAbs(value);
    Int256 wide = (Int256(HighWord(magnitude)) << 64) | Int256(LowWord(magnitude));
    return value < 0 ? Int256(-wide) : wide;
}

// Low 128 bits of `value`.
inline Uint128 TruncateToUint128(const Uint256& value) {
    const Uint256 mask(UINT64_MAX);
    const auto low = static_cast<std::uint64_t>(value & mask);
    const auto high = static_cast<std::uint64_t>((value >> 64) & mask);
    return MakeUint128(high, low);
}

inline std::optional<Uint128> NarrowToUint128(const Uint256& value) {
    if ((value >> 128) != 0) {
        return std::nullopt;
    }
    return TruncateToUint128(value);
}

inline std::optional<Int128> NarrowToInt128(const Int256& value) {
    static const Int256 kMax = WidenToInt256(kInt128Max);
    static const Int256 kMin = WidenToInt256(kInt128Min);
    if (value > kMax || value < kMin) {
        return std::nullopt;
    }
    const Int256 magnitude = mp::abs(value);
    const Int256 mask(UINT64_MAX);
    const auto low = static_cast<std::uint64_t>(magnitude & mask);
    const auto high = static_cast<std::uint64_t>((magnitude >> 64) & mask);
    const Uint128 bits = MakeUint128(high, low);
    return value < 0 ? static_cast<Int128>(~bits + 1) : static_cast<Int128>(bits);
}

}  // namespace ledger_math

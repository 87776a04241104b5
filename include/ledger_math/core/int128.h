#pragma once

#include <cstdint>
#include <string>

namespace ledger_math {

__extension__ typedef __int128 Int128;
__extension__ typedef unsigned __int128 Uint128;

constexpr Uint128 kUint128Max = ~static_cast<Uint128>(0);
constexpr Int128 kInt128Max = static_cast<Int128>(kUint128Max >> 1);
constexpr Int128 kInt128Min = -kInt128Max - 1;

inline constexpr Uint128 MakeUint128(std::uint64_t high, std::uint64_t low) {
    return (static_cast<Uint128>(high) << 64) | static_cast<Uint128>(low);
}

inline constexpr std::uint64_t HighWord(Uint128 value) {
    return static_cast<std::uint64_t>(value >> 64);
}

inline constexpr std::uint64_t LowWord(Uint128 value) {
    return static_cast<std::uint64_t>(value);
}

// Two's complement magnitude; well defined for kInt128Min.
inline constexpr Uint128 UnsignedAbs(Int128 value) {
    return value < 0 ? ~static_cast<Uint128>(value) + 1 : static_cast<Uint128>(value);
}

std::string ToDecimalString(Uint128 value);
std::string ToDecimalString(Int128 value);

bool ParseUint128(const std::string& text, Uint128* out, std::string* error);
bool ParseInt128(const std::string& text, Int128* out, std::string* error);

}  // namespace ledger_math

#pragma once

namespace ledger_math {

// A basis point is 10^-4 of a unit.
constexpr int kBpsExponent = -4;

}  // namespace ledger_math

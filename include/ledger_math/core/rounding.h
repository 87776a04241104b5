#pragma once

#include <string>

namespace ledger_math {

enum class FixedRoundingMode {
    kHalfUp = 0,
    kDown = 1,
    kUp = 2,
};

const char* FixedRoundingModeName(FixedRoundingMode mode);
bool ParseFixedRoundingMode(const std::string& text, FixedRoundingMode* mode);

}  // namespace ledger_math

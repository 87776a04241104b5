#include "ledger_math/core/rounding.h"

namespace ledger_math {

const char* FixedRoundingModeName(FixedRoundingMode mode) {
    switch (mode) {
        case FixedRoundingMode::kDown:
            return "down";
        case FixedRoundingMode::kUp:
            return "up";
        case FixedRoundingMode::kHalfUp:
        default:
            return "nearest";
    }
}

bool ParseFixedRoundingMode(const std::string& text, FixedRoundingMode* mode) {
    if (mode == nullptr) {
        return false;
    }
    if (text == "down" || text == "floor") {
        *mode = FixedRoundingMode::kDown;
        return true;
    }
    if (text == "up" || text == "ceil") {
        *mode = FixedRoundingMode::kUp;
        return true;
    }
    if (text == "nearest" || text == "half_up") {
        *mode = FixedRoundingMode::kHalfUp;
        return true;
    }
    return false;
}

}  // namespace ledger_math

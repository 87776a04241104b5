#pragma once

#include <stdexcept>
#include <string>

namespace ledger_math {

enum class NumericalErrorCode {
    kAdditionOverflow = 0,
    kSubtractionUnderflow = 1,
    kMultiplicationOverflow = 2,
    kZeroDivision = 3,
    kOverflow = 4,
    kNegativeValue = 5,
};

const char* NumericalErrorCodeName(NumericalErrorCode code);

// Raised for faults that indicate caller misuse: overflow on a raw operator,
// division by zero, or narrowing a value that cannot fit the target.
// `value()` holds the canonical rendering of the operand that overflowed.
class NumericalError : public std::runtime_error {
public:
    NumericalError(NumericalErrorCode code, std::string value);
    NumericalError(NumericalErrorCode code, std::string value, const std::string& message);

    NumericalErrorCode code() const noexcept { return code_; }
    const std::string& value() const noexcept { return value_; }

private:
    NumericalErrorCode code_;
    std::string value_;
};

std::string DefaultNumericalErrorMessage(NumericalErrorCode code);

}  // namespace ledger_math

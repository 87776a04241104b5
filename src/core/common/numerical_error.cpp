#include "ledger_math/core/numerical_error.h"

#include <utility>

namespace ledger_math {

const char* NumericalErrorCodeName(NumericalErrorCode code) {
    switch (code) {
        case NumericalErrorCode::kAdditionOverflow:
            return "addition_overflow";
        case NumericalErrorCode::kSubtractionUnderflow:
            return "subtraction_underflow";
        case NumericalErrorCode::kMultiplicationOverflow:
            return "multiplication_overflow";
        case NumericalErrorCode::kZeroDivision:
            return "zero_division";
        case NumericalErrorCode::kOverflow:
            return "overflow";
        case NumericalErrorCode::kNegativeValue:
            return "negative_value";
    }
    return "unknown";
}

std::string DefaultNumericalErrorMessage(NumericalErrorCode code) {
    switch (code) {
        case NumericalErrorCode::kAdditionOverflow:
            return "overflow on checked add";
        case NumericalErrorCode::kSubtractionUnderflow:
            return "underflow on checked sub";
        case NumericalErrorCode::kMultiplicationOverflow:
            return "overflow on checked mul";
        case NumericalErrorCode::kZeroDivision:
            return "division by zero";
        case NumericalErrorCode::kOverflow:
            return "an integer value overflowed";
        case NumericalErrorCode::kNegativeValue:
            return "value is negative";
    }
    return "numerical error";
}

NumericalError::NumericalError(NumericalErrorCode code, std::string value)
    : NumericalError(code, std::move(value), DefaultNumericalErrorMessage(code)) {}

NumericalError::NumericalError(NumericalErrorCode code,
                               std::string value,
                               const std::string& message)
    : std::runtime_error(value.empty() ? message : message + ": " + value),
      code_(code),
      value_(std::move(value)) {}

}  // namespace ledger_math

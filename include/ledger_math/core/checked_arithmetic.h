#pragma once

#include <optional>
#include <string>
#include <type_traits>

#include "ledger_math/core/int128.h"
#include "ledger_math/core/numerical_error.h"

namespace ledger_math {

template <typename T>
struct IsBuiltinInteger
    : std::integral_constant<bool,
                             (std::is_integral<T>::value && !std::is_same<T, bool>::value) ||
                                 std::is_same<T, Int128>::value ||
                                 std::is_same<T, Uint128>::value> {};

// Minimal interface behind the checked helpers below. Class types provide
// CheckedAdd/CheckedSub/CheckedMul/CheckedDiv members returning std::optional;
// built-in integers (including the 128-bit extensions) use compiler builtins.
template <typename T, typename Enable = void>
struct CheckedArithmetic {
    static std::optional<T> Add(const T& lhs, const T& rhs) { return lhs.CheckedAdd(rhs); }
    static std::optional<T> Sub(const T& lhs, const T& rhs) { return lhs.CheckedSub(rhs); }
    static std::optional<T> Mul(const T& lhs, const T& rhs) { return lhs.CheckedMul(rhs); }
    static std::optional<T> Div(const T& lhs, const T& rhs) { return lhs.CheckedDiv(rhs); }
    static std::string Render(const T& value) { return value.ToString(); }
};

template <typename T>
struct CheckedArithmetic<T, std::enable_if_t<IsBuiltinInteger<T>::value>> {
    static constexpr bool kSigned = static_cast<T>(-1) < static_cast<T>(0);

    static std::optional<T> Add(T lhs, T rhs) {
        T out{};
        if (__builtin_add_overflow(lhs, rhs, &out)) {
            return std::nullopt;
        }
        return out;
    }

    static std::optional<T> Sub(T lhs, T rhs) {
        T out{};
        if (__builtin_sub_overflow(lhs, rhs, &out)) {
            return std::nullopt;
        }
        return out;
    }

    static std::optional<T> Mul(T lhs, T rhs) {
        T out{};
        if (__builtin_mul_overflow(lhs, rhs, &out)) {
            return std::nullopt;
        }
        return out;
    }

    static std::optional<T> Div(T lhs, T rhs) {
        if (rhs == 0) {
            return std::nullopt;
        }
        if (kSigned && rhs == static_cast<T>(-1)) {
            // min / -1 is the only signed quotient that does not fit.
            return Sub(static_cast<T>(0), lhs);
        }
        return static_cast<T>(lhs / rhs);
    }

    static std::string Render(T value) {
        if (kSigned) {
            return ToDecimalString(static_cast<Int128>(value));
        }
        return ToDecimalString(static_cast<Uint128>(value));
    }
};

template <typename T>
std::optional<T> CheckedAdd(const T& lhs, const T& rhs) {
    return CheckedArithmetic<T>::Add(lhs, rhs);
}

template <typename T>
std::optional<T> CheckedSub(const T& lhs, const T& rhs) {
    return CheckedArithmetic<T>::Sub(lhs, rhs);
}

template <typename T>
std::optional<T> CheckedMul(const T& lhs, const T& rhs) {
    return CheckedArithmetic<T>::Mul(lhs, rhs);
}

template <typename T>
std::optional<T> CheckedDiv(const T& lhs, const T& rhs) {
    return CheckedArithmetic<T>::Div(lhs, rhs);
}

namespace detail {

template <typename T>
NumericalErrorCode DivisionFailureCode(const T& rhs) {
    return rhs == T{} ? NumericalErrorCode::kZeroDivision : NumericalErrorCode::kOverflow;
}

template <typename T>
bool AssignOrReport(T* value,
                    const std::optional<T>& result,
                    NumericalErrorCode failure,
                    NumericalErrorCode* error) {
    if (!result.has_value()) {
        if (error != nullptr) {
            *error = failure;
        }
        return false;
    }
    *value = *result;
    return true;
}

template <typename T>
T ValueOrThrow(const std::optional<T>& result, NumericalErrorCode failure, const T& operand) {
    if (!result.has_value()) {
        throw NumericalError(failure, CheckedArithmetic<T>::Render(operand));
    }
    return *result;
}

}  // namespace detail

// In-place variants: `*value` is overwritten only when the operation succeeds.
// `amount` does not take part in deduction, so literals convert to T.
template <typename T>
bool TryAddAssign(T* value, const std::decay_t<T>& amount, NumericalErrorCode* error = nullptr) {
    return detail::AssignOrReport(
        value, CheckedAdd(*value, amount), NumericalErrorCode::kAdditionOverflow, error);
}

template <typename T>
bool TrySubAssign(T* value, const std::decay_t<T>& amount, NumericalErrorCode* error = nullptr) {
    return detail::AssignOrReport(
        value, CheckedSub(*value, amount), NumericalErrorCode::kSubtractionUnderflow, error);
}

template <typename T>
bool TryMulAssign(T* value, const std::decay_t<T>& amount, NumericalErrorCode* error = nullptr) {
    return detail::AssignOrReport(
        value, CheckedMul(*value, amount), NumericalErrorCode::kMultiplicationOverflow, error);
}

template <typename T>
bool TryDivAssign(T* value, const std::decay_t<T>& amount, NumericalErrorCode* error = nullptr) {
    return detail::AssignOrReport(
        value, CheckedDiv(*value, amount), detail::DivisionFailureCode(amount), error);
}

template <typename T>
T SafeAdd(const T& lhs, const T& rhs) {
    return detail::ValueOrThrow(CheckedAdd(lhs, rhs), NumericalErrorCode::kAdditionOverflow, lhs);
}

template <typename T>
T SafeSub(const T& lhs, const T& rhs) {
    return detail::ValueOrThrow(
        CheckedSub(lhs, rhs), NumericalErrorCode::kSubtractionUnderflow, lhs);
}

template <typename T>
T SafeMul(const T& lhs, const T& rhs) {
    return detail::ValueOrThrow(
        CheckedMul(lhs, rhs), NumericalErrorCode::kMultiplicationOverflow, lhs);
}

template <typename T>
T SafeDiv(const T& lhs, const T& rhs) {
    return detail::ValueOrThrow(CheckedDiv(lhs, rhs), detail::DivisionFailureCode(rhs), lhs);
}

}  // namespace ledger_math

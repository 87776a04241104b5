#include "ledger_math/apps/decimal_cli.h"

#include <cstdint>
#include <iomanip>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>

#include "ledger_math/core/narrow_fixed_point.h"
#include "ledger_math/core/numerical_error.h"
#include "ledger_math/core/signed_decimal128.h"
#include "ledger_math/core/wide_decimal.h"

namespace ledger_math::apps {
namespace {

bool ParseExponent(const std::string& text, int* out, std::string* error) {
    bool valid = false;
    try {
        std::size_t consumed = 0;
        const int parsed = std::stoi(text, &consumed);
        valid = consumed == text.size();
        if (valid) {
            *out = parsed;
        }
    } catch (const std::exception&) {
        valid = false;
    }
    if (valid) {
        return true;
    }
    if (error != nullptr) {
        *error = "invalid exponent: " + text;
    }
    return false;
}

bool ParseDecimalType(const std::string& text, DecimalType* type) {
    if (text == "wide") {
        *type = DecimalType::kWide;
        return true;
    }
    if (text == "signed") {
        *type = DecimalType::kSigned;
        return true;
    }
    if (text == "fp32") {
        *type = DecimalType::kFp32;
        return true;
    }
    return false;
}

bool IsBinaryOp(const std::string& op) {
    return op == "add" || op == "sub" || op == "mul" || op == "div";
}

Uint192 ToUint192(Uint128 value) {
    return (Uint192(HighWord(value)) << 64) | Uint192(LowWord(value));
}

bool ParseWide(const std::string& text, int exponent, WideDecimal* out, std::string* error) {
    Uint128 value = 0;
    if (!ParseUint128(text, &value, error)) {
        return false;
    }
    *out = WideDecimal::FromDecimal(ToUint192(value), exponent);
    return true;
}

bool ParseSigned(const std::string& text, int exponent, SignedDecimal128* out, std::string* error) {
    Int128 value = 0;
    if (!ParseInt128(text, &value, error)) {
        return false;
    }
    *out = SignedDecimal128::FromDecimal(value, exponent);
    return true;
}

bool ParseFp32(const std::string& text, NarrowFixedPoint* out, std::string* error) {
    Uint128 value = 0;
    if (!ParseUint128(text, &value, error)) {
        return false;
    }
    if (value > std::numeric_limits<std::uint64_t>::max()) {
        if (error != nullptr) {
            *error = "fp32 input must fit in 64 bits: " + text;
        }
        return false;
    }
    *out = NarrowFixedPoint::FromInteger(static_cast<std::uint64_t>(value));
    return true;
}

template <typename T>
T ApplyBinaryOp(const std::string& op, const T& lhs, const T& rhs) {
    if (op == "add") {
        return lhs + rhs;
    }
    if (op == "sub") {
        return lhs - rhs;
    }
    if (op == "mul") {
        return lhs * rhs;
    }
    return lhs / rhs;
}

std::string OptionalU64Text(const std::optional<std::uint64_t>& value) {
    return value.has_value() ? std::to_string(*value) : "none";
}

int UnsupportedOp(const DecimalCliRequest& request, const char* type_name, std::string* error) {
    if (error != nullptr) {
        *error = std::string("unsupported op for ") + type_name + ": " + request.op;
    }
    return kExitInvalidArgument;
}

int RunWide(const DecimalCliRequest& request,
            const LedgerMathConfig& config,
            std::string* output,
            std::string* error) {
    WideDecimal value;
    if (!ParseWide(request.value, request.exponent, &value, error)) {
        return kExitInvalidArgument;
    }
    if (IsBinaryOp(request.op)) {
        WideDecimal rhs;
        if (!ParseWide(request.rhs, request.rhs_exponent, &rhs, error)) {
            return kExitInvalidArgument;
        }
        *output = ApplyBinaryOp(request.op, value, rhs).ToString();
        return kExitOk;
    }
    if (request.op == "render") {
        *output = value.ToString();
    } else if (request.op == "as_u64") {
        *output = std::to_string(value.AsU64(request.target_exponent));
    } else if (request.op == "as_u64_ceil") {
        *output = std::to_string(value.AsU64Ceil(request.target_exponent));
    } else if (request.op == "as_u64_rounded") {
        *output = std::to_string(value.AsU64Rounded(request.target_exponent));
    } else if (request.op == "narrow") {
        *output = std::to_string(value.AsU64(request.target_exponent, config.rounding));
    } else if (request.op == "as_decimal") {
        *output = value.AsDecimal(request.target_exponent).str();
    } else if (request.op == "bits") {
        *output = BytesToHex(value.IntoBits());
    } else {
        return UnsupportedOp(request, "wide", error);
    }
    return kExitOk;
}

int RunSigned(const DecimalCliRequest& request, std::string* output, std::string* error) {
    SignedDecimal128 value;
    if (!ParseSigned(request.value, request.exponent, &value, error)) {
        return kExitInvalidArgument;
    }
    if (IsBinaryOp(request.op)) {
        SignedDecimal128 rhs;
        if (!ParseSigned(request.rhs, request.rhs_exponent, &rhs, error)) {
            return kExitInvalidArgument;
        }
        *output = ApplyBinaryOp(request.op, value, rhs).ToString();
        return kExitOk;
    }
    if (request.op == "render") {
        *output = value.ToString();
    } else if (request.op == "as_u64") {
        *output = std::to_string(value.AsU64(request.target_exponent));
    } else if (request.op == "as_f64") {
        std::ostringstream oss;
        oss << std::setprecision(std::numeric_limits<double>::max_digits10) << value.AsF64();
        *output = oss.str();
    } else if (request.op == "bits") {
        *output = BytesToHex(value.IntoBits());
    } else {
        return UnsupportedOp(request, "signed", error);
    }
    return kExitOk;
}

int RunFp32(const DecimalCliRequest& request, std::string* output, std::string* error) {
    NarrowFixedPoint value;
    if (!ParseFp32(request.value, &value, error)) {
        return kExitInvalidArgument;
    }
    if (IsBinaryOp(request.op)) {
        NarrowFixedPoint rhs;
        if (!ParseFp32(request.rhs, &rhs, error)) {
            return kExitInvalidArgument;
        }
        *output = ApplyBinaryOp(request.op, value, rhs).ToString();
        return kExitOk;
    }
    if (request.op == "render") {
        *output = value.ToString();
    } else if (request.op == "as_u64") {
        *output = OptionalU64Text(value.AsDecimalU64());
    } else if (request.op == "as_u64_ceil") {
        *output = OptionalU64Text(value.AsDecimalU64Ceil());
    } else if (request.op == "bits") {
        *output = BytesToHex(value.IntoBits());
    } else {
        return UnsupportedOp(request, "fp32", error);
    }
    return kExitOk;
}

}  // namespace

bool ParseDecimalCliRequest(const ArgMap& args,
                            const LedgerMathConfig& config,
                            DecimalCliRequest* request,
                            std::string* error) {
    if (request == nullptr) {
        if (error != nullptr) {
            *error = "output request pointer is null";
        }
        return false;
    }
    DecimalCliRequest parsed;
    const auto type_text = GetArg(args, "type", "wide");
    if (!ParseDecimalType(type_text, &parsed.type)) {
        if (error != nullptr) {
            *error = "invalid type: " + type_text;
        }
        return false;
    }
    parsed.op = GetArg(args, "op", "render");
    if (!HasArg(args, "value")) {
        if (error != nullptr) {
            *error = "missing --value";
        }
        return false;
    }
    parsed.value = GetArg(args, "value");
    parsed.exponent = config.default_exponent;
    if (HasArg(args, "exponent") && !ParseExponent(GetArg(args, "exponent"), &parsed.exponent, error)) {
        return false;
    }
    parsed.target_exponent = parsed.exponent;
    if (HasArg(args, "target-exponent") &&
        !ParseExponent(GetArg(args, "target-exponent"), &parsed.target_exponent, error)) {
        return false;
    }
    parsed.rhs_exponent = parsed.exponent;
    if (HasArg(args, "rhs-exponent") &&
        !ParseExponent(GetArg(args, "rhs-exponent"), &parsed.rhs_exponent, error)) {
        return false;
    }
    parsed.has_rhs = HasArg(args, "rhs");
    parsed.rhs = GetArg(args, "rhs");
    if (IsBinaryOp(parsed.op) && !parsed.has_rhs) {
        if (error != nullptr) {
            *error = "missing --rhs for op: " + parsed.op;
        }
        return false;
    }
    *request = parsed;
    return true;
}

int RunDecimalCli(const DecimalCliRequest& request,
                  const LedgerMathConfig& config,
                  std::string* output,
                  std::string* error,
                  NumericalErrorCode* numerical_code) {
    if (output == nullptr) {
        if (error != nullptr) {
            *error = "output pointer is null";
        }
        return kExitInvalidArgument;
    }
    try {
        switch (request.type) {
            case DecimalType::kWide:
                return RunWide(request, config, output, error);
            case DecimalType::kSigned:
                return RunSigned(request, output, error);
            case DecimalType::kFp32:
                return RunFp32(request, output, error);
        }
    } catch (const NumericalError& ex) {
        if (error != nullptr) {
            *error = ex.what();
        }
        if (numerical_code != nullptr) {
            *numerical_code = ex.code();
        }
        return kExitNumericalError;
    } catch (const std::invalid_argument& ex) {
        if (error != nullptr) {
            *error = ex.what();
        }
        return kExitInvalidArgument;
    }
    if (error != nullptr) {
        *error = "unknown decimal type";
    }
    return kExitInvalidArgument;
}

}  // namespace ledger_math::apps

#pragma once

#include <string>

#include "ledger_math/apps/cli_support.h"
#include "ledger_math/core/ledger_math_config.h"
#include "ledger_math/core/numerical_error.h"

namespace ledger_math::apps {

enum class DecimalType {
    kWide = 0,
    kSigned = 1,
    kFp32 = 2,
};

struct DecimalCliRequest {
    DecimalType type{DecimalType::kWide};
    std::string op{"render"};
    std::string value{"0"};
    int exponent{0};
    // Exponent the conversion ops (as_u64*, narrow, as_decimal) read back at.
    int target_exponent{0};
    bool has_rhs{false};
    std::string rhs;
    int rhs_exponent{0};
};

constexpr int kExitOk = 0;
constexpr int kExitInvalidArgument = 2;
constexpr int kExitConfigError = 3;
constexpr int kExitNumericalError = 4;

bool ParseDecimalCliRequest(const ArgMap& args,
                            const LedgerMathConfig& config,
                            DecimalCliRequest* request,
                            std::string* error);

// Evaluates `request` and writes the rendered result to `output`.
// Returns one of the kExit* codes; `error` is set on failure and
// `numerical_code` on kExitNumericalError.
int RunDecimalCli(const DecimalCliRequest& request,
                  const LedgerMathConfig& config,
                  std::string* output,
                  std::string* error,
                  NumericalErrorCode* numerical_code = nullptr);

}  // namespace ledger_math::apps

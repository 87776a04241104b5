#pragma once

#include <string>

#include "ledger_math/core/rounding.h"

namespace ledger_math {

struct LedgerMathConfig {
    std::string log_level{"info"};
    std::string log_sink{"stderr"};
    int default_exponent{0};
    FixedRoundingMode rounding{FixedRoundingMode::kDown};
};

std::string GetEnvOrDefault(const char* key, const std::string& default_value);

// Replaces ${NAME} with the environment value of NAME; unknown names expand to "".
std::string ResolveEnvVars(const std::string& text);

class LedgerMathConfigValidator {
public:
    static bool Validate(const LedgerMathConfig& config, std::string* error);
};

}  // namespace ledger_math

#pragma once

#include <string>

#include "ledger_math/core/ledger_math_config.h"

namespace ledger_math {

class LedgerMathConfigLoader {
public:
    static bool LoadFromYaml(const std::string& path, LedgerMathConfig* config, std::string* error);
};

}  // namespace ledger_math

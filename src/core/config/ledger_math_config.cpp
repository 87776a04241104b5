#include "ledger_math/core/ledger_math_config.h"

#include <cstdlib>

#include "ledger_math/core/wide_decimal.h"

namespace ledger_math {

std::string GetEnvOrDefault(const char* key, const std::string& default_value) {
    const char* raw = std::getenv(key);
    if (raw == nullptr) {
        return default_value;
    }
    return std::string(raw);
}

std::string ResolveEnvVars(const std::string& text) {
    std::string resolved;
    resolved.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        const auto start = text.find("${", pos);
        if (start == std::string::npos) {
            resolved.append(text, pos, std::string::npos);
            break;
        }
        const auto end = text.find('}', start + 2);
        if (end == std::string::npos) {
            resolved.append(text, pos, std::string::npos);
            break;
        }
        resolved.append(text, pos, start - pos);
        const auto name = text.substr(start + 2, end - start - 2);
        resolved += GetEnvOrDefault(name.c_str(), "");
        pos = end + 1;
    }
    return resolved;
}

bool LedgerMathConfigValidator::Validate(const LedgerMathConfig& config, std::string* error) {
    if (config.log_level != "debug" && config.log_level != "info" && config.log_level != "warn" &&
        config.log_level != "error") {
        if (error != nullptr) {
            *error = "invalid log_level: " + config.log_level;
        }
        return false;
    }
    if (config.log_sink != "stderr" && config.log_sink != "stdout") {
        if (error != nullptr) {
            *error = "invalid log_sink: " + config.log_sink;
        }
        return false;
    }
    const int max_exponent = static_cast<int>(WideDecimal::kMaxTenPowExponent);
    if (config.default_exponent < -max_exponent || config.default_exponent > max_exponent) {
        if (error != nullptr) {
            *error = "default_exponent out of range: " + std::to_string(config.default_exponent);
        }
        return false;
    }
    return true;
}

}  // namespace ledger_math

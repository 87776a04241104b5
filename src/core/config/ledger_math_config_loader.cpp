#include "ledger_math/core/ledger_math_config_loader.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include "ledger_math/core/structured_log.h"

namespace ledger_math {
namespace {

std::string Trim(std::string value) {
    const auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
    value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string Lowercase(std::string value) {
    std::transform(value.begin(),
                   value.end(),
                   value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

std::unordered_map<std::string, std::string> LoadSimpleYaml(const std::string& path,
                                                            std::string* error) {
    std::unordered_map<std::string, std::string> kv;
    std::ifstream in(path);
    if (!in.is_open()) {
        if (error != nullptr) {
            *error = "unable to open config: " + path;
        }
        return kv;
    }

    std::string line;
    while (std::getline(in, line)) {
        const auto hash = line.find('#');
        if (hash != std::string::npos) {
            line = line.substr(0, hash);
        }
        line = Trim(line);
        if (line.empty() || line == "ledger_math:") {
            continue;
        }

        const auto pos = line.find(':');
        if (pos == std::string::npos) {
            continue;
        }

        const auto key = Trim(line.substr(0, pos));
        auto value = Trim(ResolveEnvVars(line.substr(pos + 1)));
        if (!key.empty()) {
            kv[key] = value;
        }
    }
    return kv;
}

bool ParseIntValue(const std::string& value, int* out) {
    if (out == nullptr) {
        return false;
    }
    try {
        std::size_t consumed = 0;
        const int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            return false;
        }
        *out = parsed;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

}  // namespace

bool LedgerMathConfigLoader::LoadFromYaml(const std::string& path,
                                          LedgerMathConfig* config,
                                          std::string* error) {
    if (config == nullptr) {
        if (error != nullptr) {
            *error = "output config pointer is null";
        }
        return false;
    }

    std::string load_error;
    const auto kv = LoadSimpleYaml(path, &load_error);
    if (!load_error.empty()) {
        if (error != nullptr) {
            *error = load_error;
        }
        return false;
    }

    LedgerMathConfig loaded;
    if (const auto it = kv.find("log_level"); it != kv.end()) {
        loaded.log_level = NormalizeLogLevel(it->second);
    }
    if (const auto it = kv.find("log_sink"); it != kv.end()) {
        loaded.log_sink = Lowercase(it->second);
    }
    if (const auto it = kv.find("default_exponent"); it != kv.end()) {
        if (!ParseIntValue(it->second, &loaded.default_exponent)) {
            if (error != nullptr) {
                *error = "invalid integer for key: default_exponent";
            }
            return false;
        }
    }
    if (const auto it = kv.find("rounding"); it != kv.end()) {
        if (!ParseFixedRoundingMode(Lowercase(it->second), &loaded.rounding)) {
            if (error != nullptr) {
                *error = "invalid rounding: " + it->second;
            }
            return false;
        }
    }

    std::string validation_error;
    if (!LedgerMathConfigValidator::Validate(loaded, &validation_error)) {
        if (error != nullptr) {
            *error = validation_error;
        }
        return false;
    }
    *config = loaded;
    return true;
}

}  // namespace ledger_math

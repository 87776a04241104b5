#include <iostream>
#include <string>

#include "ledger_math/apps/cli_support.h"
#include "ledger_math/apps/decimal_cli.h"
#include "ledger_math/core/ledger_math_config_loader.h"
#include "ledger_math/core/numerical_error.h"
#include "ledger_math/core/rounding.h"
#include "ledger_math/core/structured_log.h"

int main(int argc, char** argv) {
    using namespace ledger_math;
    using namespace ledger_math::apps;

    const auto args = ParseArgs(argc, argv);
    LedgerMathConfig config;
    const auto config_path = GetArg(args, "config", GetEnvOrDefault("LEDGER_MATH_CONFIG_PATH", ""));
    if (!config_path.empty()) {
        std::string error;
        if (!LedgerMathConfigLoader::LoadFromYaml(config_path, &config, &error)) {
            EmitStructuredLog(nullptr,
                              "ledger_math_cli",
                              "error",
                              "config_load_failed",
                              {{"config_path", config_path}, {"error", error}});
            return kExitConfigError;
        }
    }

    DecimalCliRequest request;
    std::string error;
    if (!ParseDecimalCliRequest(args, config, &request, &error)) {
        EmitStructuredLog(&config, "ledger_math_cli", "error", "invalid_argument", {{"error", error}});
        std::cerr << "usage: ledger_math_cli --type wide|signed|fp32 --op <op> --value N "
                     "[--exponent E] [--target-exponent E] [--rhs N] [--rhs-exponent E] "
                     "[--config path]\n";
        return kExitInvalidArgument;
    }

    EmitStructuredLog(&config,
                      "ledger_math_cli",
                      "debug",
                      "request_parsed",
                      {{"op", request.op},
                       {"value", request.value},
                       {"exponent", std::to_string(request.exponent)},
                       {"rounding", FixedRoundingModeName(config.rounding)}});

    std::string output;
    NumericalErrorCode code = NumericalErrorCode::kOverflow;
    const int rc = RunDecimalCli(request, config, &output, &error, &code);
    if (rc == kExitNumericalError) {
        EmitStructuredLog(&config,
                          "ledger_math_cli",
                          "error",
                          "numerical_error",
                          {{"op", request.op},
                           {"code", NumericalErrorCodeName(code)},
                           {"error", error}});
        return rc;
    }
    if (rc != kExitOk) {
        EmitStructuredLog(&config,
                          "ledger_math_cli",
                          "error",
                          "invalid_argument",
                          {{"op", request.op}, {"error", error}});
        return rc;
    }
    std::cout << "result=" << output << '\n';
    EmitStructuredLog(&config, "ledger_math_cli", "info", "completed", {{"op", request.op}});
    return kExitOk;
}

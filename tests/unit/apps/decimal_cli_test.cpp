#include <string>

#include <gtest/gtest.h>

#include "ledger_math/apps/decimal_cli.h"

namespace ledger_math::apps {
namespace {

struct CliOutcome {
    int rc{0};
    std::string output;
    std::string error;
};

CliOutcome RunCli(const ArgMap& args, const LedgerMathConfig& config = LedgerMathConfig{}) {
    CliOutcome outcome;
    DecimalCliRequest request;
    if (!ParseDecimalCliRequest(args, config, &request, &outcome.error)) {
        outcome.rc = kExitInvalidArgument;
        return outcome;
    }
    outcome.rc = RunDecimalCli(request, config, &outcome.output, &outcome.error);
    return outcome;
}

}  // namespace

TEST(DecimalCliTest, ParseAppliesDefaults) {
    LedgerMathConfig config;
    config.default_exponent = -2;
    DecimalCliRequest request;
    std::string error;
    ASSERT_TRUE(ParseDecimalCliRequest({{"value", "125"}}, config, &request, &error)) << error;
    EXPECT_EQ(request.type, DecimalType::kWide);
    EXPECT_EQ(request.op, "render");
    EXPECT_EQ(request.exponent, -2);
    EXPECT_EQ(request.target_exponent, -2);
    EXPECT_EQ(request.rhs_exponent, -2);
    EXPECT_FALSE(request.has_rhs);
}

TEST(DecimalCliTest, ParseReadsExplicitExponents) {
    DecimalCliRequest request;
    std::string error;
    ASSERT_TRUE(ParseDecimalCliRequest({{"type", "signed"},
                                        {"op", "add"},
                                        {"value", "1"},
                                        {"exponent", "-3"},
                                        {"target-exponent", "0"},
                                        {"rhs", "2"},
                                        {"rhs-exponent", "1"}},
                                       LedgerMathConfig{},
                                       &request,
                                       &error))
        << error;
    EXPECT_EQ(request.type, DecimalType::kSigned);
    EXPECT_EQ(request.exponent, -3);
    EXPECT_EQ(request.target_exponent, 0);
    EXPECT_EQ(request.rhs_exponent, 1);
    EXPECT_TRUE(request.has_rhs);
    EXPECT_EQ(request.rhs, "2");
}

TEST(DecimalCliTest, ParseRejectsBadArguments) {
    DecimalCliRequest request;
    std::string error;
    EXPECT_FALSE(ParseDecimalCliRequest({}, LedgerMathConfig{}, &request, &error));
    EXPECT_EQ(error, "missing --value");

    EXPECT_FALSE(ParseDecimalCliRequest(
        {{"type", "decimal"}, {"value", "1"}}, LedgerMathConfig{}, &request, &error));
    EXPECT_EQ(error, "invalid type: decimal");

    EXPECT_FALSE(ParseDecimalCliRequest(
        {{"op", "add"}, {"value", "1"}}, LedgerMathConfig{}, &request, &error));
    EXPECT_EQ(error, "missing --rhs for op: add");

    EXPECT_FALSE(ParseDecimalCliRequest(
        {{"value", "1"}, {"exponent", "-3x"}}, LedgerMathConfig{}, &request, &error));
    EXPECT_EQ(error, "invalid exponent: -3x");
}

TEST(DecimalCliTest, WideRenderAndConversions) {
    EXPECT_EQ(RunCli({{"value", "1242"}, {"exponent", "-3"}}).output, "1.242");

    const ArgMap base = {{"value", "15"}, {"exponent", "-1"}, {"target-exponent", "0"}};
    auto with_op = [&base](const std::string& op) {
        ArgMap args = base;
        args["op"] = op;
        return args;
    };
    EXPECT_EQ(RunCli(with_op("as_u64")).output, "1");
    EXPECT_EQ(RunCli(with_op("as_u64_ceil")).output, "2");
    EXPECT_EQ(RunCli(with_op("as_u64_rounded")).output, "2");
    EXPECT_EQ(RunCli(with_op("narrow")).output, "1");

    LedgerMathConfig round_up;
    round_up.rounding = FixedRoundingMode::kUp;
    EXPECT_EQ(RunCli(with_op("narrow"), round_up).output, "2");

    EXPECT_EQ(RunCli({{"op", "as_decimal"}, {"value", "1242"}, {"exponent", "-3"}}).output, "1242");
    EXPECT_EQ(RunCli({{"op", "bits"}, {"value", "0"}}).output, std::string(48, '0'));
}

TEST(DecimalCliTest, WideBinaryOps) {
    EXPECT_EQ(RunCli({{"op", "add"}, {"value", "1"}, {"rhs", "2"}}).output, "3.0");
    EXPECT_EQ(RunCli({{"op", "div"}, {"value", "1000"}, {"rhs", "500"}}).output, "2.0");
    EXPECT_EQ(RunCli({{"op", "mul"},
                   {"value", "15"},
                   {"exponent", "-1"},
                   {"rhs", "2"},
                   {"rhs-exponent", "0"}})
                  .output,
              "3.0");
}

TEST(DecimalCliTest, NumericalErrorsMapToExitCode) {
    const auto underflow = RunCli({{"op", "sub"}, {"value", "1"}, {"rhs", "2"}});
    EXPECT_EQ(underflow.rc, kExitNumericalError);
    EXPECT_EQ(underflow.error, "underflow on checked sub: 1.0");

    const auto zero_division = RunCli({{"op", "div"}, {"value", "1"}, {"rhs", "0"}});
    EXPECT_EQ(zero_division.rc, kExitNumericalError);
    EXPECT_EQ(zero_division.error, "division by zero: 1.0");

    const auto negative = RunCli({{"type", "signed"}, {"op", "as_u64"}, {"value", "-1"}});
    EXPECT_EQ(negative.rc, kExitNumericalError);
    EXPECT_NE(negative.error.find("value < 0"), std::string::npos);
}

TEST(DecimalCliTest, NumericalErrorsReportTheirCode) {
    LedgerMathConfig config;
    DecimalCliRequest request;
    std::string error;
    ASSERT_TRUE(ParseDecimalCliRequest(
        {{"type", "signed"}, {"op", "as_u64"}, {"value", "-5"}, {"target-exponent", "-12"}},
        config,
        &request,
        &error));
    std::string output;
    NumericalErrorCode code = NumericalErrorCode::kOverflow;
    EXPECT_EQ(RunDecimalCli(request, config, &output, &error, &code), kExitNumericalError);
    EXPECT_STREQ(NumericalErrorCodeName(code), "negative_value");

    ASSERT_TRUE(ParseDecimalCliRequest(
        {{"op", "div"}, {"value", "1"}, {"rhs", "0"}}, config, &request, &error));
    EXPECT_EQ(RunDecimalCli(request, config, &output, &error, &code), kExitNumericalError);
    EXPECT_EQ(code, NumericalErrorCode::kZeroDivision);
}

TEST(DecimalCliTest, InvalidInputsMapToInvalidArgument) {
    const auto exponent = RunCli({{"value", "1"}, {"exponent", "17"}});
    EXPECT_EQ(exponent.rc, kExitInvalidArgument);
    EXPECT_EQ(exponent.error, "no support for exponent: 17");

    const auto digits = RunCli({{"value", "12x"}});
    EXPECT_EQ(digits.rc, kExitInvalidArgument);
    EXPECT_NE(digits.error.find("invalid digit"), std::string::npos);

    const auto unsupported = RunCli({{"op", "as_f64"}, {"value", "1"}});
    EXPECT_EQ(unsupported.rc, kExitInvalidArgument);
    EXPECT_EQ(unsupported.error, "unsupported op for wide: as_f64");

    const auto fp32_range = RunCli({{"type", "fp32"}, {"value", "18446744073709551616"}});
    EXPECT_EQ(fp32_range.rc, kExitInvalidArgument);
    EXPECT_NE(fp32_range.error.find("fp32 input must fit in 64 bits"), std::string::npos);
}

TEST(DecimalCliTest, SignedOps) {
    EXPECT_EQ(RunCli({{"type", "signed"}, {"value", "-15"}, {"exponent", "-1"}}).output, "-1.5");
    EXPECT_EQ(
        RunCli({{"type", "signed"}, {"op", "as_f64"}, {"value", "-15"}, {"exponent", "-1"}}).output,
        "-1.5");
    EXPECT_EQ(
        RunCli({{"type", "signed"}, {"op", "as_u64"}, {"value", "31455"}, {"exponent", "-3"}}).output,
        "31455");
    EXPECT_EQ(RunCli({{"type", "signed"}, {"op", "sub"}, {"value", "1"}, {"rhs", "3"}}).output,
              "-2.0");
}

TEST(DecimalCliTest, Fp32Ops) {
    EXPECT_EQ(RunCli({{"type", "fp32"}, {"value", "3"}}).output, "3.0");
    EXPECT_EQ(RunCli({{"type", "fp32"}, {"op", "div"}, {"value", "1"}, {"rhs", "4"}}).output,
              "0.25");
    EXPECT_EQ(RunCli({{"type", "fp32"}, {"op", "as_u64_ceil"}, {"value", "3"}}).output, "3");
    EXPECT_EQ(RunCli({{"type", "fp32"}, {"op", "as_u64"}, {"value", "7"}}).output, "7");
}

TEST(DecimalCliTest, BytesToHexFormatsEachByte) {
    const unsigned char bytes[] = {0x00, 0x0f, 0xa0, 0xff};
    EXPECT_EQ(BytesToHex(bytes), "000fa0ff");
}

TEST(DecimalCliTest, ParseArgsSupportsBothFlagForms) {
    char arg0[] = "ledger_math_cli";
    char arg1[] = "--type=signed";
    char arg2[] = "--value";
    char arg3[] = "-15";
    char arg4[] = "--verbose";
    char* argv[] = {arg0, arg1, arg2, arg3, arg4};
    const auto args = ParseArgs(5, argv);
    EXPECT_EQ(GetArg(args, "type"), "signed");
    EXPECT_EQ(GetArg(args, "value"), "-15");
    EXPECT_EQ(GetArg(args, "verbose"), "true");
    EXPECT_FALSE(HasArg(args, "exponent"));
    EXPECT_EQ(GetArg(args, "exponent", "0"), "0");
}

}  // namespace ledger_math::apps

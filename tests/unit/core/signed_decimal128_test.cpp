#include <cfloat>
#include <cmath>
#include <cstdint>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include "ledger_math/core/numerical_error.h"
#include "ledger_math/core/signed_decimal128.h"

namespace ledger_math {
namespace {

SignedDecimal128 Dec(Int128 value, int exponent) {
    return SignedDecimal128::FromDecimal(value, exponent);
}

template <typename Fn>
NumericalErrorCode CaptureErrorCode(Fn&& fn) {
    try {
        fn();
    } catch (const NumericalError& ex) {
        return ex.code();
    }
    ADD_FAILURE() << "expected NumericalError";
    return NumericalErrorCode::kOverflow;
}

}  // namespace

TEST(SignedDecimal128Test, ConstantsAndConstruction) {
    EXPECT_EQ(SignedDecimal128::Zero(), Dec(0, 0));
    EXPECT_EQ(SignedDecimal128::One(), Dec(1, 0));
    EXPECT_EQ(-SignedDecimal128::One(), Dec(-1, 0));
    EXPECT_TRUE(SignedDecimal128::One().ToI128() == kSignedDecimalOne);
    EXPECT_TRUE(SignedDecimal128::FromI128(42).ToI128() == 42);
    EXPECT_EQ(SignedDecimal128::FromBps(15000), Dec(15, -1));
    EXPECT_EQ(Dec(1, -22), SignedDecimal128::Zero());
    EXPECT_EQ(Dec(1, 2), Dec(100, 0));
}

TEST(SignedDecimal128Test, BasicArithmetic) {
    EXPECT_EQ(Dec(1, 0) + Dec(1, 0), Dec(2, 0));
    EXPECT_EQ(Dec(1, 0) - Dec(1, 0), SignedDecimal128::Zero());
    EXPECT_EQ(Dec(1, 0) - Dec(2, 0), Dec(-1, 0));
    EXPECT_EQ(SignedDecimal128::One() * SignedDecimal128::One(), SignedDecimal128::One());
    EXPECT_EQ(SignedDecimal128::One() / SignedDecimal128::One(), SignedDecimal128::One());
    EXPECT_EQ(Dec(10, 0) / Dec(100, 0), Dec(1, -1));
    EXPECT_EQ(Dec(-3, 0) * Dec(2, 0), Dec(-6, 0));
    EXPECT_EQ(Dec(1, 1) * 3, Dec(3, 1));
}

TEST(SignedDecimal128Test, CompoundAssignment) {
    auto value = Dec(101, 0);
    value += Dec(2, 0);
    EXPECT_EQ(value, Dec(103, 0));
    value -= Dec(3, 0);
    EXPECT_EQ(value, Dec(100, 0));
    value *= Dec(2, 0);
    EXPECT_EQ(value, Dec(200, 0));

    auto quotient = Dec(101, 0);
    quotient /= Dec(2, 0);
    EXPECT_EQ(quotient, Dec(505, -1));
}

TEST(SignedDecimal128Test, DivideByInteger) {
    EXPECT_EQ(Dec(1000, 0) / 500, Dec(2, 0));
    EXPECT_EQ(Dec(1000, -3) / 3, Dec(3'333'333'333, -10));
    EXPECT_EQ(Dec(-1000, -3) / 3, Dec(-3'333'333'333, -10));
}

TEST(SignedDecimal128Test, MultiplicationAndDivisionTruncateTowardZero) {
    EXPECT_EQ(Dec(-1, -10) * Dec(5, -1), SignedDecimal128::Zero());
    EXPECT_EQ(Dec(1, -10) * Dec(5, -1), SignedDecimal128::Zero());
    EXPECT_EQ(Dec(-1, 0) / Dec(3, 0), Dec(-3'333'333'333, -10));
}

TEST(SignedDecimal128Test, ProductsUseWideIntermediates) {
    // The raw product (10^28 * 10^13) exceeds 128 bits but the result fits.
    const Int128 quintillion = 1'000'000'000'000'000'000;
    const auto product = Dec(quintillion, 0) * Dec(1000, 0);
    EXPECT_EQ(product, Dec(quintillion * 1000, 0));
    EXPECT_EQ(product / Dec(1000, 0), Dec(quintillion, 0));
}

TEST(SignedDecimal128Test, IdentityLaws) {
    const SignedDecimal128 samples[] = {SignedDecimal128::Zero(),
                                        SignedDecimal128::One(),
                                        -SignedDecimal128::One(),
                                        Dec(1242, -3),
                                        Dec(-31455, -3),
                                        Dec(1, -10),
                                        Dec(-1, -10),
                                        Dec(123'456'789'012'345'678, -4),
                                        Dec(-987'654'321'987'654'321, -2),
                                        SignedDecimal128::Max(),
                                        SignedDecimal128::Min()};
    for (const auto& a : samples) {
        EXPECT_EQ(a + SignedDecimal128::Zero(), a) << a;
        EXPECT_EQ(a - SignedDecimal128::Zero(), a) << a;
        EXPECT_EQ(a * SignedDecimal128::One(), a) << a;
        EXPECT_EQ(a / SignedDecimal128::One(), a) << a;
        EXPECT_EQ(SignedDecimal128::FromBits(a.IntoBits()), a) << a;
    }
}

TEST(SignedDecimal128Test, DivisionTruncatesWithinDivisorUnits) {
    const SignedDecimal128 dividends[] = {Dec(1, 0),
                                          Dec(-1, 0),
                                          Dec(10, 0),
                                          Dec(-31455, -3),
                                          Dec(123'456'789, -7),
                                          Dec(-987'654'321'123, -5)};
    const SignedDecimal128 divisors[] = {
        Dec(3, 0), Dec(-3, 0), Dec(7, -1), Dec(-13, -2), Dec(100, 0), Dec(-12345, -4)};
    for (const auto& a : dividends) {
        for (const auto& b : divisors) {
            const Int128 back = ((a / b) * b).ToI128();
            Int128 gap = a.ToI128() - back;
            if (gap < 0) {
                gap = -gap;
            }
            Int128 unit = b.ToI128() < 0 ? -b.ToI128() : b.ToI128();
            // The quotient loses under one unit, scaled by |b|, plus one unit from the product.
            unit = unit / kSignedDecimalOne + 1;
            EXPECT_TRUE(gap <= unit) << a << " / " << b;
        }
    }
}

TEST(SignedDecimal128Test, ComparisonHandlesSign) {
    const auto a = Dec(1000, -4);
    const auto b = Dec(10, -2);
    const auto c = Dec(1001, -4);
    const auto d = Dec(9'999'999, -8);
    EXPECT_EQ(a, b);
    EXPECT_LT(a, c);
    EXPECT_GT(a, d);
    EXPECT_LT(Dec(-1, 0), SignedDecimal128::Zero());
    EXPECT_LT(SignedDecimal128::Min(), Dec(-1, 0));
    EXPECT_GT(SignedDecimal128::Max(), c);
}

TEST(SignedDecimal128Test, RawOperatorsThrowOnOverflow) {
    const auto max = SignedDecimal128::Max();
    const auto min = SignedDecimal128::Min();
    EXPECT_EQ(CaptureErrorCode([&] { (void)(max + SignedDecimal128::One()); }),
              NumericalErrorCode::kAdditionOverflow);
    EXPECT_EQ(CaptureErrorCode([&] { (void)(min - SignedDecimal128::One()); }),
              NumericalErrorCode::kSubtractionUnderflow);
    EXPECT_EQ(CaptureErrorCode([&] { (void)(max * Dec(2, 0)); }),
              NumericalErrorCode::kMultiplicationOverflow);
    EXPECT_EQ(CaptureErrorCode([&] { (void)(SignedDecimal128::One() / SignedDecimal128::Zero()); }),
              NumericalErrorCode::kZeroDivision);
    EXPECT_EQ(CaptureErrorCode([&] { (void)(SignedDecimal128::One() / 0); }),
              NumericalErrorCode::kZeroDivision);
    EXPECT_EQ(CaptureErrorCode([&] { (void)(max * 2); }),
              NumericalErrorCode::kMultiplicationOverflow);
    EXPECT_EQ(CaptureErrorCode([&] { (void)(min / -1); }), NumericalErrorCode::kOverflow);
    EXPECT_EQ(CaptureErrorCode([&] { (void)(-min); }), NumericalErrorCode::kOverflow);
}

TEST(SignedDecimal128Test, CheckedOperationsReturnEmptyOnOverflow) {
    EXPECT_FALSE(SignedDecimal128::Max().CheckedAdd(SignedDecimal128::One()).has_value());
    EXPECT_FALSE(SignedDecimal128::Min().CheckedSub(SignedDecimal128::One()).has_value());
    EXPECT_FALSE(SignedDecimal128::Max().CheckedMul(Dec(2, 0)).has_value());
    EXPECT_FALSE(SignedDecimal128::One().CheckedDiv(SignedDecimal128::Zero()).has_value());
    EXPECT_FALSE(SignedDecimal128::Max().CheckedDiv(Dec(1, -10)).has_value());

    const auto quotient = Dec(-9, 0).CheckedDiv(Dec(3, 0));
    ASSERT_TRUE(quotient.has_value());
    EXPECT_EQ(*quotient, Dec(-3, 0));
}

TEST(SignedDecimal128Test, AsU64AtExponent) {
    EXPECT_EQ(Dec(31455, -3).AsU64(-3), 31455U);
    EXPECT_EQ(Dec(1242, -3).AsU64(0), 1U);
    EXPECT_EQ(Dec(5, 0).AsU64(-12), 5'000'000'000'000U);
    EXPECT_EQ(Dec(12345, 0).AsU64(2), 123U);
    EXPECT_EQ(SignedDecimal128::Zero().AsU64(0), 0U);
}

TEST(SignedDecimal128Test, AsU64RejectsNegativeValues) {
    try {
        (void)Dec(-1, 0).AsU64(0);
        FAIL() << "expected NumericalError";
    } catch (const NumericalError& ex) {
        EXPECT_EQ(ex.code(), NumericalErrorCode::kNegativeValue);
        EXPECT_NE(std::string(ex.what()).find("cannot convert to u64 because value < 0"),
                  std::string::npos);
        EXPECT_EQ(ex.value(), "-1.0");
    }
}

TEST(SignedDecimal128Test, AsU64ReportsNegativeBeforeOverflow) {
    EXPECT_EQ(CaptureErrorCode([] { (void)SignedDecimal128::Min().AsU64(-12); }),
              NumericalErrorCode::kNegativeValue);
    EXPECT_EQ(CaptureErrorCode([] { (void)Dec(-1, -10).AsU64(-12); }),
              NumericalErrorCode::kNegativeValue);
    EXPECT_EQ(CaptureErrorCode([] { (void)SignedDecimal128::Min().AsU64(0); }),
              NumericalErrorCode::kNegativeValue);
    // Values that truncate to zero convert to zero.
    EXPECT_EQ(Dec(-5, -1).AsU64(0), 0U);
    EXPECT_EQ(Dec(-99, 0).AsU64(2), 0U);
}

TEST(SignedDecimal128Test, AsU64RejectsValuesAboveU64) {
    const Int128 just_over = static_cast<Int128>(std::numeric_limits<std::uint64_t>::max()) + 1;
    try {
        (void)Dec(just_over, -3).AsU64(-3);
        FAIL() << "expected NumericalError";
    } catch (const NumericalError& ex) {
        EXPECT_EQ(ex.code(), NumericalErrorCode::kOverflow);
        EXPECT_NE(std::string(ex.what()).find("cannot convert to u64 due to overflow"),
                  std::string::npos);
    }
    EXPECT_THROW((void)SignedDecimal128::Max().AsU64(-12), NumericalError);
}

TEST(SignedDecimal128Test, UnsupportedExponentThrowsInvalidArgument) {
    EXPECT_THROW(Dec(1, 3), std::invalid_argument);
    EXPECT_THROW(Dec(1, -23), std::invalid_argument);
    EXPECT_THROW((void)SignedDecimal128::One().AsU64(3), std::invalid_argument);
}

TEST(SignedDecimal128Test, FromDecimalOverflowThrows) {
    EXPECT_THROW(Dec(kInt128Max, 0), NumericalError);
    EXPECT_THROW(Dec(kInt128Min, 1), NumericalError);
}

TEST(SignedDecimal128Test, AsF64MatchesDecimalValue) {
    EXPECT_DOUBLE_EQ(SignedDecimal128::FromBps(15000).AsF64(), 1.5);
    EXPECT_DOUBLE_EQ(SignedDecimal128::Min().AsF64(), -17014118346046923173168730371.5884105728);
    EXPECT_DOUBLE_EQ(SignedDecimal128::Max().AsF64(), 17014118346046923173168730371.5884105727);
    EXPECT_DOUBLE_EQ((SignedDecimal128::FromBps(0) - SignedDecimal128::FromBps(15000)).AsF64(),
                     -1.5);
    EXPECT_DOUBLE_EQ(Dec(12'345'678'901, -10).AsF64(), 1.2345678901);
    EXPECT_DOUBLE_EQ(Dec(-12'345'678'901, -10).AsF64(), -1.2345678901);
    EXPECT_DOUBLE_EQ(Dec(-12'345'678'901, -9).AsF64(), -12.345678901);
    EXPECT_DOUBLE_EQ(Dec(12'345'678'901, -9).AsF64(), 12.345678901);
    EXPECT_DOUBLE_EQ(Dec(kSignedDecimalOne - 1, 1).AsF64(), 99999999990.0);
    EXPECT_DOUBLE_EQ(Dec(12'345'678'901, -13).AsF64(), 0.0012345678);
    EXPECT_DOUBLE_EQ(Dec(-12'345'678'901, -13).AsF64(), -0.0012345678);
}

TEST(SignedDecimal128Test, AsF64RelativeErrorIsBounded) {
    const SignedDecimal128 samples[] = {SignedDecimal128::Min(),
                                        SignedDecimal128::Max(),
                                        SignedDecimal128::FromI128(kInt128Max / 3),
                                        SignedDecimal128::FromI128(-kInt128Max / 7),
                                        Dec(123'456'789'012'345'678, -10)};
    for (const auto& sample : samples) {
        const long double exact = static_cast<long double>(sample.ToI128()) /
                                  static_cast<long double>(kSignedDecimalOne);
        const long double actual = sample.AsF64();
        EXPECT_LE(std::fabs(actual - exact), 2 * std::fabs(exact) * DBL_EPSILON) << sample;
    }
}

TEST(SignedDecimal128Test, ToStringRendersSignAndFraction) {
    EXPECT_EQ(SignedDecimal128::FromBps(15000).ToString(), "1.5");
    EXPECT_EQ((SignedDecimal128::FromBps(0) - SignedDecimal128::FromBps(15000)).ToString(), "-1.5");
    EXPECT_EQ(Dec(12'345'678'901, -10).ToString(), "1.2345678901");
    EXPECT_EQ(Dec(-12'345'678'901, -10).ToString(), "-1.2345678901");
    EXPECT_EQ(Dec(-12'345'678'901, -9).ToString(), "-12.345678901");
    EXPECT_EQ(Dec(12'345'678'901, -9).ToString(), "12.345678901");
    EXPECT_EQ(Dec(kSignedDecimalOne - 1, 1).ToString(), "99999999990.0");
    EXPECT_EQ(Dec(12'345'678'901, -13).ToString(), "0.0012345678");
    EXPECT_EQ(Dec(-12'345'678'901, -13).ToString(), "-0.0012345678");
    EXPECT_EQ(SignedDecimal128::Zero().ToString(), "0.0");
    EXPECT_EQ((-SignedDecimal128::One()).ToString(), "-1.0");
    EXPECT_EQ(SignedDecimal128::Min().ToString(), "-17014118346046923173168730371.5884105728");
    EXPECT_EQ(SignedDecimal128::Max().ToString(), "17014118346046923173168730371.5884105727");

    std::ostringstream oss;
    oss << Dec(-25, -1);
    EXPECT_EQ(oss.str(), "-2.5");
}

TEST(SignedDecimal128Test, BitsRoundTrip) {
    const auto value = Dec(1242, -3);
    EXPECT_EQ(SignedDecimal128::FromBits(value.IntoBits()), value);
    EXPECT_EQ(SignedDecimal128::FromBits(SignedDecimal128::Min().IntoBits()),
              SignedDecimal128::Min());

    const auto minus_one = SignedDecimal128::FromI128(-1).IntoBits();
    for (const auto byte : minus_one) {
        EXPECT_EQ(byte, 0xff);
    }
}

}  // namespace ledger_math

#include "common/decimal.H"
#include "common/errors.H"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace perpdesk;

TEST(DecimalTest, ParseAndFormat) {
    EXPECT_EQ(Decimal::parse("97500").raw(), 97500 * Decimal::ONE);
    EXPECT_EQ(Decimal::parse("0.00000001").raw(), 1);
    EXPECT_EQ(Decimal::parse("-1.5").raw(), -150000000);
    EXPECT_EQ(Decimal::parse("+2").raw(), 2 * Decimal::ONE);
    EXPECT_EQ(Decimal::parse(".5"), Decimal("0.5"));
    EXPECT_EQ(Decimal::parse("1.1000000000"), Decimal("1.1"));

    EXPECT_EQ(Decimal("97500.10").to_string(), "97500.1");
    EXPECT_EQ(Decimal("-0.25").to_string(), "-0.25");
    EXPECT_EQ(Decimal(42).to_string(), "42");
    EXPECT_EQ(Decimal("1.005").to_string(2), "1.01");
    EXPECT_EQ(Decimal("3").to_string(2), "3.00");
}

TEST(DecimalTest, ParseRejectsMalformedInput) {
    EXPECT_THROW(Decimal::parse(""), ValidationError);
    EXPECT_THROW(Decimal::parse("-"), ValidationError);
    EXPECT_THROW(Decimal::parse("1.2.3"), ValidationError);
    EXPECT_THROW(Decimal::parse("1e5"), ValidationError);
    EXPECT_THROW(Decimal::parse("abc"), ValidationError);
    EXPECT_THROW(Decimal::parse("0.000000001"), ValidationError);
    EXPECT_THROW(Decimal::parse("999999999999999"), ValidationError);
}

TEST(DecimalTest, ParseRoundedKeepsEightPlaces) {
    EXPECT_EQ(Decimal::parse_rounded("0.000000015", ROUNDING::HALF_UP).raw(), 2);
    EXPECT_EQ(Decimal::parse_rounded("0.000000015", ROUNDING::HALF_EVEN).raw(), 2);
    EXPECT_EQ(Decimal::parse_rounded("0.000000025", ROUNDING::HALF_EVEN).raw(), 2);
    EXPECT_EQ(Decimal::parse_rounded("0.000000019", ROUNDING::DOWN).raw(), 1);
}

TEST(DecimalTest, ExactArithmetic) {
    EXPECT_EQ(Decimal("0.1") + Decimal("0.2"), Decimal("0.3"));
    EXPECT_EQ(Decimal("1.5") * Decimal("97500"), Decimal("146250"));
    EXPECT_EQ(Decimal::div(Decimal("146250"), Decimal(10)), Decimal("14625"));
    EXPECT_EQ(Decimal::div(Decimal(1), Decimal(3), ROUNDING::DOWN), Decimal("0.33333333"));
    EXPECT_EQ(Decimal::div(Decimal(2), Decimal(3), ROUNDING::HALF_UP), Decimal("0.66666667"));
    EXPECT_EQ(Decimal::div(Decimal(-2), Decimal(3), ROUNDING::DOWN), Decimal("-0.66666666"));
    EXPECT_THROW(Decimal::div(Decimal(1), Decimal()), std::domain_error);
}

TEST(DecimalTest, SingleRoundingHelpers) {
    // 95000 * 19.1 / 20
    EXPECT_EQ(Decimal::mul_div(Decimal(95000), Decimal("19.1"), Decimal(20)), Decimal("90725"));
    // 0.5 * 96000 * 0.0004
    EXPECT_EQ(Decimal::mul3(Decimal("0.5"), Decimal(96000), Decimal("0.0004")), Decimal("19.2"));
    EXPECT_EQ(Decimal::mul3(Decimal("0.00000001"), Decimal("0.5"), Decimal("0.5"), ROUNDING::UP).raw(), 1);
    EXPECT_EQ(Decimal::mul3(Decimal("0.00000001"), Decimal("0.5"), Decimal("0.5"), ROUNDING::DOWN).raw(), 0);
}

TEST(DecimalTest, WeightedAverageRoundsOnce) {
    // (1 * 100 + 2 * 101) / 3 = 100.666...
    EXPECT_EQ(Decimal::weighted_average(Decimal(1), Decimal(100), Decimal(2), Decimal(101)),
              Decimal("100.66666667"));
    EXPECT_EQ(Decimal::weighted_average(Decimal("0.5"), Decimal(95000), Decimal("0.5"), Decimal(97000)),
              Decimal(96000));
}

TEST(DecimalTest, NotionalAveragesWithoutChainedRounding) {
    Notional basis = Notional::of(Decimal(1), Decimal(100));
    basis.add(Decimal(2), Decimal(101));
    EXPECT_EQ(basis.average(Decimal(3)), Decimal("100.66666667"));

    basis.add(Decimal(3), Decimal(100));
    // 602 / 6, averaging the rounded 100.66666667 again would give 100.33333334
    EXPECT_EQ(basis.average(Decimal(6)), Decimal("100.33333333"));
    EXPECT_EQ(Decimal::weighted_average(Decimal(3), Decimal("100.66666667"), Decimal(3), Decimal(100)),
              Decimal("100.33333334"));

    EXPECT_TRUE(Notional().is_zero());
    EXPECT_THROW(Notional().average(Decimal()), std::domain_error);
}

TEST(DecimalTest, Rounding) {
    EXPECT_EQ(Decimal("2.345").round(2, ROUNDING::HALF_UP), Decimal("2.35"));
    EXPECT_EQ(Decimal("2.345").round(2, ROUNDING::HALF_EVEN), Decimal("2.34"));
    EXPECT_EQ(Decimal("2.345").round(2, ROUNDING::DOWN), Decimal("2.34"));
    EXPECT_EQ(Decimal("2.341").round(2, ROUNDING::UP), Decimal("2.35"));
    EXPECT_EQ(Decimal("-2.345").round(2, ROUNDING::DOWN), Decimal("-2.34"));
    EXPECT_THROW(Decimal("1").round(9), std::invalid_argument);
}

TEST(DecimalTest, DecimalPlaces) {
    EXPECT_EQ(Decimal(5).decimal_places(), 0);
    EXPECT_EQ(Decimal("0.125").decimal_places(), 3);
    EXPECT_EQ(Decimal("-0.00000001").decimal_places(), 8);
}

TEST(DecimalTest, OverflowThrows) {
    Decimal big = Decimal::from_raw(INT64_MAX);
    EXPECT_THROW(big + Decimal::from_raw(1), std::overflow_error);
    EXPECT_THROW(Decimal(90000000000) * Decimal(90000000000), std::overflow_error);
}

TEST(DecimalTest, Comparisons) {
    EXPECT_LT(Decimal("-1"), Decimal());
    EXPECT_GT(Decimal("0.00000001"), Decimal());
    EXPECT_TRUE(Decimal("-3").abs() == Decimal(3));
    EXPECT_TRUE(Decimal().is_zero());
    EXPECT_TRUE(Decimal("-0.1").is_negative());
}

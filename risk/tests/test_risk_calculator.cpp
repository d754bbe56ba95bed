#include "risk/risk_calculator.H"

#include "common/errors.H"

#include <gtest/gtest.h>

using namespace perpdesk;
using namespace perpdesk::risk;

TEST(RiskCalculatorTest, MarginRequired) {
    EXPECT_EQ(margin_required(Decimal("1.5"), Decimal(97500), 10), Decimal(14625));
    EXPECT_EQ(margin_required(Decimal("0.5"), Decimal(95000), 20), Decimal(2375));
    EXPECT_EQ(margin_required(Decimal("0.001"), Decimal("97123.45"), 125), Decimal("0.77698760"));
    EXPECT_THROW(margin_required(Decimal(1), Decimal(100), 0), ValidationError);
}

TEST(RiskCalculatorTest, LiquidationPrice) {
    Decimal buffer("0.9");
    EXPECT_EQ(liquidation_price(POSITION_SIDE::LONG, Decimal(95000), 20, buffer), Decimal("90725"));
    EXPECT_EQ(liquidation_price(POSITION_SIDE::SHORT, Decimal(95000), 20, buffer), Decimal("99275"));
    EXPECT_EQ(liquidation_price(POSITION_SIDE::LONG, Decimal(100), 1, buffer), Decimal(10));
    // 100 * (3 - 0.9) / 3 = 70
    EXPECT_EQ(liquidation_price(POSITION_SIDE::LONG, Decimal(100), 3, buffer), Decimal(70));
}

TEST(RiskCalculatorTest, UnrealizedPnlAndRoe) {
    EXPECT_EQ(unrealized_pnl(POSITION_SIDE::LONG, Decimal("0.5"), Decimal(95000), Decimal(96000)), Decimal(500));
    EXPECT_EQ(unrealized_pnl(POSITION_SIDE::SHORT, Decimal("0.5"), Decimal(95000), Decimal(96000)), Decimal(-500));
    EXPECT_EQ(roe(Decimal(500), Decimal(2375)), Decimal("21.05263158"));
    EXPECT_TRUE(roe(Decimal(500), Decimal()).is_zero());
}

TEST(RiskCalculatorTest, CommissionRoundsDown) {
    EXPECT_EQ(commission(Decimal("0.5"), Decimal(96000), Decimal("0.0004")), Decimal("19.2"));
    // 0.333 * 97123.45 * 0.0004 = 12.93684354
    EXPECT_EQ(commission(Decimal("0.333"), Decimal("97123.45"), Decimal("0.0004")), Decimal("12.93684354"));
    EXPECT_EQ(commission(Decimal("0.333"), Decimal("97123.45"), Decimal("0.0004"), 2), Decimal("12.93"));
    EXPECT_EQ(commission(Decimal("0.00000001"), Decimal("1"), Decimal("0.0004")), Decimal());
}

TEST(RiskCalculatorTest, FeeRateBySide) {
    RiskConfig config;
    EXPECT_EQ(fee_rate(false, config), Decimal("0.0004"));
    EXPECT_EQ(fee_rate(true, config), Decimal("0.0002"));
}

TEST(RiskCalculatorTest, RiskLevels) {
    // margin 2375 on 0.5 @ 95000
    Decimal margin(2375);
    EXPECT_EQ(liquidation_risk_level(POSITION_SIDE::LONG, Decimal("0.5"), Decimal(95000), margin, Decimal(95000)),
              RISK_LEVEL::SAFE);
    // -1200 leaves 49.47%
    EXPECT_EQ(liquidation_risk_level(POSITION_SIDE::LONG, Decimal("0.5"), Decimal(95000), margin, Decimal(92600)),
              RISK_LEVEL::WARNING);
    // -1800 leaves 24.2%
    EXPECT_EQ(liquidation_risk_level(POSITION_SIDE::LONG, Decimal("0.5"), Decimal(95000), margin, Decimal(91400)),
              RISK_LEVEL::DANGER);
    EXPECT_EQ(liquidation_risk_level(POSITION_SIDE::SHORT, Decimal("0.5"), Decimal(95000), margin, Decimal(98600)),
              RISK_LEVEL::DANGER);
    EXPECT_EQ(liquidation_risk_level(POSITION_SIDE::LONG, Decimal("0.5"), Decimal(95000), Decimal(), Decimal(1)),
              RISK_LEVEL::SAFE);

    EXPECT_FALSE(is_liquidation_risk(POSITION_SIDE::LONG, Decimal("0.5"), Decimal(95000), margin, Decimal(90251)));
    EXPECT_TRUE(is_liquidation_risk(POSITION_SIDE::LONG, Decimal("0.5"), Decimal(95000), margin, Decimal(90250)));
}

TEST(RiskCalculatorTest, LiquidationCrossing) {
    EXPECT_TRUE(is_liquidated(POSITION_SIDE::LONG, Decimal(90725), Decimal(90725)));
    EXPECT_FALSE(is_liquidated(POSITION_SIDE::LONG, Decimal(90725), Decimal(90726)));
    EXPECT_TRUE(is_liquidated(POSITION_SIDE::SHORT, Decimal(99275), Decimal(99300)));
    EXPECT_FALSE(is_liquidated(POSITION_SIDE::SHORT, Decimal(99275), Decimal(99274)));
}

#include <gtest/gtest.h>
#include "trade_sim/backtest/leverage_accountant.hpp"

using namespace trade_sim;

class LeverageAccountantTest : public ::testing::Test {};

TEST_F(LeverageAccountantTest, WithoutLeverageCommitsAtMostCash) {
    auto within = LeverageAccountant::allocate(20000.0, 100000.0, false, 2.0);
    EXPECT_TRUE(within.shares_computable);
    EXPECT_DOUBLE_EQ(within.committed_capital, 20000.0);
    EXPECT_DOUBLE_EQ(within.leverage_used, 0.0);
    EXPECT_FALSE(within.clamped);

    auto above = LeverageAccountant::allocate(250000.0, 100000.0, false, 2.0);
    EXPECT_DOUBLE_EQ(above.committed_capital, 100000.0);
    EXPECT_DOUBLE_EQ(above.leverage_used, 0.0);
    EXPECT_TRUE(above.clamped);
}

TEST_F(LeverageAccountantTest, LeverageIsCommittedOverCash) {
    auto allocation = LeverageAccountant::allocate(150000.0, 100000.0, true, 2.0);
    EXPECT_DOUBLE_EQ(allocation.committed_capital, 150000.0);
    EXPECT_DOUBLE_EQ(allocation.leverage_used, 1.5);
    EXPECT_FALSE(allocation.clamped);

    auto small = LeverageAccountant::allocate(25000.0, 100000.0, true, 2.0);
    EXPECT_DOUBLE_EQ(small.leverage_used, 0.25);
}

TEST_F(LeverageAccountantTest, LeverageNeverExceedsMaximum) {
    auto allocation = LeverageAccountant::allocate(1e9, 100000.0, true, 2.0);
    EXPECT_DOUBLE_EQ(allocation.committed_capital, 200000.0);
    EXPECT_DOUBLE_EQ(allocation.leverage_used, 2.0);
    EXPECT_TRUE(allocation.clamped);

    for (double cash : {0.1, 3.0, 77777.77, 1e7}) {
        auto a = LeverageAccountant::allocate(cash * 10.0, cash, true, 3.0);
        EXPECT_LE(a.leverage_used, 3.0) << cash;
    }
}

TEST_F(LeverageAccountantTest, NoCashIsNotComputable) {
    auto zero_cash = LeverageAccountant::allocate(10000.0, 0.0, true, 2.0);
    EXPECT_FALSE(zero_cash.shares_computable);
    EXPECT_DOUBLE_EQ(zero_cash.committed_capital, 0.0);
    EXPECT_DOUBLE_EQ(zero_cash.leverage_used, 0.0);

    EXPECT_FALSE(LeverageAccountant::allocate(10000.0, -5.0, false, 2.0).shares_computable);
    EXPECT_FALSE(LeverageAccountant::allocate(0.0, 10000.0, false, 2.0).shares_computable);
}

TEST_F(LeverageAccountantTest, WholeSharesRoundDown) {
    EXPECT_DOUBLE_EQ(LeverageAccountant::whole_shares(2000.0, 101.0), 19.0);
    EXPECT_DOUBLE_EQ(LeverageAccountant::whole_shares(2000.0, 100.0), 20.0);
    EXPECT_DOUBLE_EQ(LeverageAccountant::whole_shares(50.0, 100.0), 0.0);
    EXPECT_DOUBLE_EQ(LeverageAccountant::whole_shares(2000.0, 0.0), 0.0);
}

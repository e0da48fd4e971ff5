#include <gtest/gtest.h>
#include <cmath>
#include <numeric>
#include "../data/test_data_utils.hpp"
#include "trade_sim/backtest/performance_aggregator.hpp"

using namespace trade_sim;
using namespace trade_sim::testing;

class PerformanceAggregatorTest : public TestBase {
protected:
    static Trade make_trade(double pnl, double pnl_pct, int days, double leverage,
                            double value_after, double position_value = 5000.0) {
        Trade trade;
        trade.symbol = "AAPL";
        trade.pnl_amount = pnl;
        trade.pnl_percent = pnl_pct;
        trade.days_held = days;
        trade.leverage_used = leverage;
        trade.position_value = position_value;
        trade.portfolio_value_after = value_after;
        return trade;
    }

    std::vector<Trade> mixed_log() const {
        return {make_trade(200.0, 4.0, 3, 0.0, 10200.0),
                make_trade(-100.0, -2.0, 5, 0.0, 10100.0, 4000.0),
                make_trade(300.0, 6.0, 1, 2.5, 10400.0, 7000.0),
                make_trade(-400.0, -8.0, 1, 0.0, 10000.0)};
    }

    PerformanceAggregator aggregator;
};

TEST_F(PerformanceAggregatorTest, EmptyLogIsAllZeros) {
    auto metrics = aggregator.compute({}, 100000.0);
    for (const auto& [key, value] : metrics.to_map()) {
        EXPECT_DOUBLE_EQ(value, 0.0) << key;
    }
}

TEST_F(PerformanceAggregatorTest, MixedLog) {
    auto metrics = aggregator.compute(mixed_log(), 10000.0);

    EXPECT_EQ(metrics.total_trades, 4);
    EXPECT_DOUBLE_EQ(metrics.win_rate_pct, 50.0);
    EXPECT_DOUBLE_EQ(metrics.average_win_pct, 5.0);
    EXPECT_DOUBLE_EQ(metrics.average_loss_pct, -5.0);
    EXPECT_DOUBLE_EQ(metrics.total_pnl, 0.0);
    EXPECT_DOUBLE_EQ(metrics.total_return_pct, 0.0);
    EXPECT_NEAR(metrics.max_drawdown_pct, -400.0 / 10400.0 * 100.0, 1e-12);
    EXPECT_DOUBLE_EQ(metrics.profit_factor, 1.0);
    EXPECT_DOUBLE_EQ(metrics.calmar_ratio, 0.0);
    EXPECT_DOUBLE_EQ(metrics.average_holding_period, 2.5);
    EXPECT_DOUBLE_EQ(metrics.average_position_size, 5250.0);
    EXPECT_DOUBLE_EQ(metrics.max_position_size, 7000.0);
    EXPECT_DOUBLE_EQ(metrics.min_position_size, 4000.0);
    EXPECT_DOUBLE_EQ(metrics.avg_leverage_used, 0.625);
    EXPECT_DOUBLE_EQ(metrics.max_leverage_used, 2.5);
    EXPECT_DOUBLE_EQ(metrics.leverage_risk_score, 25.0);
    EXPECT_DOUBLE_EQ(metrics.average_win_amount, 250.0);
    EXPECT_DOUBLE_EQ(metrics.average_loss_amount, -250.0);
}

TEST_F(PerformanceAggregatorTest, DrawdownIsNeverPositive) {
    EXPECT_DOUBLE_EQ(aggregator.max_drawdown_pct({100.0, 110.0, 120.0}), 0.0);
    EXPECT_DOUBLE_EQ(aggregator.max_drawdown_pct({100.0, 50.0, 200.0, 150.0}), -50.0);
    EXPECT_DOUBLE_EQ(aggregator.max_drawdown_pct({}), 0.0);

    auto curve = aggregator.equity_curve(mixed_log(), 10000.0);
    EXPECT_EQ(curve, (std::vector<double>{10000.0, 10200.0, 10100.0, 10400.0, 10000.0}));
}

TEST_F(PerformanceAggregatorTest, ProfitFactorSentinelWithoutLosses) {
    std::vector<Trade> winners = {make_trade(100.0, 1.0, 1, 0.0, 10100.0),
                                  make_trade(50.0, 0.5, 1, 0.0, 10150.0)};
    EXPECT_DOUBLE_EQ(aggregator.profit_factor(winners), PerformanceAggregator::PROFIT_FACTOR_CAP);

    std::vector<Trade> losers = {make_trade(-100.0, -1.0, 1, 0.0, 9900.0)};
    EXPECT_DOUBLE_EQ(aggregator.profit_factor(losers), 0.0);

    // flat trades count as losing but add no loss
    std::vector<Trade> flat = {make_trade(0.0, 0.0, 1, 0.0, 10000.0)};
    EXPECT_DOUBLE_EQ(aggregator.profit_factor(flat), 0.0);
    EXPECT_DOUBLE_EQ(aggregator.compute(flat, 10000.0).win_rate_pct, 0.0);

    std::vector<Trade> lopsided = {make_trade(1e7, 50.0, 1, 0.0, 1e7 + 10000.0),
                                   make_trade(-1.0, -0.01, 1, 0.0, 1e7 + 9999.0)};
    EXPECT_DOUBLE_EQ(aggregator.profit_factor(lopsided), PerformanceAggregator::PROFIT_FACTOR_CAP);
}

TEST_F(PerformanceAggregatorTest, SharpeUsesReturnsOnEquityBeforeTrade) {
    auto returns = aggregator.trade_returns(mixed_log());
    ASSERT_EQ(returns.size(), 4u);
    EXPECT_DOUBLE_EQ(returns[0], 200.0 / 10000.0);
    EXPECT_DOUBLE_EQ(returns[1], -100.0 / 10200.0);
    EXPECT_DOUBLE_EQ(returns[2], 300.0 / 10100.0);
    EXPECT_DOUBLE_EQ(returns[3], -400.0 / 10400.0);

    double mean = std::accumulate(returns.begin(), returns.end(), 0.0) / 4.0;
    double sq = 0.0;
    for (double r : returns) {
        sq += (r - mean) * (r - mean);
    }
    double expected = mean / std::sqrt(sq / 3.0) * std::sqrt(252.0);
    EXPECT_NEAR(aggregator.compute(mixed_log(), 10000.0).sharpe_ratio, expected, 1e-12);

    PerformanceAggregator with_rate(0.0252);
    double expected_rf = (mean - 0.0001) / std::sqrt(sq / 3.0) * std::sqrt(252.0);
    EXPECT_NEAR(with_rate.sharpe_ratio(returns), expected_rf, 1e-12);
}

TEST_F(PerformanceAggregatorTest, SharpeNeedsTwoVaryingReturns) {
    EXPECT_DOUBLE_EQ(aggregator.sharpe_ratio({0.05}), 0.0);
    EXPECT_DOUBLE_EQ(aggregator.sharpe_ratio({0.25, 0.25, 0.25}), 0.0);
}

TEST_F(PerformanceAggregatorTest, CalmarIsReturnOverDrawdown) {
    EXPECT_DOUBLE_EQ(aggregator.calmar_ratio(12.0, -4.0), 3.0);
    EXPECT_DOUBLE_EQ(aggregator.calmar_ratio(12.0, 0.0), 0.0);

    std::vector<Trade> log = {make_trade(-500.0, -5.0, 2, 0.0, 9500.0),
                              make_trade(1500.0, 15.0, 2, 0.0, 11000.0)};
    auto metrics = aggregator.compute(log, 10000.0);
    EXPECT_DOUBLE_EQ(metrics.total_return_pct, 10.0);
    EXPECT_DOUBLE_EQ(metrics.max_drawdown_pct, -5.0);
    EXPECT_DOUBLE_EQ(metrics.calmar_ratio, 2.0);
}

TEST_F(PerformanceAggregatorTest, MapAndJsonShareKeys) {
    auto metrics = aggregator.compute(mixed_log(), 10000.0);
    auto map = metrics.to_map();
    auto json = metrics.to_json();

    for (const char* key :
         {"Total Trades", "Win Rate (%)", "Average Win (%)", "Average Loss (%)",
          "Total Return (%)", "Max Drawdown (%)", "Profit Factor", "Sharpe Ratio", "Calmar Ratio",
          "Average Holding Period (days)", "Average Position Size ($)", "Avg Leverage Used",
          "Max Leverage Used"}) {
        ASSERT_EQ(map.count(key), 1u) << key;
        ASSERT_TRUE(json.contains(key)) << key;
        EXPECT_DOUBLE_EQ(json[key].get<double>(), map.at(key)) << key;
    }
    EXPECT_DOUBLE_EQ(map.at("Total Trades"), 4.0);
}

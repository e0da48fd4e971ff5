#include <gtest/gtest.h>
#include "../data/test_data_utils.hpp"
#include "trade_sim/backtest/parameter_sweep.hpp"
#include "trade_sim/backtest/trade_simulator.hpp"
#include "trade_sim/data/indicator_store.hpp"

using namespace trade_sim;
using namespace trade_sim::testing;

class ParameterSweepTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        auto bars = random_walk("AAPL", 200, 100.0, 5);
        auto msft = random_walk("MSFT", 200, 60.0, 6, 0.03);
        bars.insert(bars.end(), msft.begin(), msft.end());
        index = build_index(bars);

        for (int offset = 0; offset < 270; offset += 9) {
            signals.emplace_back("AAPL", day(offset));
            signals.emplace_back("MSFT", day(offset + 4), Direction::SHORT);
        }
    }

    SweepGrid small_grid() const {
        SweepGrid grid;
        grid.holding_periods = {3, 10};
        grid.stop_losses = {2.0, 5.0};
        grid.take_profits = {std::nullopt, 6.0};
        return grid;
    }

    PriceSeriesIndex index;
    std::vector<Signal> signals;
};

TEST_F(ParameterSweepTest, RangeValuesAreInclusive) {
    auto halves = SweepRange{1.0, 3.0, 0.5}.values();
    ASSERT_TRUE(halves.is_ok());
    EXPECT_EQ(halves.value(), (std::vector<double>{1.0, 1.5, 2.0, 2.5, 3.0}));

    // 0.1 steps do not add up exactly in binary
    auto tenths = SweepRange{0.1, 0.3, 0.1}.values();
    ASSERT_TRUE(tenths.is_ok());
    ASSERT_EQ(tenths.value().size(), 3u);
    EXPECT_DOUBLE_EQ(tenths.value()[1], 0.2);
    EXPECT_DOUBLE_EQ(tenths.value()[2], 0.3);

    auto single = SweepRange{5.0, 5.0, 1.0}.values();
    ASSERT_TRUE(single.is_ok());
    EXPECT_EQ(single.value().size(), 1u);
}

TEST_F(ParameterSweepTest, RangeRejectsBadBounds) {
    auto zero_step = SweepRange{1.0, 3.0, 0.0}.values();
    ASSERT_TRUE(zero_step.is_error());
    EXPECT_EQ(zero_step.error()->code(), ErrorCode::INVALID_ARGUMENT);

    EXPECT_TRUE((SweepRange{3.0, 1.0, 1.0}.values().is_error()));
    EXPECT_TRUE((SweepRange{1.0, 3.0, -1.0}.values().is_error()));
}

TEST_F(ParameterSweepTest, GridFromRanges) {
    auto grid = SweepGrid::from_ranges({3, 5, 1}, {2, 4, 2}, SweepRange{5, 10, 5}, true);
    ASSERT_TRUE(grid.is_ok());
    EXPECT_EQ(grid.value().holding_periods, (std::vector<int>{3, 4, 5}));
    EXPECT_EQ(grid.value().stop_losses, (std::vector<double>{2.0, 4.0}));
    ASSERT_EQ(grid.value().take_profits.size(), 3u);
    EXPECT_FALSE(grid.value().take_profits[0].has_value());
    EXPECT_EQ(grid.value().size(), 18u);

    auto no_target = SweepGrid::from_ranges({5, 5, 1}, {2, 4, 1}, std::nullopt);
    ASSERT_TRUE(no_target.is_ok());
    ASSERT_EQ(no_target.value().take_profits.size(), 1u);
    EXPECT_FALSE(no_target.value().take_profits[0].has_value());
    EXPECT_EQ(no_target.value().size(), 3u);

    EXPECT_TRUE(SweepGrid::from_ranges({5, 1, 1}, {2, 4, 1}, std::nullopt).is_error());
}

TEST_F(ParameterSweepTest, ExpandVariesHoldingPeriodSlowest) {
    BacktestConfig base;
    base.initial_capital = 25000.0;
    base.sizing = KellyCriterionParams{};

    auto configs = small_grid().expand(base);
    ASSERT_EQ(configs.size(), 8u);
    EXPECT_EQ(configs[0].holding_period, 3);
    EXPECT_DOUBLE_EQ(configs[0].stop_loss_pct, 2.0);
    EXPECT_FALSE(configs[0].take_profit_pct.has_value());
    EXPECT_EQ(configs[1].take_profit_pct, std::optional<double>(6.0));
    EXPECT_DOUBLE_EQ(configs[2].stop_loss_pct, 5.0);
    EXPECT_EQ(configs[4].holding_period, 10);
    for (const auto& config : configs) {
        EXPECT_DOUBLE_EQ(config.initial_capital, 25000.0);
        EXPECT_EQ(config.sizing_method(), SizingMethod::KELLY_CRITERION);
    }
}

TEST_F(ParameterSweepTest, MatchesIndependentRuns) {
    BacktestConfig base;
    SweepConfig sweep_config;
    sweep_config.max_workers = 4;
    ParameterSweep sweep(sweep_config);

    auto results = sweep.run(index, signals, base, small_grid());
    ASSERT_TRUE(results.is_ok());
    ASSERT_EQ(results.value().size(), 8u);

    auto configs = small_grid().expand(base);
    for (size_t i = 0; i < configs.size(); ++i) {
        const SweepResult& result = results.value()[i];
        SCOPED_TRACE("combination " + std::to_string(i));
        ASSERT_TRUE(result.ok) << result.error;
        EXPECT_EQ(result.combination_index, i);
        EXPECT_EQ(result.holding_period, configs[i].holding_period);
        EXPECT_DOUBLE_EQ(result.stop_loss_pct, configs[i].stop_loss_pct);
        EXPECT_EQ(result.take_profit_pct, configs[i].take_profit_pct);

        auto direct = TradeSimulator().run(index, signals, configs[i]);
        ASSERT_TRUE(direct.is_ok());
        auto metrics = PerformanceAggregator().compute(direct.value().trades,
                                                       configs[i].initial_capital);
        EXPECT_EQ(result.metrics.total_trades, metrics.total_trades);
        EXPECT_THAT(result.metrics.total_return_pct,
                    IsNearRelative(metrics.total_return_pct, 1e-9));
        EXPECT_THAT(result.metrics.sharpe_ratio, IsNearRelative(metrics.sharpe_ratio, 1e-9));
        EXPECT_EQ(result.warning_count, direct.value().warnings.size());
    }
}

TEST_F(ParameterSweepTest, ResultsIndependentOfWorkerCount) {
    SweepConfig serial_config;
    serial_config.max_workers = 1;
    serial_config.use_vectorized = false;
    SweepConfig parallel_config;
    parallel_config.max_workers = 8;

    auto serial = ParameterSweep(serial_config).run(index, signals, BacktestConfig(), small_grid());
    auto parallel =
        ParameterSweep(parallel_config).run(index, signals, BacktestConfig(), small_grid());
    ASSERT_TRUE(serial.is_ok());
    ASSERT_TRUE(parallel.is_ok());
    ASSERT_EQ(serial.value().size(), parallel.value().size());

    for (size_t i = 0; i < serial.value().size(); ++i) {
        EXPECT_EQ(serial.value()[i].metrics.total_trades,
                  parallel.value()[i].metrics.total_trades);
        EXPECT_THAT(serial.value()[i].metrics.total_pnl,
                    IsNearRelative(parallel.value()[i].metrics.total_pnl, 1e-9));
    }
}

TEST_F(ParameterSweepTest, FailedCombinationDoesNotFailSweep) {
    SweepGrid grid;
    grid.holding_periods = {5};
    grid.stop_losses = {0.0, 5.0};  // 0 is rejected by validation

    auto results = ParameterSweep().run(index, signals, BacktestConfig(), grid);
    ASSERT_TRUE(results.is_ok());
    ASSERT_EQ(results.value().size(), 2u);
    EXPECT_FALSE(results.value()[0].ok);
    EXPECT_NE(results.value()[0].error.find("stop_loss_pct"), std::string::npos);
    EXPECT_TRUE(results.value()[1].ok);

    auto best = ParameterSweep::best(results.value());
    ASSERT_TRUE(best.is_ok());
    EXPECT_EQ(best.value().combination_index, 1u);
}

TEST_F(ParameterSweepTest, EmptyGridIsInvalid) {
    SweepGrid grid;
    grid.stop_losses = {5.0};

    auto results = ParameterSweep().run(index, signals, BacktestConfig(), grid);
    ASSERT_TRUE(results.is_error());
    EXPECT_EQ(results.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(ParameterSweepTest, BestRanksByMetric) {
    std::vector<SweepResult> results(3);
    for (size_t i = 0; i < results.size(); ++i) {
        results[i].combination_index = i;
        results[i].ok = true;
    }
    results[0].metrics.total_return_pct = 4.0;
    results[0].metrics.sharpe_ratio = 2.0;
    results[1].metrics.total_return_pct = 9.0;
    results[1].metrics.sharpe_ratio = 0.5;
    results[2].metrics.total_return_pct = 9.0;  // tie, first wins
    results[2].ok = false;

    auto by_return = ParameterSweep::best(results);
    ASSERT_TRUE(by_return.is_ok());
    EXPECT_EQ(by_return.value().combination_index, 1u);

    auto by_sharpe = ParameterSweep::best(results, "Sharpe Ratio");
    ASSERT_TRUE(by_sharpe.is_ok());
    EXPECT_EQ(by_sharpe.value().combination_index, 0u);

    auto unknown = ParameterSweep::best(results, "Alpha");
    ASSERT_TRUE(unknown.is_error());
    EXPECT_EQ(unknown.error()->code(), ErrorCode::INVALID_ARGUMENT);

    for (auto& result : results) {
        result.ok = false;
    }
    auto none = ParameterSweep::best(results);
    ASSERT_TRUE(none.is_error());
    EXPECT_EQ(none.error()->code(), ErrorCode::DATA_NOT_FOUND);
}

TEST_F(ParameterSweepTest, ResultAndConfigJson) {
    SweepResult failed;
    failed.combination_index = 3;
    failed.holding_period = 5;
    failed.stop_loss_pct = 0.0;
    failed.error = "bad stop";
    auto j = failed.to_json();
    EXPECT_FALSE(j["ok"].get<bool>());
    EXPECT_EQ(j["error"], "bad stop");
    EXPECT_TRUE(j["take_profit_pct"].is_null());
    EXPECT_FALSE(j.contains("metrics"));

    SweepResult ok;
    ok.ok = true;
    ok.take_profit_pct = 8.0;
    auto ok_json = ok.to_json();
    EXPECT_TRUE(ok_json.contains("metrics"));
    EXPECT_DOUBLE_EQ(ok_json["take_profit_pct"].get<double>(), 8.0);

    SweepConfig config;
    config.max_workers = 3;
    config.use_vectorized = false;
    config.risk_free_rate = 0.04;
    SweepConfig loaded;
    loaded.from_json(config.to_json());
    EXPECT_EQ(loaded.max_workers, 3u);
    EXPECT_FALSE(loaded.use_vectorized);
    EXPECT_DOUBLE_EQ(loaded.risk_free_rate, 0.04);
}

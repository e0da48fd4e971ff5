// include/trade_sim/backtest/parameter_sweep.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "trade_sim/backtest/backtest_config.hpp"
#include "trade_sim/backtest/performance_aggregator.hpp"
#include "trade_sim/core/config_base.hpp"
#include "trade_sim/core/error.hpp"

namespace trade_sim {

class IndicatorStore;
class PriceSeriesIndex;

/**
 * @brief Inclusive {min, max, step} range
 */
struct SweepRange {
    double min{0.0};
    double max{0.0};
    double step{1.0};

    /**
     * @brief Values min, min + step, ... up to max, rounded to two decimals
     * @return Values, or INVALID_ARGUMENT for step <= 0 or max < min
     */
    Result<std::vector<double>> values() const;
};

/**
 * @brief Cartesian grid of exit parameters; holding period varies slowest
 */
struct SweepGrid {
    std::vector<int> holding_periods;
    std::vector<double> stop_losses;
    std::vector<std::optional<double>> take_profits{std::nullopt};  // empty entry disables the target

    static Result<SweepGrid> from_ranges(const SweepRange& holding_period,
                                         const SweepRange& stop_loss,
                                         const std::optional<SweepRange>& take_profit,
                                         bool include_no_take_profit = false);

    size_t size() const {
        return holding_periods.size() * stop_losses.size() * take_profits.size();
    }

    /**
     * @brief One config per combination, every other field copied from base
     */
    std::vector<BacktestConfig> expand(const BacktestConfig& base) const;
};

/**
 * @brief Execution options of a sweep
 */
struct SweepConfig : public ConfigBase {
    size_t max_workers{0};  // 0 uses hardware concurrency
    bool use_vectorized{true};
    double risk_free_rate{0.0};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Outcome of one grid combination
 */
struct SweepResult {
    size_t combination_index{0};
    int holding_period{0};
    double stop_loss_pct{0.0};
    std::optional<double> take_profit_pct;
    bool ok{false};
    std::string error;  // set when the combination could not run
    PerformanceMetrics metrics;
    size_t warning_count{0};

    nlohmann::json to_json() const;
};

/**
 * Runs every grid combination as an independent simulation on a pool of worker threads.
 *
 * Inputs are shared read-only; each run owns its portfolio. Results come back in
 * combination order whatever the scheduling. A combination that fails (for example an
 * invalid stop loss) yields an error entry instead of failing the sweep.
 */
class ParameterSweep {
public:
    explicit ParameterSweep(SweepConfig config = SweepConfig()) : config_(std::move(config)) {}

    /**
     * @return One result per combination, or INVALID_ARGUMENT for an empty grid
     */
    Result<std::vector<SweepResult>> run(const PriceSeriesIndex& index,
                                         const std::vector<Signal>& signals,
                                         const BacktestConfig& base_config, const SweepGrid& grid,
                                         const IndicatorStore* indicators = nullptr) const;

    /**
     * @brief Successful result with the highest value of a metric (first wins ties)
     * @param metric Key of PerformanceMetrics::to_map()
     * @return Best result, INVALID_ARGUMENT for unknown keys, DATA_NOT_FOUND when no
     *         combination succeeded
     */
    static Result<SweepResult> best(const std::vector<SweepResult>& results,
                                    const std::string& metric = "Total Return (%)");

    const SweepConfig& config() const {
        return config_;
    }

private:
    SweepResult run_one(size_t combination_index, const BacktestConfig& config,
                        const PriceSeriesIndex& index, const std::vector<Signal>& signals,
                        const IndicatorStore* indicators) const;

    SweepConfig config_;
};

}  // namespace trade_sim
